#pragma once
#include <cstddef>
#include <cstdint>

namespace plugctl {

// Verbosity thresholds. A message prints when the global level is >= its level.
enum : int {
  PLUGCTL_LOG_ERROR   = 0,
  PLUGCTL_LOG_INFO    = 1,
  PLUGCTL_LOG_DEVICE  = 2,
  PLUGCTL_LOG_PAYLOAD = 5,
  PLUGCTL_LOG_FLOW    = 10,
  PLUGCTL_LOG_DUMP    = 20,
};

void set_log_level(int level);
int log_level();

void log_msg(int level, const char* tag, const char* fmt, ...)
    __attribute__((format(printf, 3, 4)));

// Canonical offset / hex / ASCII dump, 16 bytes per row.
void log_hex(int level, const char* tag, const char* label, const uint8_t* data, size_t len);

} // namespace plugctl
