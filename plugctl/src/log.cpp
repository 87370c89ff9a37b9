#include "log.hpp"
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>

namespace plugctl {

static std::atomic<int> g_log_level{PLUGCTL_LOG_INFO};

void set_log_level(int level) {
  g_log_level.store(level);
}

int log_level() {
  return g_log_level.load();
}

void log_msg(int level, const char* tag, const char* fmt, ...) {
  if (g_log_level.load() < level) return;
  FILE* out = (level == PLUGCTL_LOG_ERROR) ? stderr : stdout;

  std::fprintf(out, "[%s] ", tag);
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fputc('\n', out);
}

void log_hex(int level, const char* tag, const char* label, const uint8_t* data, size_t len) {
  if (g_log_level.load() < level) return;

  std::printf("[%s] %s (%zu bytes)\n", tag, label, len);
  for (size_t row = 0; row < len; row += 16) {
    std::printf("%08zx ", row);
    for (size_t i = 0; i < 16; ++i) {
      if (i == 8) std::printf(" ");
      if (row + i < len) std::printf(" %02x", data[row + i]);
      else std::printf("   ");
    }
    std::printf("  |");
    for (size_t i = 0; i < 16 && row + i < len; ++i) {
      const int c = data[row + i];
      std::printf("%c", std::isprint(c) ? c : '.');
    }
    std::printf("|\n");
  }
}

} // namespace plugctl
