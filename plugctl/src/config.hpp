#pragma once
#include <cstdint>
#include <string>

namespace plugctl {

struct ClientConfig {
  std::string device_ip;
  uint16_t device_port = 80;
  std::string device_mac;       // "aa:bb:cc:dd:ee:ff"
  uint16_t device_type = 0;     // vendor model code, selects the family
  std::string bind_ip = "0.0.0.0";
  uint32_t command_timeout_ms = 1000;
  uint32_t auth_timeout_ms = 10000;
  int log_level = 1;
};

// Whole-string unsigned parse; base 0 follows the C prefix rules. Rejects
// signs, whitespace, trailing characters and values above `max`.
bool parse_uint(const char* text, int base, uint32_t max, uint32_t& out);

// Defaults overridden by PLUGCTL_* environment variables.
ClientConfig load_client_config();

// Empty string when the host name cannot be read.
std::string local_host_name();

} // namespace plugctl
