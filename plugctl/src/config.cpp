#include "config.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <unistd.h>

namespace plugctl {

static const char* env_str(const char* name) {
  const char* v = std::getenv(name);
  if (v && v[0]) return v;
  return nullptr;
}

static bool env_u32(const char* name, uint32_t& out) {
  const char* v = env_str(name);
  if (!v) return false;
  return parse_uint(v, 0, 0xFFFFFFFFu, out);
}

bool parse_uint(const char* text, int base, uint32_t max, uint32_t& out) {
  if (!text || !std::isxdigit((unsigned char)text[0])) return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long n = std::strtoull(text, &end, base);
  if (end == text || *end != '\0' || errno == ERANGE || n > max) return false;
  out = (uint32_t)n;
  return true;
}

ClientConfig load_client_config() {
  ClientConfig cfg;
  uint32_t n = 0;

  if (const char* ip = env_str("PLUGCTL_DEVICE_IP")) cfg.device_ip = ip;
  if (const char* mac = env_str("PLUGCTL_DEVICE_MAC")) cfg.device_mac = mac;
  if (const char* bind = env_str("PLUGCTL_BIND_IP")) cfg.bind_ip = bind;

  if (env_u32("PLUGCTL_DEVICE_PORT", n) && n > 0 && n <= 0xFFFF) cfg.device_port = (uint16_t)n;
  if (env_u32("PLUGCTL_DEVICE_TYPE", n) && n <= 0xFFFF) cfg.device_type = (uint16_t)n;
  if (env_u32("PLUGCTL_COMMAND_TIMEOUT_MS", n) && n > 0) cfg.command_timeout_ms = n;
  if (env_u32("PLUGCTL_AUTH_TIMEOUT_MS", n) && n > 0) cfg.auth_timeout_ms = n;
  if (env_u32("PLUGCTL_LOG_LEVEL", n)) cfg.log_level = (int)n;

  return cfg;
}

std::string local_host_name() {
  char buf[HOST_NAME_MAX + 1] = {0};
  if (::gethostname(buf, sizeof(buf) - 1) != 0) return std::string();
  return std::string(buf);
}

} // namespace plugctl
