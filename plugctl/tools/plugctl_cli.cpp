#include "../src/config.hpp"
#include "../src/log.hpp"
#include "../src/power_client.hpp"
#include <cstdio>
#include <cstring>
#include <string>

using namespace plugctl;

static void usage() {
  std::fprintf(stderr,
    "Usage: plugctl_cli <ip> <mac> <type_hex> <command> [args]\n"
    "  auth                 authenticate only, print device id\n"
    "  on | off             single relay power\n"
    "  query                single relay state\n"
    "  mask <hex> <on|off>  multi relay, by bitmask\n"
    "  relay <n> <on|off>   multi relay, 1-based index\n"
    "  raw                  multi relay status bitmask\n"
    "Environment: PLUGCTL_LOG_LEVEL, PLUGCTL_COMMAND_TIMEOUT_MS, PLUGCTL_AUTH_TIMEOUT_MS\n");
}

static bool parse_onoff(const char* s, bool& on) {
  if (std::strcmp(s, "on") == 0) { on = true; return true; }
  if (std::strcmp(s, "off") == 0) { on = false; return true; }
  return false;
}

static int report_failure(const char* what, const PowerClient& client) {
  const Error& e = client.last_error();
  std::fprintf(stderr, "%s failed (%s): %s\n", what, error_kind_name(e.kind), e.message.c_str());
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 5) {
    usage();
    return 2;
  }

  ClientConfig cfg = load_client_config();
  cfg.device_ip = argv[1];
  cfg.device_mac = argv[2];
  uint32_t type = 0;
  if (!parse_uint(argv[3], 16, 0xFFFF, type)) {
    std::fprintf(stderr, "bad device type: %s\n", argv[3]);
    usage();
    return 2;
  }
  cfg.device_type = (uint16_t)type;
  const std::string cmd = argv[4];
  set_log_level(cfg.log_level);

  bool on = false;
  uint8_t mask = 0;
  int index = 0;
  if (cmd == "on" || cmd == "off") {
    on = (cmd == "on");
  } else if (cmd == "mask" || cmd == "relay") {
    if (argc < 7 || !parse_onoff(argv[6], on)) { usage(); return 2; }
    uint32_t n = 0;
    if (!parse_uint(argv[5], cmd == "mask" ? 16 : 10, 0xFF, n)) {
      std::fprintf(stderr, "bad %s: %s\n", cmd.c_str(), argv[5]);
      usage();
      return 2;
    }
    if (cmd == "mask") mask = (uint8_t)n;
    else index = (int)n;
  } else if (cmd != "auth" && cmd != "query" && cmd != "raw") {
    usage();
    return 2;
  }

  PowerClient client;
  if (!client.open(cfg)) return report_failure("open", client);

  uint32_t device_id = 0;
  if (!client.authenticate(device_id)) {
    const int rc = report_failure("auth", client);
    client.close();
    return rc;
  }
  std::printf("device id=0x%08X family=%s\n", device_id, family_name(client.family()));

  int rc = 0;
  if (cmd == "on" || cmd == "off") {
    if (client.set_power(on)) std::printf("power %s\n", on ? "on" : "off");
    else rc = report_failure("set_power", client);
  } else if (cmd == "query") {
    if (client.query_power(on)) std::printf("power=%s\n", on ? "on" : "off");
    else rc = report_failure("query_power", client);
  } else if (cmd == "mask") {
    if (client.set_power_mask(mask, on)) std::printf("mask 0x%02X %s\n", mask, on ? "on" : "off");
    else rc = report_failure("set_power_mask", client);
  } else if (cmd == "relay") {
    if (client.set_power_by_index(index, on)) std::printf("relay %d %s\n", index, on ? "on" : "off");
    else rc = report_failure("set_power_by_index", client);
  } else if (cmd == "raw") {
    if (client.query_power_raw(mask)) std::printf("relays=0x%02X\n", mask);
    else rc = report_failure("query_power_raw", client);
  }

  client.close();
  return rc;
}
