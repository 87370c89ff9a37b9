#include "payloads.hpp"
#include <algorithm>
#include <cstring>

namespace plugctl {

CommandPayload build_sp_set_power(bool on) {
  CommandPayload p{};
  p[SP_OFF_SUBCMD] = SP_SUBCMD_SET;
  p[SP_OFF_STATE] = on ? 1 : 0;
  return p;
}

CommandPayload build_sp_query_power() {
  CommandPayload p{};
  p[SP_OFF_SUBCMD] = SP_SUBCMD_QUERY;
  return p;
}

bool parse_sp_power_state(const Bytes& plain, bool& on) {
  if (plain.size() <= SP_OFF_STATE) return false;
  const uint8_t st = plain[SP_OFF_STATE];
  on = (st == 0x01 || st == 0x03 || st == 0xfd);
  return true;
}

uint8_t mp_control_byte(uint8_t mask, bool on) {
  const uint8_t base = on ? (uint8_t)(mask << 1) : mask;
  return (uint8_t)(base + kMpControlBias);
}

CommandPayload build_mp_set_mask(uint8_t mask, bool on) {
  static const uint8_t kPrefix[] = {0x0d, 0x00, 0xa5, 0xa5, 0x5a, 0x5a, 0x00, 0xc0, 0x02, 0x00, 0x03};
  CommandPayload p{};
  std::memcpy(p.data(), kPrefix, sizeof(kPrefix));
  p[MP_OFF_CONTROL] = mp_control_byte(mask, on);
  p[MP_OFF_MASK] = mask;
  p[MP_OFF_ENABLED] = on ? mask : 0;
  return p;
}

bool mp_mask_for_index(int index, uint8_t& mask) {
  if (index < 1 || index > kMpMaxRelays) return false;
  mask = (uint8_t)(0x01u << (index - 1));
  return true;
}

CommandPayload build_mp_query() {
  static const uint8_t kQuery[] = {0x0a, 0x00, 0xa5, 0xa5, 0x5a, 0x5a, 0xae, 0xc0, 0x01};
  CommandPayload p{};
  std::memcpy(p.data(), kQuery, sizeof(kQuery));
  return p;
}

bool parse_mp_status(const Bytes& plain, uint8_t& mask) {
  if (plain.size() <= MP_OFF_STATUS) return false;
  mask = plain[MP_OFF_STATUS];
  return true;
}

Bytes build_auth_request(const std::string& host_name) {
  Bytes p(WIRE_AUTH_REQ_LEN, 0);
  p[WIRE_AUTH_REQ_OFF_FLAG] = 0x01;
  const size_t n = std::min<size_t>(host_name.size(), WIRE_AUTH_REQ_HOST_LEN);
  if (n) std::memcpy(p.data() + WIRE_AUTH_REQ_OFF_HOST, host_name.data(), n);
  return p;
}

bool parse_auth_reply(const Bytes& plain, AuthReply& out) {
  if (plain.size() < WIRE_AUTH_RESP_MIN_LEN) return false;
  out.device_id = rd32_le(plain.data() + WIRE_AUTH_RESP_OFF_ID);
  std::memcpy(out.key.data(), plain.data() + WIRE_AUTH_RESP_OFF_KEY, out.key.size());
  return true;
}

} // namespace plugctl
