#include "power_client.hpp"
#include "log.hpp"
#include "payloads.hpp"

namespace plugctl {

bool PowerClient::open(const ClientConfig& cfg) {
  m_last_error = Error{};
  m_family = family_for_model(cfg.device_type);
  log_msg(PLUGCTL_LOG_FLOW, "client", "model 0x%04x is %s", cfg.device_type, family_name(m_family));
  if (!m_session.open(cfg)) return session_failed();
  return true;
}

void PowerClient::close() {
  m_session.close();
}

bool PowerClient::session_failed() {
  m_last_error = m_session.last_error();
  return false;
}

bool PowerClient::require(DeviceFamily family, const char* op) {
  if (m_family == family) return true;
  m_last_error = Error{ErrorKind::NOT_SUPPORTED, 0, "Not supported"};
  log_msg(PLUGCTL_LOG_FLOW, "client", "%s not supported by %s device", op, family_name(m_family));
  return false;
}

// Sends one 0x6a envelope; the reply header must carry no error code.
bool PowerClient::exchange(const CommandPayload& payload, Bytes& reply) {
  log_hex(PLUGCTL_LOG_PAYLOAD, "client", "PAYLOAD", payload.data(), payload.size());
  if (!m_session.send_command(WIRE_CMD_COMMAND, payload.data(), payload.size(), reply)) {
    return session_failed();
  }
  if (!m_session.check_reply(reply)) return session_failed();
  return true;
}

bool PowerClient::query(const CommandPayload& payload, Bytes& plain) {
  Bytes reply;
  if (!exchange(payload, reply)) return false;
  if (!m_session.open_reply(reply, plain)) return session_failed();
  return true;
}

bool PowerClient::authenticate(uint32_t& device_id) {
  if (!m_session.authenticate(device_id)) return session_failed();
  m_last_error = Error{};
  return true;
}

bool PowerClient::set_power(bool on) {
  if (!require(DeviceFamily::SINGLE_RELAY, "set_power")) return false;
  Bytes reply;
  if (!exchange(build_sp_set_power(on), reply)) return false;
  m_last_error = Error{};
  return true;
}

bool PowerClient::query_power(bool& on) {
  if (!require(DeviceFamily::SINGLE_RELAY, "query_power")) return false;
  Bytes plain;
  if (!query(build_sp_query_power(), plain)) return false;
  if (!parse_sp_power_state(plain, on)) {
    m_last_error = Error{ErrorKind::MALFORMED, 0, "power state reply too short"};
    return false;
  }
  m_last_error = Error{};
  return true;
}

bool PowerClient::set_power_mask(uint8_t mask, bool on) {
  if (!require(DeviceFamily::MULTI_RELAY, "set_power_mask")) return false;
  log_msg(PLUGCTL_LOG_PAYLOAD, "client", "POWERMASK=0x%02x %s", mask, on ? "on" : "off");
  Bytes reply;
  if (!exchange(build_mp_set_mask(mask, on), reply)) return false;
  m_last_error = Error{};
  return true;
}

bool PowerClient::set_power_by_index(int index, bool on) {
  if (!require(DeviceFamily::MULTI_RELAY, "set_power_by_index")) return false;
  uint8_t mask = 0;
  if (!mp_mask_for_index(index, mask)) {
    m_last_error = Error{ErrorKind::MALFORMED, 0, "relay index out of range: " + std::to_string(index)};
    return false;
  }
  return set_power_mask(mask, on);
}

bool PowerClient::query_power_raw(uint8_t& mask) {
  if (!require(DeviceFamily::MULTI_RELAY, "query_power_raw")) return false;
  Bytes plain;
  if (!query(build_mp_query(), plain)) return false;
  if (!parse_mp_status(plain, mask)) {
    m_last_error = Error{ErrorKind::MALFORMED, 0, "relay status reply too short"};
    return false;
  }
  m_last_error = Error{};
  return true;
}

} // namespace plugctl
