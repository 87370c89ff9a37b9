#include "device_session.hpp"
#include "log.hpp"
#include "payloads.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace plugctl {

DeviceSession::~DeviceSession() {
  close();
}

bool DeviceSession::fail(ErrorKind kind, const std::string& message, uint16_t code) {
  m_last_error = Error{kind, code, message};
  log_msg(PLUGCTL_LOG_FLOW, "session", "%s error: %s", error_kind_name(kind), message.c_str());
  return false;
}

bool DeviceSession::open(const ClientConfig& cfg) {
  close();
  m_last_error = Error{};
  set_log_level(cfg.log_level);

  // Frames left over from a previous socket belong to no caller.
  m_queue.clear();
  m_discarded = 0;

  DeviceIdentity id;
  id.ip = cfg.device_ip;
  id.port = cfg.device_port;
  id.model_code = cfg.device_type;
  if (!parse_mac(cfg.device_mac.c_str(), id.mac)) {
    return fail(ErrorKind::TRANSPORT, "invalid MAC address: " + cfg.device_mac);
  }

  if (!m_transport.open(cfg.bind_ip, 0)) {
    return fail(ErrorKind::TRANSPORT, "cannot open UDP socket on " + cfg.bind_ip);
  }
  if (!m_transport.set_peer(cfg.device_ip, cfg.device_port)) {
    m_transport.close();
    return fail(ErrorKind::TRANSPORT, "cannot resolve device address " + cfg.device_ip);
  }

  m_identity = id;
  m_cipher = SessionCipher();
  m_command_timeout = std::chrono::milliseconds(cfg.command_timeout_ms);
  m_auth_timeout = std::chrono::milliseconds(cfg.auth_timeout_ms);
  if (m_host_name.empty()) m_host_name = local_host_name();

  m_listener = std::thread(&DeviceSession::listener_loop, this);
  log_msg(PLUGCTL_LOG_FLOW, "session", "open %s:%u type=0x%04x local port %u",
          id.ip.c_str(), id.port, id.model_code, m_transport.local_port());
  return true;
}

void DeviceSession::close() {
  if (!m_listener.joinable() && !m_transport.is_open()) return;
  log_msg(PLUGCTL_LOG_FLOW, "session", "close");
  m_transport.shutdown();
  if (m_listener.joinable()) m_listener.join();
  m_transport.close();
}

void DeviceSession::listener_loop() {
  uint8_t buf[kMaxDatagram];

  while (true) {
    sockaddr_in from{};
    const int n = m_transport.recv(buf, sizeof(buf), from);
    if (n <= 0) {
      if (n == 0 || m_transport.is_shut_down() || errno == EBADF || errno == ENOTSOCK) break;
      continue;
    }

    if (!validate_frame(buf, (size_t)n)) {
      m_discarded++;
      log_msg(PLUGCTL_LOG_DUMP, "listener", "drop %d byte frame, bad checksum", n);
      continue;
    }

    if (!m_queue.push(Bytes(buf, buf + n))) {
      log_msg(PLUGCTL_LOG_ERROR, "listener", "response queue full, frame dropped");
    }
  }
  log_msg(PLUGCTL_LOG_FLOW, "listener", "stopped");
}

bool DeviceSession::send_raw(uint16_t command, const uint8_t* payload, size_t len) {
  if (!m_transport.is_open()) {
    return fail(ErrorKind::TRANSPORT, "client closed");
  }

  m_identity.send_count++;

  FrameHeader h;
  h.device_type = m_identity.model_code;
  h.command = command;
  h.sequence = m_identity.send_count;
  h.mac = m_identity.mac;
  h.device_id = m_identity.device_id;

  Bytes ciphertext;
  if (payload && len > 0) {
    const Bytes padded = pad_zero(payload, len);
    h.payload_checksum = checksum16(padded.data(), padded.size());
    if (!m_cipher.encrypt_padded(padded.data(), padded.size(), ciphertext)) {
      return fail(ErrorKind::MALFORMED, "payload encryption failed");
    }
    log_hex(PLUGCTL_LOG_DUMP, "session", "payload", padded.data(), padded.size());
  }

  const Bytes frame = build_frame(h, ciphertext.data(), ciphertext.size());
  log_hex(PLUGCTL_LOG_DUMP, "session", "frame", frame.data(), frame.size());

  if (!m_transport.send(frame.data(), frame.size())) {
    return fail(ErrorKind::TRANSPORT, "send failed");
  }
  return true;
}

bool DeviceSession::send_command(uint16_t command, const uint8_t* payload, size_t len, Bytes& reply) {
  if (!send_raw(command, payload, len)) return false;
  log_msg(PLUGCTL_LOG_FLOW, "session", "wait for reply to 0x%04x seq=%u", command, m_identity.send_count);
  const bool ok = recv(m_command_timeout, reply);
  log_msg(PLUGCTL_LOG_FLOW, "session", "got reply: %s", ok ? "ok" : m_last_error.message.c_str());
  return ok;
}

bool DeviceSession::recv(std::chrono::milliseconds timeout, Bytes& out) {
  Error err;
  if (!m_correlator.recv(timeout, out, err)) return fail(err.kind, err.message);
  return true;
}

bool DeviceSession::wait_for_type(uint16_t expected, std::chrono::milliseconds timeout, Bytes& out) {
  Error err;
  if (!m_correlator.wait_for_type(expected, timeout, out, err)) return fail(err.kind, err.message);
  return true;
}

bool DeviceSession::check_reply(const Bytes& reply) {
  FrameHeader h;
  if (!decode_header(reply.data(), reply.size(), h)) {
    return fail(ErrorKind::MALFORMED, "reply shorter than header");
  }
  log_msg(PLUGCTL_LOG_FLOW, "session", "reply type=0x%04x error=0x%04x", h.command, h.error_code);
  if (h.error_code != 0) {
    char msg[32];
    std::snprintf(msg, sizeof(msg), "Response %x", h.error_code);
    return fail(ErrorKind::PROTOCOL, msg, h.error_code);
  }
  return true;
}

bool DeviceSession::open_reply(const Bytes& reply, Bytes& plain) {
  if (!check_reply(reply)) return false;
  if (!m_cipher.decrypt(reply.data() + kHeaderLen, reply.size() - kHeaderLen, plain)) {
    return fail(ErrorKind::MALFORMED, "reply payload is not a whole number of cipher blocks");
  }
  return true;
}

bool DeviceSession::authenticate(uint32_t& device_id) {
  const Bytes req = build_auth_request(m_host_name);
  if (!send_raw(WIRE_CMD_AUTH, req.data(), req.size())) return false;

  Bytes resp;
  if (!wait_for_type(WIRE_RESP_AUTH, m_auth_timeout, resp)) return false;
  log_hex(PLUGCTL_LOG_FLOW, "session", "auth response", resp.data(), resp.size());

  Bytes plain;
  if (!open_reply(resp, plain)) return false;

  AuthReply ar;
  if (!parse_auth_reply(plain, ar)) {
    return fail(ErrorKind::MALFORMED, "auth reply too short");
  }

  m_identity.device_id = ar.device_id;
  m_cipher.set_key(ar.key);
  device_id = ar.device_id;
  log_msg(PLUGCTL_LOG_DEVICE, "session", "Device Id=%u", ar.device_id);
  return true;
}

} // namespace plugctl
