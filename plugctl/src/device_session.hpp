#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>

#include "config.hpp"
#include "correlator.hpp"
#include "error.hpp"
#include "protocol.hpp"
#include "response_queue.hpp"
#include "session_cipher.hpp"
#include "udp_transport.hpp"

namespace plugctl {

struct DeviceIdentity {
  std::string ip;
  uint16_t port = PLUGCTL_DEFAULT_PORT;
  MacAddress mac{};
  uint16_t model_code = 0;
  uint32_t device_id = 0;   // 0 until authenticated
  uint16_t send_count = 0;  // incremented before every send, wraps
};

// One logical device: its identity, session key, socket and listener thread.
//
// Not thread safe. Key, sequence counter and device id are mutated without
// locking, so callers must keep at most one command in flight per session.
class DeviceSession {
public:
  DeviceSession() = default;
  ~DeviceSession();

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

  bool open(const ClientConfig& cfg);
  // Idempotent. Stops the listener; later sends fail fast.
  void close();
  bool is_open() const { return m_transport.is_open(); }

  // Frame + encrypt + send, no wait.
  bool send_raw(uint16_t command, const uint8_t* payload, size_t len);
  // send_raw() then recv() with the command timeout.
  bool send_command(uint16_t command, const uint8_t* payload, size_t len, Bytes& reply);

  bool recv(std::chrono::milliseconds timeout, Bytes& out);
  bool wait_for_type(uint16_t expected, std::chrono::milliseconds timeout, Bytes& out);

  // Rejects short replies and nonzero device error codes.
  bool check_reply(const Bytes& reply);
  // check_reply(), then decrypts the payload with the current key. Padding is
  // left in place.
  bool open_reply(const Bytes& reply, Bytes& plain);

  // 0x65 handshake. On success the device id and session key are replaced.
  bool authenticate(uint32_t& device_id);

  const DeviceIdentity& identity() const { return m_identity; }
  const SessionCipher& cipher() const { return m_cipher; }
  const Error& last_error() const { return m_last_error; }
  uint16_t local_port() const { return m_transport.local_port(); }
  size_t pending_responses() const { return m_queue.size(); }
  size_t discarded_frames() const { return m_discarded.load(); }

  void set_host_name(const std::string& name) { m_host_name = name; }

private:
  void listener_loop();
  bool fail(ErrorKind kind, const std::string& message, uint16_t code = 0);

  DeviceIdentity m_identity;
  SessionCipher m_cipher;
  UdpTransport m_transport;
  ResponseQueue m_queue;
  ResponseCorrelator m_correlator{m_queue};
  std::thread m_listener;
  std::atomic<size_t> m_discarded{0};

  std::chrono::milliseconds m_command_timeout{1000};
  std::chrono::milliseconds m_auth_timeout{10000};
  std::string m_host_name;
  Error m_last_error;
};

} // namespace plugctl
