#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <netinet/in.h>

namespace plugctl {

// Blocking UDP socket bound to an ephemeral local port, talking to one peer.
class UdpTransport {
public:
  UdpTransport() = default;
  ~UdpTransport();

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  bool open(const std::string& bind_ip, uint16_t bind_port);
  bool set_peer(const std::string& ip, uint16_t port);

  // Unblocks a thread sitting in recv(); the descriptor stays valid.
  void shutdown();
  void close();

  // Blocking. >0 bytes read, 0 when the socket was shut down, -1 on error
  // (errno preserved).
  int recv(uint8_t* buf, size_t max_len, sockaddr_in& from);
  bool send(const uint8_t* buf, size_t len);

  bool is_open() const { return m_fd.load() >= 0 && !m_shut.load(); }
  bool is_shut_down() const { return m_shut.load(); }
  uint16_t local_port() const;

private:
  std::atomic<int> m_fd{-1};
  std::atomic<bool> m_shut{false};
  sockaddr_in m_peer{};
};

} // namespace plugctl
