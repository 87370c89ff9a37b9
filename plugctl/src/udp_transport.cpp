#include "udp_transport.hpp"
#include "log.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace plugctl {

UdpTransport::~UdpTransport() {
  close();
}

bool UdpTransport::open(const std::string& bind_ip, uint16_t bind_port) {
  close();
  const int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) {
    log_msg(PLUGCTL_LOG_ERROR, "udp", "socket() failed: %s", std::strerror(errno));
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(bind_port);
  if (::inet_pton(AF_INET, bind_ip.c_str(), &addr.sin_addr) != 1) {
    log_msg(PLUGCTL_LOG_ERROR, "udp", "bad bind address: %s", bind_ip.c_str());
    ::close(fd);
    return false;
  }

  if (::bind(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
    log_msg(PLUGCTL_LOG_ERROR, "udp", "bind(%s:%u) failed: %s", bind_ip.c_str(), bind_port, std::strerror(errno));
    ::close(fd);
    return false;
  }

  // Bounded blocking so a reader also notices shutdown on its own.
  timeval tv{0, 200000};
  ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

  m_shut.store(false);
  m_fd.store(fd);
  return true;
}

bool UdpTransport::set_peer(const std::string& ip, uint16_t port) {
  sockaddr_in to{};
  to.sin_family = AF_INET;
  to.sin_port = htons(port);
  if (::inet_pton(AF_INET, ip.c_str(), &to.sin_addr) != 1) {
    log_msg(PLUGCTL_LOG_ERROR, "udp", "bad device address: %s", ip.c_str());
    return false;
  }
  m_peer = to;
  return true;
}

void UdpTransport::shutdown() {
  m_shut.store(true);
  const int fd = m_fd.load();
  if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void UdpTransport::close() {
  const int fd = m_fd.exchange(-1);
  m_shut.store(true);
  if (fd >= 0) ::close(fd);
}

int UdpTransport::recv(uint8_t* buf, size_t max_len, sockaddr_in& from) {
  const int fd = m_fd.load();
  if (fd < 0) {
    errno = EBADF;
    return -1;
  }
  socklen_t sl = sizeof(from);
  const int n = (int)::recvfrom(fd, buf, max_len, 0, (sockaddr*)&from, &sl);
  if (n == 0 && !m_shut.load()) {
    // Empty datagram, not a shutdown.
    errno = EAGAIN;
    return -1;
  }
  return n;
}

bool UdpTransport::send(const uint8_t* buf, size_t len) {
  const int fd = m_fd.load();
  if (fd < 0 || m_shut.load()) return false;
  const int n = (int)::sendto(fd, buf, len, 0, (const sockaddr*)&m_peer, sizeof(m_peer));
  if (n != (int)len) {
    log_msg(PLUGCTL_LOG_ERROR, "udp", "sendto failed: %s", n < 0 ? std::strerror(errno) : "short write");
    return false;
  }
  return true;
}

uint16_t UdpTransport::local_port() const {
  const int fd = m_fd.load();
  if (fd < 0) return 0;
  sockaddr_in addr{};
  socklen_t sl = sizeof(addr);
  if (::getsockname(fd, (sockaddr*)&addr, &sl) != 0) return 0;
  return ntohs(addr.sin_port);
}

} // namespace plugctl
