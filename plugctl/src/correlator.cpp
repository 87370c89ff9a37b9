#include "correlator.hpp"
#include "log.hpp"
#include <thread>

namespace plugctl {

bool ResponseCorrelator::recv(std::chrono::milliseconds timeout, Bytes& out, Error& err) {
  if (!m_queue.pop(out, timeout)) {
    err = Error{ErrorKind::TIMEOUT, 0, "Timeout"};
    return false;
  }
  return true;
}

bool ResponseCorrelator::wait_for_type(uint16_t expected, std::chrono::milliseconds timeout,
                                       Bytes& out, Error& err) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + timeout;

  while (true) {
    const auto now = clock::now();
    const auto left = (now < deadline)
        ? std::chrono::ceil<std::chrono::milliseconds>(deadline - now)
        : std::chrono::milliseconds(0);

    Bytes frame;
    if (!m_queue.pop(frame, left)) {
      err = Error{ErrorKind::TIMEOUT, 0, "Timeout"};
      return false;
    }

    const uint16_t type = frame_command(frame);
    if (type == expected) {
      out = std::move(frame);
      return true;
    }

    log_msg(PLUGCTL_LOG_FLOW, "correlator", "skip frame type=0x%04x (want 0x%04x)", type, expected);
    if (!m_queue.push(std::move(frame))) {
      log_msg(PLUGCTL_LOG_FLOW, "correlator", "queue full, unmatched frame dropped");
    }
    if (clock::now() >= deadline) {
      err = Error{ErrorKind::TIMEOUT, 0, "Check time"};
      return false;
    }
    std::this_thread::yield();
  }
}

} // namespace plugctl
