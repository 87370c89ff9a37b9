#pragma once
#include <chrono>
#include <cstdint>

#include "error.hpp"
#include "protocol.hpp"
#include "response_queue.hpp"

namespace plugctl {

// Matches queued frames to the request a caller is waiting on.
//
// Only correct with one command in flight per device: recv() takes whatever
// arrives next, and a wait that times out leaves a late reply in the queue
// for the next caller to pick up.
class ResponseCorrelator {
public:
  explicit ResponseCorrelator(ResponseQueue& queue) : m_queue(queue) {}

  // Next frame, unconditionally.
  bool recv(std::chrono::milliseconds timeout, Bytes& out, Error& err);

  // First frame whose tag at 0x26 equals `expected`. Others go back to the
  // tail of the queue, so a mismatched frame that keeps returning to the head
  // can starve the wait until the deadline.
  bool wait_for_type(uint16_t expected, std::chrono::milliseconds timeout, Bytes& out, Error& err);

private:
  ResponseQueue& m_queue;
};

} // namespace plugctl
