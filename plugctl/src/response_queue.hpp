#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "protocol.hpp"

namespace plugctl {

static constexpr size_t kResponseQueueDepth = 1000;

// Bounded FIFO of checksum-valid frames. One producer (the listener) and one
// consumer at a time (whichever caller is waiting).
class ResponseQueue {
public:
  explicit ResponseQueue(size_t depth = kResponseQueueDepth) : m_depth(depth) {}

  // Never blocks; false (frame dropped) when full.
  bool push(Bytes frame);
  // Waits up to `timeout` for a frame; false on timeout.
  bool pop(Bytes& out, std::chrono::milliseconds timeout);
  // Drops every queued frame and resets the drop counter.
  void clear();

  size_t size() const;
  size_t depth() const { return m_depth; }
  size_t dropped() const;

private:
  const size_t m_depth;
  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::deque<Bytes> m_frames;
  size_t m_dropped = 0;
};

} // namespace plugctl
