#include "response_queue.hpp"

namespace plugctl {

bool ResponseQueue::push(Bytes frame) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_frames.size() >= m_depth) {
      m_dropped++;
      return false;
    }
    m_frames.push_back(std::move(frame));
  }
  m_cv.notify_one();
  return true;
}

bool ResponseQueue::pop(Bytes& out, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(m_mutex);
  if (!m_cv.wait_for(lock, timeout, [this] { return !m_frames.empty(); })) {
    return false;
  }
  out = std::move(m_frames.front());
  m_frames.pop_front();
  return true;
}

void ResponseQueue::clear() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_frames.clear();
  m_dropped = 0;
}

size_t ResponseQueue::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_frames.size();
}

size_t ResponseQueue::dropped() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_dropped;
}

} // namespace plugctl
