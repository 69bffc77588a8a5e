#include "frame_queue.hpp"

#include <stdexcept>
#include <utility>

namespace dispatch {

FrameQueue::FrameQueue(std::size_t depth) : depth_(depth) {
  if (depth_ == 0) {
    throw std::invalid_argument("frame queue depth must be at least 1");
  }
}

bool FrameQueue::push(reassembly::Frame &&frame) {
  bool kept_all = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      ++dropped_;
      return false;
    }
    if (frames_.size() >= depth_) {
      frames_.pop_front();
      ++dropped_;
      kept_all = false;
    }
    frames_.push_back(std::move(frame));
  }
  cv_.notify_one();
  return kept_all;
}

std::optional<reassembly::Frame>
FrameQueue::pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !frames_.empty(); });
  if (frames_.empty()) {
    return std::nullopt;
  }
  reassembly::Frame f = std::move(frames_.front());
  frames_.pop_front();
  return f;
}

void FrameQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool FrameQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t FrameQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_.size();
}

uint64_t FrameQueue::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

} // namespace dispatch
