#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "reassembly/frame.hpp"

namespace dispatch {

/**
 * @brief Bounded hand-off from connection threads to the consumer.
 *
 * push() never blocks: when the queue is full the oldest frame is dropped so
 * a slow consumer cannot stall reassembly. Frames are moved in and out.
 */
class FrameQueue {
public:
  // depth must be at least 1.
  explicit FrameQueue(std::size_t depth);

  FrameQueue(const FrameQueue &) = delete;
  FrameQueue &operator=(const FrameQueue &) = delete;

  // Returns false if a frame was discarded (oldest on overflow, or the given
  // frame when the queue is closed).
  bool push(reassembly::Frame &&frame);

  // Waits up to timeout. nullopt on timeout, or once closed and drained.
  std::optional<reassembly::Frame> pop(std::chrono::milliseconds timeout);

  // Wakes all waiters; later pushes are discarded.
  void close();

  bool closed() const;
  std::size_t size() const;
  std::size_t depth() const { return depth_; }
  uint64_t dropped() const;

private:
  const std::size_t depth_;
  std::deque<reassembly::Frame> frames_;
  bool closed_ = false;
  uint64_t dropped_ = 0;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

} // namespace dispatch
