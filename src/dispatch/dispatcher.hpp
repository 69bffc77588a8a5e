#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

#include "dispatch/frame_queue.hpp"
#include "pose/pose_codec.hpp"
#include "pose/pose_correlator.hpp"
#include "reassembly/frame.hpp"
#include "session/connection_outcome.hpp"

namespace dispatch {

using FrameCallback = std::function<void(reassembly::Frame &&)>;
using UnknownMessageCallback = std::function<void(const pose::UnknownMessage &)>;
using ConnectionEndedCallback =
    std::function<void(const session::ConnectionOutcome &)>;

/**
 * @brief Routes decoded frames and side-channel messages to the consumer.
 *
 * Frames go to a FrameQueue when one is attached, otherwise to the frame
 * callback. Pose messages are decoded in the configured format; poses feed
 * the correlator and everything else reaches the unknown-message callback.
 * With no unknown-message callback the message is logged.
 *
 * Callbacks are set before any connection starts and may be invoked from
 * several connection threads at once.
 */
class Dispatcher {
public:
  // correlator may be null when this side does not track poses.
  Dispatcher(pose::PoseCorrelator *correlator, pose::PoseFormat format);

  void set_frame_queue(FrameQueue *queue) { queue_ = queue; }
  void set_frame_callback(FrameCallback cb) { frame_cb_ = std::move(cb); }
  void set_unknown_message_callback(UnknownMessageCallback cb) {
    unknown_cb_ = std::move(cb);
  }
  void set_connection_ended_callback(ConnectionEndedCallback cb) {
    ended_cb_ = std::move(cb);
  }

  void on_frame(reassembly::Frame &&frame);

  // Returns true if the message was a pose the correlator accepted.
  bool on_pose_message(const uint8_t *data, std::size_t len);

  void on_connection_ended(const session::ConnectionOutcome &outcome);

  uint64_t frames_dispatched() const { return frames_dispatched_.load(); }
  uint64_t dropped_frames() const;
  uint64_t unknown_messages() const { return unknown_messages_.load(); }
  pose::PoseFormat pose_format() const { return format_; }

private:
  pose::PoseCorrelator *correlator_;
  pose::PoseFormat format_;
  FrameQueue *queue_ = nullptr;
  FrameCallback frame_cb_;
  UnknownMessageCallback unknown_cb_;
  ConnectionEndedCallback ended_cb_;

  std::atomic<uint64_t> frames_dispatched_{0};
  std::atomic<uint64_t> unrouted_frames_{0};
  std::atomic<uint64_t> unknown_messages_{0};
};

} // namespace dispatch
