#include "dispatcher.hpp"

#include <iostream>
#include <utility>
#include <variant>

namespace dispatch {

Dispatcher::Dispatcher(pose::PoseCorrelator *correlator,
                       pose::PoseFormat format)
    : correlator_(correlator), format_(format) {}

void Dispatcher::on_frame(reassembly::Frame &&frame) {
  if (queue_ != nullptr) {
    queue_->push(std::move(frame));
  } else if (frame_cb_) {
    frame_cb_(std::move(frame));
  } else {
    ++unrouted_frames_;
    return;
  }
  ++frames_dispatched_;
}

bool Dispatcher::on_pose_message(const uint8_t *data, std::size_t len) {
  pose::PoseMessage msg = pose::decode_pose_message(data, len, format_);

  if (auto *sample = std::get_if<pose::PoseSample>(&msg)) {
    if (correlator_ == nullptr) {
      return false;
    }
    return correlator_->observe(*sample);
  }

  const auto &unknown = std::get<pose::UnknownMessage>(msg);
  ++unknown_messages_;
  if (unknown_cb_) {
    unknown_cb_(unknown);
  } else {
    std::cerr << "[Dispatcher] unrecognized side-channel message ("
              << unknown.raw.size() << " bytes): " << unknown.reason << "\n";
  }
  return false;
}

void Dispatcher::on_connection_ended(const session::ConnectionOutcome &outcome) {
  if (ended_cb_) {
    ended_cb_(outcome);
  }
}

uint64_t Dispatcher::dropped_frames() const {
  uint64_t n = unrouted_frames_.load();
  if (queue_ != nullptr) {
    n += queue_->dropped();
  }
  return n;
}

} // namespace dispatch
