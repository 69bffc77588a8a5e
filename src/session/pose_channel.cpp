#include "pose_channel.hpp"

#include <iostream>
#include <utility>
#include <vector>

#include "transport/framed_stream.hpp"

namespace session {

PoseChannel::PoseChannel(std::unique_ptr<transport::ByteStream> stream,
                         dispatch::Dispatcher &dispatcher,
                         uint32_t max_message_bytes)
    : stream_(std::move(stream)), dispatcher_(dispatcher),
      max_message_bytes_(max_message_bytes), peer_(stream_->describe()) {}

ConnectionOutcome PoseChannel::run() {
  ConnectionOutcome outcome;
  outcome.peer = peer_;

  transport::FramedReader reader(*stream_);
  std::vector<uint8_t> msg;
  std::string err;

  while (true) {
    if (reader.read_frame(msg, err, max_message_bytes_)) {
      ++messages_;
      if (dispatcher_.on_pose_message(msg.data(), msg.size())) {
        ++accepted_;
      }
      continue;
    }

    if (cancelled_.load()) {
      outcome.reason = EndReason::Cancelled;
      break;
    }

    switch (reader.last_failure()) {
    case transport::FrameReadFailure::None:
      outcome.reason = EndReason::CleanEnd;
      break;
    case transport::FrameReadFailure::Truncated:
      outcome.reason = EndReason::EndWithUnreadBytes;
      break;
    case transport::FrameReadFailure::BadLength:
      outcome.reason = EndReason::ProtocolFailure;
      break;
    case transport::FrameReadFailure::Stream:
      outcome.reason = EndReason::TransportFailure;
      break;
    }
    outcome.message = err;
    break;
  }

  stream_->close();
  outcome.frames = messages_.load();

  std::cerr << "[PoseChannel] " << peer_ << ": "
            << end_reason_name(outcome.reason) << " after " << outcome.frames
            << " messages (" << accepted_.load() << " accepted)";
  if (!outcome.message.empty()) {
    std::cerr << ": " << outcome.message;
  }
  std::cerr << "\n";
  return outcome;
}

void PoseChannel::cancel() {
  cancelled_.store(true);
  stream_->close();
}

} // namespace session
