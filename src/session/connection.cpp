#include "connection.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "errors.hpp"

namespace session {

const char *connection_state_name(ConnectionState state) {
  switch (state) {
  case ConnectionState::Connecting:
    return "connecting";
  case ConnectionState::Open:
    return "open";
  case ConnectionState::Closing:
    return "closing";
  case ConnectionState::Closed:
    return "closed";
  }
  return "unknown";
}

Connection::Connection(std::unique_ptr<transport::ByteStream> stream,
                       const reassembly::SizingPolicy &policy,
                       std::size_t buffer_capacity,
                       dispatch::Dispatcher &dispatcher,
                       uint64_t log_every_n_frames)
    : stream_(std::move(stream)), reassembler_(policy, buffer_capacity),
      dispatcher_(dispatcher), log_every_n_frames_(log_every_n_frames),
      peer_(stream_->describe()) {}

void Connection::on_frame(reassembly::Frame &&frame) {
  if (log_every_n_frames_ > 0 && frame.sequence % log_every_n_frames_ == 0) {
    std::cerr << "[Connection] " << peer_ << ": " << frame.sequence
              << " frames received (last " << frame.width << "x"
              << frame.height << ", pose_id=" << frame.pose_id << ")\n";
  }
  dispatcher_.on_frame(std::move(frame));
}

ConnectionOutcome Connection::run() {
  ConnectionOutcome outcome;
  outcome.peer = peer_;

  ConnectionState expected = ConnectionState::Connecting;
  state_.compare_exchange_strong(expected, ConnectionState::Open);

  const reassembly::FrameSink sink = [this](reassembly::Frame &&f) {
    on_frame(std::move(f));
  };

  std::vector<uint8_t> chunk;
  std::string err;

  try {
    while (true) {
      if (cancelled_.load()) {
        outcome.reason = EndReason::Cancelled;
        break;
      }

      const std::size_t room = reassembler_.prepare_read();
      const transport::ReadStatus st = stream_->read_some(chunk, room, err);

      if (st == transport::ReadStatus::Data) {
        reassembler_.ingest(chunk.data(), chunk.size(), sink);
        continue;
      }

      if (cancelled_.load()) {
        outcome.reason = EndReason::Cancelled;
        break;
      }

      if (st == transport::ReadStatus::EndOfStream) {
        outcome.unread_bytes = reassembler_.finish();
        outcome.reason = outcome.unread_bytes > 0
                             ? EndReason::EndWithUnreadBytes
                             : EndReason::CleanEnd;
      } else if (st == transport::ReadStatus::Timeout) {
        outcome.reason = EndReason::TransportFailure;
        outcome.message = "idle timeout: " + err;
      } else {
        outcome.reason = EndReason::TransportFailure;
        outcome.message = err;
      }
      break;
    }
  } catch (const frame_relay::ProtocolError &e) {
    outcome.reason = EndReason::ProtocolFailure;
    outcome.message = e.what();
    outcome.unread_bytes = reassembler_.pending_bytes();
  } catch (const std::exception &e) {
    // Consumer callback or frame copy failure.
    outcome.reason = EndReason::ProtocolFailure;
    outcome.message = std::string("frame handling failed: ") + e.what();
    outcome.unread_bytes = reassembler_.pending_bytes();
  }

  state_.store(ConnectionState::Closing);
  stream_->close();
  state_.store(ConnectionState::Closed);

  outcome.frames = reassembler_.frames_emitted();
  log_outcome(outcome);
  dispatcher_.on_connection_ended(outcome);
  return outcome;
}

void Connection::cancel() {
  cancelled_.store(true);
  ConnectionState expected = ConnectionState::Open;
  state_.compare_exchange_strong(expected, ConnectionState::Closing);
  stream_->close();
}

void Connection::log_outcome(const ConnectionOutcome &outcome) const {
  std::cerr << "[Connection] " << peer_ << ": "
            << end_reason_name(outcome.reason) << " after " << outcome.frames
            << " frames";
  if (outcome.unread_bytes > 0) {
    std::cerr << ", " << outcome.unread_bytes << " unread bytes";
  }
  if (!outcome.message.empty()) {
    std::cerr << " (" << outcome.message << ")";
  }
  std::cerr << "\n";
}

} // namespace session
