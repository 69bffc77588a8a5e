#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "dispatch/dispatcher.hpp"
#include "reassembly/frame_reassembler.hpp"
#include "session/connection_outcome.hpp"
#include "transport/byte_stream.hpp"

namespace session {

enum class ConnectionState { Connecting, Open, Closing, Closed };

const char *connection_state_name(ConnectionState state);

/**
 * @brief Per-connection context: the stream, its reassembler and buffer.
 *
 * run() is the only reader of the stream. It loops read -> ingest until the
 * stream ends or fails, then closes the stream, reports the outcome to the
 * dispatcher and returns it. The buffer is released with the Connection.
 *
 * Thread Safety:
 *   cancel() may be called from any thread while run() is active.
 */
class Connection {
public:
  // Throws frame_relay::AllocationError if the buffer cannot be allocated.
  Connection(std::unique_ptr<transport::ByteStream> stream,
             const reassembly::SizingPolicy &policy,
             std::size_t buffer_capacity, dispatch::Dispatcher &dispatcher,
             uint64_t log_every_n_frames = 0);

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  ConnectionOutcome run();

  // Closes the stream. Idempotent.
  void cancel();

  ConnectionState state() const { return state_.load(); }
  const std::string &peer() const { return peer_; }
  uint64_t frames() const { return reassembler_.frames_emitted(); }

private:
  void on_frame(reassembly::Frame &&frame);
  void log_outcome(const ConnectionOutcome &outcome) const;

  std::unique_ptr<transport::ByteStream> stream_;
  reassembly::FrameReassembler reassembler_;
  dispatch::Dispatcher &dispatcher_;
  uint64_t log_every_n_frames_;
  std::string peer_;

  std::atomic<ConnectionState> state_{ConnectionState::Connecting};
  std::atomic<bool> cancelled_{false};
};

} // namespace session
