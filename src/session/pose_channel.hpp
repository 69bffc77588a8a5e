#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "dispatch/dispatcher.hpp"
#include "session/connection_outcome.hpp"
#include "transport/byte_stream.hpp"

namespace session {

// Reader loop for the pose side channel. Each length-prefixed message is
// handed to the dispatcher, which decodes it and updates the correlator.
class PoseChannel {
public:
  PoseChannel(std::unique_ptr<transport::ByteStream> stream,
              dispatch::Dispatcher &dispatcher, uint32_t max_message_bytes);

  PoseChannel(const PoseChannel &) = delete;
  PoseChannel &operator=(const PoseChannel &) = delete;

  // Blocks until the stream ends. ConnectionOutcome::frames counts messages.
  ConnectionOutcome run();

  // Closes the stream. Idempotent.
  void cancel();

  uint64_t messages() const { return messages_.load(); }
  uint64_t accepted() const { return accepted_.load(); }

private:
  std::unique_ptr<transport::ByteStream> stream_;
  dispatch::Dispatcher &dispatcher_;
  uint32_t max_message_bytes_;
  std::string peer_;

  std::atomic<bool> cancelled_{false};
  std::atomic<uint64_t> messages_{0};
  std::atomic<uint64_t> accepted_{0};
};

} // namespace session
