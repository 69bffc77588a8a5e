#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "transport/byte_stream.hpp"

namespace transport {

// Default cap for side-channel messages (pose updates are tiny)
constexpr uint32_t kMaxSideChannelBytes = 64u * 1024u;

// Why the last read_frame() returned false.
enum class FrameReadFailure {
  None,      // clean EOF before any byte of a message
  Truncated, // stream ended inside a message
  BadLength, // zero or over the limit
  Stream     // read error, idle timeout or local close
};

// Reads length-prefixed messages (uint32_le + payload bytes) from a
// ByteStream. Bytes read past the end of one message are kept for the next.
class FramedReader {
public:
  explicit FramedReader(ByteStream &stream) : stream_(stream) {}

  // Reads one length-prefixed message.
  // Returns:
  //  - true  => message read successfully into out
  //  - false => EOF (err empty) or fatal protocol/IO error (err non-empty)
  bool read_frame(std::vector<uint8_t> &out, std::string &err,
                  uint32_t max_len = kMaxSideChannelBytes);

  FrameReadFailure last_failure() const { return last_failure_; }

private:
  // Fills buf with exactly n bytes. Sets got to the count actually copied
  // when the stream ends early.
  bool read_exact(uint8_t *buf, std::size_t n, std::size_t &got,
                  std::string &err);

  ByteStream &stream_;
  std::vector<uint8_t> pending_;
  std::size_t pending_pos_ = 0;
  std::vector<uint8_t> scratch_;
  FrameReadFailure last_failure_ = FrameReadFailure::None;
};

// Writes one length-prefixed message.
// Returns false on error and sets err.
bool write_frame(ByteStream &out, const uint8_t *data, std::size_t len,
                 std::string &err, uint32_t max_len = kMaxSideChannelBytes);

} // namespace transport
