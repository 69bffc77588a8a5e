#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "reassembly/connection_buffer.hpp"
#include "reassembly/frame.hpp"
#include "wire/wire_format.hpp"

namespace reassembly {

// How message boundaries are found in the byte stream.
struct SizingPolicy {
  wire::HeaderVariant variant = wire::HeaderVariant::Stamped;
  wire::WireLimits limits;
  // Fixed only: dimensions agreed out of band.
  uint32_t fixed_width = 0;
  uint32_t fixed_height = 0;

  // Every message is exactly width*height*4 bytes, no header.
  static SizingPolicy fixed(uint32_t width, uint32_t height);
  // Header of the given variant, then the payload (chunked for Basic/Stamped).
  static SizingPolicy header_prefixed(wire::HeaderVariant variant,
                                      const wire::WireLimits &limits);

  uint64_t fixed_message_bytes() const;
};

using FrameSink = std::function<void(Frame &&)>;

/**
 * @brief Turns an ordered byte stream into validated frames.
 *
 * Each ingest() call takes exactly the bytes of one read, however they are
 * split. The per-read steps are:
 *   1. compact the buffer when read_pos > 0
 *   2. fail if the buffer is still full
 *   3. append the bytes (fail if they do not fit)
 *   4. extract every complete message and emit it
 *
 * Any ProtocolError is fatal for the connection; there is no resync. Frames
 * emitted before the error are unaffected.
 */
class FrameReassembler {
public:
  // Throws frame_relay::AllocationError if the buffer cannot be allocated and
  // std::invalid_argument for an unusable fixed policy.
  FrameReassembler(const SizingPolicy &policy, std::size_t buffer_capacity);

  // Steps 1 and 2. Returns how many bytes the next read may deliver.
  // Throws frame_relay::ProtocolError when no space can be freed.
  std::size_t prepare_read();

  // Steps 1 to 4 for one read. Returns the number of frames emitted.
  // Throws frame_relay::ProtocolError.
  std::size_t ingest(const uint8_t *data, std::size_t len,
                     const FrameSink &sink);

  // Call on end of stream. Returns the bytes left unconsumed (a partial
  // message) and logs a warning when there are any.
  std::size_t finish();

  std::size_t pending_bytes() const { return buffer_.unread(); }
  std::size_t capacity() const { return buffer_.capacity(); }
  uint64_t frames_emitted() const { return frames_emitted_; }
  const SizingPolicy &policy() const { return policy_; }

private:
  // Progress through a header-prefixed message whose header has been parsed.
  // Offsets are relative to the buffer's read position.
  struct PendingMessage {
    bool active = false;
    wire::FrameHeader header;
    std::size_t cursor = 0;        // next unparsed byte
    uint32_t chunk_len = 0;        // body length of the prefix just parsed
    bool in_chunk = false;         // prefix parsed, body not yet copied
    uint64_t payload_seen = 0;     // payload bytes covered by parsed prefixes
    uint32_t chunks_seen = 0;
    std::vector<uint8_t> pixels;
  };

  std::size_t extract(const FrameSink &sink);
  bool extract_fixed(const FrameSink &sink);
  bool extract_prefixed(const FrameSink &sink);
  bool start_message();
  void check_chunk(uint32_t chunk_len);
  void emit(Frame &&frame, std::size_t consumed, const FrameSink &sink);

  SizingPolicy policy_;
  ConnectionBuffer buffer_;
  PendingMessage pending_;
  uint64_t frames_emitted_ = 0;
};

} // namespace reassembly
