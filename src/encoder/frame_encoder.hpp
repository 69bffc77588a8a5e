#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "pose/pose_correlator.hpp"
#include "transport/byte_stream.hpp"
#include "wire/wire_format.hpp"

namespace encoder {

struct EncoderOptions {
  wire::HeaderVariant variant = wire::HeaderVariant::Stamped;
  uint32_t max_chunk_bytes = 0; // 0 = whole payload in one chunk
  // Fixed variant only: the agreed frame size.
  uint32_t fixed_width = 0;
  uint32_t fixed_height = 0;
};

/**
 * @brief Turns raw pixel buffers into wire messages.
 *
 * The Stamped variant reads the correlator at encode time. With no pose known
 * yet the frame is stamped pose_timestamp = frame_timestamp, pose_id = 0.
 * Payloads larger than max_chunk_bytes are split into several length-prefixed
 * chunks under a single header (Basic and Stamped).
 */
class FrameEncoder {
public:
  // correlator may be null; frames are then always stamped with the fallback.
  FrameEncoder(const EncoderOptions &options,
               const pose::PoseCorrelator *correlator);

  // Throws std::invalid_argument when the buffer does not match the
  // dimensions the variant requires.
  std::vector<uint8_t> encode(const uint8_t *pixels, std::size_t len,
                              uint32_t width, uint32_t height,
                              double frame_timestamp);

  // encode() followed by one write. Throws frame_relay::TransportError on a
  // write failure.
  void send(transport::ByteStream &stream, const uint8_t *pixels,
            std::size_t len, uint32_t width, uint32_t height,
            double frame_timestamp);

  const EncoderOptions &options() const { return options_; }
  uint64_t frames_encoded() const { return frames_encoded_; }

private:
  void validate(std::size_t len, uint32_t width, uint32_t height) const;
  void append_chunks(std::vector<uint8_t> &out, const uint8_t *pixels,
                     std::size_t len) const;

  EncoderOptions options_;
  const pose::PoseCorrelator *correlator_;
  uint64_t frames_encoded_ = 0;
};

} // namespace encoder
