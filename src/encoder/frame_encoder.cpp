#include "frame_encoder.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include "errors.hpp"

namespace encoder {

using wire::HeaderVariant;

FrameEncoder::FrameEncoder(const EncoderOptions &options,
                           const pose::PoseCorrelator *correlator)
    : options_(options), correlator_(correlator) {
  if (options_.variant == HeaderVariant::Fixed &&
      (options_.fixed_width == 0 || options_.fixed_height == 0)) {
    throw std::invalid_argument(
        "fixed variant requires non-zero fixed_width and fixed_height");
  }
}

void FrameEncoder::validate(std::size_t len, uint32_t width,
                            uint32_t height) const {
  if (width == 0 || height == 0) {
    throw std::invalid_argument("frame dimensions must be non-zero");
  }

  if (options_.variant != HeaderVariant::Fixed &&
      len > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument("payload of " + std::to_string(len) +
                                " bytes does not fit a u32 length");
  }

  const uint64_t rgba = wire::rgba_payload_bytes(width, height);

  switch (options_.variant) {
  case HeaderVariant::Fixed:
    if (width != options_.fixed_width || height != options_.fixed_height) {
      throw std::invalid_argument(
          "frame " + std::to_string(width) + "x" + std::to_string(height) +
          " does not match fixed size " + std::to_string(options_.fixed_width) +
          "x" + std::to_string(options_.fixed_height));
    }
    if (len != rgba) {
      throw std::invalid_argument("fixed frame must be exactly " +
                                  std::to_string(rgba) + " bytes, got " +
                                  std::to_string(len));
    }
    break;

  case HeaderVariant::Basic:
    if (len == 0 || len > rgba) {
      throw std::invalid_argument("payload of " + std::to_string(len) +
                                  " bytes invalid for " +
                                  std::to_string(width) + "x" +
                                  std::to_string(height));
    }
    break;

  case HeaderVariant::Dimensions:
  case HeaderVariant::Stamped:
    if (len != rgba) {
      throw std::invalid_argument("payload must be width*height*4 = " +
                                  std::to_string(rgba) + " bytes, got " +
                                  std::to_string(len));
    }
    break;
  }
}

void FrameEncoder::append_chunks(std::vector<uint8_t> &out,
                                 const uint8_t *pixels,
                                 std::size_t len) const {
  const std::size_t max_chunk =
      options_.max_chunk_bytes == 0 ? len : options_.max_chunk_bytes;

  std::size_t offset = 0;
  while (offset < len) {
    const std::size_t n = std::min(max_chunk, len - offset);
    const auto prefix = wire::encode_chunk_prefix(static_cast<uint32_t>(n));
    out.insert(out.end(), prefix.begin(), prefix.end());
    out.insert(out.end(), pixels + offset, pixels + offset + n);
    offset += n;
  }
}

std::vector<uint8_t> FrameEncoder::encode(const uint8_t *pixels,
                                          std::size_t len, uint32_t width,
                                          uint32_t height,
                                          double frame_timestamp) {
  validate(len, width, height);

  wire::FrameHeader header;
  header.width = width;
  header.height = height;
  header.payload_length = static_cast<uint32_t>(len);
  header.chunk_count = wire::chunk_count_for(len, options_.max_chunk_bytes);
  header.frame_timestamp = frame_timestamp;
  header.pose_timestamp = frame_timestamp;
  header.pose_id = 0;

  if (options_.variant == HeaderVariant::Stamped && correlator_ != nullptr) {
    if (auto pose = correlator_->current()) {
      header.pose_timestamp = pose->timestamp;
      header.pose_id = pose->id.value_or(0);
    }
  }

  std::vector<uint8_t> out = wire::encode_header(options_.variant, header);

  if (wire::has_chunk_prefixes(options_.variant)) {
    out.reserve(out.size() + len +
                header.chunk_count * wire::kChunkPrefixBytes);
    append_chunks(out, pixels, len);
  } else {
    out.insert(out.end(), pixels, pixels + len);
  }

  ++frames_encoded_;
  return out;
}

void FrameEncoder::send(transport::ByteStream &stream, const uint8_t *pixels,
                        std::size_t len, uint32_t width, uint32_t height,
                        double frame_timestamp) {
  const std::vector<uint8_t> message =
      encode(pixels, len, width, height, frame_timestamp);

  std::string err;
  if (!stream.write_all(message.data(), message.size(), err)) {
    throw frame_relay::TransportError("write to " + stream.describe() +
                                      " failed: " + err);
  }
}

} // namespace encoder
