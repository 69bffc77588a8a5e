#include "wire_format.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>

#include "errors.hpp"

namespace wire {

using frame_relay::ProtocolError;

// Largest integer a f64 pose id carries exactly.
static constexpr uint64_t kMaxExactPoseId = (1ULL << 53);

uint32_t decode_u32_le(const uint8_t *b) {
  return (static_cast<uint32_t>(b[0])) | (static_cast<uint32_t>(b[1]) << 8) |
         (static_cast<uint32_t>(b[2]) << 16) |
         (static_cast<uint32_t>(b[3]) << 24);
}

void encode_u32_le(uint32_t v, uint8_t *b) {
  b[0] = static_cast<uint8_t>(v & 0xFF);
  b[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
  b[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
  b[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
}

double decode_f64_le(const uint8_t *b) {
  uint64_t bits = 0;
  for (int i = 0; i < 8; ++i) {
    bits |= static_cast<uint64_t>(b[i]) << (i * 8);
  }
  double v;
  std::memcpy(&v, &bits, sizeof(v));
  return v;
}

void encode_f64_le(double v, uint8_t *b) {
  uint64_t bits;
  std::memcpy(&bits, &v, sizeof(bits));
  for (int i = 0; i < 8; ++i) {
    b[i] = static_cast<uint8_t>((bits >> (i * 8)) & 0xFF);
  }
}

std::vector<uint8_t> encode_chunk_prefix(uint32_t chunk_len) {
  std::vector<uint8_t> out(kChunkPrefixBytes);
  encode_u32_le(chunk_len, out.data());
  return out;
}

std::size_t header_size(HeaderVariant variant) {
  switch (variant) {
  case HeaderVariant::Fixed:
    return 0;
  case HeaderVariant::Dimensions:
    return kDimensionsHeaderBytes;
  case HeaderVariant::Basic:
    return kBasicHeaderBytes;
  case HeaderVariant::Stamped:
    return kStampedHeaderBytes;
  }
  return 0;
}

bool has_chunk_prefixes(HeaderVariant variant) {
  return variant == HeaderVariant::Basic || variant == HeaderVariant::Stamped;
}

HeaderVariant parse_header_variant(const std::string &name) {
  if (name == "fixed") {
    return HeaderVariant::Fixed;
  } else if (name == "dimensions") {
    return HeaderVariant::Dimensions;
  } else if (name == "basic") {
    return HeaderVariant::Basic;
  } else if (name == "stamped") {
    return HeaderVariant::Stamped;
  } else {
    throw std::runtime_error("Invalid header variant: '" + name +
                             "'. Valid values: fixed, dimensions, basic, "
                             "stamped");
  }
}

const char *header_variant_name(HeaderVariant variant) {
  switch (variant) {
  case HeaderVariant::Fixed:
    return "fixed";
  case HeaderVariant::Dimensions:
    return "dimensions";
  case HeaderVariant::Basic:
    return "basic";
  case HeaderVariant::Stamped:
    return "stamped";
  }
  return "unknown";
}

uint64_t rgba_payload_bytes(uint32_t width, uint32_t height) {
  return static_cast<uint64_t>(width) * static_cast<uint64_t>(height) *
         kBytesPerPixel;
}

uint32_t chunk_count_for(uint64_t payload_length, uint32_t max_chunk_bytes) {
  if (payload_length == 0) {
    return 0;
  }
  if (max_chunk_bytes == 0) {
    return 1;
  }
  return static_cast<uint32_t>((payload_length + max_chunk_bytes - 1) /
                               max_chunk_bytes);
}

uint64_t max_message_bytes(HeaderVariant variant, const WireLimits &limits,
                           uint32_t max_chunk_bytes) {
  const uint64_t payload =
      rgba_payload_bytes(limits.max_width, limits.max_height);
  uint64_t total = header_size(variant) + payload;
  if (has_chunk_prefixes(variant)) {
    total += kChunkPrefixBytes *
             static_cast<uint64_t>(chunk_count_for(payload, max_chunk_bytes));
  }
  return total;
}

std::vector<uint8_t> encode_header(HeaderVariant variant,
                                   const FrameHeader &header) {
  std::vector<uint8_t> out(header_size(variant), 0);

  switch (variant) {
  case HeaderVariant::Fixed:
    break;
  case HeaderVariant::Dimensions:
    encode_u32_le(header.width, out.data());
    encode_u32_le(header.height, out.data() + 4);
    break;
  case HeaderVariant::Basic:
    encode_u32_le(header.width, out.data());
    encode_u32_le(header.height, out.data() + 4);
    encode_u32_le(header.payload_length, out.data() + 8);
    encode_u32_le(header.chunk_count, out.data() + 12);
    break;
  case HeaderVariant::Stamped:
    if (header.pose_id > kMaxExactPoseId) {
      throw ProtocolError("pose_id " + std::to_string(header.pose_id) +
                          " not representable as f64");
    }
    encode_u32_le(header.width, out.data());
    encode_u32_le(header.height, out.data() + 4);
    encode_f64_le(header.frame_timestamp, out.data() + 8);
    encode_f64_le(header.pose_timestamp, out.data() + 16);
    encode_f64_le(static_cast<double>(header.pose_id), out.data() + 24);
    break;
  }

  return out;
}

static void validate_dimensions(const FrameHeader &h,
                                const WireLimits &limits) {
  if (h.width == 0 || h.height == 0) {
    throw ProtocolError("malformed header: zero dimension " +
                        std::to_string(h.width) + "x" +
                        std::to_string(h.height));
  }
  if (h.width > limits.max_width || h.height > limits.max_height) {
    throw ProtocolError("malformed header: dimensions " +
                        std::to_string(h.width) + "x" +
                        std::to_string(h.height) + " exceed limit " +
                        std::to_string(limits.max_width) + "x" +
                        std::to_string(limits.max_height));
  }
}

static uint32_t implied_payload(const FrameHeader &h) {
  const uint64_t payload = rgba_payload_bytes(h.width, h.height);
  if (payload > std::numeric_limits<uint32_t>::max()) {
    throw ProtocolError("malformed header: payload does not fit u32", payload,
                        std::numeric_limits<uint32_t>::max());
  }
  return static_cast<uint32_t>(payload);
}

FrameHeader decode_header(HeaderVariant variant, const uint8_t *data,
                          std::size_t len, const WireLimits &limits) {
  if (variant == HeaderVariant::Fixed) {
    throw std::invalid_argument("fixed variant carries no header");
  }

  const std::size_t need = header_size(variant);
  if (len < need) {
    throw ProtocolError("malformed header: insufficient bytes", need, len);
  }

  FrameHeader h;
  h.width = decode_u32_le(data);
  h.height = decode_u32_le(data + 4);
  validate_dimensions(h, limits);

  switch (variant) {
  case HeaderVariant::Fixed:
    break;

  case HeaderVariant::Dimensions:
    h.payload_length = implied_payload(h);
    h.chunk_count = 1;
    break;

  case HeaderVariant::Basic: {
    h.payload_length = decode_u32_le(data + 8);
    h.chunk_count = decode_u32_le(data + 12);

    const uint64_t rgba = rgba_payload_bytes(h.width, h.height);
    if (h.payload_length == 0) {
      throw ProtocolError("malformed header: empty payload");
    }
    if (h.payload_length > rgba) {
      throw ProtocolError(
          "malformed header: payload_length exceeds width*height*4",
          h.payload_length, rgba);
    }
    if (h.chunk_count == 0 || h.chunk_count > h.payload_length) {
      throw ProtocolError("malformed header: chunk_count " +
                          std::to_string(h.chunk_count) +
                          " inconsistent with payload_length " +
                          std::to_string(h.payload_length));
    }
    break;
  }

  case HeaderVariant::Stamped: {
    h.payload_length = implied_payload(h);
    h.frame_timestamp = decode_f64_le(data + 8);
    h.pose_timestamp = decode_f64_le(data + 16);
    const double pose_id = decode_f64_le(data + 24);

    if (!std::isfinite(h.frame_timestamp) ||
        !std::isfinite(h.pose_timestamp)) {
      throw ProtocolError("malformed header: non-finite timestamp");
    }
    if (!std::isfinite(pose_id) || pose_id < 0.0 ||
        pose_id != std::floor(pose_id) ||
        pose_id > static_cast<double>(kMaxExactPoseId)) {
      throw ProtocolError("malformed header: invalid pose_id");
    }
    h.pose_id = static_cast<uint64_t>(pose_id);
    break;
  }
  }

  return h;
}

} // namespace wire
