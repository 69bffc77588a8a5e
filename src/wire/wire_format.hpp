#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace wire {

// Header layout shared by both ends. Chosen per deployment, never negotiated.
enum class HeaderVariant {
  Fixed,      // no header, every message is exactly N payload bytes
  Dimensions, // legacy 8 bytes: width, height; payload width*height*4
  Basic,      // 16 bytes: width, height, payload_length, chunk_count
  Stamped     // 32 bytes: width, height, frame_ts, pose_ts, pose_id
};

constexpr uint32_t kBytesPerPixel = 4; // uncompressed RGBA
constexpr std::size_t kChunkPrefixBytes = 4;
constexpr std::size_t kDimensionsHeaderBytes = 8;
constexpr std::size_t kBasicHeaderBytes = 16;
constexpr std::size_t kStampedHeaderBytes = 32;

// Upper bounds a decoder accepts for declared dimensions.
struct WireLimits {
  uint32_t max_width = 8192;
  uint32_t max_height = 8192;
};

struct FrameHeader {
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t payload_length = 0;
  // Basic only. Dimensions has no chunk prefixes; Stamped ends the chunk
  // sequence when the lengths add up to payload_length.
  uint32_t chunk_count = 0;
  double frame_timestamp = 0.0;
  double pose_timestamp = 0.0;
  uint64_t pose_id = 0;
};

// Little-endian primitives.
uint32_t decode_u32_le(const uint8_t *b);
void encode_u32_le(uint32_t v, uint8_t *b);
double decode_f64_le(const uint8_t *b);
void encode_f64_le(double v, uint8_t *b);

// The u32 length prefix that precedes each chunk body.
std::vector<uint8_t> encode_chunk_prefix(uint32_t chunk_len);

// Size of the fixed preamble for the variant (0 for Fixed).
std::size_t header_size(HeaderVariant variant);

// True when each chunk carries a u32 length prefix.
bool has_chunk_prefixes(HeaderVariant variant);

// Parse/format a variant name: fixed, dimensions, basic, stamped.
// Throws std::runtime_error on an unknown name.
HeaderVariant parse_header_variant(const std::string &name);
const char *header_variant_name(HeaderVariant variant);

// width * height * kBytesPerPixel without overflow.
uint64_t rgba_payload_bytes(uint32_t width, uint32_t height);

// Largest message a conforming sender can produce under the limits.
// max_chunk_bytes == 0 means a single chunk.
uint64_t max_message_bytes(HeaderVariant variant, const WireLimits &limits,
                           uint32_t max_chunk_bytes);

// Number of chunks a payload is split into for the given chunk size.
uint32_t chunk_count_for(uint64_t payload_length, uint32_t max_chunk_bytes);

// Serialize the header for the variant. Fixed produces an empty vector.
// Throws frame_relay::ProtocolError if the header cannot be represented.
std::vector<uint8_t> encode_header(HeaderVariant variant,
                                   const FrameHeader &header);

// Parse and validate a header from the first header_size(variant) bytes.
// Throws frame_relay::ProtocolError (malformed) when len is short or the
// fields are structurally inconsistent.
FrameHeader decode_header(HeaderVariant variant, const uint8_t *data,
                          std::size_t len, const WireLimits &limits);

} // namespace wire
