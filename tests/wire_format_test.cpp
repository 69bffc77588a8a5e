#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include "errors.hpp"
#include "wire/wire_format.hpp"

using frame_relay::ProtocolError;
using wire::FrameHeader;
using wire::HeaderVariant;

namespace {

std::vector<uint8_t> basic_header(uint32_t w, uint32_t h, uint32_t payload,
                                  uint32_t chunks) {
  FrameHeader hdr;
  hdr.width = w;
  hdr.height = h;
  hdr.payload_length = payload;
  hdr.chunk_count = chunks;
  return wire::encode_header(HeaderVariant::Basic, hdr);
}

std::vector<uint8_t> stamped_with_raw_pose_id(double pose_id) {
  FrameHeader hdr;
  hdr.width = 2;
  hdr.height = 2;
  std::vector<uint8_t> out = wire::encode_header(HeaderVariant::Stamped, hdr);
  wire::encode_f64_le(pose_id, out.data() + 24);
  return out;
}

} // namespace

TEST(WireFormatTest, LittleEndianPrimitives) {
  uint8_t b[8] = {};
  wire::encode_u32_le(0x04030201u, b);
  EXPECT_EQ(b[0], 0x01);
  EXPECT_EQ(b[1], 0x02);
  EXPECT_EQ(b[2], 0x03);
  EXPECT_EQ(b[3], 0x04);
  EXPECT_EQ(wire::decode_u32_le(b), 0x04030201u);

  const auto prefix = wire::encode_chunk_prefix(65536);
  ASSERT_EQ(prefix.size(), wire::kChunkPrefixBytes);
  EXPECT_EQ(wire::decode_u32_le(prefix.data()), 65536u);

  // 1.0 is 0x3FF0000000000000
  wire::encode_f64_le(1.0, b);
  EXPECT_EQ(b[6], 0xF0);
  EXPECT_EQ(b[7], 0x3F);
  EXPECT_DOUBLE_EQ(wire::decode_f64_le(b), 1.0);
}

TEST(WireFormatTest, HeaderSizes) {
  EXPECT_EQ(wire::header_size(HeaderVariant::Fixed), 0u);
  EXPECT_EQ(wire::header_size(HeaderVariant::Dimensions), 8u);
  EXPECT_EQ(wire::header_size(HeaderVariant::Basic), 16u);
  EXPECT_EQ(wire::header_size(HeaderVariant::Stamped), 32u);

  EXPECT_FALSE(wire::has_chunk_prefixes(HeaderVariant::Fixed));
  EXPECT_FALSE(wire::has_chunk_prefixes(HeaderVariant::Dimensions));
  EXPECT_TRUE(wire::has_chunk_prefixes(HeaderVariant::Basic));
  EXPECT_TRUE(wire::has_chunk_prefixes(HeaderVariant::Stamped));
}

TEST(WireFormatTest, BasicHeaderLayout) {
  const auto bytes = basic_header(640, 480, 1228800, 1);
  ASSERT_EQ(bytes.size(), 16u);
  EXPECT_EQ(wire::decode_u32_le(bytes.data()), 640u);
  EXPECT_EQ(wire::decode_u32_le(bytes.data() + 4), 480u);
  EXPECT_EQ(wire::decode_u32_le(bytes.data() + 8), 1228800u);
  EXPECT_EQ(wire::decode_u32_le(bytes.data() + 12), 1u);

  const FrameHeader h = wire::decode_header(HeaderVariant::Basic, bytes.data(),
                                            bytes.size(), wire::WireLimits{});
  EXPECT_EQ(h.width, 640u);
  EXPECT_EQ(h.height, 480u);
  EXPECT_EQ(h.payload_length, 1228800u);
  EXPECT_EQ(h.chunk_count, 1u);
}

TEST(WireFormatTest, StampedHeaderCarriesTimestampsAndPoseId) {
  FrameHeader in;
  in.width = 1296;
  in.height = 1296;
  in.frame_timestamp = 1234.5;
  in.pose_timestamp = 1234.25;
  in.pose_id = 987654321;

  const auto bytes = wire::encode_header(HeaderVariant::Stamped, in);
  ASSERT_EQ(bytes.size(), 32u);

  const FrameHeader out = wire::decode_header(
      HeaderVariant::Stamped, bytes.data(), bytes.size(), wire::WireLimits{});
  EXPECT_EQ(out.width, 1296u);
  EXPECT_EQ(out.height, 1296u);
  EXPECT_EQ(out.payload_length, 1296u * 1296u * 4u);
  EXPECT_DOUBLE_EQ(out.frame_timestamp, 1234.5);
  EXPECT_DOUBLE_EQ(out.pose_timestamp, 1234.25);
  EXPECT_EQ(out.pose_id, 987654321u);
}

TEST(WireFormatTest, DimensionsHeaderImpliesPayload) {
  FrameHeader in;
  in.width = 320;
  in.height = 200;
  const auto bytes = wire::encode_header(HeaderVariant::Dimensions, in);
  ASSERT_EQ(bytes.size(), 8u);

  const FrameHeader out = wire::decode_header(
      HeaderVariant::Dimensions, bytes.data(), bytes.size(), wire::WireLimits{});
  EXPECT_EQ(out.payload_length, 320u * 200u * 4u);
}

TEST(WireFormatTest, FixedVariantHasNoHeader) {
  EXPECT_TRUE(wire::encode_header(HeaderVariant::Fixed, FrameHeader{}).empty());
  const uint8_t dummy[4] = {};
  EXPECT_THROW(wire::decode_header(HeaderVariant::Fixed, dummy, sizeof(dummy),
                                   wire::WireLimits{}),
               std::invalid_argument);
}

TEST(WireFormatTest, ShortInputIsMalformed) {
  const auto bytes = basic_header(2, 2, 16, 1);
  try {
    wire::decode_header(HeaderVariant::Basic, bytes.data(), 10,
                        wire::WireLimits{});
    FAIL() << "expected ProtocolError";
  } catch (const ProtocolError &e) {
    EXPECT_TRUE(e.has_lengths());
    EXPECT_EQ(e.declared(), 16u);
    EXPECT_EQ(e.actual(), 10u);
  }
}

TEST(WireFormatTest, RejectsStructurallyInconsistentBasicHeaders) {
  const wire::WireLimits limits;
  auto decode = [&](const std::vector<uint8_t> &b) {
    return wire::decode_header(HeaderVariant::Basic, b.data(), b.size(), limits);
  };

  EXPECT_THROW(decode(basic_header(0, 480, 16, 1)), ProtocolError);
  EXPECT_THROW(decode(basic_header(640, 0, 16, 1)), ProtocolError);
  EXPECT_THROW(decode(basic_header(2, 2, 0, 1)), ProtocolError);
  // payload larger than width*height*4
  EXPECT_THROW(decode(basic_header(2, 2, 17, 1)), ProtocolError);
  EXPECT_THROW(decode(basic_header(2, 2, 16, 0)), ProtocolError);
  // more chunks than payload bytes
  EXPECT_THROW(decode(basic_header(2, 2, 16, 17)), ProtocolError);

  EXPECT_NO_THROW(decode(basic_header(2, 2, 16, 16)));
  // compressed payloads may be shorter than width*height*4
  EXPECT_NO_THROW(decode(basic_header(2, 2, 5, 1)));
}

TEST(WireFormatTest, RejectsDimensionsAboveLimits) {
  wire::WireLimits limits;
  limits.max_width = 1920;
  limits.max_height = 1080;

  const auto ok = basic_header(1920, 1080, 16, 1);
  EXPECT_NO_THROW(
      wire::decode_header(HeaderVariant::Basic, ok.data(), ok.size(), limits));

  const auto wide = basic_header(1921, 1080, 16, 1);
  EXPECT_THROW(wire::decode_header(HeaderVariant::Basic, wide.data(),
                                   wide.size(), limits),
               ProtocolError);
}

TEST(WireFormatTest, RejectsInvalidStampedPoseIds) {
  const wire::WireLimits limits;
  auto decode = [&](double pose_id) {
    const auto b = stamped_with_raw_pose_id(pose_id);
    return wire::decode_header(HeaderVariant::Stamped, b.data(), b.size(),
                               limits);
  };

  EXPECT_EQ(decode(0.0).pose_id, 0u);
  EXPECT_EQ(decode(42.0).pose_id, 42u);
  EXPECT_THROW(decode(-1.0), ProtocolError);
  EXPECT_THROW(decode(1.5), ProtocolError);
  EXPECT_THROW(decode(std::numeric_limits<double>::quiet_NaN()), ProtocolError);
  EXPECT_THROW(decode(std::numeric_limits<double>::infinity()), ProtocolError);
}

TEST(WireFormatTest, PoseIdMustFitInDouble) {
  FrameHeader h;
  h.width = 1;
  h.height = 1;
  h.pose_id = (1ULL << 53) + 1;
  EXPECT_THROW(wire::encode_header(HeaderVariant::Stamped, h), ProtocolError);
}

TEST(WireFormatTest, VariantNames) {
  EXPECT_EQ(wire::parse_header_variant("fixed"), HeaderVariant::Fixed);
  EXPECT_EQ(wire::parse_header_variant("dimensions"), HeaderVariant::Dimensions);
  EXPECT_EQ(wire::parse_header_variant("basic"), HeaderVariant::Basic);
  EXPECT_EQ(wire::parse_header_variant("stamped"), HeaderVariant::Stamped);
  EXPECT_THROW(wire::parse_header_variant("Stamped"), std::runtime_error);
  EXPECT_STREQ(wire::header_variant_name(HeaderVariant::Basic), "basic");
}

TEST(WireFormatTest, ChunkCountAndMaxMessageSize) {
  EXPECT_EQ(wire::chunk_count_for(0, 100), 0u);
  EXPECT_EQ(wire::chunk_count_for(100, 0), 1u);
  EXPECT_EQ(wire::chunk_count_for(100, 100), 1u);
  EXPECT_EQ(wire::chunk_count_for(101, 100), 2u);

  wire::WireLimits limits;
  limits.max_width = 640;
  limits.max_height = 480;

  EXPECT_EQ(wire::max_message_bytes(HeaderVariant::Stamped, limits, 0),
            32u + 1228800u + 4u);
  // 1228800 / 65536 = 18.75, so 19 chunk prefixes
  EXPECT_EQ(wire::max_message_bytes(HeaderVariant::Basic, limits, 65536),
            16u + 1228800u + 19u * 4u);
  EXPECT_EQ(wire::max_message_bytes(HeaderVariant::Dimensions, limits, 65536),
            8u + 1228800u);
}
