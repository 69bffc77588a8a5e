#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "scripted_stream.hpp"
#include "transport/framed_stream.hpp"

using frame_relay_test::ScriptedStream;
using transport::FramedReader;
using transport::FrameReadFailure;

namespace {

std::vector<uint8_t> bytes_of(const std::string &s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<uint8_t> framed(const std::vector<std::string> &messages) {
  ScriptedStream out;
  std::string err;
  for (const auto &m : messages) {
    const auto b = bytes_of(m);
    EXPECT_TRUE(transport::write_frame(out, b.data(), b.size(), err)) << err;
  }
  return out.written();
}

} // namespace

TEST(FramedStreamTest, WriteFramePrefixesLength) {
  const auto wire_bytes = framed({"pose"});
  ASSERT_EQ(wire_bytes.size(), 8u);
  EXPECT_EQ(wire_bytes[0], 4);
  EXPECT_EQ(wire_bytes[1], 0);
  EXPECT_EQ(wire_bytes[2], 0);
  EXPECT_EQ(wire_bytes[3], 0);
  EXPECT_EQ(std::string(wire_bytes.begin() + 4, wire_bytes.end()), "pose");
}

TEST(FramedStreamTest, ReadsMessagesAcrossArbitraryReadBoundaries) {
  const auto wire_bytes = framed({"first", "second message", "3"});
  ScriptedStream in(frame_relay_test::split_every(wire_bytes, 3));
  FramedReader reader(in);

  std::vector<uint8_t> msg;
  std::string err;
  ASSERT_TRUE(reader.read_frame(msg, err)) << err;
  EXPECT_EQ(std::string(msg.begin(), msg.end()), "first");
  ASSERT_TRUE(reader.read_frame(msg, err)) << err;
  EXPECT_EQ(std::string(msg.begin(), msg.end()), "second message");
  ASSERT_TRUE(reader.read_frame(msg, err)) << err;
  EXPECT_EQ(std::string(msg.begin(), msg.end()), "3");

  EXPECT_FALSE(reader.read_frame(msg, err));
  EXPECT_TRUE(err.empty());
  EXPECT_EQ(reader.last_failure(), FrameReadFailure::None);
}

TEST(FramedStreamTest, SeveralMessagesInOneRead) {
  std::vector<std::vector<uint8_t>> reads{framed({"a", "bb", "ccc"})};
  ScriptedStream in(reads);
  FramedReader reader(in);

  std::vector<uint8_t> msg;
  std::string err;
  for (const char *want : {"a", "bb", "ccc"}) {
    ASSERT_TRUE(reader.read_frame(msg, err)) << err;
    EXPECT_EQ(std::string(msg.begin(), msg.end()), want);
  }
  EXPECT_EQ(in.read_calls(), 1);
}

TEST(FramedStreamTest, TruncatedMessageIsNotCleanEof) {
  auto wire_bytes = framed({"truncated"});
  wire_bytes.resize(wire_bytes.size() - 2);
  std::vector<std::vector<uint8_t>> reads{wire_bytes};
  ScriptedStream in(reads);
  FramedReader reader(in);

  std::vector<uint8_t> msg;
  std::string err;
  EXPECT_FALSE(reader.read_frame(msg, err));
  EXPECT_FALSE(err.empty());
  EXPECT_EQ(reader.last_failure(), FrameReadFailure::Truncated);
}

TEST(FramedStreamTest, TruncatedLengthPrefix) {
  std::vector<std::vector<uint8_t>> reads{{5, 0}};
  ScriptedStream in(reads);
  FramedReader reader(in);

  std::vector<uint8_t> msg;
  std::string err;
  EXPECT_FALSE(reader.read_frame(msg, err));
  EXPECT_EQ(reader.last_failure(), FrameReadFailure::Truncated);
}

TEST(FramedStreamTest, RejectsZeroAndOversizeLengths) {
  {
    std::vector<std::vector<uint8_t>> reads{{0, 0, 0, 0}};
    ScriptedStream in(reads);
    FramedReader reader(in);
    std::vector<uint8_t> msg;
    std::string err;
    EXPECT_FALSE(reader.read_frame(msg, err));
    EXPECT_EQ(reader.last_failure(), FrameReadFailure::BadLength);
  }
  {
    std::vector<std::vector<uint8_t>> reads{{0x01, 0x01, 0, 0, 'x'}};
    ScriptedStream in(reads);
    FramedReader reader(in);
    std::vector<uint8_t> msg;
    std::string err;
    EXPECT_FALSE(reader.read_frame(msg, err, 256));
    EXPECT_EQ(reader.last_failure(), FrameReadFailure::BadLength);
    EXPECT_NE(err.find("exceeds max"), std::string::npos);
  }
}

TEST(FramedStreamTest, StreamErrorsAreReported) {
  std::vector<std::vector<uint8_t>> reads;
  ScriptedStream in(reads, transport::ReadStatus::Timeout, "no data for 50ms");
  FramedReader reader(in);

  std::vector<uint8_t> msg;
  std::string err;
  EXPECT_FALSE(reader.read_frame(msg, err));
  EXPECT_EQ(reader.last_failure(), FrameReadFailure::Stream);
  EXPECT_NE(err.find("idle timeout"), std::string::npos);
}

TEST(FramedStreamTest, WriteFrameRejectsEmptyAndOversize) {
  ScriptedStream out;
  std::string err;
  const std::vector<uint8_t> big(300, 1);
  EXPECT_FALSE(transport::write_frame(out, big.data(), 0, err));
  EXPECT_FALSE(transport::write_frame(out, big.data(), big.size(), err, 256));
  EXPECT_TRUE(out.written().empty());

  out.fail_writes();
  EXPECT_FALSE(transport::write_frame(out, big.data(), 10, err));
  EXPECT_FALSE(err.empty());
}
