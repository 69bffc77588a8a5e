#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include "config.hpp"

using frame_relay::load_config;
using frame_relay::parse_config;
using frame_relay::RelayConfig;

namespace {

RelayConfig parse(const std::string &text) {
  return parse_config(YAML::Load(text));
}

// Expects parse() to fail with a message containing `needle`.
void expect_rejected(const std::string &text, const std::string &needle) {
  try {
    parse(text);
    FAIL() << "expected rejection for:\n" << text;
  } catch (const std::runtime_error &e) {
    const std::string what = e.what();
    EXPECT_NE(what.find("[CONFIG]"), std::string::npos) << what;
    EXPECT_NE(what.find(needle), std::string::npos) << what;
  }
}

class TempConfigFile {
public:
  explicit TempConfigFile(const std::string &contents) {
    path_ = "/tmp/frame_relay_config_test_" + std::to_string(::getpid()) +
            "_" + std::to_string(counter_++) + ".yaml";
    std::ofstream out(path_);
    out << contents;
  }
  ~TempConfigFile() { std::remove(path_.c_str()); }

  const std::string &path() const { return path_; }

private:
  static inline int counter_ = 0;
  std::string path_;
};

const char *kMinimal = R"(
stream:
  endpoint: unix:/tmp/frame-relay.sock
  max_width: 64
  max_height: 32
source:
  width: 64
  height: 32
)";

} // namespace

TEST(ConfigTest, MinimalConfigGetsDefaults) {
  const RelayConfig cfg = parse(kMinimal);

  EXPECT_EQ(cfg.stream.endpoint.kind, transport::EndpointKind::Unix);
  EXPECT_EQ(cfg.stream.endpoint.path, "/tmp/frame-relay.sock");
  EXPECT_EQ(cfg.stream.header_variant, wire::HeaderVariant::Stamped);
  EXPECT_EQ(cfg.stream.max_chunk_bytes, 0u);
  EXPECT_EQ(cfg.stream.idle_timeout.count(), 5000);
  EXPECT_EQ(cfg.dispatch.queue_depth, 4u);
  EXPECT_EQ(cfg.dispatch.log_every_n_frames, 10u);
  EXPECT_FALSE(cfg.pose.endpoint.has_value());
  EXPECT_EQ(cfg.pose.format, pose::PoseFormat::Json);
  EXPECT_EQ(cfg.session.reconnect_backoff.count(), 1000);

  EXPECT_GE(cfg.max_message_bytes(), 64u * 32u * 4u);
  EXPECT_EQ(cfg.stream.buffer_capacity_bytes, 2 * cfg.max_message_bytes());
}

TEST(ConfigTest, FullConfigIsParsed) {
  const RelayConfig cfg = parse(R"(
stream:
  endpoint: tcp:127.0.0.1:9000
  header_variant: basic
  max_width: 320
  max_height: 240
  max_chunk_bytes: 4096
  idle_timeout_ms: 0
  buffer_capacity_bytes: 1048576
dispatch:
  queue_depth: 16
  log_every_n_frames: 0
pose:
  endpoint: unix:/tmp/frame-relay-pose.sock
  format: protobuf
  max_message_bytes: 1024
session:
  reconnect_backoff_ms: 0
source:
  width: 320
  height: 240
)");

  EXPECT_EQ(cfg.stream.endpoint.kind, transport::EndpointKind::Tcp);
  EXPECT_EQ(cfg.stream.endpoint.port, 9000);
  EXPECT_EQ(cfg.stream.header_variant, wire::HeaderVariant::Basic);
  EXPECT_EQ(cfg.stream.max_chunk_bytes, 4096u);
  EXPECT_EQ(cfg.stream.idle_timeout.count(), 0);
  EXPECT_EQ(cfg.stream.buffer_capacity_bytes, 1048576u);
  EXPECT_EQ(cfg.dispatch.queue_depth, 16u);
  EXPECT_EQ(cfg.dispatch.log_every_n_frames, 0u);
  ASSERT_TRUE(cfg.pose.endpoint.has_value());
  EXPECT_EQ(cfg.pose.endpoint->path, "/tmp/frame-relay-pose.sock");
  EXPECT_EQ(cfg.pose.format, pose::PoseFormat::Protobuf);
  EXPECT_EQ(cfg.pose.max_message_bytes, 1024u);
  EXPECT_EQ(cfg.session.reconnect_backoff.count(), 0);
  EXPECT_EQ(cfg.source.width, 320u);
}

TEST(ConfigTest, FixedVariantSizesBufferFromFixedFrame) {
  const RelayConfig cfg = parse(R"(
stream:
  endpoint: fifo:/tmp/frame-relay.fifo
  header_variant: fixed
  fixed_frame:
    width: 4
    height: 2
)");

  EXPECT_EQ(cfg.stream.header_variant, wire::HeaderVariant::Fixed);
  ASSERT_TRUE(cfg.stream.fixed_frame.has_value());
  EXPECT_EQ(cfg.max_message_bytes(), 32u);
  EXPECT_EQ(cfg.stream.buffer_capacity_bytes, 64u);

  const auto policy = cfg.sizing_policy();
  EXPECT_EQ(policy.variant, wire::HeaderVariant::Fixed);
  EXPECT_EQ(policy.fixed_message_bytes(), 32u);
}

TEST(ConfigTest, MissingStreamSectionIsRejected) {
  expect_rejected("dispatch:\n  queue_depth: 2\n", "stream");
}

TEST(ConfigTest, MissingEndpointIsRejected) {
  expect_rejected("stream:\n  header_variant: basic\n", "stream.endpoint");
}

TEST(ConfigTest, MalformedEndpointIsRejected) {
  expect_rejected("stream:\n  endpoint: carrier-pigeon\n", "stream.endpoint");
}

TEST(ConfigTest, UnknownVariantIsRejected) {
  expect_rejected(R"(
stream:
  endpoint: unix:/tmp/a.sock
  header_variant: compressed
)",
                  "header_variant");
}

TEST(ConfigTest, CapacityBelowMaxMessageIsRejected) {
  expect_rejected(R"(
stream:
  endpoint: unix:/tmp/a.sock
  max_width: 64
  max_height: 64
  buffer_capacity_bytes: 1024
source:
  width: 64
  height: 64
)",
                  "buffer_capacity_bytes");
}

TEST(ConfigTest, FixedVariantWithoutFrameSizeIsRejected) {
  expect_rejected(R"(
stream:
  endpoint: unix:/tmp/a.sock
  header_variant: fixed
)",
                  "fixed_frame");
}

TEST(ConfigTest, FixedFrameWithHeaderVariantIsRejected) {
  expect_rejected(R"(
stream:
  endpoint: unix:/tmp/a.sock
  header_variant: dimensions
  fixed_frame:
    width: 4
    height: 4
)",
                  "fixed_frame");
}

TEST(ConfigTest, OutOfRangeValuesAreRejected) {
  expect_rejected(R"(
stream:
  endpoint: unix:/tmp/a.sock
dispatch:
  queue_depth: 0
)",
                  "dispatch.queue_depth");

  expect_rejected(R"(
stream:
  endpoint: unix:/tmp/a.sock
  max_width: -5
)",
                  "stream.max_width");

  expect_rejected(R"(
stream:
  endpoint: unix:/tmp/a.sock
  idle_timeout_ms: soon
)",
                  "stream.idle_timeout_ms");
}

TEST(ConfigTest, SourceLargerThanLimitsIsRejected) {
  expect_rejected(R"(
stream:
  endpoint: unix:/tmp/a.sock
  max_width: 32
  max_height: 32
)",
                  "source dimensions");
}

TEST(ConfigTest, PoseEndpointMustDifferFromStream) {
  expect_rejected(R"(
stream:
  endpoint: unix:/tmp/a.sock
  max_width: 640
  max_height: 480
pose:
  endpoint: unix:/tmp/a.sock
)",
                  "pose.endpoint");
}

TEST(ConfigTest, UnknownPoseFormatIsRejected) {
  expect_rejected(R"(
stream:
  endpoint: unix:/tmp/a.sock
  max_width: 640
  max_height: 480
pose:
  format: xml
)",
                  "pose.format");
}

TEST(ConfigTest, TopLevelMustBeMap) {
  expect_rejected("- just\n- a list\n", "Top level");
}

TEST(ConfigTest, LoadConfigReadsFile) {
  TempConfigFile file(kMinimal);
  const RelayConfig cfg = load_config(file.path());

  EXPECT_EQ(cfg.stream.endpoint.path, "/tmp/frame-relay.sock");
  EXPECT_EQ(cfg.config_file_path, file.path());
}

TEST(ConfigTest, LoadConfigReportsMissingFile) {
  try {
    load_config("/tmp/frame_relay_config_test_does_not_exist.yaml");
    FAIL() << "expected missing file to throw";
  } catch (const std::runtime_error &e) {
    EXPECT_NE(std::string(e.what()).find("Failed to load config file"),
              std::string::npos);
  }
}

TEST(ConfigTest, LoadConfigReportsSyntaxError) {
  TempConfigFile file("stream: [unterminated\n");
  EXPECT_THROW(load_config(file.path()), std::runtime_error);
}
