#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

#include "pose/pose_codec.hpp"
#include "reassembly/frame_reassembler.hpp"
#include "transport/endpoint.hpp"
#include "wire/wire_format.hpp"

namespace frame_relay {

// Frame size agreed out of band for the fixed variant
struct FixedFrameSize {
  uint32_t width = 0;
  uint32_t height = 0;
};

// Frame stream: endpoint, wire variant and reassembly bounds
struct StreamConfig {
  transport::Endpoint endpoint;
  wire::HeaderVariant header_variant = wire::HeaderVariant::Stamped;
  std::size_t buffer_capacity_bytes = 0; // resolved: 2 x max message if unset
  uint32_t max_chunk_bytes = 0;          // 0 = single chunk
  std::chrono::milliseconds idle_timeout{5000}; // 0 = no timeout
  wire::WireLimits limits;
  std::optional<FixedFrameSize> fixed_frame; // Required for fixed variant
};

struct DispatchConfig {
  std::size_t queue_depth = 4;
  uint64_t log_every_n_frames = 10; // 0 = silent
};

// Pose side channel
struct PoseConfig {
  std::optional<transport::Endpoint> endpoint; // channel disabled if absent
  pose::PoseFormat format = pose::PoseFormat::Json;
  uint32_t max_message_bytes = 64 * 1024;
};

struct SessionConfig {
  std::chrono::milliseconds reconnect_backoff{1000};
};

// Test-pattern dimensions for send mode (ignored by the fixed variant, which
// uses fixed_frame)
struct SourceConfig {
  uint32_t width = 640;
  uint32_t height = 480;
};

// Complete relay configuration
struct RelayConfig {
  std::string config_file_path;
  StreamConfig stream;
  DispatchConfig dispatch;
  PoseConfig pose;
  SessionConfig session;
  SourceConfig source;

  // Largest frame message the configured sender can produce
  uint64_t max_message_bytes() const;

  reassembly::SizingPolicy sizing_policy() const;
};

// Load relay configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
RelayConfig load_config(const std::string &path);

// Same as load_config for an already parsed document
RelayConfig parse_config(const YAML::Node &yaml);

} // namespace frame_relay
