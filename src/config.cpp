#include "config.hpp"
#include <filesystem>
#include <limits>
#include <stdexcept>

namespace frame_relay {

namespace fs = std::filesystem;

// Integer field within [min, max]
static uint64_t read_uint(const YAML::Node &node, const std::string &where,
                          uint64_t min, uint64_t max) {
  long long value = 0;
  try {
    value = node.as<long long>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] " + where + " must be an integer: " +
                             e.what());
  }
  if (value < 0 || static_cast<uint64_t>(value) < min ||
      static_cast<uint64_t>(value) > max) {
    throw std::runtime_error("[CONFIG] " + where + " must be in range [" +
                             std::to_string(min) + ", " + std::to_string(max) +
                             "], got " + std::to_string(value));
  }
  return static_cast<uint64_t>(value);
}

static std::string read_string(const YAML::Node &node,
                               const std::string &where) {
  try {
    return node.as<std::string>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] " + where + " must be a string: " +
                             e.what());
  }
}

static transport::Endpoint read_endpoint(const YAML::Node &node,
                                         const std::string &where) {
  const std::string text = read_string(node, where);
  try {
    return transport::parse_endpoint(text);
  } catch (const std::exception &e) {
    throw std::runtime_error("[CONFIG] Invalid " + where + ": " + e.what());
  }
}

static void require_map(const YAML::Node &node, const std::string &name) {
  if (node && !node.IsMap()) {
    throw std::runtime_error("[CONFIG] '" + name + "' section must be a map");
  }
}

static void parse_stream(const YAML::Node &node, StreamConfig &stream) {
  if (!node) {
    throw std::runtime_error("[CONFIG] Missing required 'stream' section");
  }
  require_map(node, "stream");

  if (!node["endpoint"]) {
    throw std::runtime_error("[CONFIG] Missing required 'stream.endpoint'");
  }
  stream.endpoint = read_endpoint(node["endpoint"], "stream.endpoint");

  if (node["header_variant"]) {
    try {
      stream.header_variant = wire::parse_header_variant(
          read_string(node["header_variant"], "stream.header_variant"));
    } catch (const std::runtime_error &e) {
      throw std::runtime_error("[CONFIG] stream.header_variant: " +
                               std::string(e.what()));
    }
  }

  if (node["max_width"]) {
    stream.limits.max_width = static_cast<uint32_t>(
        read_uint(node["max_width"], "stream.max_width", 1, 16384));
  }
  if (node["max_height"]) {
    stream.limits.max_height = static_cast<uint32_t>(
        read_uint(node["max_height"], "stream.max_height", 1, 16384));
  }
  if (node["max_chunk_bytes"]) {
    stream.max_chunk_bytes = static_cast<uint32_t>(
        read_uint(node["max_chunk_bytes"], "stream.max_chunk_bytes", 0,
                  std::numeric_limits<uint32_t>::max()));
  }
  if (node["idle_timeout_ms"]) {
    stream.idle_timeout = std::chrono::milliseconds(read_uint(
        node["idle_timeout_ms"], "stream.idle_timeout_ms", 0, 3600000));
  }
  if (node["buffer_capacity_bytes"]) {
    stream.buffer_capacity_bytes = static_cast<std::size_t>(
        read_uint(node["buffer_capacity_bytes"], "stream.buffer_capacity_bytes",
                  1, std::numeric_limits<uint32_t>::max() * 2ULL));
  }

  if (node["fixed_frame"]) {
    const YAML::Node &ff = node["fixed_frame"];
    require_map(ff, "stream.fixed_frame");
    if (!ff["width"] || !ff["height"]) {
      throw std::runtime_error(
          "[CONFIG] stream.fixed_frame requires 'width' and 'height'");
    }
    FixedFrameSize size;
    size.width = static_cast<uint32_t>(
        read_uint(ff["width"], "stream.fixed_frame.width", 1, 16384));
    size.height = static_cast<uint32_t>(
        read_uint(ff["height"], "stream.fixed_frame.height", 1, 16384));
    stream.fixed_frame = size;
  }

  if (stream.header_variant == wire::HeaderVariant::Fixed &&
      !stream.fixed_frame) {
    throw std::runtime_error(
        "[CONFIG] header_variant=fixed requires stream.fixed_frame");
  }
  if (stream.header_variant != wire::HeaderVariant::Fixed &&
      stream.fixed_frame) {
    throw std::runtime_error("[CONFIG] stream.fixed_frame is only valid with "
                             "header_variant=fixed");
  }
}

static void parse_dispatch(const YAML::Node &node, DispatchConfig &dispatch) {
  if (!node) {
    return;
  }
  require_map(node, "dispatch");

  if (node["queue_depth"]) {
    dispatch.queue_depth = static_cast<std::size_t>(
        read_uint(node["queue_depth"], "dispatch.queue_depth", 1, 1024));
  }
  if (node["log_every_n_frames"]) {
    dispatch.log_every_n_frames =
        read_uint(node["log_every_n_frames"], "dispatch.log_every_n_frames", 0,
                  std::numeric_limits<uint32_t>::max());
  }
}

static void parse_pose(const YAML::Node &node, PoseConfig &pose) {
  if (!node) {
    return;
  }
  require_map(node, "pose");

  if (node["endpoint"]) {
    pose.endpoint = read_endpoint(node["endpoint"], "pose.endpoint");
  }
  if (node["format"]) {
    try {
      pose.format =
          pose::parse_pose_format(read_string(node["format"], "pose.format"));
    } catch (const std::runtime_error &e) {
      throw std::runtime_error("[CONFIG] pose.format: " +
                               std::string(e.what()));
    }
  }
  if (node["max_message_bytes"]) {
    pose.max_message_bytes = static_cast<uint32_t>(read_uint(
        node["max_message_bytes"], "pose.max_message_bytes", 64, 16777216));
  }
}

static void parse_session(const YAML::Node &node, SessionConfig &session) {
  if (!node) {
    return;
  }
  require_map(node, "session");

  if (node["reconnect_backoff_ms"]) {
    session.reconnect_backoff = std::chrono::milliseconds(
        read_uint(node["reconnect_backoff_ms"], "session.reconnect_backoff_ms",
                  0, 600000));
  }
}

static void parse_source(const YAML::Node &node, SourceConfig &source) {
  if (!node) {
    return;
  }
  require_map(node, "source");

  if (node["width"]) {
    source.width = static_cast<uint32_t>(
        read_uint(node["width"], "source.width", 1, 16384));
  }
  if (node["height"]) {
    source.height = static_cast<uint32_t>(
        read_uint(node["height"], "source.height", 1, 16384));
  }
}

uint64_t RelayConfig::max_message_bytes() const {
  if (stream.header_variant == wire::HeaderVariant::Fixed) {
    return stream.fixed_frame ? wire::rgba_payload_bytes(
                                    stream.fixed_frame->width,
                                    stream.fixed_frame->height)
                              : 0;
  }
  return wire::max_message_bytes(stream.header_variant, stream.limits,
                                 stream.max_chunk_bytes);
}

reassembly::SizingPolicy RelayConfig::sizing_policy() const {
  if (stream.header_variant == wire::HeaderVariant::Fixed) {
    return reassembly::SizingPolicy::fixed(stream.fixed_frame->width,
                                           stream.fixed_frame->height);
  }
  return reassembly::SizingPolicy::header_prefixed(stream.header_variant,
                                                   stream.limits);
}

RelayConfig parse_config(const YAML::Node &yaml) {
  if (!yaml || !yaml.IsMap()) {
    throw std::runtime_error("[CONFIG] Top level must be a map");
  }

  RelayConfig config;
  parse_stream(yaml["stream"], config.stream);
  parse_dispatch(yaml["dispatch"], config.dispatch);
  parse_pose(yaml["pose"], config.pose);
  parse_session(yaml["session"], config.session);
  parse_source(yaml["source"], config.source);

  // Buffer must hold the largest message a conforming sender can produce
  const uint64_t max_msg = config.max_message_bytes();
  if (config.stream.buffer_capacity_bytes == 0) {
    config.stream.buffer_capacity_bytes = static_cast<std::size_t>(2 * max_msg);
  } else if (config.stream.buffer_capacity_bytes < max_msg) {
    throw std::runtime_error(
        "[CONFIG] stream.buffer_capacity_bytes (" +
        std::to_string(config.stream.buffer_capacity_bytes) +
        ") is below the maximum message size (" + std::to_string(max_msg) +
        ") for header_variant=" +
        wire::header_variant_name(config.stream.header_variant));
  }

  if (config.stream.header_variant != wire::HeaderVariant::Fixed &&
      (config.source.width > config.stream.limits.max_width ||
       config.source.height > config.stream.limits.max_height)) {
    throw std::runtime_error("[CONFIG] source dimensions exceed "
                             "stream.max_width/max_height");
  }

  if (config.pose.endpoint &&
      config.pose.endpoint->to_string() == config.stream.endpoint.to_string()) {
    throw std::runtime_error(
        "[CONFIG] pose.endpoint must differ from stream.endpoint");
  }

  return config;
}

RelayConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  RelayConfig config = parse_config(yaml);
  config.config_file_path = fs::absolute(path).string();
  return config;
}

} // namespace frame_relay
