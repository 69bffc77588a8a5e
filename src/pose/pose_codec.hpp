#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "pose/pose_sample.hpp"

namespace pose {

// Pose side-channel payload format, shared by both ends.
enum class PoseFormat {
  Json,    // tracker JSON: timestamp, id, mDeviceToAbsoluteTracking.m[3][4]
  Protobuf // frame_relay.v1.PoseUpdate
};

// Throws std::runtime_error on an unknown name.
PoseFormat parse_pose_format(const std::string &name);
const char *pose_format_name(PoseFormat format);

// A side-channel message that did not validate as a pose. Forwarded to the
// consumer instead of being dropped.
struct UnknownMessage {
  std::vector<uint8_t> raw;
  std::string reason;
};

using PoseMessage = std::variant<PoseSample, UnknownMessage>;

// Never throws on bad input; anything that fails validation comes back as
// UnknownMessage with the reason filled in.
PoseMessage decode_pose_message(const uint8_t *data, std::size_t len,
                                PoseFormat format);

std::vector<uint8_t> encode_pose_message(const PoseSample &sample,
                                         PoseFormat format);

} // namespace pose
