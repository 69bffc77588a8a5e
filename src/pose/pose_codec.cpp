#include "pose_codec.hpp"

#include <cmath>
#include <stdexcept>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "frame_relay.pb.h"

namespace pose {

namespace {

constexpr const char *kTrackingKey = "mDeviceToAbsoluteTracking";
constexpr double kMaxExactId = 9007199254740992.0; // 2^53

UnknownMessage unknown(const uint8_t *data, std::size_t len,
                       const std::string &reason) {
  UnknownMessage m;
  m.raw.assign(data, data + len);
  m.reason = reason;
  return m;
}

bool valid_id(double v) {
  return std::isfinite(v) && v >= 0.0 && v == std::floor(v) && v <= kMaxExactId;
}

PoseMessage decode_json(const uint8_t *data, std::size_t len) {
  const std::string text(reinterpret_cast<const char *>(data), len);

  google::protobuf::Struct root;
  google::protobuf::util::JsonParseOptions opts;
  opts.ignore_unknown_fields = true;
  const auto status =
      google::protobuf::util::JsonStringToMessage(text, &root, opts);
  if (!status.ok()) {
    return unknown(data, len, "invalid JSON: " + status.ToString());
  }

  const auto &fields = root.fields();

  auto tracking_it = fields.find(kTrackingKey);
  if (tracking_it == fields.end() || !tracking_it->second.has_struct_value()) {
    return unknown(data, len, std::string("missing ") + kTrackingKey);
  }

  PoseSample sample;

  auto ts_it = fields.find("timestamp");
  if (ts_it == fields.end() ||
      ts_it->second.kind_case() != google::protobuf::Value::kNumberValue ||
      !std::isfinite(ts_it->second.number_value())) {
    return unknown(data, len, "missing or non-numeric timestamp");
  }
  sample.timestamp = ts_it->second.number_value();

  auto id_it = fields.find("id");
  if (id_it != fields.end() &&
      id_it->second.kind_case() != google::protobuf::Value::kNullValue) {
    if (id_it->second.kind_case() != google::protobuf::Value::kNumberValue ||
        !valid_id(id_it->second.number_value())) {
      return unknown(data, len, "id must be a non-negative integer");
    }
    sample.id = static_cast<uint64_t>(id_it->second.number_value());
  }

  const auto &tracking = tracking_it->second.struct_value().fields();
  auto m_it = tracking.find("m");
  if (m_it == tracking.end() || !m_it->second.has_list_value() ||
      m_it->second.list_value().values_size() != 3) {
    return unknown(data, len, "m must be a 3x4 matrix");
  }

  const auto &rows = m_it->second.list_value().values();
  for (int r = 0; r < 3; ++r) {
    if (!rows.Get(r).has_list_value() ||
        rows.Get(r).list_value().values_size() != 4) {
      return unknown(data, len, "m row " + std::to_string(r) +
                                    " must have 4 values");
    }
    const auto &cols = rows.Get(r).list_value().values();
    for (int c = 0; c < 4; ++c) {
      const auto &v = cols.Get(c);
      if (v.kind_case() != google::protobuf::Value::kNumberValue ||
          !std::isfinite(v.number_value())) {
        return unknown(data, len, "m[" + std::to_string(r) + "][" +
                                      std::to_string(c) + "] not a number");
      }
      sample.transform[static_cast<std::size_t>(r * 4 + c)] = v.number_value();
    }
  }

  return sample;
}

PoseMessage decode_protobuf(const uint8_t *data, std::size_t len) {
  frame_relay::v1::PoseUpdate msg;
  if (!msg.ParseFromArray(data, static_cast<int>(len))) {
    return unknown(data, len, "failed to parse PoseUpdate protobuf");
  }
  if (msg.transform_size() != 12) {
    return unknown(data, len,
                   "transform has " + std::to_string(msg.transform_size()) +
                       " values, expected 12");
  }
  if (!std::isfinite(msg.timestamp())) {
    return unknown(data, len, "non-finite timestamp");
  }

  PoseSample sample;
  sample.timestamp = msg.timestamp();
  if (msg.has_id()) {
    // Same bound as JSON: the id has to survive the f64 in a stamped header.
    if (msg.id() > (1ULL << 53)) {
      return unknown(data, len,
                     "id " + std::to_string(msg.id()) + " exceeds 2^53");
    }
    sample.id = msg.id();
  }
  for (int i = 0; i < 12; ++i) {
    if (!std::isfinite(msg.transform(i))) {
      return unknown(data, len, "non-finite transform value");
    }
    sample.transform[static_cast<std::size_t>(i)] = msg.transform(i);
  }
  return sample;
}

std::vector<uint8_t> encode_json(const PoseSample &sample) {
  google::protobuf::Struct root;
  auto &fields = *root.mutable_fields();
  fields["timestamp"].set_number_value(sample.timestamp);
  if (sample.id) {
    fields["id"].set_number_value(static_cast<double>(*sample.id));
  }

  google::protobuf::Struct tracking;
  auto *rows = (*tracking.mutable_fields())["m"].mutable_list_value();
  for (int r = 0; r < 3; ++r) {
    auto *row = rows->add_values()->mutable_list_value();
    for (int c = 0; c < 4; ++c) {
      row->add_values()->set_number_value(
          sample.transform[static_cast<std::size_t>(r * 4 + c)]);
    }
  }
  *fields[kTrackingKey].mutable_struct_value() = tracking;

  std::string out;
  const auto status = google::protobuf::util::MessageToJsonString(root, &out);
  if (!status.ok()) {
    throw std::runtime_error("failed to serialize pose JSON: " +
                             status.ToString());
  }
  return std::vector<uint8_t>(out.begin(), out.end());
}

std::vector<uint8_t> encode_protobuf(const PoseSample &sample) {
  frame_relay::v1::PoseUpdate msg;
  msg.set_timestamp(sample.timestamp);
  if (sample.id) {
    msg.set_id(*sample.id);
  }
  for (double v : sample.transform) {
    msg.add_transform(v);
  }

  std::string out;
  if (!msg.SerializeToString(&out)) {
    throw std::runtime_error("failed to serialize PoseUpdate protobuf");
  }
  return std::vector<uint8_t>(out.begin(), out.end());
}

} // namespace

PoseFormat parse_pose_format(const std::string &name) {
  if (name == "json") {
    return PoseFormat::Json;
  } else if (name == "protobuf") {
    return PoseFormat::Protobuf;
  } else {
    throw std::runtime_error("Invalid pose format: '" + name +
                             "'. Valid values: json, protobuf");
  }
}

const char *pose_format_name(PoseFormat format) {
  switch (format) {
  case PoseFormat::Json:
    return "json";
  case PoseFormat::Protobuf:
    return "protobuf";
  }
  return "unknown";
}

PoseMessage decode_pose_message(const uint8_t *data, std::size_t len,
                                PoseFormat format) {
  switch (format) {
  case PoseFormat::Json:
    return decode_json(data, len);
  case PoseFormat::Protobuf:
    return decode_protobuf(data, len);
  }
  return unknown(data, len, "unsupported pose format");
}

std::vector<uint8_t> encode_pose_message(const PoseSample &sample,
                                         PoseFormat format) {
  switch (format) {
  case PoseFormat::Json:
    return encode_json(sample);
  case PoseFormat::Protobuf:
    return encode_protobuf(sample);
  }
  throw std::runtime_error("unsupported pose format");
}

} // namespace pose
