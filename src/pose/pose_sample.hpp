#pragma once

#include <array>
#include <cstdint>
#include <optional>

namespace pose {

// 3x4 row-major rigid transform: rotation in columns 0..2, translation in
// column 3.
using Transform3x4 = std::array<double, 12>;

inline Transform3x4 identity_transform() {
  return {1.0, 0.0, 0.0, 0.0, //
          0.0, 1.0, 0.0, 0.0, //
          0.0, 0.0, 1.0, 0.0};
}

struct PoseSample {
  double timestamp = 0.0;     // monotonic, source clock
  std::optional<uint64_t> id; // monotonic counter, absent on some sources
  Transform3x4 transform = identity_transform();
};

} // namespace pose
