#pragma once

#include <cstdint>
#include <vector>

namespace reassembly {

// One decoded frame. pixels is an owned copy, never a view into the
// connection buffer.
struct Frame {
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<uint8_t> pixels;
  double frame_timestamp = 0.0; // Stamped only
  double pose_timestamp = 0.0;  // Stamped only
  uint64_t pose_id = 0;         // Stamped only
  uint64_t sequence = 0;        // per connection, first frame is 1
};

} // namespace reassembly
