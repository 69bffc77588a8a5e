#pragma once

#include <cstdint>
#include <vector>

namespace encoder {

// One uncompressed RGBA image as handed over by the renderer.
struct RawFrame {
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<uint8_t> pixels; // width * height * 4 bytes, row-major
};

// Supplier of raw frames. Implementations own their pixel storage; the
// returned frame is a copy the caller may keep.
class FrameSource {
public:
  virtual ~FrameSource() = default;

  // Returns false when the source has nothing more to offer.
  virtual bool next_frame(RawFrame &out) = 0;
};

} // namespace encoder
