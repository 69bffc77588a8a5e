#include "framed_stream.hpp"

#include <algorithm>
#include <cstring>

#include "wire/wire_format.hpp"

namespace transport {

static constexpr std::size_t kReadChunk = 4096;

bool FramedReader::read_exact(uint8_t *buf, std::size_t n, std::size_t &got,
                              std::string &err) {
  got = 0;
  while (got < n) {
    if (pending_pos_ < pending_.size()) {
      const std::size_t take =
          std::min(n - got, pending_.size() - pending_pos_);
      std::memcpy(buf + got, pending_.data() + pending_pos_, take);
      pending_pos_ += take;
      got += take;
      continue;
    }

    pending_.clear();
    pending_pos_ = 0;
    const ReadStatus st = stream_.read_some(scratch_, kReadChunk, err);
    switch (st) {
    case ReadStatus::Data:
      pending_.swap(scratch_);
      break;
    case ReadStatus::EndOfStream:
      return false;
    case ReadStatus::Timeout:
      err = "idle timeout: " + err;
      return false;
    case ReadStatus::Error:
      return false;
    }
  }
  return true;
}

bool FramedReader::read_frame(std::vector<uint8_t> &out, std::string &err,
                              uint32_t max_len) {
  err.clear();
  last_failure_ = FrameReadFailure::None;

  uint8_t hdr[4] = {0, 0, 0, 0};

  // Distinguish a clean EOF (no bytes at all) from a truncated header.
  std::size_t got = 0;
  if (!read_exact(hdr, sizeof(hdr), got, err)) {
    if (!err.empty()) {
      last_failure_ = FrameReadFailure::Stream;
    } else if (got > 0) {
      err = "unexpected EOF while reading frame header";
      last_failure_ = FrameReadFailure::Truncated;
    }
    return false;
  }

  const uint32_t len = wire::decode_u32_le(hdr);
  if (len == 0) {
    err = "invalid frame length: 0";
    last_failure_ = FrameReadFailure::BadLength;
    return false;
  }
  if (len > max_len) {
    err = "frame length " + std::to_string(len) + " exceeds max " +
          std::to_string(max_len);
    last_failure_ = FrameReadFailure::BadLength;
    return false;
  }

  out.assign(len, 0);
  if (!read_exact(out.data(), len, got, err)) {
    if (err.empty()) {
      err = "unexpected EOF while reading frame payload";
      last_failure_ = FrameReadFailure::Truncated;
    } else {
      last_failure_ = FrameReadFailure::Stream;
    }
    return false;
  }

  return true;
}

bool write_frame(ByteStream &out, const uint8_t *data, std::size_t len,
                 std::string &err, uint32_t max_len) {
  err.clear();

  if (len == 0) {
    err = "invalid frame length: 0";
    return false;
  }
  if (len > max_len) {
    err = "frame length exceeds max";
    return false;
  }

  // One write keeps the prefix and payload together on the wire.
  std::vector<uint8_t> buf(4 + len);
  wire::encode_u32_le(static_cast<uint32_t>(len), buf.data());
  std::memcpy(buf.data() + 4, data, len);

  if (!out.write_all(buf.data(), buf.size(), err)) {
    err = "failed writing frame: " + err;
    return false;
  }

  return true;
}

} // namespace transport
