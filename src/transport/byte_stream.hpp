#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace transport {

enum class ReadStatus {
  Data,        // out holds at least one byte
  EndOfStream, // peer finished or the stream was closed locally
  Timeout,     // no byte arrived within the idle-read timeout
  Error        // err describes the failure
};

// Ordered, reliable byte connection (pipe, FIFO or socket).
//
// read_some() returns whatever bytes are available, up to max_bytes. One call
// is not aligned to any message boundary: it may deliver part of a message,
// several messages, or the tail of one and the head of the next.
//
// At most one read_some() may be outstanding per stream. close() may be
// called from another thread to cancel it and is idempotent.
class ByteStream {
public:
  virtual ~ByteStream() = default;

  virtual ReadStatus read_some(std::vector<uint8_t> &out, std::size_t max_bytes,
                               std::string &err) = 0;

  // Writes all bytes or fails. Returns false and sets err on failure.
  virtual bool write_all(const uint8_t *data, std::size_t len,
                         std::string &err) = 0;

  virtual void close() = 0;

  virtual bool is_closed() const = 0;

  // Human-readable peer description for logs.
  virtual std::string describe() const = 0;
};

} // namespace transport
