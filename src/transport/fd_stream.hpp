#pragma once

#include <atomic>
#include <chrono>
#include <string>

#include "transport/byte_stream.hpp"

namespace transport {

// ByteStream over a POSIX file descriptor: a connected socket, one end of a
// socketpair, or a FIFO. Takes ownership of the descriptor.
class FdStream : public ByteStream {
public:
  // idle_timeout of zero disables the timeout.
  FdStream(int fd, bool is_socket, std::string description,
           std::chrono::milliseconds idle_timeout);
  ~FdStream() override;

  FdStream(const FdStream &) = delete;
  FdStream &operator=(const FdStream &) = delete;

  ReadStatus read_some(std::vector<uint8_t> &out, std::size_t max_bytes,
                       std::string &err) override;

  bool write_all(const uint8_t *data, std::size_t len,
                 std::string &err) override;

  void close() override;

  bool is_closed() const override { return closed_.load(); }

  std::string describe() const override { return description_; }

private:
  int fd_;
  bool is_socket_;
  std::string description_;
  std::chrono::milliseconds idle_timeout_;
  std::atomic<bool> closed_{false};
};

} // namespace transport
