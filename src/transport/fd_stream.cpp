#include "fd_stream.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <utility>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace transport {

// Poll slice; bounds how long a cancelled read takes to notice close().
static constexpr int kPollSliceMs = 100;

FdStream::FdStream(int fd, bool is_socket, std::string description,
                   std::chrono::milliseconds idle_timeout)
    : fd_(fd), is_socket_(is_socket), description_(std::move(description)),
      idle_timeout_(idle_timeout) {}

FdStream::~FdStream() {
  close();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

ReadStatus FdStream::read_some(std::vector<uint8_t> &out, std::size_t max_bytes,
                               std::string &err) {
  err.clear();
  out.clear();

  if (max_bytes == 0) {
    err = "read_some called with no room";
    return ReadStatus::Error;
  }

  const auto started = std::chrono::steady_clock::now();

  while (true) {
    if (closed_.load()) {
      return ReadStatus::EndOfStream;
    }

    int slice = kPollSliceMs;
    if (idle_timeout_.count() > 0) {
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      if (elapsed >= idle_timeout_) {
        err = "no data for " + std::to_string(idle_timeout_.count()) + "ms";
        return ReadStatus::Timeout;
      }
      slice = static_cast<int>(
          std::min<long long>(slice, (idle_timeout_ - elapsed).count()));
    }

    pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int pr = ::poll(&pfd, 1, slice);
    if (pr < 0) {
      if (errno == EINTR) {
        continue;
      }
      err = std::string("poll failed: ") + std::strerror(errno);
      return ReadStatus::Error;
    }
    if (pr == 0) {
      continue;
    }

    out.resize(max_bytes);
    const ssize_t r = ::read(fd_, out.data(), max_bytes);
    if (r > 0) {
      out.resize(static_cast<std::size_t>(r));
      return ReadStatus::Data;
    }
    out.clear();
    if (r == 0) {
      return ReadStatus::EndOfStream;
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
      continue;
    }
    if (closed_.load()) {
      return ReadStatus::EndOfStream;
    }
    err = std::string("read failed: ") + std::strerror(errno);
    return ReadStatus::Error;
  }
}

bool FdStream::write_all(const uint8_t *data, std::size_t len,
                         std::string &err) {
  err.clear();

  while (len > 0) {
    if (closed_.load()) {
      err = "stream closed";
      return false;
    }

    ssize_t w;
    if (is_socket_) {
      w = ::send(fd_, data, len, MSG_NOSIGNAL);
    } else {
      w = ::write(fd_, data, len);
    }

    if (w > 0) {
      data += static_cast<std::size_t>(w);
      len -= static_cast<std::size_t>(w);
      continue;
    }
    if (w < 0 && errno == EINTR) {
      continue;
    }
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd pfd{};
      pfd.fd = fd_;
      pfd.events = POLLOUT;
      ::poll(&pfd, 1, kPollSliceMs);
      continue;
    }

    err = std::string("write failed: ") +
          (w < 0 ? std::strerror(errno) : "wrote 0 bytes");
    return false;
  }

  return true;
}

void FdStream::close() {
  if (closed_.exchange(true)) {
    return;
  }
  // The descriptor itself is released in the destructor so a concurrent
  // reader never touches a recycled fd. Shutdown wakes it up now.
  if (is_socket_ && fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

} // namespace transport
