#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace frame_relay {

// Connect/read/write failure, including the idle-read timeout.
// Recoverable only by opening a fresh connection.
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string &msg)
      : std::runtime_error("transport error: " + msg) {}
};

// Malformed header, payload-length mismatch or buffer capacity exceeded.
// Fatal for the current connection; there is no resynchronization.
class ProtocolError : public std::runtime_error {
public:
  explicit ProtocolError(const std::string &msg)
      : std::runtime_error("protocol error: " + msg) {}

  ProtocolError(const std::string &msg, std::size_t declared,
                std::size_t actual)
      : std::runtime_error("protocol error: " + msg +
                           " (declared=" + std::to_string(declared) +
                           ", actual=" + std::to_string(actual) + ")"),
        declared_(declared), actual_(actual), has_lengths_(true) {}

  std::size_t declared() const { return declared_; }
  std::size_t actual() const { return actual_; }
  bool has_lengths() const { return has_lengths_; }

private:
  std::size_t declared_ = 0;
  std::size_t actual_ = 0;
  bool has_lengths_ = false;
};

// Connection buffer could not be sized as configured. Fatal at startup.
class AllocationError : public std::runtime_error {
public:
  explicit AllocationError(const std::string &msg)
      : std::runtime_error("allocation error: " + msg) {}
};

} // namespace frame_relay
