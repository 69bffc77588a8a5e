#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "transport/byte_stream.hpp"

namespace transport {

enum class EndpointKind {
  Unix, // unix:<path>        Unix domain stream socket
  Tcp,  // tcp:<host>:<port>  TCP socket
  Fifo  // fifo:<path>        named FIFO, one direction only
};

struct Endpoint {
  EndpointKind kind = EndpointKind::Unix;
  std::string path; // Unix, Fifo
  std::string host; // Tcp
  uint16_t port = 0;

  std::string to_string() const;
};

// Parse "unix:/tmp/x.sock", "tcp:127.0.0.1:9000" or "fifo:/tmp/x.fifo".
// Throws std::runtime_error on malformed input.
Endpoint parse_endpoint(const std::string &text);

// Open the client side. Returns nullptr and sets err on failure; the caller
// owns retry policy.
std::unique_ptr<ByteStream> connect_endpoint(const Endpoint &endpoint,
                                             std::chrono::milliseconds idle_timeout,
                                             std::string &err);

// Server side. For sockets this is a listening socket; for a FIFO it holds
// the read end and hands it out once a writer shows up.
class StreamListener {
public:
  // Throws frame_relay::TransportError if the endpoint cannot be bound.
  StreamListener(const Endpoint &endpoint,
                 std::chrono::milliseconds idle_timeout);
  ~StreamListener();

  StreamListener(const StreamListener &) = delete;
  StreamListener &operator=(const StreamListener &) = delete;

  // Waits up to `wait` for the next connection. Returns nullptr on timeout.
  // Throws frame_relay::TransportError on a listener failure.
  std::unique_ptr<ByteStream> accept(std::chrono::milliseconds wait);

  const Endpoint &endpoint() const { return endpoint_; }

private:
  std::unique_ptr<ByteStream> accept_socket(std::chrono::milliseconds wait);
  std::unique_ptr<ByteStream> accept_fifo(std::chrono::milliseconds wait);

  Endpoint endpoint_;
  std::chrono::milliseconds idle_timeout_;
  int listen_fd_ = -1;
  int fifo_fd_ = -1;
};

} // namespace transport
