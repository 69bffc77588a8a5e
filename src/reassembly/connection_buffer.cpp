#include "connection_buffer.hpp"

#include <cstring>
#include <new>
#include <stdexcept>
#include <string>

#include "errors.hpp"

namespace reassembly {

ConnectionBuffer::ConnectionBuffer(std::size_t capacity) {
  if (capacity == 0) {
    throw frame_relay::AllocationError("buffer capacity must be non-zero");
  }
  try {
    bytes_.resize(capacity);
  } catch (const std::bad_alloc &) {
    throw frame_relay::AllocationError("cannot allocate " +
                                       std::to_string(capacity) +
                                       " byte connection buffer");
  } catch (const std::length_error &) {
    throw frame_relay::AllocationError("buffer capacity " +
                                       std::to_string(capacity) +
                                       " exceeds addressable size");
  }
}

void ConnectionBuffer::compact() {
  if (read_pos_ == 0) {
    return;
  }
  const std::size_t n = unread();
  if (n > 0) {
    std::memmove(bytes_.data(), bytes_.data() + read_pos_, n);
  }
  read_pos_ = 0;
  write_pos_ = n;
}

void ConnectionBuffer::append(const uint8_t *data, std::size_t len) {
  if (len > free_space()) {
    throw frame_relay::ProtocolError("buffer overflow", write_pos_ + len,
                                     bytes_.size());
  }
  if (len > 0) {
    std::memcpy(bytes_.data() + write_pos_, data, len);
    write_pos_ += len;
  }
}

void ConnectionBuffer::consume(std::size_t n) {
  if (n > unread()) {
    throw std::logic_error("consume past write position");
  }
  read_pos_ += n;
}

} // namespace reassembly
