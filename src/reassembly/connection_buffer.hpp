#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace reassembly {

/**
 * @brief Fixed-capacity staging area for one connection.
 *
 * Invariant: read_pos <= write_pos <= capacity. Bytes in [read_pos, write_pos)
 * are received but not yet consumed. The buffer never grows.
 */
class ConnectionBuffer {
public:
  // Throws frame_relay::AllocationError if the storage cannot be obtained.
  explicit ConnectionBuffer(std::size_t capacity);

  ConnectionBuffer(const ConnectionBuffer &) = delete;
  ConnectionBuffer &operator=(const ConnectionBuffer &) = delete;

  // Moves unread bytes to offset 0. No-op when read_pos is already 0.
  void compact();

  // Throws frame_relay::ProtocolError if len exceeds free_space().
  void append(const uint8_t *data, std::size_t len);

  // Marks n unread bytes as consumed.
  void consume(std::size_t n);

  const uint8_t *unread_data() const { return bytes_.data() + read_pos_; }

  std::size_t capacity() const { return bytes_.size(); }
  std::size_t read_pos() const { return read_pos_; }
  std::size_t write_pos() const { return write_pos_; }
  std::size_t unread() const { return write_pos_ - read_pos_; }
  std::size_t free_space() const { return bytes_.size() - write_pos_; }
  bool full() const { return write_pos_ == bytes_.size(); }

private:
  std::vector<uint8_t> bytes_;
  std::size_t read_pos_ = 0;
  std::size_t write_pos_ = 0;
};

} // namespace reassembly
