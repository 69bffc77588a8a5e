#include "frame_reassembler.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "errors.hpp"

namespace reassembly {

using frame_relay::ProtocolError;
using wire::HeaderVariant;

SizingPolicy SizingPolicy::fixed(uint32_t width, uint32_t height) {
  SizingPolicy p;
  p.variant = HeaderVariant::Fixed;
  p.fixed_width = width;
  p.fixed_height = height;
  return p;
}

SizingPolicy SizingPolicy::header_prefixed(HeaderVariant variant,
                                           const wire::WireLimits &limits) {
  if (variant == HeaderVariant::Fixed) {
    throw std::invalid_argument("header_prefixed policy needs a header variant");
  }
  SizingPolicy p;
  p.variant = variant;
  p.limits = limits;
  return p;
}

uint64_t SizingPolicy::fixed_message_bytes() const {
  return wire::rgba_payload_bytes(fixed_width, fixed_height);
}

FrameReassembler::FrameReassembler(const SizingPolicy &policy,
                                   std::size_t buffer_capacity)
    : policy_(policy), buffer_(buffer_capacity) {
  if (policy_.variant == HeaderVariant::Fixed) {
    const uint64_t n = policy_.fixed_message_bytes();
    if (n == 0) {
      throw std::invalid_argument("fixed frame size must be non-zero");
    }
    if (n > buffer_capacity) {
      throw std::invalid_argument("buffer capacity " +
                                  std::to_string(buffer_capacity) +
                                  " below fixed frame size " +
                                  std::to_string(n));
    }
  } else if (wire::header_size(policy_.variant) > buffer_capacity) {
    throw std::invalid_argument("buffer capacity below header size");
  }
}

std::size_t FrameReassembler::prepare_read() {
  buffer_.compact();
  if (buffer_.full()) {
    throw ProtocolError("buffer full with no complete message",
                        buffer_.unread(), buffer_.capacity());
  }
  return buffer_.free_space();
}

std::size_t FrameReassembler::ingest(const uint8_t *data, std::size_t len,
                                     const FrameSink &sink) {
  prepare_read();
  buffer_.append(data, len);
  return extract(sink);
}

std::size_t FrameReassembler::finish() {
  const std::size_t n = buffer_.unread();
  if (n > 0) {
    std::cerr << "[Reassembler] end of stream with " << n
              << " unprocessed bytes after " << frames_emitted_ << " frames\n";
  }
  return n;
}

std::size_t FrameReassembler::extract(const FrameSink &sink) {
  std::size_t emitted = 0;
  if (policy_.variant == HeaderVariant::Fixed) {
    while (extract_fixed(sink)) {
      ++emitted;
    }
  } else {
    while (extract_prefixed(sink)) {
      ++emitted;
    }
  }
  return emitted;
}

bool FrameReassembler::extract_fixed(const FrameSink &sink) {
  const std::size_t n = static_cast<std::size_t>(policy_.fixed_message_bytes());
  if (buffer_.unread() < n) {
    return false;
  }

  Frame frame;
  frame.width = policy_.fixed_width;
  frame.height = policy_.fixed_height;
  frame.pixels.assign(buffer_.unread_data(), buffer_.unread_data() + n);
  emit(std::move(frame), n, sink);
  return true;
}

bool FrameReassembler::start_message() {
  const std::size_t hs = wire::header_size(policy_.variant);
  if (buffer_.unread() < hs) {
    return false;
  }

  const wire::FrameHeader h = wire::decode_header(
      policy_.variant, buffer_.unread_data(), hs, policy_.limits);

  // Smallest message this header can introduce.
  uint64_t min_total = hs + static_cast<uint64_t>(h.payload_length);
  if (policy_.variant == HeaderVariant::Basic) {
    min_total += wire::kChunkPrefixBytes * static_cast<uint64_t>(h.chunk_count);
  } else if (policy_.variant == HeaderVariant::Stamped) {
    min_total += wire::kChunkPrefixBytes;
  }
  if (min_total > buffer_.capacity()) {
    throw ProtocolError("message larger than buffer capacity", min_total,
                        buffer_.capacity());
  }

  pending_ = PendingMessage();
  pending_.active = true;
  pending_.header = h;
  pending_.cursor = hs;
  pending_.pixels.reserve(h.payload_length);
  return true;
}

void FrameReassembler::check_chunk(uint32_t chunk_len) {
  const wire::FrameHeader &h = pending_.header;

  if (chunk_len == 0) {
    throw ProtocolError("zero-length chunk " +
                        std::to_string(pending_.chunks_seen + 1));
  }
  if (pending_.payload_seen + chunk_len > h.payload_length) {
    throw ProtocolError("chunk overruns declared payload", h.payload_length,
                        pending_.payload_seen + chunk_len);
  }

  pending_.payload_seen += chunk_len;
  pending_.chunks_seen += 1;

  if (policy_.variant == HeaderVariant::Basic) {
    if (pending_.chunks_seen == h.chunk_count &&
        pending_.payload_seen != h.payload_length) {
      throw ProtocolError("chunk lengths do not sum to payload_length",
                          h.payload_length, pending_.payload_seen);
    }
    if (pending_.payload_seen == h.payload_length &&
        pending_.chunks_seen != h.chunk_count) {
      throw ProtocolError("payload complete before declared chunk count",
                          h.chunk_count, pending_.chunks_seen);
    }
  }

  // Where the message will end, counting prefixes still to come.
  const uint64_t remaining_payload = h.payload_length - pending_.payload_seen;
  uint64_t remaining_prefixes = 0;
  if (policy_.variant == HeaderVariant::Basic) {
    remaining_prefixes = h.chunk_count - pending_.chunks_seen;
  } else if (remaining_payload > 0) {
    remaining_prefixes = 1;
  }
  const uint64_t projected_end =
      pending_.cursor + wire::kChunkPrefixBytes + chunk_len +
      remaining_payload + remaining_prefixes * wire::kChunkPrefixBytes;
  if (projected_end > buffer_.capacity()) {
    throw ProtocolError("message exceeds buffer capacity", projected_end,
                        buffer_.capacity());
  }
}

bool FrameReassembler::extract_prefixed(const FrameSink &sink) {
  if (!pending_.active && !start_message()) {
    return false;
  }

  const uint8_t *base = buffer_.unread_data();
  const std::size_t avail = buffer_.unread();
  const wire::FrameHeader &h = pending_.header;

  if (policy_.variant == HeaderVariant::Dimensions) {
    const std::size_t end = pending_.cursor + h.payload_length;
    if (avail < end) {
      return false;
    }
    pending_.pixels.assign(base + pending_.cursor, base + end);
    pending_.cursor = end;
  } else {
    while (true) {
      if (!pending_.in_chunk) {
        if (pending_.payload_seen == h.payload_length) {
          break;
        }
        if (avail - pending_.cursor < wire::kChunkPrefixBytes) {
          return false;
        }
        const uint32_t n = wire::decode_u32_le(base + pending_.cursor);
        check_chunk(n);
        pending_.cursor += wire::kChunkPrefixBytes;
        pending_.chunk_len = n;
        pending_.in_chunk = true;
      }

      if (avail - pending_.cursor < pending_.chunk_len) {
        return false;
      }
      pending_.pixels.insert(pending_.pixels.end(), base + pending_.cursor,
                             base + pending_.cursor + pending_.chunk_len);
      pending_.cursor += pending_.chunk_len;
      pending_.in_chunk = false;
    }
  }

  Frame frame;
  frame.width = h.width;
  frame.height = h.height;
  frame.pixels = std::move(pending_.pixels);
  frame.frame_timestamp = h.frame_timestamp;
  frame.pose_timestamp = h.pose_timestamp;
  frame.pose_id = h.pose_id;

  const std::size_t consumed = pending_.cursor;
  pending_ = PendingMessage();
  emit(std::move(frame), consumed, sink);
  return true;
}

void FrameReassembler::emit(Frame &&frame, std::size_t consumed,
                            const FrameSink &sink) {
  buffer_.consume(consumed);
  ++frames_emitted_;
  frame.sequence = frames_emitted_;
  if (sink) {
    sink(std::move(frame));
  }
}

} // namespace reassembly
