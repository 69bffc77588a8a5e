#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace session {

enum class EndReason {
  CleanEnd,           // peer closed on a message boundary
  EndWithUnreadBytes, // peer closed mid-message
  TransportFailure,   // read error or idle timeout
  ProtocolFailure,    // malformed input or buffer capacity exceeded
  Cancelled           // closed locally
};

inline const char *end_reason_name(EndReason reason) {
  switch (reason) {
  case EndReason::CleanEnd:
    return "clean_end";
  case EndReason::EndWithUnreadBytes:
    return "end_with_unread_bytes";
  case EndReason::TransportFailure:
    return "transport_failure";
  case EndReason::ProtocolFailure:
    return "protocol_failure";
  case EndReason::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

// What the consumer learns when a connection ends. An end is abrupt when
// bytes were left unconsumed or a fault occurred.
struct ConnectionOutcome {
  EndReason reason = EndReason::CleanEnd;
  uint64_t frames = 0;          // frames delivered before the end
  std::size_t unread_bytes = 0; // bytes of an incomplete message
  std::string message;          // error text, empty on a clean end
  std::string peer;

  bool abrupt() const {
    return reason == EndReason::EndWithUnreadBytes ||
           reason == EndReason::TransportFailure ||
           reason == EndReason::ProtocolFailure;
  }
};

} // namespace session
