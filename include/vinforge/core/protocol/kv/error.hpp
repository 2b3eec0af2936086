#pragma once

#include <cstdint>
#include <string_view>

#include "vinforge/core/transport/error.hpp"


namespace vinforge::core::protocol::kv {

// Outcome of one request/response exchange with the key-value server
enum class Error : std::uint8_t {
    None = 0,
    NotConnected,      // No open connection (connect() not called or dropped)
    Timeout,           // Deadline expired; the request may have been applied
    TransportFailure,  // Connection refused, reset or closed by the peer
    ServerError,       // Server answered with -ERR (including rejected AUTH)
    UnexpectedReply    // Well-formed reply of the wrong type, or malformed stream
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
    case Error::None:             return "None";
    case Error::NotConnected:     return "NotConnected";
    case Error::Timeout:          return "Timeout";
    case Error::TransportFailure: return "TransportFailure";
    case Error::ServerError:      return "ServerError";
    case Error::UnexpectedReply:  return "UnexpectedReply";
    default:                      return "Unknown";
    }
}

[[nodiscard]]
inline constexpr Error from_transport(transport::Error e) noexcept {
    switch (e) {
    case transport::Error::None:         return Error::None;
    case transport::Error::Timeout:      return Error::Timeout;
    case transport::Error::InvalidState: return Error::NotConnected;
    default:                             return Error::TransportFailure;
    }
}

} // namespace vinforge::core::protocol::kv
