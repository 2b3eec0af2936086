#pragma once

#include <string_view>

namespace vinforge::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
platform-specific error codes (errno, getaddrinfo codes, ...).

Higher layers (kv::Client, store::RemoteStore) map these onto store statuses:

  Timeout                         -> store::Status::Timeout (outcome unknown)
  InvalidUrl, InvalidState        -> caller / configuration error
  everything else                 -> store::Status::BackendUnavailable
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current transport state (e.g. send before connect)

    // --- Expected / benign termination --------------------------------------
    RemoteClosed,     // Remote endpoint closed the connection

    // --- Transient / recoverable failures -----------------------------------
    Timeout,          // Deadline expired while connecting, sending or receiving
    ConnectionFailed, // Connection attempt failed (DNS, refused, unreachable, ...)

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure  // Unclassified socket failure
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace vinforge::core
