#pragma once

#include <cstdint>
#include <string_view>

namespace vinforge::core {
namespace store {

/*
===============================================================================
 store::Status
===============================================================================

Outcome classification shared by every SequenceStore backend.

A status other than Ok never carries a value. Callers must not interpret a
failed allocation as "zero" or any other default: that would reissue numbers.

Timeout is special for the remote backend: the request may have reached the
server and the increment may have landed. Retrying is safe (a number may be
skipped), inventing a number locally is not.
===============================================================================
*/

enum class Status : std::uint8_t {
    Ok = 0,

    // --- Caller errors ------------------------------------------------------
    InvalidPrefix,        // Empty prefix or prefix with characters unsafe for the backend
    InvalidValue,         // Reset value above MAX_COUNTER_VALUE

    // --- Transient / recoverable --------------------------------------------
    Timeout,              // Deadline expired (remote: outcome unknown)
    BackendUnavailable,   // Remote store unreachable or connection lost

    // --- Backend failures ---------------------------------------------------
    ProtocolError,        // Remote store answered with an error or an unexpected reply
    PersistFailed,        // Local store could not durably write the new state
    Corrupted,            // Local store file exists but cannot be parsed
    CounterExhausted      // Counter already at MAX_COUNTER_VALUE, nothing left to hand out
};


[[nodiscard]]
inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
    case Status::Ok:                 return "Ok";
    case Status::InvalidPrefix:      return "InvalidPrefix";
    case Status::InvalidValue:       return "InvalidValue";
    case Status::Timeout:            return "Timeout";
    case Status::BackendUnavailable: return "BackendUnavailable";
    case Status::ProtocolError:      return "ProtocolError";
    case Status::PersistFailed:      return "PersistFailed";
    case Status::Corrupted:          return "Corrupted";
    case Status::CounterExhausted:   return "CounterExhausted";
    default:                         return "Unknown";
    }
}

// Which concrete backend a store is
enum class Backend : std::uint8_t {
    File,
    Remote
};

[[nodiscard]]
inline constexpr std::string_view to_string(Backend b) noexcept {
    switch (b) {
    case Backend::File:   return "file";
    case Backend::Remote: return "kv";
    default:              return "unknown";
    }
}

} // namespace store
} // namespace vinforge::core
