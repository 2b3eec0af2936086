#pragma once

#include <string>
#include <string_view>

namespace vinforge::lite {

/*
===============================================================================
Lite Error Model (v1)
===============================================================================

Lite errors represent *semantic failures* observable by service users. They
abstract away the Core status enums (codec::Error, store::Status,
batch::Status) behind a small, stable set of codes.

[validation] the request was rejected before any sequence number was
consumed (bad quantity, field length, alphabet or model year), or an
administrative value was out of range.

[unavailable] the sequence store could not be reached. Nothing was
allocated by the failing call.

[timeout] the operation hit its deadline. For the remote store the last
allocation may have landed; retrying is safe.

[partial] a batch failed after some codes were produced. The response still
carries those codes; their numbers are consumed.

[exhausted] the prefix ran past 999999 mid-batch, or its counter reached the
store's upper bound. A new prefix is required.

[storage] the store itself failed (corrupted file, failed write, protocol
violation by the server).

[configuration] the backend could not be selected (e.g. malformed URL).

Error codes may be extended in future versions, but existing values will
never change meaning.
===============================================================================
*/

enum class error_code {
    validation,
    unavailable,
    timeout,
    partial,
    exhausted,
    storage,
    configuration
};

[[nodiscard]]
inline constexpr std::string_view to_string(error_code c) noexcept {
    switch (c) {
    case error_code::validation:    return "validation";
    case error_code::unavailable:   return "unavailable";
    case error_code::timeout:       return "timeout";
    case error_code::partial:       return "partial";
    case error_code::exhausted:     return "exhausted";
    case error_code::storage:       return "storage";
    case error_code::configuration: return "configuration";
    default:                        return "unknown";
    }
}

struct error {
    error_code code = error_code::storage;
    std::string message; // Human-readable explanation
};

} // namespace vinforge::lite
