/*
================================================================================
Sequence Configuration
================================================================================

Compile-time limits governing sequence allocation and batch generation.

Sequence numbers occupy the last six characters of a code, so the largest
value that can be rendered is 999999. Stores never refuse to go beyond it:
crossing the limit is a soft condition reported through the log so that
operators rotate to a new prefix. The warning threshold fires earlier so the
rotation can be planned before the limit is hit.

Invariant:
    SEQUENCE_WARNING_THRESHOLD < MAX_SEQUENCE
================================================================================
*/
#pragma once

#include <cstdint>
#include <cstddef>
#include <chrono>
#include <limits>
#include <string_view>


namespace vinforge::core::config::sequence {

// -----------------------------------------------------------------------------
// Sequence limits
// -----------------------------------------------------------------------------
inline constexpr static std::uint64_t MIN_SEQUENCE               = 1;
inline constexpr static std::uint64_t MAX_SEQUENCE               = 999'999;
inline constexpr static std::uint64_t SEQUENCE_WARNING_THRESHOLD = 990'000;
inline constexpr static std::size_t   SEQUENCE_DIGITS            = 6;

// Largest counter value a store holds. Remote INCR is signed 64-bit, the
// file store uses the same bound so both backends agree.
inline constexpr static std::uint64_t MAX_COUNTER_VALUE =
    static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

static_assert(SEQUENCE_WARNING_THRESHOLD < MAX_SEQUENCE);
static_assert(MAX_SEQUENCE < MAX_COUNTER_VALUE);

// -----------------------------------------------------------------------------
// Batch limits
// -----------------------------------------------------------------------------
inline constexpr static std::uint32_t MIN_BATCH_QUANTITY = 1;
inline constexpr static std::uint32_t MAX_BATCH_QUANTITY = 10'000;

// -----------------------------------------------------------------------------
// Store defaults
// -----------------------------------------------------------------------------

// Key namespace used by the remote store ("chassis_seq:<prefix>")
inline constexpr static std::string_view REMOTE_KEY_NAMESPACE = "chassis_seq:";

// Upper bound on connections one remote store keeps open
inline constexpr static std::size_t DEFAULT_REMOTE_POOL_SIZE = 8;

// File used by the local store when nothing else is configured
inline constexpr static std::string_view DEFAULT_SEQUENCE_FILE = "data/chassis_sequences.json";

// Deadline applied by callers that do not supply one
inline constexpr static std::chrono::milliseconds DEFAULT_OPERATION_TIMEOUT{5'000};

// Deadline for a whole batch when the caller does not supply one
inline constexpr static std::chrono::milliseconds DEFAULT_BATCH_TIMEOUT{60'000};

} // namespace vinforge::core::config::sequence
