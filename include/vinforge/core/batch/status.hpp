#pragma once

#include <cstdint>
#include <string_view>

namespace vinforge::core {
namespace batch {

/*
===============================================================================
 batch::Status
===============================================================================

  Ok                   every requested code was produced
  InvalidRequest       a field failed validation (see Result::validation)
  InvalidQuantity      quantity outside 1..10000
  PartialBatchFailure  the store failed mid-batch (see Result::store_status)
  SequenceExhausted    the counter went past 999999 mid-batch

The two rejection statuses are raised before the store is touched: no
sequence number is consumed. The two failure statuses keep the codes produced
so far; the numbers already allocated are never reclaimed.
===============================================================================
*/

enum class Status : std::uint8_t {
    Ok = 0,
    InvalidRequest,
    InvalidQuantity,
    PartialBatchFailure,
    SequenceExhausted
};

[[nodiscard]]
inline constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
    case Status::Ok:                  return "Ok";
    case Status::InvalidRequest:      return "InvalidRequest";
    case Status::InvalidQuantity:     return "InvalidQuantity";
    case Status::PartialBatchFailure: return "PartialBatchFailure";
    case Status::SequenceExhausted:   return "SequenceExhausted";
    default:                          return "Unknown";
    }
}

[[nodiscard]]
inline constexpr bool is_rejection(Status s) noexcept {
    return s == Status::InvalidRequest || s == Status::InvalidQuantity;
}

} // namespace batch
} // namespace vinforge::core
