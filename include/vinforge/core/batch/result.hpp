#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "vinforge/core/batch/status.hpp"
#include "vinforge/core/codec/error.hpp"
#include "vinforge/core/codec/assembler.hpp"
#include "vinforge/core/store/status.hpp"
#include "vinforge/core/timestamp.hpp"


namespace vinforge::core::batch {

// Outcome of one generate() call.
//
// `codes[i]` carries sequence number `start_sequence + i` unless another
// caller allocated on the same prefix while the batch was running.
// start/end cover rendered codes only. A value consumed in the store but too
// large to render is reported in `exhausted_sequence`.
struct Result {
    Status status = Status::Ok;
    codec::Error validation = codec::Error::None;    // set for InvalidRequest
    store::Status store_status = store::Status::Ok;  // set for store failures and CounterExhausted
    std::string message;

    codec::Fields fields;                            // upper-cased as used
    std::string prefix;
    std::int64_t quantity = 0;                       // as requested
    std::uint64_t start_sequence = 0;                // first rendered value, 0 if none
    std::uint64_t end_sequence = 0;                  // last rendered value, 0 if none
    std::uint64_t exhausted_sequence = 0;            // burnt value past MAX_SEQUENCE, 0 if none
    std::vector<std::string> codes;
    Timestamp generated_at{};

    [[nodiscard]] bool ok() const noexcept { return status == Status::Ok; }
    [[nodiscard]] std::size_t produced() const noexcept { return codes.size(); }
};

} // namespace vinforge::core::batch
