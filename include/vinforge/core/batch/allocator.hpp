#pragma once

#include <cstdint>

#include "vinforge/core/batch/result.hpp"
#include "vinforge/core/codec/assembler.hpp"
#include "vinforge/core/store/sequence_store.hpp"
#include "vinforge/core/config/sequence.hpp"


namespace vinforge::core::batch {

// ============================================================================
//  class BatchAllocator
//  ----------------------------------------------------------------------------
//  Produces N codes for one field combination:
//
//      validate -> per unit { store.allocate_next(prefix) -> assemble }
//
//  Allocation and assembly are interleaved one unit at a time. Nothing is
//  reserved up front, so concurrent batches on the same prefix interleave
//  their numbers; each batch still gets unique, increasing values.
//
//  The allocator holds a reference to a store owned elsewhere. It keeps no
//  state of its own and may be shared between threads if the store is.
// ----------------------------------------------------------------------------
class BatchAllocator {
public:
    explicit BatchAllocator(store::SequenceStore& store) noexcept
        : store_(store)
    {}

    [[nodiscard]]
    Result generate(const codec::Fields& fields, std::int64_t quantity, store::Deadline deadline);

    [[nodiscard]]
    Result generate(const codec::Fields& fields, std::int64_t quantity) {
        return generate(fields, quantity, store::deadline_after(config::sequence::DEFAULT_BATCH_TIMEOUT));
    }

    [[nodiscard]] store::SequenceStore& store() noexcept { return store_; }

private:
    store::SequenceStore& store_;
};

} // namespace vinforge::core::batch
