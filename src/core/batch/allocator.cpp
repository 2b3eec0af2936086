#include "vinforge/core/batch/allocator.hpp"

#include <string>
#include <string_view>
#include <sstream>
#include <utility>
#include <cstdlib>

#include "lcr/log/logger.hpp"


namespace vinforge::core::batch {

namespace {

[[nodiscard]] std::string upper(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out += codec::to_upper(c);
    return out;
}

} // namespace


Result BatchAllocator::generate(const codec::Fields& fields, std::int64_t quantity, store::Deadline deadline) {
    using namespace config::sequence;

    Result result;
    result.quantity = quantity;
    result.fields = codec::Fields{upper(fields.manufacturer_id), upper(fields.descriptor),
                                  fields.model_year, upper(fields.plant_code)};
    result.generated_at = now();

    // ---------------------------------------------------------------------
    // Validation (nothing below may run for a rejected request)
    // ---------------------------------------------------------------------
    if (quantity < static_cast<std::int64_t>(MIN_BATCH_QUANTITY) ||
        quantity > static_cast<std::int64_t>(MAX_BATCH_QUANTITY)) {
        result.status = Status::InvalidQuantity;
        std::ostringstream oss;
        oss << "quantity must be between " << MIN_BATCH_QUANTITY << " and " << MAX_BATCH_QUANTITY
            << " (got " << quantity << ")";
        result.message = oss.str();
        return result;
    }
    const codec::Error err = codec::make_prefix(result.fields, result.prefix);
    if (err != codec::Error::None) {
        result.status = Status::InvalidRequest;
        result.validation = err;
        result.message = std::string(codec::describe(err));
        if (err == codec::Error::UnsupportedYear) {
            result.message += " (got " + std::to_string(fields.model_year) + ")";
        }
        return result;
    }

    // ---------------------------------------------------------------------
    // Per-unit allocation
    // ---------------------------------------------------------------------
    result.codes.reserve(static_cast<std::size_t>(quantity));
    for (std::int64_t i = 0; i < quantity; ++i) {
        const store::Outcome next = store_.allocate_next(result.prefix, deadline);
        if (next.status == store::Status::CounterExhausted) {
            result.status = Status::SequenceExhausted;
            result.store_status = next.status;
            std::ostringstream oss;
            oss << "sequence counter cannot be incremented after " << result.codes.size() << " of " << quantity
                << " codes. Rotate to a new prefix.";
            result.message = oss.str();
            VF_ERROR("[Batch] " << result.prefix << ": " << result.message);
            return result;
        }
        if (!next.ok()) {
            result.status = Status::PartialBatchFailure;
            result.store_status = next.status;
            std::ostringstream oss;
            oss << "sequence store failed after " << result.codes.size() << " of " << quantity
                << " codes: " << store::to_string(next.status);
            result.message = oss.str();
            VF_ERROR("[Batch] " << result.prefix << ": " << result.message);
            return result;
        }

        if (next.value > MAX_SEQUENCE) {
            // The value is consumed in the store but cannot be rendered
            result.status = Status::SequenceExhausted;
            result.exhausted_sequence = next.value;
            std::ostringstream oss;
            oss << "sequence " << next.value << " exceeds " << MAX_SEQUENCE << " after " << result.codes.size()
                << " of " << quantity << " codes. Rotate to a new prefix.";
            result.message = oss.str();
            VF_ERROR("[Batch] " << result.prefix << ": " << result.message);
            return result;
        }

        std::string code;
        const codec::Error aerr = codec::assemble(result.fields, next.value, code);
        if (aerr != codec::Error::None) {
            // Fields were validated above and the range was just checked
            VF_FATAL("[Batch] invariant violation: assemble failed after validation ("
                     << codec::to_string(aerr) << ")");
            std::abort();
        }
        if (result.codes.empty()) {
            result.start_sequence = next.value;
        }
        result.end_sequence = next.value;
        result.codes.push_back(std::move(code));
    }

    VF_INFO("[Batch] " << result.prefix << ": generated " << result.codes.size() << " codes ("
            << result.start_sequence << ".." << result.end_sequence << ") via " << store_.name());
    return result;
}

} // namespace vinforge::core::batch
