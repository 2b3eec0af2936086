#include "vinforge/lite/service.hpp"

#include <string>
#include <utility>

// ---- Core includes (PRIVATE) ----
#include "vinforge/core/codec/validator.hpp"
#include "vinforge/core/batch/allocator.hpp"
#include "vinforge/core/store/sequence_store.hpp"
#include "vinforge/core/store/selector.hpp"
#include "vinforge/core/timestamp.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace vinforge::lite {

namespace store = vinforge::core::store;
namespace batch = vinforge::core::batch;
namespace codec = vinforge::core::codec;

namespace {

[[nodiscard]] error from_store(store::Status s, std::string_view what) {
    std::string message(what);
    message += ": ";
    message += store::to_string(s);
    switch (s) {
    case store::Status::Timeout:
        return error{error_code::timeout, std::move(message)};
    case store::Status::BackendUnavailable:
        return error{error_code::unavailable, std::move(message)};
    case store::Status::InvalidPrefix:
    case store::Status::InvalidValue:
        return error{error_code::validation, std::move(message)};
    case store::Status::CounterExhausted:
        return error{error_code::exhausted, std::move(message)};
    default:
        return error{error_code::storage, std::move(message)};
    }
}

[[nodiscard]] error from_batch(const batch::Result& r) {
    switch (r.status) {
    case batch::Status::InvalidRequest:
    case batch::Status::InvalidQuantity:
        return error{error_code::validation, r.message};
    case batch::Status::SequenceExhausted:
        return error{error_code::exhausted, r.message};
    default:
        break;
    }
    // Partial failure: nothing produced is reported as the store error itself
    if (r.codes.empty()) {
        return from_store(r.store_status, "sequence store failed");
    }
    return error{error_code::partial, r.message};
}

} // namespace


// -----------------------------
// Impl
// -----------------------------

struct Service::Impl {
    std::unique_ptr<store::SequenceStore> sequences;
    batch::BatchAllocator allocator;

    explicit Impl(std::unique_ptr<store::SequenceStore> s)
        : sequences(std::move(s))
        , allocator(*sequences)
    {
    }
};


std::unique_ptr<Service> Service::create(const service_config& cfg, error& err) {
    store::Selection sel = store::select_store(store::process_environment(), cfg.sequence_file);
    if (!sel.ok()) {
        err = error{error_code::configuration, sel.message};
        return nullptr;
    }
    VF_DEBUG("[Service] sequence store: " << sel.store->name());
    return std::make_unique<Service>(std::move(sel.store));
}

Service::Service(std::unique_ptr<core::store::SequenceStore> store)
    : impl_(std::make_unique<Impl>(std::move(store)))
{
}

Service::~Service() = default;


generate_response Service::generate(const generate_request& request) {
    const int year = request.model_year == 0 ? core::current_year() : request.model_year;
    const codec::Fields fields{request.manufacturer_id, request.descriptor, year, request.plant_code};
    batch::Result r = impl_->allocator.generate(fields, request.quantity);

    generate_response out;
    out.success = r.ok();
    out.codes = std::move(r.codes);
    out.metadata.quantity = r.quantity;
    out.metadata.manufacturer_id = r.fields.manufacturer_id;
    out.metadata.descriptor = r.fields.descriptor;
    out.metadata.model_year = r.fields.model_year;
    out.metadata.plant_code = r.fields.plant_code;
    out.metadata.prefix = r.prefix;
    out.metadata.start_sequence = r.start_sequence;
    out.metadata.end_sequence = r.end_sequence;
    out.metadata.generated_at = core::to_string(r.generated_at);
    if (!r.ok()) {
        out.failure = from_batch(r);
    }
    return out;
}

validation_report Service::validate(std::string_view code) {
    codec::ValidationResult r = codec::validate_code(code);
    return validation_report{r.valid, std::move(r.errors)};
}

bool Service::statistics(sequence_statistics& out, error& err) {
    const store::StatisticsOutcome r = impl_->sequences->statistics();
    if (!r.ok()) {
        err = from_store(r.status, "cannot read statistics");
        return false;
    }
    out = sequence_statistics{r.stats.total_prefixes, r.stats.total_issued, r.stats.max_sequence, r.stats.average_sequence};
    return true;
}

bool Service::sequences(std::map<std::string, std::uint64_t>& out, error& err) {
    store::SnapshotOutcome r = impl_->sequences->snapshot();
    if (!r.ok()) {
        err = from_store(r.status, "cannot list sequences");
        return false;
    }
    out = std::move(r.counters);
    return true;
}

bool Service::current(std::string_view prefix, std::uint64_t& out, error& err) {
    const store::Outcome r = impl_->sequences->read_current(prefix);
    if (!r.ok()) {
        err = from_store(r.status, "cannot read sequence");
        return false;
    }
    out = r.value;
    return true;
}

bool Service::reset(std::string_view prefix, std::uint64_t value, error& err) {
    const store::Status s = impl_->sequences->reset(prefix, value);
    if (s != store::Status::Ok) {
        err = from_store(s, "cannot reset sequence");
        return false;
    }
    return true;
}

bool Service::clear_all(error& err) {
    const store::Status s = impl_->sequences->clear_all();
    if (s != store::Status::Ok) {
        err = from_store(s, "cannot clear sequences");
        return false;
    }
    return true;
}

std::string_view Service::backend() const noexcept {
    return store::to_string(impl_->sequences->kind());
}


// -----------------------------------------------------------------------------
// Export helpers
// -----------------------------------------------------------------------------

std::string to_json(const generate_response& response) {
    const batch_metadata& m = response.metadata;
    std::string out;
    out.reserve(128 + response.codes.size() * 20);

    out += "{\"success\":";
    out += response.success ? "true" : "false";
    out += ",\"codes\":[";
    for (std::size_t i = 0; i < response.codes.size(); ++i) {
        if (i) out += ',';
        lcr::json::append_string(out, response.codes[i]);
    }
    out += "],\"metadata\":{\"quantity\":";
    out += std::to_string(m.quantity);
    out += ",\"manufacturerId\":";
    lcr::json::append_string(out, m.manufacturer_id);
    out += ",\"descriptor\":";
    lcr::json::append_string(out, m.descriptor);
    out += ",\"modelYear\":";
    out += std::to_string(m.model_year);
    out += ",\"plantCode\":";
    lcr::json::append_string(out, m.plant_code);
    out += ",\"prefix\":";
    lcr::json::append_string(out, m.prefix);
    out += ",\"startSequence\":";
    lcr::json::append(out, m.start_sequence);
    out += ",\"endSequence\":";
    lcr::json::append(out, m.end_sequence);
    out += ",\"produced\":";
    lcr::json::append(out, response.codes.size());
    out += ",\"generatedAt\":";
    lcr::json::append_string(out, m.generated_at);
    out += '}';
    if (response.failure) {
        out += ",\"error\":{\"code\":";
        lcr::json::append_string(out, to_string(response.failure->code));
        out += ",\"message\":";
        lcr::json::append_string(out, response.failure->message);
        out += '}';
    }
    out += '}';
    return out;
}

std::string to_csv(const std::vector<std::string>& codes) {
    std::string out = "index,vin";
    for (std::size_t i = 0; i < codes.size(); ++i) {
        out += '\n';
        lcr::json::append(out, i + 1);
        out += ',';
        out += codes[i];
    }
    return out;
}

std::string to_text(const std::vector<std::string>& codes) {
    std::string out;
    for (std::size_t i = 0; i < codes.size(); ++i) {
        if (i) out += '\n';
        out += codes[i];
    }
    return out;
}

} // namespace vinforge::lite
