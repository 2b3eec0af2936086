#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>
#include <cstdint>

#include "vinforge/lite/error.hpp"

namespace vinforge::core::store { class SequenceStore; }


namespace vinforge::lite {

// -----------------------------------------------------------------------------
// Requests / responses
// -----------------------------------------------------------------------------
struct generate_request {
    std::int64_t quantity = 1;
    std::string manufacturer_id;         // 3 characters
    std::string descriptor = "HCKZS";    // 5 characters
    int model_year = 0;                  // 2001..2030, 0: current calendar year
    std::string plant_code = "S";        // 1 character
};

struct batch_metadata {
    std::int64_t quantity = 0;
    std::string manufacturer_id;
    std::string descriptor;
    int model_year = 0;
    std::string plant_code;
    std::string prefix;
    std::uint64_t start_sequence = 0;
    std::uint64_t end_sequence = 0;
    std::string generated_at;            // ISO-8601 UTC
};

struct generate_response {
    bool success = false;
    std::vector<std::string> codes;      // produced codes, also on partial failure
    batch_metadata metadata;
    std::optional<error> failure;
};

struct validation_report {
    bool valid = false;
    std::vector<std::string> errors;
};

struct sequence_statistics {
    std::uint64_t total_prefixes = 0;
    std::uint64_t total_issued = 0;
    std::uint64_t max_sequence = 0;
    double average_sequence = 0.0;
};

struct service_config {
    /// Local sequence file. Empty: VINFORGE_SEQUENCE_FILE, then the built-in default.
    /// Ignored when the remote store is configured.
    std::filesystem::path sequence_file;
};


/*
===============================================================================
vinforge Lite Service (v1)
===============================================================================

User-facing façade over the Core codec, sequence store and batch allocator.

  - One sequence store per Service, chosen at construction and never swapped
  - Every call is synchronous and bounded by the default operation timeout
  - Failures are reported as lite::error, never by throwing
  - Thread-safe when the underlying store is (both built-in stores are)

Typical use:

    lite::error err;
    auto service = lite::Service::create({}, err);
    if (!service) { ... err.message ... }
    auto response = service->generate({5, "LZS", "HCKZS", 2028, "S"});
===============================================================================
*/
class Service {
public:
    // Builds a service on the store selected from the process environment.
    // Returns null and fills `err` on configuration errors.
    [[nodiscard]]
    static std::unique_ptr<Service> create(const service_config& cfg, error& err);

    // Builds a service on an explicit store (tests, embedding)
    explicit Service(std::unique_ptr<core::store::SequenceStore> store);

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;
    ~Service();

    // Generates `quantity` unique codes. On failure `failure` is set and
    // `codes` holds whatever was produced before the failure.
    [[nodiscard]] generate_response generate(const generate_request& request);

    // Store-independent code validation
    [[nodiscard]] static validation_report validate(std::string_view code);

    // Counter inspection
    [[nodiscard]] bool statistics(sequence_statistics& out, error& err);
    [[nodiscard]] bool sequences(std::map<std::string, std::uint64_t>& out, error& err);
    [[nodiscard]] bool current(std::string_view prefix, std::uint64_t& out, error& err);

    // Counter administration. Both can reissue codes already in the field.
    [[nodiscard]] bool reset(std::string_view prefix, std::uint64_t value, error& err);
    [[nodiscard]] bool clear_all(error& err);

    // "file" or "kv"
    [[nodiscard]] std::string_view backend() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};


// -----------------------------------------------------------------------------
// Export helpers
// -----------------------------------------------------------------------------

// {"success":...,"codes":[...],"metadata":{...}[,"error":{...}]}
[[nodiscard]] std::string to_json(const generate_response& response);

// "index,vin" header followed by one numbered row per code
[[nodiscard]] std::string to_csv(const std::vector<std::string>& codes);

// One code per line
[[nodiscard]] std::string to_text(const std::vector<std::string>& codes);

} // namespace vinforge::lite
