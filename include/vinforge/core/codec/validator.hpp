#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

#include "vinforge/core/codec/checksum.hpp"

/*
================================================================================
Code Validator
================================================================================

Store-independent validation entry point used by external tools and by the
assembler's self-check.

Unlike compute_check(), the validator is strict: a character outside the
check table is reported, never silently transliterated to 0.

Rules for 17-character VINs (ISO 3779):
  • exactly 17 characters (otherwise nothing else is evaluated)
  • alphanumeric only
  • no I, O or Q
  • check character matches (evaluated only when all rules above pass)

Manufacturer chassis numbers follow looser rules: a length window and an
optional explicit character set.
================================================================================
*/

namespace vinforge::core::codec {

enum class ChassisType : std::uint8_t {
    Vin,            // 17-character ISO 3779 code with check character
    Manufacturer    // Free-form manufacturer chassis number
};

[[nodiscard]]
inline constexpr std::string_view to_string(ChassisType t) noexcept {
    switch (t) {
        case ChassisType::Vin:          return "vin_iso3779";
        case ChassisType::Manufacturer: return "manufacturer";
        default:                        return "unknown";
    }
}

struct ValidationResult {
    bool valid = false;
    ChassisType type = ChassisType::Vin;
    std::vector<std::string> errors;
    // Empty when the check character was not evaluated
    std::optional<bool> checksum_valid;
};


namespace detail {

[[nodiscard]]
inline bool is_ascii_alnum(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

[[nodiscard]]
inline std::string join_chars(const std::vector<char>& chars) {
    std::string out;
    for (std::size_t i = 0; i < chars.size(); ++i) {
        if (i > 0) out += ", ";
        out += chars[i];
    }
    return out;
}

} // namespace detail


// ---------------------------------------------------------------------
// Validates a 17-character VIN
// ---------------------------------------------------------------------
[[nodiscard]]
inline ValidationResult validate_code(std::string_view code, bool check_checksum = true) {
    ValidationResult result;
    result.type = ChassisType::Vin;

    if (code.size() != CODE_LENGTH) {
        result.errors.push_back("invalid length: " + std::to_string(code.size()) + " (expected 17)");
        return result;
    }

    bool alnum = true;
    std::vector<char> forbidden;
    for (char c : code) {
        if (!detail::is_ascii_alnum(c)) {
            alnum = false;
        }
        else if (is_forbidden_letter(c)) {
            forbidden.push_back(c);
        }
    }
    if (!alnum) {
        result.errors.emplace_back("non-alphanumeric characters detected");
    }
    if (!forbidden.empty()) {
        result.errors.push_back("forbidden characters (I/O/Q): " + detail::join_chars(forbidden));
    }

    if (check_checksum && result.errors.empty()) {
        char expected = 0;
        (void)compute_check(code, expected); // length already checked
        const char actual = to_upper(code[CHECK_POSITION]);
        result.checksum_valid = (expected == actual);
        if (!*result.checksum_valid) {
            result.errors.push_back(std::string("invalid check character: expected '") + expected +
                                    "', got '" + actual + "'");
        }
    }

    result.valid = result.errors.empty();
    return result;
}

// ---------------------------------------------------------------------
// Validates a manufacturer chassis number.
// An empty `allowed` set means "alphanumeric".
// ---------------------------------------------------------------------
[[nodiscard]]
inline ValidationResult validate_manufacturer_chassis(std::string_view chassis,
                                                      std::size_t min_length = 13,
                                                      std::size_t max_length = 17,
                                                      std::string_view allowed = {}) {
    ValidationResult result;
    result.type = ChassisType::Manufacturer;

    if (chassis.size() < min_length || chassis.size() > max_length) {
        result.errors.push_back("length " + std::to_string(chassis.size()) + " out of bounds (" +
                                std::to_string(min_length) + "-" + std::to_string(max_length) + ")");
    }

    if (allowed.empty()) {
        for (char c : chassis) {
            if (!detail::is_ascii_alnum(c)) {
                result.errors.emplace_back("non-alphanumeric characters detected");
                break;
            }
        }
    }
    else {
        std::vector<char> rejected;
        for (char c : chassis) {
            if (allowed.find(c) == std::string_view::npos) {
                rejected.push_back(c);
            }
        }
        if (!rejected.empty()) {
            result.errors.push_back("characters not allowed: " + detail::join_chars(rejected));
        }
    }

    result.valid = result.errors.empty();
    return result;
}

// 17 characters are validated as a VIN, anything else as a manufacturer chassis
[[nodiscard]]
inline ValidationResult validate_auto(std::string_view chassis) {
    if (chassis.size() == CODE_LENGTH) {
        return validate_code(chassis);
    }
    return validate_manufacturer_chassis(chassis);
}

} // namespace vinforge::core::codec
