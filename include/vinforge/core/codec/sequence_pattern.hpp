#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "vinforge/core/codec/checksum.hpp"
#include "vinforge/core/codec/validator.hpp"

/*
================================================================================
Sequence Continuation
================================================================================

Extends an existing run of chassis numbers from its last two samples:

    {"AB0007", "AB0009"}  -> pattern "AB" + 4 digits, increment 2
    continue 3            -> "AB0011", "AB0013", "AB0015"

The numeric suffix is the trailing run of digits that contains the first
position where the two samples differ. Its width is kept.

When both samples are valid 17-character VINs the check character is not
part of the comparison, the suffix is confined to the serial field and every
generated VIN gets a freshly computed check character:

    {"LZSHCKZS3WS000001", "LZSHCKZS5WS000002"}
        -> "LZSHCKZS7WS000003", "LZSHCKZS9WS000004", ...

Nothing is written anywhere. Either every number is generated or none is.
================================================================================
*/

namespace vinforge::core::codec {

enum class PatternError : std::uint8_t {
    None = 0,

    TooFewSamples,          // Fewer than two existing numbers
    LengthMismatch,         // Last two samples differ in length
    NoDifference,           // Last two samples are identical
    NonNumericSuffix,       // The differing part is not a run of digits
    NonPositiveIncrement,   // Last sample is not above the one before it
    SuffixOverflow,         // Continuation would need more digits than the samples carry
    InvalidQuantity         // Nothing to generate
};

[[nodiscard]]
inline constexpr std::string_view to_string(PatternError err) noexcept {
    switch (err) {
    case PatternError::None:                 return "None";
    case PatternError::TooFewSamples:        return "TooFewSamples";
    case PatternError::LengthMismatch:       return "LengthMismatch";
    case PatternError::NoDifference:         return "NoDifference";
    case PatternError::NonNumericSuffix:     return "NonNumericSuffix";
    case PatternError::NonPositiveIncrement: return "NonPositiveIncrement";
    case PatternError::SuffixOverflow:       return "SuffixOverflow";
    case PatternError::InvalidQuantity:      return "InvalidQuantity";
    default:                                 return "Unknown";
    }
}

struct SequencePattern {
    std::string prefix;            // everything before the numeric suffix
    std::size_t digits = 0;        // suffix width
    std::uint64_t last = 0;        // suffix value of the last sample
    std::uint64_t increment = 0;
    bool vin = false;              // check character recomputed per code

    // "AB + 4 digits (increment 2)"
    [[nodiscard]] std::string describe() const {
        std::string out = prefix;
        out += " + ";
        out += std::to_string(digits);
        out += " digits (increment ";
        out += std::to_string(increment);
        out += vin ? ", VIN check character)" : ")";
        return out;
    }
};

// First index of the VIN serial field (positions 12-17)
inline constexpr std::size_t VIN_SERIAL_POSITION = 11;

// A suffix of this many digits always fits in 64 bits
inline constexpr std::size_t MAX_SUFFIX_DIGITS = 19;


namespace detail {

[[nodiscard]]
inline constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]]
inline constexpr std::uint64_t max_for_digits(std::size_t digits) noexcept {
    std::uint64_t v = 1;
    for (std::size_t i = 0; i < digits; ++i) v *= 10;
    return v - 1;
}

[[nodiscard]]
inline bool parse_digits(std::string_view s, std::uint64_t& out) noexcept {
    if (s.empty() || s.size() > MAX_SUFFIX_DIGITS) {
        return false;
    }
    std::uint64_t v = 0;
    for (char c : s) {
        if (!is_digit(c)) return false;
        v = v * 10 + static_cast<std::uint64_t>(c - '0');
    }
    out = v;
    return true;
}

} // namespace detail


[[nodiscard]]
inline PatternError detect_pattern(const std::vector<std::string>& existing, SequencePattern& out) {
    if (existing.size() < 2) {
        return PatternError::TooFewSamples;
    }
    const std::string& last = existing[existing.size() - 1];
    const std::string& prev = existing[existing.size() - 2];
    if (last.size() != prev.size()) {
        return PatternError::LengthMismatch;
    }

    const bool vin = validate_code(last).valid && validate_code(prev).valid;

    std::size_t first = 0;
    while (first < last.size() &&
           (last[first] == prev[first] || (vin && first == CHECK_POSITION))) {
        ++first;
    }
    if (first == last.size()) {
        return PatternError::NoDifference;
    }

    // Widen the suffix to the whole trailing digit run
    const std::size_t floor = vin ? VIN_SERIAL_POSITION : 0;
    if (first < floor) {
        return PatternError::NonNumericSuffix;
    }
    std::size_t begin = first;
    while (begin > floor && detail::is_digit(last[begin - 1]) && detail::is_digit(prev[begin - 1])) {
        --begin;
    }

    const std::string_view suffix_last = std::string_view(last).substr(begin);
    const std::string_view suffix_prev = std::string_view(prev).substr(begin);
    if (suffix_last.size() > MAX_SUFFIX_DIGITS) {
        for (char c : suffix_last) {
            if (!detail::is_digit(c)) return PatternError::NonNumericSuffix;
        }
        return PatternError::SuffixOverflow;
    }
    std::uint64_t num_last = 0;
    std::uint64_t num_prev = 0;
    if (!detail::parse_digits(suffix_last, num_last) || !detail::parse_digits(suffix_prev, num_prev)) {
        return PatternError::NonNumericSuffix;
    }
    if (num_last <= num_prev) {
        return PatternError::NonPositiveIncrement;
    }

    out.prefix = last.substr(0, begin);
    out.digits = suffix_last.size();
    out.last = num_last;
    out.increment = num_last - num_prev;
    out.vin = vin;
    return PatternError::None;
}

// Generates the `quantity` numbers following `existing`
[[nodiscard]]
inline PatternError continue_sequence(const std::vector<std::string>& existing, std::size_t quantity,
                                      std::vector<std::string>& out, SequencePattern* detected = nullptr) {
    if (quantity == 0) {
        return PatternError::InvalidQuantity;
    }
    SequencePattern p;
    if (const PatternError err = detect_pattern(existing, p); err != PatternError::None) {
        return err;
    }
    const std::uint64_t limit = detail::max_for_digits(p.digits);
    if (p.last > limit || (limit - p.last) / p.increment < quantity) {
        return PatternError::SuffixOverflow;
    }

    std::vector<std::string> codes;
    codes.reserve(quantity);
    std::uint64_t value = p.last;
    for (std::size_t i = 0; i < quantity; ++i) {
        value += p.increment;
        std::string digits = std::to_string(value);
        std::string code = p.prefix;
        code.append(p.digits - digits.size(), '0');
        code += digits;
        if (p.vin) {
            char check = 0;
            if (compute_check(code, check) != Error::None) {
                return PatternError::NonNumericSuffix;
            }
            code[CHECK_POSITION] = check;
        }
        codes.push_back(std::move(code));
    }

    out = std::move(codes);
    if (detected) {
        *detected = std::move(p);
    }
    return PatternError::None;
}

} // namespace vinforge::core::codec
