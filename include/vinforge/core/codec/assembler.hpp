#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstdlib>

#include "vinforge/core/codec/error.hpp"
#include "vinforge/core/codec/checksum.hpp"
#include "vinforge/core/codec/year_table.hpp"
#include "vinforge/core/codec/validator.hpp"
#include "vinforge/core/config/sequence.hpp"
#include "lcr/log/logger.hpp"

/*
================================================================================
Code Assembler
================================================================================

Builds a 17-character code from its structural fields:

    position   1-3   4-8   9      10     11     12-17
    field      WMI   VDS   CHECK  YEAR   PLANT  SEQUENCE (zero padded)

The first ten characters without the check character (WMI + VDS + YEAR +
PLANT) form the identifier prefix: the key of one sequence counter.

Every field is validated before anything is built. Output is upper case, so
fields that only differ in case share one prefix and one counter.
================================================================================
*/

namespace vinforge::core::codec {

inline constexpr std::size_t MANUFACTURER_LENGTH = 3;
inline constexpr std::size_t DESCRIPTOR_LENGTH   = 5;
inline constexpr std::size_t PLANT_LENGTH        = 1;
inline constexpr std::size_t PREFIX_LENGTH       = MANUFACTURER_LENGTH + DESCRIPTOR_LENGTH + 1 + PLANT_LENGTH;

// Structural fields of a code (everything but check character and sequence)
struct Fields {
    std::string manufacturer_id;   // WMI, 3 characters
    std::string descriptor;        // VDS, 5 characters
    int model_year = 0;            // 2001..2030
    std::string plant_code;        // 1 character
};


namespace detail {

[[nodiscard]]
inline bool all_code_characters(std::string_view s) noexcept {
    for (char c : s) {
        if (!is_code_character(c)) return false;
    }
    return true;
}

inline void append_upper(std::string& out, std::string_view s) {
    for (char c : s) out += to_upper(c);
}

} // namespace detail


// Checks lengths, alphabet and year without building anything
[[nodiscard]]
inline Error validate_fields(const Fields& f) noexcept {
    if (f.manufacturer_id.size() != MANUFACTURER_LENGTH) return Error::ManufacturerLength;
    if (f.descriptor.size() != DESCRIPTOR_LENGTH)        return Error::DescriptorLength;
    if (f.plant_code.size() != PLANT_LENGTH)             return Error::PlantLength;
    if (!detail::all_code_characters(f.manufacturer_id) ||
        !detail::all_code_characters(f.descriptor) ||
        !detail::all_code_characters(f.plant_code)) {
        return Error::ForbiddenCharacter;
    }
    if (!is_supported_year(f.model_year))                return Error::UnsupportedYear;
    return Error::None;
}

// Identifier prefix: WMI + VDS + YEAR + PLANT (10 characters, upper case)
[[nodiscard]]
inline Error make_prefix(const Fields& f, std::string& out) {
    const Error err = validate_fields(f);
    if (err != Error::None) {
        return err;
    }
    out.clear();
    out.reserve(PREFIX_LENGTH);
    detail::append_upper(out, f.manufacturer_id);
    detail::append_upper(out, f.descriptor);
    out += year_code(f.model_year);
    detail::append_upper(out, f.plant_code);
    return Error::None;
}

[[nodiscard]]
inline constexpr bool is_valid_sequence(std::uint64_t sequence) noexcept {
    return sequence >= config::sequence::MIN_SEQUENCE && sequence <= config::sequence::MAX_SEQUENCE;
}

// ---------------------------------------------------------------------
// Assembles a full code.
//
// With `verify` set, the finished code is re-validated end to end. A
// failure there cannot be caused by input: it means the codec itself is
// broken, so the process is aborted rather than handing out a plausible
// but wrong code.
//
// Example:
//   assemble({"LZS", "HCKZS", 2028, "S"}, 1, out)  -> "LZSHCKZS3WS000001"
// ---------------------------------------------------------------------
[[nodiscard]]
inline Error assemble(const Fields& f, std::uint64_t sequence, std::string& out, bool verify = true) {
    std::string prefix;
    Error err = make_prefix(f, prefix);
    if (err != Error::None) {
        return err;
    }
    if (!is_valid_sequence(sequence)) {
        return Error::SequenceRange;
    }

    char digits[config::sequence::SEQUENCE_DIGITS];
    std::uint64_t v = sequence;
    for (std::size_t i = config::sequence::SEQUENCE_DIGITS; i-- > 0;) {
        digits[i] = static_cast<char>('0' + (v % 10));
        v /= 10;
    }

    std::string code;
    code.reserve(CODE_LENGTH);
    code.append(prefix, 0, MANUFACTURER_LENGTH + DESCRIPTOR_LENGTH);
    code += '0'; // placeholder, ignored by the codec
    code.append(prefix, MANUFACTURER_LENGTH + DESCRIPTOR_LENGTH, std::string::npos);
    code.append(digits, sizeof(digits));

    char check = 0;
    err = compute_check(code, check);
    if (err != Error::None) {
        return err;
    }
    code[CHECK_POSITION] = check;

    if (verify) {
        const ValidationResult r = validate_code(code);
        if (!r.valid) {
            VF_FATAL("[Assembler] invariant violation: assembled code " << code << " failed self-check ("
                     << (r.errors.empty() ? std::string("no detail") : r.errors.front()) << ")");
            std::abort();
        }
    }

    out = std::move(code);
    return Error::None;
}

// Convenience overload mirroring the positional field order
[[nodiscard]]
inline Error assemble(std::string_view manufacturer_id, std::string_view descriptor, int model_year,
                      std::string_view plant_code, std::uint64_t sequence, std::string& out, bool verify = true) {
    return assemble(Fields{std::string(manufacturer_id), std::string(descriptor), model_year, std::string(plant_code)},
                    sequence, out, verify);
}

} // namespace vinforge::core::codec
