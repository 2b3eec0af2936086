#pragma once

#include <array>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "vinforge/core/codec/assembler.hpp"
#include "vinforge/core/codec/validator.hpp"

/*
================================================================================
Random Test Codes
================================================================================

Well-formed but arbitrary codes for test fixtures and demos. No counter is
touched, so the output may repeat and may collide with issued codes.

  Vin            WMI from a small pool, random VDS, model year 2020..2028,
                 plant 'S', serial 1..99999, valid check character
  Manufacturer   9 random characters, 2-digit year 20..30, 5-digit serial
                 1..9999 (16 characters)
================================================================================
*/

namespace vinforge::core::codec {

inline constexpr std::array<std::string_view, 5> RANDOM_MANUFACTURERS = {"LZS", "LFV", "LBV", "LDC", "LGX"};
inline constexpr std::string_view RANDOM_ALPHABET = "ABCDEFGHJKLMNPRSTUVWXY0123456789";

inline constexpr int RANDOM_MIN_YEAR = 2020;
inline constexpr int RANDOM_MAX_YEAR = 2028;
inline constexpr std::uint64_t RANDOM_MAX_VIN_SERIAL = 99'999;
inline constexpr std::size_t RANDOM_MANUFACTURER_PREFIX = 9;
inline constexpr std::uint32_t RANDOM_MAX_MANUFACTURER_SERIAL = 9'999;


namespace detail {

template<class URBG>
[[nodiscard]]
inline std::string random_characters(URBG& rng, std::size_t count) {
    std::uniform_int_distribution<std::size_t> pick(0, RANDOM_ALPHABET.size() - 1);
    std::string out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out += RANDOM_ALPHABET[pick(rng)];
    }
    return out;
}

inline void append_padded(std::string& out, std::uint64_t value, std::size_t width) {
    const std::string digits = std::to_string(value);
    if (digits.size() < width) {
        out.append(width - digits.size(), '0');
    }
    out += digits;
}

} // namespace detail


template<class URBG>
[[nodiscard]]
inline Error random_codes(URBG& rng, std::size_t quantity, ChassisType type, std::vector<std::string>& out) {
    std::vector<std::string> codes;
    codes.reserve(quantity);

    if (type == ChassisType::Vin) {
        std::uniform_int_distribution<std::size_t> wmi(0, RANDOM_MANUFACTURERS.size() - 1);
        std::uniform_int_distribution<int> year(RANDOM_MIN_YEAR, RANDOM_MAX_YEAR);
        std::uniform_int_distribution<std::uint64_t> serial(1, RANDOM_MAX_VIN_SERIAL);
        for (std::size_t i = 0; i < quantity; ++i) {
            const Fields fields{std::string(RANDOM_MANUFACTURERS[wmi(rng)]),
                                detail::random_characters(rng, DESCRIPTOR_LENGTH), year(rng), "S"};
            std::string code;
            if (const Error err = assemble(fields, serial(rng), code); err != Error::None) {
                return err;
            }
            codes.push_back(std::move(code));
        }
    }
    else {
        std::uniform_int_distribution<std::uint32_t> year(20, 30);
        std::uniform_int_distribution<std::uint32_t> serial(1, RANDOM_MAX_MANUFACTURER_SERIAL);
        for (std::size_t i = 0; i < quantity; ++i) {
            std::string code = detail::random_characters(rng, RANDOM_MANUFACTURER_PREFIX);
            detail::append_padded(code, year(rng), 2);
            detail::append_padded(code, serial(rng), 5);
            codes.push_back(std::move(code));
        }
    }

    out = std::move(codes);
    return Error::None;
}

// Seeds a fresh engine from std::random_device
[[nodiscard]]
inline Error random_codes(std::size_t quantity, ChassisType type, std::vector<std::string>& out) {
    std::random_device rd;
    std::mt19937 rng(rd());
    return random_codes(rng, quantity, type, out);
}

} // namespace vinforge::core::codec
