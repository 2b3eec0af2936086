#pragma once

#include <array>
#include <cstdint>
#include <cstddef>

namespace vinforge::core::codec {

// ============================================================================
// Model-year table (position 10)
// ============================================================================
//
// 2001-2009 map to '1'..'9', 2010 onwards to letters. I, O, Q, U and Z are
// skipped so that the year character can never be confused with 1, 0 or 2.
// The cycle restarts in 2031, which this table deliberately does not cover.
//
inline constexpr int MIN_MODEL_YEAR = 2001;
inline constexpr int MAX_MODEL_YEAR = 2030;

inline constexpr std::array<char, MAX_MODEL_YEAR - MIN_MODEL_YEAR + 1> YEAR_CODES = {
    '1', '2', '3', '4', '5', '6', '7', '8', '9',            // 2001-2009
    'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H',                 // 2010-2017
    'J', 'K', 'L', 'M', 'N', 'P', 'R', 'S', 'T',            // 2018-2026
    'V', 'W', 'X', 'Y'                                      // 2027-2030
};

[[nodiscard]]
inline constexpr bool is_supported_year(int year) noexcept {
    return year >= MIN_MODEL_YEAR && year <= MAX_MODEL_YEAR;
}

// Returns the year character, or '\0' when the year is not supported
[[nodiscard]]
inline constexpr char year_code(int year) noexcept {
    return is_supported_year(year) ? YEAR_CODES[static_cast<std::size_t>(year - MIN_MODEL_YEAR)] : '\0';
}

// Reverse lookup; 0 when the character is not a year code
[[nodiscard]]
inline constexpr int year_from_code(char code) noexcept {
    for (std::size_t i = 0; i < YEAR_CODES.size(); ++i) {
        if (YEAR_CODES[i] == code) {
            return MIN_MODEL_YEAR + static_cast<int>(i);
        }
    }
    return 0;
}

static_assert(year_code(2018) == 'J');
static_assert(year_code(2023) == 'P');
static_assert(year_code(2024) == 'R');
static_assert(year_code(2027) == 'V');
static_assert(year_code(2030) == 'Y');

} // namespace vinforge::core::codec
