#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string_view>

#include "vinforge/core/codec/error.hpp"

/*
================================================================================
Check Character Codec (ISO 3779)
================================================================================

Maps a 17-character code to the check character stored at position 9.

  1. Every character (case-insensitive) is transliterated to a number:
       digits          -> themselves
       A..H            -> 1..8
       J..N            -> 1..5
       P -> 7, R -> 9
       S..Z            -> 2..9
  2. Each value is multiplied by the weight of its position:
       8 7 6 5 4 3 2 10 0 9 8 7 6 5 4 3 2
     The check position carries weight 0, so its character is ignored.
  3. The products are summed; sum % 11 gives the check digit, and a
     remainder of 10 is written as 'X'.

Characters outside the table (I, O, Q, punctuation) transliterate to 0.
The codec itself is lenient; rejecting such codes is the job of
codec::validate_code() and codec::assemble().

All functions are pure, allocation-free and noexcept.
================================================================================
*/

namespace vinforge::core::codec {

inline constexpr std::size_t CODE_LENGTH     = 17;
inline constexpr std::size_t CHECK_POSITION  = 8;   // 0-based index of the check character

inline constexpr std::array<std::uint8_t, CODE_LENGTH> WEIGHTS = {
    8, 7, 6, 5, 4, 3, 2, 10, 0, 9, 8, 7, 6, 5, 4, 3, 2
};

static_assert(WEIGHTS[CHECK_POSITION] == 0, "check position must not contribute to the sum");


[[nodiscard]]
inline constexpr char to_upper(char c) noexcept {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

// True for I, O and Q in either case
[[nodiscard]]
inline constexpr bool is_forbidden_letter(char c) noexcept {
    const char u = to_upper(c);
    return u == 'I' || u == 'O' || u == 'Q';
}

// True for every character the check table knows: 0-9 and A-Z minus I, O, Q
[[nodiscard]]
inline constexpr bool is_code_character(char c) noexcept {
    const char u = to_upper(c);
    if (u >= '0' && u <= '9') return true;
    if (u >= 'A' && u <= 'Z') return !is_forbidden_letter(u);
    return false;
}

// Transliteration value; -1 for characters outside the table
[[nodiscard]]
inline constexpr int char_value(char c) noexcept {
    const char u = to_upper(c);
    if (u >= '0' && u <= '9') return u - '0';
    if (u >= 'A' && u <= 'H') return (u - 'A') + 1;
    if (u >= 'J' && u <= 'N') return (u - 'J') + 1;
    if (u == 'P') return 7;
    if (u == 'R') return 9;
    if (u >= 'S' && u <= 'Z') return (u - 'S') + 2;
    return -1;
}

// Weighted sum over every position but the check position
[[nodiscard]]
inline constexpr std::uint32_t weighted_sum(std::string_view code) noexcept {
    std::uint32_t total = 0;
    for (std::size_t i = 0; i < code.size() && i < CODE_LENGTH; ++i) {
        if (i == CHECK_POSITION) continue;
        const int v = char_value(code[i]);
        total += static_cast<std::uint32_t>(v < 0 ? 0 : v) * WEIGHTS[i];
    }
    return total;
}

// ---------------------------------------------------------------------
// Computes the check character of a 17-character code.
// The character currently at the check position is ignored.
//
// Example:
//   compute_check("1M8GDM9A_KP042788", out)  -> out == 'X'
// ---------------------------------------------------------------------
[[nodiscard]]
inline constexpr Error compute_check(std::string_view code, char& out) noexcept {
    if (code.size() != CODE_LENGTH) {
        return Error::Length;
    }
    const std::uint32_t remainder = weighted_sum(code) % 11;
    out = (remainder == 10) ? 'X' : static_cast<char>('0' + remainder);
    return Error::None;
}

static_assert([] {
    char c = 0;
    return compute_check("1M8GDM9AXKP042788", c) == Error::None && c == 'X';
}(), "check table self-test");

} // namespace vinforge::core::codec
