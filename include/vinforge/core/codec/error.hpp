#pragma once

#include <cstdint>
#include <string_view>

namespace vinforge::core {
namespace codec {

/*
===============================================================================
 codec::Error
===============================================================================

Validation failures raised while computing a check character or assembling a
code from its structural fields.

All of them are caller errors: they are detected before any sequence counter
is touched and are fully recoverable by correcting the input.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    Length,               // Code is not exactly 17 characters
    ManufacturerLength,   // Manufacturer id (WMI) is not exactly 3 characters
    DescriptorLength,     // Descriptor (VDS) is not exactly 5 characters
    PlantLength,          // Plant code is not exactly 1 character
    ForbiddenCharacter,   // Character outside the code alphabet (I, O, Q, punctuation, ...)
    UnsupportedYear,      // Model year absent from the year table
    SequenceRange         // Sequence outside 1..999999
};


[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:               return "None";
    case Error::Length:             return "Length";
    case Error::ManufacturerLength: return "ManufacturerLength";
    case Error::DescriptorLength:   return "DescriptorLength";
    case Error::PlantLength:        return "PlantLength";
    case Error::ForbiddenCharacter: return "ForbiddenCharacter";
    case Error::UnsupportedYear:    return "UnsupportedYear";
    case Error::SequenceRange:      return "SequenceRange";
    default:                        return "Unknown";
    }
}

// Human-readable explanation, suitable for user-facing error messages
[[nodiscard]]
inline constexpr std::string_view describe(Error err) noexcept {
    switch (err) {
    case Error::None:               return "no error";
    case Error::Length:             return "code must be exactly 17 characters";
    case Error::ManufacturerLength: return "manufacturer id must be exactly 3 characters";
    case Error::DescriptorLength:   return "descriptor must be exactly 5 characters";
    case Error::PlantLength:        return "plant code must be exactly 1 character";
    case Error::ForbiddenCharacter: return "fields may only contain 0-9 and A-Z without I, O and Q";
    case Error::UnsupportedYear:    return "model year is not supported (2001-2030)";
    case Error::SequenceRange:      return "sequence must be between 1 and 999999";
    default:                        return "unknown error";
    }
}

} // namespace codec
} // namespace vinforge::core
