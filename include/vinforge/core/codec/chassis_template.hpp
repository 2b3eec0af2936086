#pragma once

#include <algorithm>
#include <functional>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <cstdint>
#include <cstddef>

#include "vinforge/core/codec/checksum.hpp"
#include "vinforge/core/codec/validator.hpp"
#include "vinforge/core/config/sequence.hpp"

/*
================================================================================
Manufacturer Chassis Templates
================================================================================

Manufacturer chassis numbers are free-form. They are described by a template
with named placeholders:

    {name}      replaced by the value of `name`
    {name:N}    same, left-padded with '0' to at least N characters

Everything outside braces is copied verbatim. The result is upper case.

    render_template("{prefix}{year}{seq}",
                    {{"prefix", "AP2KC1A6S"}, {"year", "25"}, {"seq", "008796"}}, out)
        -> "AP2KC1A6S25008796"

A batch renders the same template with one variable counting upward:

    render_template_batch("{prefix}{seq}", {{"prefix", "ab"}}, "seq", 7, 3, 4, out)
        -> "AB0007", "AB0008", "AB0009"

No counter is consulted. Uniqueness across calls is the caller's concern.
================================================================================
*/

namespace vinforge::core::codec {

enum class TemplateError : std::uint8_t {
    None = 0,

    UnterminatedPlaceholder,   // '{' without a closing '}'
    MalformedPlaceholder,      // Empty name, bad name character or bad width
    UnknownVariable,           // Placeholder without a value
    MissingSequenceVariable,   // Batch template never mentions the counting variable
    InvalidQuantity,           // Batch size outside 1..MAX_BATCH_QUANTITY
    SequenceRange              // Counting variable would overflow
};

[[nodiscard]]
inline constexpr std::string_view to_string(TemplateError err) noexcept {
    switch (err) {
    case TemplateError::None:                    return "None";
    case TemplateError::UnterminatedPlaceholder: return "UnterminatedPlaceholder";
    case TemplateError::MalformedPlaceholder:    return "MalformedPlaceholder";
    case TemplateError::UnknownVariable:         return "UnknownVariable";
    case TemplateError::MissingSequenceVariable: return "MissingSequenceVariable";
    case TemplateError::InvalidQuantity:         return "InvalidQuantity";
    case TemplateError::SequenceRange:           return "SequenceRange";
    default:                                     return "Unknown";
    }
}

using TemplateParams = std::map<std::string, std::string, std::less<>>;

// Widest padding a placeholder may request
inline constexpr std::size_t MAX_PLACEHOLDER_WIDTH = 32;


namespace detail {

struct Placeholder {
    std::string_view name;
    std::size_t width = 0;
};

// Parses the text between '{' and '}'
[[nodiscard]]
inline bool parse_placeholder(std::string_view body, Placeholder& out) noexcept {
    const std::size_t colon = body.find(':');
    out.name = body.substr(0, colon);
    out.width = 0;
    if (out.name.empty()) {
        return false;
    }
    for (char c : out.name) {
        if (!is_ascii_alnum(c) && c != '_') return false;
    }
    if (colon == std::string_view::npos) {
        return true;
    }
    const std::string_view digits = body.substr(colon + 1);
    if (digits.empty() || digits.size() > 2) {
        return false;
    }
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
        out.width = out.width * 10 + static_cast<std::size_t>(c - '0');
    }
    return out.width <= MAX_PLACEHOLDER_WIDTH;
}

// Calls `fn(literal_begin, literal_end, placeholder)` for each placeholder in order
template<class Fn>
[[nodiscard]]
inline TemplateError scan_template(std::string_view tmpl, Fn&& fn) {
    std::size_t pos = 0;
    while (pos < tmpl.size()) {
        const std::size_t open = tmpl.find('{', pos);
        if (open == std::string_view::npos) {
            break;
        }
        const std::size_t close = tmpl.find('}', open + 1);
        if (close == std::string_view::npos) {
            return TemplateError::UnterminatedPlaceholder;
        }
        Placeholder ph;
        if (!parse_placeholder(tmpl.substr(open + 1, close - open - 1), ph)) {
            return TemplateError::MalformedPlaceholder;
        }
        const TemplateError err = fn(tmpl.substr(pos, open - pos), ph);
        if (err != TemplateError::None) {
            return err;
        }
        pos = close + 1;
    }
    return fn(tmpl.substr(std::min(pos, tmpl.size())), Placeholder{});
}

} // namespace detail


// Names referenced by the template, in order of appearance (duplicates kept)
[[nodiscard]]
inline TemplateError template_variables(std::string_view tmpl, std::vector<std::string>& out) {
    std::vector<std::string> names;
    const TemplateError err = detail::scan_template(tmpl, [&](std::string_view, const detail::Placeholder& ph) {
        if (!ph.name.empty()) names.emplace_back(ph.name);
        return TemplateError::None;
    });
    if (err != TemplateError::None) {
        return err;
    }
    out = std::move(names);
    return TemplateError::None;
}

[[nodiscard]]
inline TemplateError render_template(std::string_view tmpl, const TemplateParams& params, std::string& out) {
    std::string result;
    result.reserve(tmpl.size() + 16);
    const TemplateError err = detail::scan_template(tmpl, [&](std::string_view literal, const detail::Placeholder& ph) {
        for (char c : literal) result += to_upper(c);
        if (ph.name.empty()) {
            return TemplateError::None;
        }
        auto it = params.find(ph.name);
        if (it == params.end()) {
            return TemplateError::UnknownVariable;
        }
        const std::string& value = it->second;
        if (value.size() < ph.width) {
            result.append(ph.width - value.size(), '0');
        }
        for (char c : value) result += to_upper(c);
        return TemplateError::None;
    });
    if (err != TemplateError::None) {
        return err;
    }
    out = std::move(result);
    return TemplateError::None;
}

// ---------------------------------------------------------------------
// Renders `quantity` chassis numbers. `sequence_var` takes the values
// start, start + 1, ... zero padded to `pad` digits; every other
// placeholder comes from `base`. Either every number is rendered or
// `out` is left untouched.
// ---------------------------------------------------------------------
[[nodiscard]]
inline TemplateError render_template_batch(std::string_view tmpl,
                                           const TemplateParams& base,
                                           std::string_view sequence_var,
                                           std::uint64_t start,
                                           std::size_t quantity,
                                           std::size_t pad,
                                           std::vector<std::string>& out) {
    if (quantity < config::sequence::MIN_BATCH_QUANTITY || quantity > config::sequence::MAX_BATCH_QUANTITY) {
        return TemplateError::InvalidQuantity;
    }
    if (pad > MAX_PLACEHOLDER_WIDTH) {
        return TemplateError::MalformedPlaceholder;
    }
    std::vector<std::string> names;
    if (const TemplateError err = template_variables(tmpl, names); err != TemplateError::None) {
        return err;
    }
    if (std::find(names.begin(), names.end(), sequence_var) == names.end()) {
        return TemplateError::MissingSequenceVariable;
    }
    if (start > std::numeric_limits<std::uint64_t>::max() - (quantity - 1)) {
        return TemplateError::SequenceRange;
    }

    TemplateParams params = base;
    std::string& counter = params[std::string(sequence_var)];

    std::vector<std::string> codes;
    codes.reserve(quantity);
    for (std::size_t i = 0; i < quantity; ++i) {
        counter = std::to_string(start + i);
        if (counter.size() < pad) {
            counter.insert(0, pad - counter.size(), '0');
        }
        std::string code;
        if (const TemplateError err = render_template(tmpl, params, code); err != TemplateError::None) {
            return err;
        }
        codes.push_back(std::move(code));
    }
    out = std::move(codes);
    return TemplateError::None;
}

} // namespace vinforge::core::codec
