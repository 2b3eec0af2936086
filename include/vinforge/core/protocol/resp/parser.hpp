#pragma once

#include <string_view>
#include <cstdint>
#include <cstddef>

#include "vinforge/core/protocol/resp/reply.hpp"

/*
================================================================================
RESP2 Reply Parser
================================================================================

Incremental, non-throwing parser for replies read from a key-value server.

The caller accumulates bytes and calls parse() after each read:

  • Complete    → `out` holds one reply, `consumed` bytes may be dropped
  • Incomplete  → more bytes are needed, nothing was consumed
  • Invalid     → the stream is not RESP; the connection must be dropped

Nested arrays are bounded by MAX_DEPTH and bulk strings by MAX_BULK_SIZE so
that a misbehaving peer cannot make the client allocate without limit.
================================================================================
*/

namespace vinforge::core::protocol::resp {

inline constexpr std::size_t    MAX_DEPTH      = 8;
inline constexpr std::int64_t   MAX_BULK_SIZE  = 512 * 1024 * 1024;
inline constexpr std::int64_t   MAX_ARRAY_SIZE = 1024 * 1024;

enum class Result : std::uint8_t {
    Complete,
    Incomplete,
    Invalid
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Complete:   return "Complete";
        case Result::Incomplete: return "Incomplete";
        case Result::Invalid:    return "Invalid";
        default:                 return "Unknown";
    }
}


namespace detail {

// Finds the CRLF-terminated line starting at `pos`
[[nodiscard]]
inline Result read_line(std::string_view buf, std::size_t pos, std::string_view& line, std::size_t& next) noexcept {
    const std::size_t cr = buf.find("\r\n", pos);
    if (cr == std::string_view::npos) {
        return Result::Incomplete;
    }
    line = buf.substr(pos, cr - pos);
    next = cr + 2;
    return Result::Complete;
}

[[nodiscard]]
inline bool parse_signed(std::string_view sv, std::int64_t& out) noexcept {
    if (sv.empty() || sv.size() > 20) return false;
    bool negative = false;
    std::size_t i = 0;
    if (sv[0] == '-' || sv[0] == '+') {
        negative = (sv[0] == '-');
        i = 1;
        if (sv.size() == 1) return false;
    }
    std::uint64_t v = 0;
    for (; i < sv.size(); ++i) {
        const char c = sv[i];
        if (c < '0' || c > '9') return false;
        const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
        if (v > (static_cast<std::uint64_t>(INT64_MAX) - d) / 10) return false;
        v = v * 10 + d;
    }
    out = negative ? -static_cast<std::int64_t>(v) : static_cast<std::int64_t>(v);
    return true;
}

[[nodiscard]]
inline Result parse_at(std::string_view buf, std::size_t pos, Reply& out, std::size_t& next, std::size_t depth) {
    if (depth > MAX_DEPTH) {
        return Result::Invalid;
    }
    if (pos >= buf.size()) {
        return Result::Incomplete;
    }
    const char marker = buf[pos];
    std::string_view line;
    std::size_t after = 0;
    Result r = read_line(buf, pos + 1, line, after);
    if (r != Result::Complete) {
        return r;
    }

    out = Reply{};
    switch (marker) {
    case '+':
        out.type = Type::SimpleString;
        out.text = std::string(line);
        next = after;
        return Result::Complete;

    case '-':
        out.type = Type::Error;
        out.text = std::string(line);
        next = after;
        return Result::Complete;

    case ':':
        if (!parse_signed(line, out.integer)) return Result::Invalid;
        out.type = Type::Integer;
        next = after;
        return Result::Complete;

    case '$': {
        std::int64_t len = 0;
        if (!parse_signed(line, len)) return Result::Invalid;
        if (len == -1) {
            out.type = Type::Null;
            next = after;
            return Result::Complete;
        }
        if (len < 0 || len > MAX_BULK_SIZE) return Result::Invalid;
        const std::size_t n = static_cast<std::size_t>(len);
        if (buf.size() < after + n + 2) return Result::Incomplete;
        if (buf[after + n] != '\r' || buf[after + n + 1] != '\n') return Result::Invalid;
        out.type = Type::BulkString;
        out.text = std::string(buf.substr(after, n));
        next = after + n + 2;
        return Result::Complete;
    }

    case '*': {
        std::int64_t count = 0;
        if (!parse_signed(line, count)) return Result::Invalid;
        if (count == -1) {
            out.type = Type::Null;
            next = after;
            return Result::Complete;
        }
        if (count < 0 || count > MAX_ARRAY_SIZE) return Result::Invalid;
        out.type = Type::Array;
        out.elements.reserve(static_cast<std::size_t>(count));
        std::size_t cursor = after;
        for (std::int64_t i = 0; i < count; ++i) {
            Reply element;
            r = parse_at(buf, cursor, element, cursor, depth + 1);
            if (r != Result::Complete) {
                return r;
            }
            out.elements.push_back(std::move(element));
        }
        next = cursor;
        return Result::Complete;
    }

    default:
        return Result::Invalid;
    }
}

} // namespace detail


// Decimal integer as carried by Integer replies and by counters stored as
// bulk strings
[[nodiscard]]
inline bool parse_integer(std::string_view text, std::int64_t& out) noexcept {
    return detail::parse_signed(text, out);
}

// Parses one reply from the front of `buf`
[[nodiscard]]
inline Result parse(std::string_view buf, Reply& out, std::size_t& consumed) {
    consumed = 0;
    std::size_t next = 0;
    const Result r = detail::parse_at(buf, 0, out, next, 0);
    if (r == Result::Complete) {
        consumed = next;
    }
    return r;
}

} // namespace vinforge::core::protocol::resp
