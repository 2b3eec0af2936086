#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <string_view>


namespace vinforge::core::protocol::resp {

// ===============================================
// REPLY TYPE (RESP2)
// ===============================================
enum class Type : std::uint8_t {
    SimpleString,   // +OK\r\n
    Error,          // -ERR message\r\n
    Integer,        // :42\r\n
    BulkString,     // $5\r\nhello\r\n   ($-1\r\n is null)
    Array,          // *2\r\n...          (*-1\r\n is null)
    Null            // null bulk string or null array
};

[[nodiscard]]
inline constexpr std::string_view to_string(Type t) noexcept {
    switch (t) {
        case Type::SimpleString: return "SimpleString";
        case Type::Error:        return "Error";
        case Type::Integer:      return "Integer";
        case Type::BulkString:   return "BulkString";
        case Type::Array:        return "Array";
        case Type::Null:         return "Null";
        default:                 return "Unknown";
    }
}

// Decoded server reply
struct Reply {
    Type type = Type::Null;
    std::int64_t integer = 0;        // Integer
    std::string text;                // SimpleString, Error, BulkString
    std::vector<Reply> elements;     // Array

    [[nodiscard]] bool is_error() const noexcept { return type == Type::Error; }
    [[nodiscard]] bool is_null() const noexcept { return type == Type::Null; }
};

} // namespace vinforge::core::protocol::resp
