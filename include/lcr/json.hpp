#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstdio>


namespace lcr {
namespace json {

// Escape helper (quotes, backslashes and control characters)
inline std::string escape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    for (char c : s) {
        switch (c) {
            case '\"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// Fast integer → string formatter
inline void append(std::string& out, std::uint64_t value)
{
    char buf[32];
    char* p = buf + sizeof(buf);

    do {
        *(--p) = '0' + (value % 10);
        value /= 10;
    } while (value > 0);

    out.append(p, buf + sizeof(buf) - p);
}

// Appends a quoted, escaped JSON string
inline void append_string(std::string& out, std::string_view value) {
    out += '\"';
    out += escape(value);
    out += '\"';
}

// Appends `"key": ` (caller writes the value)
inline void append_key(std::string& out, std::string_view key) {
    append_string(out, key);
    out += ": ";
}

} // namespace json
} // namespace lcr
