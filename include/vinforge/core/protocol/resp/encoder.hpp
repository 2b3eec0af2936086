#pragma once

#include <string>
#include <string_view>
#include <initializer_list>
#include <cstdint>

#include "lcr/json.hpp"


namespace vinforge::core::protocol::resp {

// -----------------------------------------------------------------------------
// Command encoder
// -----------------------------------------------------------------------------
//
// Commands are always sent as arrays of bulk strings, which is binary safe and
// accepted by every RESP2 server:
//
//   encode({"INCR", "chassis_seq:LZSHCKZSWS"})
//     -> "*2\r\n$4\r\nINCR\r\n$22\r\nchassis_seq:LZSHCKZSWS\r\n"
//
inline void append_bulk(std::string& out, std::string_view arg) {
    out += '$';
    lcr::json::append(out, arg.size());
    out += "\r\n";
    out.append(arg.data(), arg.size());
    out += "\r\n";
}

[[nodiscard]]
inline std::string encode(std::initializer_list<std::string_view> args) {
    std::string out;
    std::size_t payload = 0;
    for (auto a : args) payload += a.size() + 16;
    out.reserve(payload + 16);

    out += '*';
    lcr::json::append(out, args.size());
    out += "\r\n";
    for (auto a : args) {
        append_bulk(out, a);
    }
    return out;
}

// Integer argument helper (SET key <value>)
[[nodiscard]]
inline std::string to_argument(std::uint64_t value) {
    std::string out;
    lcr::json::append(out, value);
    return out;
}

} // namespace vinforge::core::protocol::resp
