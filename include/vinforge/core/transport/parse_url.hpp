#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "vinforge/core/transport/error.hpp"


namespace vinforge::core::transport {

    inline constexpr std::string_view DEFAULT_KV_PORT = "6379";

    // Contains parsed URL components
    struct ParsedUrl {
        std::string host;
        std::string port;
        std::string password;   // optional, from redis://:password@host
    };


    // ---------------------------------------------------------------------
    // NOTE: Minimal URL parser for key-value endpoints.
    // Accepts redis:// and kv:// with an optional ":password@" userinfo and
    // an optional port. Anything after the authority (a database path) is
    // rejected rather than silently ignored.
    //
    // Example inputs:
    //   redis://kv.internal:6379
    //   redis://:s3cret@10.0.0.7
    //   kv://localhost
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view redis = "redis://";
        constexpr std::string_view kv    = "kv://";
        std::size_t pos = 0;
        if (url.substr(0, redis.size()) == redis) {
            pos = redis.size();
        }
        else if (url.substr(0, kv.size()) == kv) {
            pos = kv.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Authority ends at the first '/' (a bare trailing slash is tolerated)
        std::string_view authority = url.substr(pos);
        const std::size_t slash = authority.find('/');
        if (slash != std::string_view::npos) {
            if (slash + 1 != authority.size()) {
                return Error::InvalidUrl;
            }
            authority = authority.substr(0, slash);
        }
        // 3) Optional userinfo (only the password part is used)
        const std::size_t at = authority.rfind('@');
        if (at != std::string_view::npos) {
            std::string_view userinfo = authority.substr(0, at);
            const std::size_t colon = userinfo.find(':');
            out.password = std::string(colon == std::string_view::npos ? userinfo : userinfo.substr(colon + 1));
            authority = authority.substr(at + 1);
        }
        if (authority.empty()) {
            return Error::InvalidUrl;
        }
        // 4) Split host and port
        const std::size_t colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(authority.substr(0, colon));
            out.port = std::string(authority.substr(colon + 1));
        } else {
            out.host = std::string(authority);
            out.port = std::string(DEFAULT_KV_PORT);
        }

        // Invariants check --------------------------------

        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        // Validate port - must be numeric and in range
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace vinforge::core::transport
