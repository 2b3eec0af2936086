#pragma once

#include <string>
#include <string_view>
#include <cstddef>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"


namespace vinforge::examples::cli {

// -------------------------------------------------------------
// Fixed-length code field validator (WMI, VDS, plant code)
// -------------------------------------------------------------
inline CLI::Validator field_validator(std::size_t length, std::string name) {
    return CLI::Validator(
        [length, name](std::string& value) -> std::string {
            if (value.size() != length) {
                return name + " must be exactly " + std::to_string(length) + " character(s)";
            }
            for (char c : value) {
                const bool alnum = (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
                if (!alnum) {
                    return name + " must be alphanumeric";
                }
            }
            return {};
        },
        name + " validator"
    );
}

// -------------------------------------------------------------
// Output format validator
// -------------------------------------------------------------
inline auto format_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "json" || value == "csv" || value == "text") {
            return {};
        }
        return "Format must be one of: json, csv, text";
    },
    "Output format validator"
);

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level lvl;
        if (lcr::log::parse_level(value, lvl)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "Log level validator"
);

// -------------------------------------------------------------
// Template variable validator (key=value)
// -------------------------------------------------------------
inline auto assignment_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        const std::size_t eq = value.find('=');
        if (eq == std::string::npos || eq == 0) {
            return "Variables must be given as name=value";
        }
        return {};
    },
    "Template variable validator"
);

} // namespace vinforge::examples::cli
