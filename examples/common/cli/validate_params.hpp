#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <iostream>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace vinforge::examples::cli::validate {

    struct Params {
        std::vector<std::string> codes;
        bool auto_detect      = false;
        bool skip_checksum    = false;
        std::string log_level = "warn";
    };

    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("codes", params.codes, "Code(s) to validate")->required();
        app.add_flag("-a,--auto", params.auto_detect, "Accept manufacturer chassis numbers (13-17 characters) besides 17-character codes");
        app.add_flag("--no-checksum", params.skip_checksum, "Do not verify the check character");
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
        app.footer("Exit status is 0 when every code is valid, 1 otherwise.");
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }
        set_log_level(params.log_level);
        return params;
    }

} // namespace vinforge::examples::cli::validate
