#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>
#include <iostream>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace vinforge::examples::cli::admin {

    enum class Command {
        Stats,
        List,
        Current,
        Reset,
        Clear
    };

    struct Params {
        Command command            = Command::Stats;
        std::string prefix;
        std::uint64_t value        = 0;
        bool confirmed             = false;
        std::string sequence_file;
        std::string log_level      = "info";
    };

    // -------------------------------------------------------------
    // Build CLI (one subcommand per store operation)
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        app.require_subcommand(1);
        Params params{};

        app.add_option("--sequence-file", params.sequence_file, "Local sequence file (ignored when VINFORGE_KV_URL is set)");
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

        auto* stats = app.add_subcommand("stats", "Print counter statistics");
        auto* list = app.add_subcommand("list", "Print every prefix with its counter");

        auto* current = app.add_subcommand("current", "Print the counter of one prefix");
        current->add_option("prefix", params.prefix, "Identifier prefix (10 characters)")->required();

        auto* reset = app.add_subcommand("reset", "Force a counter to a value (can reissue codes)");
        reset->add_option("prefix", params.prefix, "Identifier prefix (10 characters)")->required();
        reset->add_option("-v,--value", params.value, "New counter value")->default_val(params.value);
        reset->add_flag("--yes-i-know", params.confirmed, "Confirm that codes above the value may be issued again");

        auto* clear = app.add_subcommand("clear", "Drop every counter (can reissue every code)");
        clear->add_flag("--yes-i-know", params.confirmed, "Confirm that every code may be issued again");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }

        if (stats->parsed())        params.command = Command::Stats;
        else if (list->parsed())    params.command = Command::List;
        else if (current->parsed()) params.command = Command::Current;
        else if (reset->parsed())   params.command = Command::Reset;
        else if (clear->parsed())   params.command = Command::Clear;

        set_log_level(params.log_level);
        return params;
    }

} // namespace vinforge::examples::cli::admin
