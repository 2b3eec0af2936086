#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>

#include <CLI/CLI.hpp>

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace vinforge::examples::cli::chassis {

    enum class Command { Template, Continue, Random };

    // -------------------------------------------------------------
    // Chassis tool parameters (one subcommand per run)
    // -------------------------------------------------------------
    struct Params {
        Command command             = Command::Template;
        std::size_t quantity        = 1;

        // template
        std::string template_text;
        std::vector<std::string> variables;     // name=value
        std::string sequence_var    = "seq";
        std::uint64_t start         = 1;
        std::size_t pad             = 6;

        // continue
        std::vector<std::string> existing;

        // random
        std::string type            = "vin";
        std::uint32_t seed          = 0;
        bool seeded                 = false;

        std::string log_level       = "warn";
    };

    // -------------------------------------------------------------
    // Build CLI
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
        app.require_subcommand(1);

        auto* tmpl = app.add_subcommand("template", "Render manufacturer chassis numbers from a template");
        tmpl->add_option("template", params.template_text, "Template, e.g. {prefix}{year}{seq}")->required();
        tmpl->add_option("-v,--var", params.variables, "Template variable as name=value (repeatable)")->check(assignment_validator);
        tmpl->add_option("-s,--sequence-var", params.sequence_var, "Variable that counts upward")->default_val(params.sequence_var);
        tmpl->add_option("--start", params.start, "First value of the counting variable")->default_val(params.start);
        tmpl->add_option("--pad", params.pad, "Zero padding of the counting variable")->check(CLI::Range(0, 32))->default_val(params.pad);
        tmpl->add_option("-n,--quantity", params.quantity, "Number of chassis numbers (1-10000)")->check(CLI::Range(1, 10'000))->default_val(params.quantity);

        auto* cont = app.add_subcommand("continue", "Continue a run of existing chassis numbers or VINs");
        cont->add_option("existing", params.existing, "Existing numbers, oldest first (at least two)")->required()->expected(2, -1);
        cont->add_option("-n,--quantity", params.quantity, "Number of chassis numbers (1-10000)")->check(CLI::Range(1, 10'000))->default_val(params.quantity);

        auto* rnd = app.add_subcommand("random", "Random well-formed codes for test fixtures");
        rnd->add_option("-t,--type", params.type, "vin | manufacturer")->check(CLI::IsMember({"vin", "manufacturer"}))->default_val(params.type);
        auto* seed = rnd->add_option("--seed", params.seed, "Seed for a reproducible run");
        rnd->add_option("-n,--quantity", params.quantity, "Number of codes (1-10000)")->check(CLI::Range(1, 10'000))->default_val(params.quantity);

        app.footer("No sequence counter is touched: uniqueness against issued codes is not guaranteed.");
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }
        if (cont->parsed())     params.command = Command::Continue;
        else if (rnd->parsed()) params.command = Command::Random;
        else                    params.command = Command::Template;
        params.seeded = seed->count() > 0;
        set_log_level(params.log_level);
        return params;
    }

} // namespace vinforge::examples::cli::chassis
