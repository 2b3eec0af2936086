#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <ostream>

#include <CLI/CLI.hpp>

#include "vinforge/core/timestamp.hpp"

#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace vinforge::examples::cli::generate {

    // -------------------------------------------------------------
    // Batch generation parameters
    // -------------------------------------------------------------
    struct Params {
        std::int64_t quantity       = 1;
        std::string manufacturer_id;
        std::string descriptor      = "HCKZS";
        int model_year              = vinforge::core::current_year();
        std::string plant_code      = "S";
        std::string format          = "text";
        std::string output;
        std::string sequence_file;
        std::string log_level       = "warn";

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Quantity     : " << quantity << "\n"
               << "  Manufacturer : " << manufacturer_id << "\n"
               << "  Descriptor   : " << descriptor << "\n"
               << "  Model Year   : " << model_year << "\n"
               << "  Plant Code   : " << plant_code << "\n"
               << "  Format       : " << format << "\n"
               << "  Output       : " << (output.empty() ? "<stdout>" : output) << "\n"
               << "  Log Level    : " << log_level << "\n";
        }
    };

    // -------------------------------------------------------------
    // Build CLI
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};
        app.add_option("-n,--quantity", params.quantity, "Number of codes to generate (1-10000)")->default_val(params.quantity);
        app.add_option("-m,--manufacturer", params.manufacturer_id, "World manufacturer identifier (3 characters)")->check(field_validator(3, "Manufacturer id"))->required();
        app.add_option("-d,--descriptor", params.descriptor, "Vehicle descriptor section (5 characters)")->check(field_validator(5, "Descriptor"))->default_val(params.descriptor);
        app.add_option("-y,--year", params.model_year, "Model year (2001-2030)")->default_val(params.model_year);
        app.add_option("-p,--plant", params.plant_code, "Plant code (1 character)")->check(field_validator(1, "Plant code"))->default_val(params.plant_code);
        app.add_option("-f,--format", params.format, "Output format: json | csv | text")->check(format_validator)->default_val(params.format);
        app.add_option("-o,--output", params.output, "Write the result to this file instead of stdout");
        app.add_option("--sequence-file", params.sequence_file, "Local sequence file (ignored when VINFORGE_KV_URL is set)");
        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
        app.footer(
            "Backend: VINFORGE_KV_URL + VINFORGE_KV_TOKEN select the remote key-value store,\n"
            "otherwise the local file (VINFORGE_SEQUENCE_FILE or data/chassis_sequences.json) is used.\n"
            "Quantity and model year are validated by the service before any number is consumed."
        );
        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }
        set_log_level(params.log_level);
        return params;
    }

} // namespace vinforge::examples::cli::generate
