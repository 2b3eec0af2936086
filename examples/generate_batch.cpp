#include <fstream>
#include <iostream>
#include <string>

#include "vinforge/lite.hpp"
using namespace vinforge::lite;

#include "common/cli/generate_params.hpp"
namespace cli = vinforge::examples::cli;

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    const auto params = cli::generate::configure(argc, argv, "vinforge - Batch Generation\n"
        "Generates unique 17-character codes with persistent per-prefix sequence numbers.\n"
    );
    params.dump("=== Generation Parameters ===", std::cerr);

    // -------------------------------------------------------------
    // Service setup
    // -------------------------------------------------------------
    error err;
    auto service = Service::create(service_config{params.sequence_file}, err);
    if (!service) {
        std::cerr << "[vinforge] " << to_string(err.code) << ": " << err.message << "\n";
        return 2;
    }

    // -------------------------------------------------------------
    // Generate
    // -------------------------------------------------------------
    const generate_response response = service->generate(generate_request{
        params.quantity, params.manufacturer_id, params.descriptor, params.model_year, params.plant_code
    });

    std::string rendered;
    if (params.format == "json")      rendered = to_json(response);
    else if (params.format == "csv")  rendered = to_csv(response.codes);
    else                              rendered = to_text(response.codes);

    if (params.output.empty()) {
        std::cout << rendered << "\n";
    } else {
        std::ofstream file(params.output, std::ios::binary | std::ios::trunc);
        file << rendered << "\n";
        if (!file) {
            std::cerr << "[vinforge] cannot write " << params.output << "\n";
            return 2;
        }
    }

    if (response.failure) {
        std::cerr << "[vinforge] " << to_string(response.failure->code) << ": " << response.failure->message << "\n";
        if (!response.codes.empty()) {
            std::cerr << "[vinforge] " << response.codes.size() << " code(s) were produced and are valid.\n";
        }
        return 1;
    }
    std::cerr << "[vinforge] " << response.codes.size() << " code(s), sequences "
              << response.metadata.start_sequence << ".." << response.metadata.end_sequence
              << " (prefix " << response.metadata.prefix << ", backend " << service->backend() << ")\n";
    return 0;
}
