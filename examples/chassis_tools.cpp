#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "vinforge/core/codec/chassis_template.hpp"
#include "vinforge/core/codec/sequence_pattern.hpp"
#include "vinforge/core/codec/random.hpp"
namespace codec = vinforge::core::codec;

#include "common/cli/chassis_params.hpp"
namespace cli = vinforge::examples::cli;

namespace {

[[nodiscard]] int render(const cli::chassis::Params& params, std::vector<std::string>& codes) {
    codec::TemplateParams vars;
    for (const auto& assignment : params.variables) {
        const std::size_t eq = assignment.find('=');
        vars[assignment.substr(0, eq)] = assignment.substr(eq + 1);
    }
    const codec::TemplateError err = codec::render_template_batch(
        params.template_text, vars, params.sequence_var, params.start, params.quantity, params.pad, codes);
    if (err != codec::TemplateError::None) {
        std::cerr << "Template error: " << codec::to_string(err) << "\n";
        return 1;
    }
    return 0;
}

[[nodiscard]] int extend(const cli::chassis::Params& params, std::vector<std::string>& codes) {
    codec::SequencePattern pattern;
    const codec::PatternError err = codec::continue_sequence(params.existing, params.quantity, codes, &pattern);
    if (err != codec::PatternError::None) {
        std::cerr << "Cannot continue sequence: " << codec::to_string(err) << "\n";
        return 1;
    }
    std::cerr << "Pattern: " << pattern.describe() << "\n";
    return 0;
}

[[nodiscard]] int randomize(const cli::chassis::Params& params, std::vector<std::string>& codes) {
    const codec::ChassisType type = params.type == "manufacturer" ? codec::ChassisType::Manufacturer
                                                                  : codec::ChassisType::Vin;
    codec::Error err = codec::Error::None;
    if (params.seeded) {
        std::mt19937 rng(params.seed);
        err = codec::random_codes(rng, params.quantity, type, codes);
    }
    else {
        err = codec::random_codes(params.quantity, type, codes);
    }
    if (err != codec::Error::None) {
        std::cerr << "Random generation failed: " << codec::describe(err) << "\n";
        return 1;
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const auto params = cli::chassis::configure(argc, argv, "vinforge - Chassis Number Tools\n"
        "Template rendering, sequence continuation and random test codes.\n"
    );

    std::vector<std::string> codes;
    int rc = 0;
    switch (params.command) {
    case cli::chassis::Command::Template: rc = render(params, codes);    break;
    case cli::chassis::Command::Continue: rc = extend(params, codes);    break;
    case cli::chassis::Command::Random:   rc = randomize(params, codes); break;
    }
    if (rc != 0) {
        return rc;
    }
    for (const auto& code : codes) {
        std::cout << code << "\n";
    }
    return 0;
}
