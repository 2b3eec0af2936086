#include <iostream>
#include <string>

#include "vinforge/core/codec/validator.hpp"
namespace codec = vinforge::core::codec;

#include "common/cli/validate_params.hpp"
namespace cli = vinforge::examples::cli;

int main(int argc, char** argv) {
    const auto params = cli::validate::configure(argc, argv, "vinforge - Code Validation\n"
        "Checks length, alphabet and check character of 17-character codes.\n"
    );

    bool all_valid = true;
    for (const auto& code : params.codes) {
        const codec::ValidationResult r = params.auto_detect
            ? codec::validate_auto(code)
            : codec::validate_code(code, !params.skip_checksum);

        std::cout << code << ": " << (r.valid ? "valid" : "INVALID")
                  << " (" << codec::to_string(r.type) << ")";
        if (r.checksum_valid.has_value()) {
            std::cout << " checksum=" << (*r.checksum_valid ? "ok" : "bad");
        }
        std::cout << "\n";
        for (const auto& e : r.errors) {
            std::cout << "  - " << e << "\n";
        }
        all_valid = all_valid && r.valid;
    }
    return all_valid ? 0 : 1;
}
