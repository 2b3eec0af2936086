#include <iomanip>
#include <iostream>
#include <map>
#include <string>

#include "vinforge/lite.hpp"
using namespace vinforge::lite;

#include "common/cli/admin_params.hpp"
namespace cli = vinforge::examples::cli;
using cli::admin::Command;

namespace {

int fail(const error& err) {
    std::cerr << "[vinforge] " << to_string(err.code) << ": " << err.message << "\n";
    return 2;
}

} // namespace

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = cli::admin::configure(argc, argv, "vinforge - Sequence Administration\n"
        "Inspects and (with explicit confirmation) resets the per-prefix sequence counters.\n"
    );

    error err;
    auto service = Service::create(service_config{params.sequence_file}, err);
    if (!service) {
        return fail(err);
    }

    switch (params.command) {
    case Command::Stats: {
        sequence_statistics stats;
        if (!service->statistics(stats, err)) return fail(err);
        std::cout << "Backend          : " << service->backend() << "\n"
                  << "Prefixes         : " << stats.total_prefixes << "\n"
                  << "Codes issued     : " << stats.total_issued << "\n"
                  << "Max sequence     : " << stats.max_sequence << "\n"
                  << "Average sequence : " << std::fixed << std::setprecision(2) << stats.average_sequence << "\n";
        return 0;
    }
    case Command::List: {
        std::map<std::string, std::uint64_t> counters;
        if (!service->sequences(counters, err)) return fail(err);
        for (const auto& [prefix, value] : counters) {
            std::cout << prefix << " " << value << "\n";
        }
        return 0;
    }
    case Command::Current: {
        std::uint64_t value = 0;
        if (!service->current(params.prefix, value, err)) return fail(err);
        std::cout << params.prefix << " " << value << "\n";
        return 0;
    }
    case Command::Reset:
        if (!params.confirmed) {
            std::cerr << "[vinforge] reset can reissue codes already in use. Re-run with --yes-i-know.\n";
            return 1;
        }
        if (!service->reset(params.prefix, params.value, err)) return fail(err);
        std::cout << params.prefix << " reset to " << params.value << "\n";
        return 0;
    case Command::Clear:
        if (!params.confirmed) {
            std::cerr << "[vinforge] clear can reissue every code. Re-run with --yes-i-know.\n";
            return 1;
        }
        if (!service->clear_all(err)) return fail(err);
        std::cout << "all sequences cleared\n";
        return 0;
    }
    return 1;
}
