#include <algorithm>
#include <cstdint>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "vinforge/core/codec/random.hpp"
#include "vinforge/core/codec/validator.hpp"
#include "vinforge/core/codec/year_table.hpp"
#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace vinforge::core::codec;

namespace {

constexpr std::uint32_t SEED = 0xC0FFEE;

} // namespace

// -----------------------------------------------------------------------------
// Test: random VINs are structurally valid
// -----------------------------------------------------------------------------
void test_random_vins() {
    std::cout << "[TEST] codec::random_codes VIN\n";
    std::mt19937 rng(SEED);

    std::vector<std::string> out;
    TEST_CHECK(random_codes(rng, 500, ChassisType::Vin, out) == Error::None);
    TEST_CHECK(out.size() == 500);

    for (const auto& code : out) {
        const ValidationResult r = validate_code(code);
        TEST_CHECK(r.valid);
        TEST_CHECK(r.checksum_valid && *r.checksum_valid);

        const std::string_view wmi = std::string_view(code).substr(0, 3);
        TEST_CHECK(std::find(RANDOM_MANUFACTURERS.begin(), RANDOM_MANUFACTURERS.end(), wmi) != RANDOM_MANUFACTURERS.end());
        const int year = year_from_code(code[9]);
        TEST_CHECK(year >= RANDOM_MIN_YEAR && year <= RANDOM_MAX_YEAR);
        TEST_CHECK(code[10] == 'S');
        const std::uint64_t serial = std::stoull(code.substr(11));
        TEST_CHECK(serial >= 1 && serial <= RANDOM_MAX_VIN_SERIAL);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: random manufacturer numbers follow prefix + year + serial
// -----------------------------------------------------------------------------
void test_random_manufacturer() {
    std::cout << "[TEST] codec::random_codes manufacturer\n";
    std::mt19937 rng(SEED);

    std::vector<std::string> out;
    TEST_CHECK(random_codes(rng, 500, ChassisType::Manufacturer, out) == Error::None);
    TEST_CHECK(out.size() == 500);

    for (const auto& code : out) {
        TEST_CHECK(code.size() == 16);
        TEST_CHECK(validate_manufacturer_chassis(code).valid);
        for (std::size_t i = 0; i < RANDOM_MANUFACTURER_PREFIX; ++i) {
            TEST_CHECK(RANDOM_ALPHABET.find(code[i]) != std::string_view::npos);
        }
        const int year = std::stoi(code.substr(9, 2));
        TEST_CHECK(year >= 20 && year <= 30);
        const unsigned long serial = std::stoul(code.substr(11));
        TEST_CHECK(serial >= 1 && serial <= RANDOM_MAX_MANUFACTURER_SERIAL);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: same seed, same codes; zero quantity yields nothing
// -----------------------------------------------------------------------------
void test_reproducible() {
    std::cout << "[TEST] codec::random_codes reproducible\n";

    std::mt19937 a(SEED);
    std::mt19937 b(SEED);
    std::vector<std::string> first;
    std::vector<std::string> second;
    TEST_CHECK(random_codes(a, 20, ChassisType::Vin, first) == Error::None);
    TEST_CHECK(random_codes(b, 20, ChassisType::Vin, second) == Error::None);
    TEST_CHECK(first == second);

    std::vector<std::string> none = {"stale"};
    TEST_CHECK(random_codes(a, 0, ChassisType::Manufacturer, none) == Error::None);
    TEST_CHECK(none.empty());

    // Self-seeded overload
    std::vector<std::string> seeded;
    TEST_CHECK(random_codes(3, ChassisType::Vin, seeded) == Error::None);
    TEST_CHECK(seeded.size() == 3 && validate_code(seeded[0]).valid);

    std::cout << "[TEST] OK\n";
}

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Fatal);

    test_random_vins();
    test_random_manufacturer();
    test_reproducible();

    std::cout << "\n[ALL RANDOM CODE TESTS PASSED]\n";
    return 0;
}
