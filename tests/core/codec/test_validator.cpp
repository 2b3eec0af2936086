#include <iostream>
#include <string>

#include "vinforge/core/codec/validator.hpp"
#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace vinforge::core::codec;

// -----------------------------------------------------------------------------
// Test: known-valid codes
// -----------------------------------------------------------------------------
void test_valid_codes() {
    std::cout << "[TEST] codec::validate_code valid codes\n";

    for (const char* code : {"1M8GDM9AXKP042788", "1HGCM82633A004352", "11111111111111111", "LZSHCKZS3WS000001"}) {
        const ValidationResult r = validate_code(code);
        TEST_CHECK(r.valid);
        TEST_CHECK(r.errors.empty());
        TEST_CHECK(r.type == ChassisType::Vin);
        TEST_CHECK(r.checksum_valid.has_value() && *r.checksum_valid);
    }
    // Lower case is accepted
    TEST_CHECK(validate_code("1m8gdm9axkp042788").valid);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: length errors stop further checks
// -----------------------------------------------------------------------------
void test_length() {
    std::cout << "[TEST] codec::validate_code length\n";

    const ValidationResult r = validate_code("1HGCM82633A00435");
    TEST_CHECK(!r.valid);
    TEST_CHECK(r.errors.size() == 1);
    TEST_CHECK(r.errors[0] == "invalid length: 16 (expected 17)");
    TEST_CHECK(!r.checksum_valid.has_value());

    TEST_CHECK(!validate_code("").valid);
    TEST_CHECK(!validate_code("1HGCM82633A0043521").valid);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: alphabet errors, checksum not evaluated
// -----------------------------------------------------------------------------
void test_alphabet() {
    std::cout << "[TEST] codec::validate_code alphabet\n";

    ValidationResult r = validate_code("1HGCM82633A00435-");
    TEST_CHECK(!r.valid);
    TEST_CHECK(r.errors.size() == 1);
    TEST_CHECK(r.errors[0] == "non-alphanumeric characters detected");
    TEST_CHECK(!r.checksum_valid.has_value());

    r = validate_code("1HGCM82633AOO4352");
    TEST_CHECK(!r.valid);
    TEST_CHECK(r.errors.size() == 1);
    TEST_CHECK(r.errors[0].find("forbidden characters (I/O/Q)") == 0);
    TEST_CHECK(r.errors[0].find('O') != std::string::npos);
    TEST_CHECK(!r.checksum_valid.has_value());

    r = validate_code("IHGCM82633A0043 Q");
    TEST_CHECK(!r.valid);
    TEST_CHECK(r.errors.size() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: wrong check character
// -----------------------------------------------------------------------------
void test_checksum_mismatch() {
    std::cout << "[TEST] codec::validate_code checksum mismatch\n";

    const ValidationResult r = validate_code("1HGCM82643A004352");
    TEST_CHECK(!r.valid);
    TEST_CHECK(r.checksum_valid.has_value() && !*r.checksum_valid);
    TEST_CHECK(r.errors.size() == 1);
    TEST_CHECK(r.errors[0] == "invalid check character: expected '3', got '4'");

    // Structural validation only
    const ValidationResult lax = validate_code("1HGCM82643A004352", false);
    TEST_CHECK(lax.valid);
    TEST_CHECK(!lax.checksum_valid.has_value());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: manufacturer chassis numbers
// -----------------------------------------------------------------------------
void test_manufacturer_chassis() {
    std::cout << "[TEST] codec::validate_manufacturer_chassis\n";

    ValidationResult r = validate_manufacturer_chassis("ABC1234567890");
    TEST_CHECK(r.valid);
    TEST_CHECK(r.type == ChassisType::Manufacturer);
    TEST_CHECK(!r.checksum_valid.has_value());

    r = validate_manufacturer_chassis("ABC123");
    TEST_CHECK(!r.valid);
    TEST_CHECK(r.errors[0] == "length 6 out of bounds (13-17)");

    r = validate_manufacturer_chassis("ABC-1234567890");
    TEST_CHECK(!r.valid);

    r = validate_manufacturer_chassis("ABC-123", 5, 10, "ABC123-");
    TEST_CHECK(r.valid);
    r = validate_manufacturer_chassis("ABD-123", 5, 10, "ABC123-");
    TEST_CHECK(!r.valid);
    TEST_CHECK(r.errors[0] == "characters not allowed: D");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: auto-detection by length
// -----------------------------------------------------------------------------
void test_auto() {
    std::cout << "[TEST] codec::validate_auto\n";

    ValidationResult r = validate_auto("1HGCM82633A004352");
    TEST_CHECK(r.valid);
    TEST_CHECK(r.type == ChassisType::Vin);

    r = validate_auto("1HGCM82643A004352");
    TEST_CHECK(!r.valid);
    TEST_CHECK(r.type == ChassisType::Vin);

    r = validate_auto("ABC1234567890");
    TEST_CHECK(r.valid);
    TEST_CHECK(r.type == ChassisType::Manufacturer);
    TEST_CHECK(to_string(r.type) == "manufacturer");

    std::cout << "[TEST] OK\n";
}

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Warn);

    test_valid_codes();
    test_length();
    test_alphabet();
    test_checksum_mismatch();
    test_manufacturer_chassis();
    test_auto();

    std::cout << "\n[ALL VALIDATOR TESTS PASSED]\n";
    return 0;
}
