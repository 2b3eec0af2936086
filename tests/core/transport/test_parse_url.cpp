#include <iostream>

#include "vinforge/core/transport/parse_url.hpp"
#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace vinforge::core::transport;

// -----------------------------------------------------------------------------
// Test: accepted endpoint forms
// -----------------------------------------------------------------------------
void test_valid_urls() {
    std::cout << "[TEST] parse_url valid endpoints\n";
    ParsedUrl u;

    TEST_CHECK(parse_url("redis://kv.internal:6380", u) == Error::None);
    TEST_CHECK(u.host == "kv.internal" && u.port == "6380" && u.password.empty());

    TEST_CHECK(parse_url("kv://localhost", u) == Error::None);
    TEST_CHECK(u.host == "localhost" && u.port == DEFAULT_KV_PORT);

    TEST_CHECK(parse_url("redis://:s3cret@10.0.0.7", u) == Error::None);
    TEST_CHECK(u.host == "10.0.0.7" && u.port == "6379" && u.password == "s3cret");

    TEST_CHECK(parse_url("redis://default:pw@cache:7000/", u) == Error::None);
    TEST_CHECK(u.host == "cache" && u.port == "7000" && u.password == "pw");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: rejected inputs
// -----------------------------------------------------------------------------
void test_invalid_urls() {
    std::cout << "[TEST] parse_url invalid endpoints\n";
    ParsedUrl u;

    TEST_CHECK(parse_url("", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("http://host:6379", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("redis://", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("redis://:pw@", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("redis://host:", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("redis://host:abc", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("redis://host:0", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("redis://host:65536", u) == Error::InvalidUrl);
    TEST_CHECK(parse_url("redis://host:6379/0", u) == Error::InvalidUrl);
    TEST_CHECK(u.host.empty());

    std::cout << "[TEST] OK\n";
}

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Fatal);

    test_valid_urls();
    test_invalid_urls();

    std::cout << "\n[ALL PARSE_URL TESTS PASSED]\n";
    return 0;
}
