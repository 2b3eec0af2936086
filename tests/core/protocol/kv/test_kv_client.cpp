#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vinforge/core/protocol/kv/client.hpp"
#include "common/fake_kv_server.hpp"
#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace vinforge::core;
using namespace vinforge::core::protocol;
using vinforge::test::FakeKvServer;
using vinforge::test::FakeKvStream;
using vinforge::test::FakeKvClient;
using vinforge::test::fake_endpoint;

namespace {

[[nodiscard]] transport::Deadline soon() {
    return std::chrono::steady_clock::now() + std::chrono::seconds(1);
}

} // namespace

// -----------------------------------------------------------------------------
// Test: INCR / GET / SET / KEYS / DEL against the in-memory server
// -----------------------------------------------------------------------------
void test_commands() {
    std::cout << "[TEST] kv::Client commands\n";
    auto server = std::make_shared<FakeKvServer>();
    FakeKvClient client{FakeKvStream{server}};

    TEST_CHECK(!client.is_connected());
    TEST_CHECK(client.connect(fake_endpoint(), "", soon()) == kv::Error::None);
    TEST_CHECK(client.is_connected());

    std::int64_t v = 0;
    TEST_CHECK(client.incr("chassis_seq:A", v, soon()) == kv::Error::None && v == 1);
    TEST_CHECK(client.incr("chassis_seq:A", v, soon()) == kv::Error::None && v == 2);

    std::optional<std::int64_t> got;
    TEST_CHECK(client.get("chassis_seq:A", got, soon()) == kv::Error::None);
    TEST_CHECK(got.has_value() && *got == 2);
    TEST_CHECK(client.get("chassis_seq:missing", got, soon()) == kv::Error::None);
    TEST_CHECK(!got.has_value());

    TEST_CHECK(client.set("chassis_seq:B", 100, soon()) == kv::Error::None);
    TEST_CHECK(server->raw("chassis_seq:B") == std::optional<std::string>("100"));

    std::vector<std::string> keys;
    TEST_CHECK(client.keys("chassis_seq:*", keys, soon()) == kv::Error::None);
    TEST_CHECK(keys.size() == 2);

    std::int64_t removed = 0;
    TEST_CHECK(client.del(keys, removed, soon()) == kv::Error::None && removed == 2);
    TEST_CHECK(server->size() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: replies delivered one byte at a time are reassembled
// -----------------------------------------------------------------------------
void test_fragmented_replies() {
    std::cout << "[TEST] kv::Client fragmented replies\n";
    auto server = std::make_shared<FakeKvServer>();
    server->put("chassis_seq:A", "41");
    FakeKvClient client{FakeKvStream{server, 1}};
    TEST_CHECK(client.connect(fake_endpoint(), "", soon()) == kv::Error::None);

    std::int64_t v = 0;
    TEST_CHECK(client.incr("chassis_seq:A", v, soon()) == kv::Error::None && v == 42);
    std::vector<std::string> keys;
    TEST_CHECK(client.keys("chassis_seq:*", keys, soon()) == kv::Error::None);
    TEST_CHECK(keys.size() == 1 && keys[0] == "chassis_seq:A");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: AUTH is sent when a password is given
// -----------------------------------------------------------------------------
void test_auth() {
    std::cout << "[TEST] kv::Client AUTH\n";
    auto server = std::make_shared<FakeKvServer>();
    server->set_password("s3cret");

    FakeKvClient rejected{FakeKvStream{server}};
    TEST_CHECK(rejected.connect(fake_endpoint(), "wrong", soon()) == kv::Error::ServerError);
    TEST_CHECK(!rejected.is_connected());

    FakeKvClient anonymous{FakeKvStream{server}};
    TEST_CHECK(anonymous.connect(fake_endpoint(), "", soon()) == kv::Error::None);
    std::int64_t v = 0;
    TEST_CHECK(anonymous.incr("chassis_seq:A", v, soon()) == kv::Error::ServerError);
    // A server error keeps the connection usable
    TEST_CHECK(anonymous.is_connected());

    FakeKvClient client{FakeKvStream{server}};
    TEST_CHECK(client.connect(fake_endpoint(), "s3cret", soon()) == kv::Error::None);
    TEST_CHECK(client.incr("chassis_seq:A", v, soon()) == kv::Error::None && v == 1);
    TEST_CHECK(server->commands("AUTH") == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: transport failures and timeouts close the connection
// -----------------------------------------------------------------------------
void test_failures() {
    std::cout << "[TEST] kv::Client failures\n";
    auto server = std::make_shared<FakeKvServer>();
    FakeKvClient client{FakeKvStream{server}};

    std::int64_t v = 0;
    TEST_CHECK(client.incr("chassis_seq:A", v, soon()) == kv::Error::NotConnected);

    server->set_available(false);
    TEST_CHECK(client.connect(fake_endpoint(), "", soon()) == kv::Error::TransportFailure);
    server->set_available(true);

    TEST_CHECK(client.connect(fake_endpoint(), "", soon()) == kv::Error::None);
    server->set_stall(true);
    TEST_CHECK(client.incr("chassis_seq:A", v, soon()) == kv::Error::Timeout);
    TEST_CHECK(!client.is_connected());
    server->set_stall(false);
    // The stalled INCR was applied server-side
    TEST_CHECK(server->raw("chassis_seq:A") == std::optional<std::string>("1"));

    TEST_CHECK(client.connect(fake_endpoint(), "", soon()) == kv::Error::None);
    server->set_available(false);
    TEST_CHECK(client.incr("chassis_seq:A", v, soon()) == kv::Error::TransportFailure);
    TEST_CHECK(!client.is_connected());
    server->set_available(true);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: wrong reply types and malformed streams
// -----------------------------------------------------------------------------
void test_unexpected_replies() {
    std::cout << "[TEST] kv::Client unexpected replies\n";
    auto server = std::make_shared<FakeKvServer>();
    FakeKvClient client{FakeKvStream{server}};
    TEST_CHECK(client.connect(fake_endpoint(), "", soon()) == kv::Error::None);

    std::int64_t v = 0;
    server->inject_reply("+QUEUED\r\n");
    TEST_CHECK(client.incr("chassis_seq:A", v, soon()) == kv::Error::UnexpectedReply);

    std::optional<std::int64_t> got;
    server->inject_reply("$3\r\nabc\r\n");
    TEST_CHECK(client.get("chassis_seq:A", got, soon()) == kv::Error::UnexpectedReply);
    TEST_CHECK(!got.has_value());

    server->inject_reply("%garbage\r\n");
    TEST_CHECK(client.incr("chassis_seq:A", v, soon()) == kv::Error::UnexpectedReply);
    TEST_CHECK(!client.is_connected());

    std::cout << "[TEST] OK\n";
}

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Fatal);

    test_commands();
    test_fragmented_replies();
    test_auth();
    test_failures();
    test_unexpected_replies();

    std::cout << "\n[ALL KV CLIENT TESTS PASSED]\n";
    return 0;
}
