#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "vinforge/core/store/remote_store.hpp"
#include "vinforge/core/config/sequence.hpp"
#include "common/fake_kv_server.hpp"
#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace vinforge::core::store;
using vinforge::test::FakeKvServer;
using vinforge::test::make_fake_store;
using vinforge::test::fake_client_factory;
namespace kv = vinforge::core::protocol::kv;
namespace cfg = vinforge::core::config::sequence;

// -----------------------------------------------------------------------------
// Test: kv error mapping
// -----------------------------------------------------------------------------
void test_status_mapping() {
    std::cout << "[TEST] RemoteStore status mapping\n";
    TEST_CHECK(to_status(kv::Error::None) == Status::Ok);
    TEST_CHECK(to_status(kv::Error::Timeout) == Status::Timeout);
    TEST_CHECK(to_status(kv::Error::NotConnected) == Status::BackendUnavailable);
    TEST_CHECK(to_status(kv::Error::TransportFailure) == Status::BackendUnavailable);
    TEST_CHECK(to_status(kv::Error::ServerError) == Status::ProtocolError);
    TEST_CHECK(to_status(kv::Error::UnexpectedReply) == Status::ProtocolError);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: allocation, read, reset, snapshot and clear through INCR/GET/SET/KEYS/DEL
// -----------------------------------------------------------------------------
void test_basic_operations() {
    std::cout << "[TEST] RemoteStore basic operations\n";
    auto server = std::make_shared<FakeKvServer>();
    auto store = make_fake_store(server);

    TEST_CHECK(store->kind() == Backend::Remote);
    TEST_CHECK(server->connections() == 0); // lazy connect

    Outcome r = store->read_current("LZSHCKZSWS");
    TEST_CHECK(r.ok() && r.value == 0);
    TEST_CHECK(server->connections() == 1);

    for (std::uint64_t i = 1; i <= 5; ++i) {
        r = store->allocate_next("LZSHCKZSWS");
        TEST_CHECK(r.ok() && r.value == i);
    }
    TEST_CHECK(server->raw("chassis_seq:LZSHCKZSWS") == std::optional<std::string>("5"));
    TEST_CHECK(server->commands("INCR") == 5);

    TEST_CHECK(store->reset("LZSHCKZSWS", 100) == Status::Ok);
    r = store->allocate_next("LZSHCKZSWS");
    TEST_CHECK(r.ok() && r.value == 101);
    TEST_CHECK(store->allocate_next("WVWZZZ1KKW").value == 1);

    // Keys outside the namespace are ignored
    server->put("session:abc", "xyz");
    const SnapshotOutcome snap = store->snapshot();
    TEST_CHECK(snap.ok());
    TEST_CHECK(snap.counters.size() == 2);
    TEST_CHECK(snap.counters.at("LZSHCKZSWS") == 101);
    TEST_CHECK(snap.counters.at("WVWZZZ1KKW") == 1);

    const StatisticsOutcome stats = store->statistics();
    TEST_CHECK(stats.ok() && stats.stats.total_issued == 102 && stats.stats.average_sequence == 51.0);

    TEST_CHECK(store->clear_all() == Status::Ok);
    TEST_CHECK(store->snapshot().counters.empty());
    TEST_CHECK(server->raw("session:abc").has_value());
    TEST_CHECK(store->allocate_next("LZSHCKZSWS").value == 1);

    // Clearing an empty namespace is not an error
    TEST_CHECK(store->clear_all() == Status::Ok);
    TEST_CHECK(store->clear_all() == Status::Ok);

    TEST_CHECK(server->connections() == 1);
    TEST_CHECK(store->allocate_next("bad prefix").status == Status::InvalidPrefix);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: independent store instances (one per "process") never collide
// -----------------------------------------------------------------------------
void test_concurrent_instances() {
    std::cout << "[TEST] RemoteStore concurrent instances\n";
    constexpr int INSTANCES = 6;
    constexpr int PER_INSTANCE = 50;

    auto server = std::make_shared<FakeKvServer>();
    std::mutex mtx;
    std::vector<std::uint64_t> all;

    std::vector<std::thread> workers;
    for (int t = 0; t < INSTANCES; ++t) {
        workers.emplace_back([&] {
            auto store = make_fake_store(server);
            std::vector<std::uint64_t> mine;
            for (int i = 0; i < PER_INSTANCE; ++i) {
                const Outcome r = store->allocate_next("LZSHCKZSWS");
                TEST_CHECK(r.ok());
                mine.push_back(r.value);
            }
            std::lock_guard lock(mtx);
            all.insert(all.end(), mine.begin(), mine.end());
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    std::sort(all.begin(), all.end());
    TEST_CHECK(all.size() == static_cast<std::size_t>(INSTANCES * PER_INSTANCE));
    for (std::size_t i = 0; i < all.size(); ++i) {
        TEST_CHECK(all[i] == i + 1);
    }
    TEST_CHECK(server->connections() == static_cast<std::uint64_t>(INSTANCES));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: one store instance shared by several threads
// -----------------------------------------------------------------------------
void test_shared_instance() {
    std::cout << "[TEST] RemoteStore shared instance\n";
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 50;

    auto server = std::make_shared<FakeKvServer>();
    auto store = make_fake_store(server, "", 7);
    std::mutex mtx;
    std::vector<std::uint64_t> all;

    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < PER_THREAD; ++i) {
                const Outcome r = store->allocate_next("LZSHCKZSWS", deadline_after(std::chrono::seconds(30)));
                TEST_CHECK(r.ok());
                std::lock_guard lock(mtx);
                all.push_back(r.value);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    std::sort(all.begin(), all.end());
    TEST_CHECK(std::adjacent_find(all.begin(), all.end()) == all.end());
    TEST_CHECK(all.front() == 1 && all.back() == static_cast<std::uint64_t>(THREADS * PER_THREAD));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: unreachable backend and recovery
// -----------------------------------------------------------------------------
void test_unavailable() {
    std::cout << "[TEST] RemoteStore unavailable backend\n";
    auto server = std::make_shared<FakeKvServer>();
    auto store = make_fake_store(server);

    server->set_available(false);
    TEST_CHECK(store->allocate_next("LZSHCKZSWS").status == Status::BackendUnavailable);
    TEST_CHECK(store->read_current("LZSHCKZSWS").status == Status::BackendUnavailable);
    TEST_CHECK(store->reset("LZSHCKZSWS", 3) == Status::BackendUnavailable);
    TEST_CHECK(store->snapshot().status == Status::BackendUnavailable);
    TEST_CHECK(store->clear_all() == Status::BackendUnavailable);
    TEST_CHECK(server->size() == 0);

    server->set_available(true);
    Outcome r = store->allocate_next("LZSHCKZSWS");
    TEST_CHECK(r.ok() && r.value == 1);

    // Connection lost mid-session, then restored
    server->set_available(false);
    TEST_CHECK(store->allocate_next("LZSHCKZSWS").status == Status::BackendUnavailable);
    TEST_CHECK(store->idle_connections() == 0);
    server->set_available(true);
    r = store->allocate_next("LZSHCKZSWS");
    TEST_CHECK(r.ok() && r.value == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a timed-out INCR may land; retrying skips a number, never repeats one
// -----------------------------------------------------------------------------
void test_timeout_skips() {
    std::cout << "[TEST] RemoteStore timeout skips\n";
    auto server = std::make_shared<FakeKvServer>();
    auto store = make_fake_store(server);

    TEST_CHECK(store->allocate_next("LZSHCKZSWS").value == 1);

    server->set_stall(true);
    const Outcome lost = store->allocate_next("LZSHCKZSWS");
    TEST_CHECK(lost.status == Status::Timeout);
    TEST_CHECK(lost.value == 0);
    server->set_stall(false);

    const Outcome next = store->allocate_next("LZSHCKZSWS");
    TEST_CHECK(next.ok() && next.value == 3);
    TEST_CHECK(server->connections() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: malformed or unexpected server data
// -----------------------------------------------------------------------------
void test_protocol_errors() {
    std::cout << "[TEST] RemoteStore protocol errors\n";
    auto server = std::make_shared<FakeKvServer>();
    auto store = make_fake_store(server);

    server->put("chassis_seq:TEXT", "not-a-number");
    TEST_CHECK(store->allocate_next("TEXT").status == Status::ProtocolError);
    TEST_CHECK(store->read_current("TEXT").status == Status::ProtocolError);

    server->put("chassis_seq:NEG", "-5");
    TEST_CHECK(store->read_current("NEG").status == Status::ProtocolError);
    // INCR of -5 yields -4: never handed out
    TEST_CHECK(store->allocate_next("NEG").status == Status::ProtocolError);

    server->inject_reply("+OK\r\n");
    TEST_CHECK(store->allocate_next("LZSHCKZSWS").status == Status::ProtocolError);

    // A snapshot fails as a whole when one counter is unreadable
    TEST_CHECK(store->snapshot().status == Status::ProtocolError);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: credentials
// -----------------------------------------------------------------------------
void test_authentication() {
    std::cout << "[TEST] RemoteStore authentication\n";
    auto server = std::make_shared<FakeKvServer>();
    server->set_password("tok3n");

    auto anonymous = make_fake_store(server);
    TEST_CHECK(anonymous->allocate_next("LZSHCKZSWS").status == Status::ProtocolError);

    auto wrong = make_fake_store(server, "nope");
    TEST_CHECK(wrong->allocate_next("LZSHCKZSWS").status == Status::BackendUnavailable);

    auto good = make_fake_store(server, "tok3n");
    const Outcome r = good->allocate_next("LZSHCKZSWS");
    TEST_CHECK(r.ok() && r.value == 1);

    // The URL password is used when no token is given
    vinforge::core::transport::ParsedUrl endpoint = vinforge::test::fake_endpoint();
    endpoint.password = "tok3n";
    vinforge::test::FakeRemoteStore from_url(endpoint, "", fake_client_factory(server));
    TEST_CHECK(from_url.allocate_next("LZSHCKZSWS").value == 2);

    // ... and the token wins over it
    endpoint.password = "stale";
    vinforge::test::FakeRemoteStore token_wins(endpoint, "tok3n", fake_client_factory(server));
    TEST_CHECK(token_wins.allocate_next("LZSHCKZSWS").value == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: a request stuck on one prefix does not hold up other prefixes
// -----------------------------------------------------------------------------
void test_unrelated_prefixes_in_parallel() {
    std::cout << "[TEST] RemoteStore unrelated prefixes in parallel\n";
    auto server = std::make_shared<FakeKvServer>();
    auto store = make_fake_store(server);

    TEST_CHECK(store->allocate_next("SLOWPREFIX").value == 1);
    server->hold_key("chassis_seq:SLOWPREFIX");

    Outcome slow;
    std::thread blocked([&] {
        slow = store->allocate_next("SLOWPREFIX", deadline_after(std::chrono::seconds(30)));
    });
    while (server->waiting() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    for (std::uint64_t i = 1; i <= 3; ++i) {
        const Outcome r = store->allocate_next("FASTPREFIX", deadline_after(std::chrono::seconds(1)));
        TEST_CHECK(r.ok() && r.value == i);
    }
    TEST_CHECK(store->read_current("FASTPREFIX").value == 3);
    TEST_CHECK(server->waiting() == 1);

    server->release();
    blocked.join();
    TEST_CHECK(slow.ok() && slow.value == 2);
    TEST_CHECK(server->connections() == 2);
    TEST_CHECK(store->idle_connections() == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: waiting for a free connection honours the deadline
// -----------------------------------------------------------------------------
void test_pool_exhausted_timeout() {
    std::cout << "[TEST] RemoteStore pool exhausted timeout\n";
    auto server = std::make_shared<FakeKvServer>();
    auto store = make_fake_store(server, "", 4096, 1);
    TEST_CHECK(store->pool_size() == 1);

    server->hold_key("chassis_seq:SLOWPREFIX");
    Outcome slow;
    std::thread blocked([&] {
        slow = store->allocate_next("SLOWPREFIX", deadline_after(std::chrono::seconds(30)));
    });
    while (server->waiting() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    const Outcome r = store->allocate_next("FASTPREFIX", deadline_after(std::chrono::milliseconds(50)));
    TEST_CHECK(r.status == Status::Timeout);
    TEST_CHECK(r.value == 0);
    TEST_CHECK(server->commands("INCR") == 0);

    server->release();
    blocked.join();
    TEST_CHECK(slow.ok() && slow.value == 1);
    TEST_CHECK(store->allocate_next("FASTPREFIX").value == 1);
    TEST_CHECK(server->connections() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test: counters stay within the signed 64-bit range of INCR
// -----------------------------------------------------------------------------
void test_counter_bounds() {
    std::cout << "[TEST] RemoteStore counter bounds\n";
    auto server = std::make_shared<FakeKvServer>();
    auto store = make_fake_store(server);

    TEST_CHECK(store->reset("LZSHCKZSWS", cfg::MAX_COUNTER_VALUE + 1) == Status::InvalidValue);
    TEST_CHECK(store->reset("LZSHCKZSWS", UINT64_MAX) == Status::InvalidValue);
    TEST_CHECK(server->size() == 0);
    TEST_CHECK(server->commands("SET") == 0);

    TEST_CHECK(store->reset("LZSHCKZSWS", cfg::MAX_COUNTER_VALUE) == Status::Ok);
    const Outcome r = store->allocate_next("LZSHCKZSWS");
    TEST_CHECK(r.status == Status::ProtocolError);
    TEST_CHECK(r.value == 0);
    TEST_CHECK(store->read_current("LZSHCKZSWS").value == cfg::MAX_COUNTER_VALUE);

    std::cout << "[TEST] OK\n";
}

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Fatal);

    test_status_mapping();
    test_basic_operations();
    test_concurrent_instances();
    test_shared_instance();
    test_unavailable();
    test_timeout_skips();
    test_protocol_errors();
    test_authentication();
    test_unrelated_prefixes_in_parallel();
    test_pool_exhausted_timeout();
    test_counter_bounds();

    std::cout << "\n[ALL REMOTE STORE TESTS PASSED]\n";
    return 0;
}
