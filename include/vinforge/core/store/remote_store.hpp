#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <mutex>
#include <memory>
#include <functional>
#include <condition_variable>
#include <utility>
#include <cstdint>

#include "vinforge/core/store/sequence_store.hpp"
#include "vinforge/core/config/sequence.hpp"
#include "vinforge/core/transport/parse_url.hpp"
#include "vinforge/core/transport/tcp/socket.hpp"
#include "vinforge/core/protocol/kv/client.hpp"
#include "lcr/log/logger.hpp"


namespace vinforge::core::store {

/*
===============================================================================
 vinforge::core::store::RemoteStore
===============================================================================

SequenceStore backed by a remote key-value service. Counters live under

    chassis_seq:<prefix>

and every allocation is a single INCR, so uniqueness holds across threads,
processes and hosts sharing the service.

-------------------------------------------------------------------------------
 Connection model
-------------------------------------------------------------------------------
- A bounded pool of connections per store instance. Each operation leases
  one client for its whole request/reply exchange, so calls on unrelated
  prefixes run in parallel and never wait on each other's round trips.
- Clients are created on demand by the factory, up to `pool_size`, and
  connected lazily. A client that failed is returned closed and reconnects
  on its next lease.
- Waiting for a free client honours the caller's deadline (Timeout).
- Idle clients are reused last-in first-out, so sequential callers keep
  using a single connection.

-------------------------------------------------------------------------------
 Failure mapping
-------------------------------------------------------------------------------
  kv::Error::Timeout                    -> Status::Timeout (outcome unknown)
  NotConnected / TransportFailure       -> Status::BackendUnavailable
  ServerError / UnexpectedReply         -> Status::ProtocolError

A value is never synthesised locally. After Timeout the INCR may have landed;
retrying skips a number at worst.
===============================================================================
*/

[[nodiscard]]
inline constexpr Status to_status(protocol::kv::Error e) noexcept {
    using protocol::kv::Error;
    switch (e) {
    case Error::None:             return Status::Ok;
    case Error::Timeout:          return Status::Timeout;
    case Error::NotConnected:
    case Error::TransportFailure: return Status::BackendUnavailable;
    default:                      return Status::ProtocolError;
    }
}

template<class Client>
class RemoteStore final : public SequenceStore {
public:
    using ClientFactory = std::function<Client()>;

    // `token` takes precedence over a password embedded in the URL.
    // An empty factory default-constructs clients.
    RemoteStore(transport::ParsedUrl endpoint, std::string token, ClientFactory factory = {},
                std::size_t pool_size = config::sequence::DEFAULT_REMOTE_POOL_SIZE)
        : endpoint_(std::move(endpoint))
        , password_(token.empty() ? endpoint_.password : std::move(token))
        , factory_(factory ? std::move(factory) : ClientFactory([] { return Client{}; }))
        , pool_size_(pool_size == 0 ? 1 : pool_size)
    {
        VF_DEBUG("[RemoteStore] endpoint " << endpoint_.host << ":" << endpoint_.port
                 << ", up to " << pool_size_ << " connections");
    }

    ~RemoteStore() override = default;

    using SequenceStore::allocate_next;
    using SequenceStore::read_current;
    using SequenceStore::reset;
    using SequenceStore::snapshot;
    using SequenceStore::clear_all;

    [[nodiscard]] Backend kind() const noexcept override { return Backend::Remote; }
    [[nodiscard]] std::string_view name() const noexcept override { return "RemoteStore"; }

    [[nodiscard]]
    Outcome allocate_next(std::string_view prefix, Deadline deadline) override {
        if (!is_valid_prefix(prefix)) {
            return Outcome{Status::InvalidPrefix, 0};
        }
        std::int64_t value = 0;
        {
            Lease lease(*this);
            Status s = lease.acquire(deadline);
            if (s != Status::Ok) {
                return Outcome{s, 0};
            }
            s = finish_("INCR", prefix, lease.client().incr(key_(prefix), value, deadline));
            if (s != Status::Ok) {
                return Outcome{s, 0};
            }
        }
        if (value <= 0) {
            VF_ERROR("[RemoteStore] INCR " << prefix << " returned " << value << ", counter was set out of band");
            return Outcome{Status::ProtocolError, 0};
        }
        const auto next = static_cast<std::uint64_t>(value);
        report_sequence_limit(name(), prefix, next);
        return Outcome{Status::Ok, next};
    }

    [[nodiscard]]
    Outcome read_current(std::string_view prefix, Deadline deadline) override {
        if (!is_valid_prefix(prefix)) {
            return Outcome{Status::InvalidPrefix, 0};
        }
        Lease lease(*this);
        Status s = lease.acquire(deadline);
        if (s != Status::Ok) {
            return Outcome{s, 0};
        }
        std::optional<std::uint64_t> value;
        s = get_(lease.client(), prefix, value, deadline);
        if (s != Status::Ok) {
            return Outcome{s, 0};
        }
        return Outcome{Status::Ok, value.value_or(0)};
    }

    [[nodiscard]]
    Status reset(std::string_view prefix, std::uint64_t value, Deadline deadline) override {
        if (!is_valid_prefix(prefix)) {
            return Status::InvalidPrefix;
        }
        if (value > config::sequence::MAX_COUNTER_VALUE) {
            return Status::InvalidValue;
        }
        Lease lease(*this);
        Status s = lease.acquire(deadline);
        if (s != Status::Ok) {
            return s;
        }
        s = finish_("SET", prefix, lease.client().set(key_(prefix), value, deadline));
        if (s == Status::Ok) {
            VF_WARN("[RemoteStore] Sequence " << prefix << " reset to " << value
                    << ". Numbers above " << value << " may be issued again.");
        }
        return s;
    }

    [[nodiscard]]
    SnapshotOutcome snapshot(Deadline deadline) override {
        Lease lease(*this);
        Status s = lease.acquire(deadline);
        if (s != Status::Ok) {
            return SnapshotOutcome{s, {}};
        }
        std::vector<std::string> keys;
        s = list_keys_(lease.client(), keys, deadline);
        if (s != Status::Ok) {
            return SnapshotOutcome{s, {}};
        }
        SnapshotOutcome out;
        const std::string_view ns = config::sequence::REMOTE_KEY_NAMESPACE;
        for (const auto& key : keys) {
            const std::string_view prefix = std::string_view(key).substr(ns.size());
            std::optional<std::uint64_t> value;
            s = get_(lease.client(), prefix, value, deadline);
            if (s != Status::Ok) {
                return SnapshotOutcome{s, {}};
            }
            // Deleted between KEYS and GET
            if (value) {
                out.counters[std::string(prefix)] = *value;
            }
        }
        return out;
    }

    [[nodiscard]]
    Status clear_all(Deadline deadline) override {
        Lease lease(*this);
        Status s = lease.acquire(deadline);
        if (s != Status::Ok) {
            return s;
        }
        std::vector<std::string> keys;
        s = list_keys_(lease.client(), keys, deadline);
        if (s != Status::Ok) {
            return s;
        }
        std::int64_t removed = 0;
        s = finish_("DEL", "*", lease.client().del(keys, removed, deadline));
        if (s == Status::Ok) {
            VF_WARN("[RemoteStore] All sequences cleared (" << removed << " prefixes). Every number may be issued again.");
        }
        return s;
    }

    [[nodiscard]] const transport::ParsedUrl& endpoint() const noexcept { return endpoint_; }

    [[nodiscard]] std::size_t pool_size() const noexcept { return pool_size_; }

    // Idle clients that currently hold an open connection
    [[nodiscard]] std::size_t idle_connections() const {
        std::lock_guard lock(pool_mutex_);
        std::size_t n = 0;
        for (const auto& c : idle_) {
            if (c->is_connected()) ++n;
        }
        return n;
    }

private:
    // Exclusive use of one pooled client; returns it to the pool on scope exit
    class Lease {
    public:
        explicit Lease(RemoteStore& owner) noexcept
            : owner_(owner)
        {}

        ~Lease() {
            if (client_) {
                owner_.release_(std::move(client_));
            }
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        [[nodiscard]] Status acquire(Deadline deadline) { return owner_.acquire_(client_, deadline); }
        [[nodiscard]] Client& client() noexcept { return *client_; }

    private:
        RemoteStore& owner_;
        std::unique_ptr<Client> client_;
    };

    // Takes an idle client or creates one, then makes sure it is connected.
    // On failure `out` may still hold the client; the lease returns it.
    [[nodiscard]]
    Status acquire_(std::unique_ptr<Client>& out, Deadline deadline) {
        {
            std::unique_lock lock(pool_mutex_);
            const bool ready = pool_cv_.wait_until(lock, deadline, [this] {
                return !idle_.empty() || created_ < pool_size_;
            });
            if (!ready) {
                VF_WARN("[RemoteStore] no free connection before the deadline (" << pool_size_ << " in use)");
                return Status::Timeout;
            }
            if (!idle_.empty()) {
                out = std::move(idle_.back());
                idle_.pop_back();
            }
            else {
                ++created_;
            }
        }
        if (!out) {
            out = std::make_unique<Client>(factory_());
        }
        return ensure_connected_(*out, deadline);
    }

    void release_(std::unique_ptr<Client> client) {
        {
            std::lock_guard lock(pool_mutex_);
            idle_.push_back(std::move(client));
        }
        pool_cv_.notify_one();
    }

    [[nodiscard]]
    static std::string key_(std::string_view prefix) {
        std::string key(config::sequence::REMOTE_KEY_NAMESPACE);
        key.append(prefix.data(), prefix.size());
        return key;
    }

    [[nodiscard]]
    Status ensure_connected_(Client& client, Deadline deadline) {
        if (client.is_connected()) {
            return Status::Ok;
        }
        const protocol::kv::Error e = client.connect(endpoint_, password_, deadline);
        if (e == protocol::kv::Error::None) {
            VF_INFO("[RemoteStore] connected to " << endpoint_.host << ":" << endpoint_.port);
            return Status::Ok;
        }
        VF_ERROR("[RemoteStore] cannot reach " << endpoint_.host << ":" << endpoint_.port
                 << " (" << protocol::kv::to_string(e) << ")");
        return e == protocol::kv::Error::Timeout ? Status::Timeout : Status::BackendUnavailable;
    }

    [[nodiscard]]
    Status get_(Client& client, std::string_view prefix, std::optional<std::uint64_t>& out, Deadline deadline) {
        out.reset();
        std::optional<std::int64_t> raw;
        const Status s = finish_("GET", prefix, client.get(key_(prefix), raw, deadline));
        if (s != Status::Ok) {
            return s;
        }
        if (raw) {
            if (*raw < 0) {
                VF_ERROR("[RemoteStore] counter " << prefix << " holds negative value " << *raw);
                return Status::ProtocolError;
            }
            out = static_cast<std::uint64_t>(*raw);
        }
        return Status::Ok;
    }

    // Returns the namespaced keys of every counter
    [[nodiscard]]
    Status list_keys_(Client& client, std::vector<std::string>& keys, Deadline deadline) {
        std::string pattern(config::sequence::REMOTE_KEY_NAMESPACE);
        pattern += '*';
        const Status s = finish_("KEYS", pattern, client.keys(pattern, keys, deadline));
        if (s != Status::Ok) {
            return s;
        }
        const std::string_view ns = config::sequence::REMOTE_KEY_NAMESPACE;
        for (const auto& k : keys) {
            if (k.size() <= ns.size() || std::string_view(k).substr(0, ns.size()) != ns) {
                VF_ERROR("[RemoteStore] KEYS returned foreign key " << k);
                return Status::ProtocolError;
            }
        }
        return Status::Ok;
    }

    // Maps and logs the outcome of one command
    [[nodiscard]]
    Status finish_(std::string_view command, std::string_view prefix, protocol::kv::Error e) {
        const Status s = to_status(e);
        if (s == Status::Timeout) {
            VF_WARN("[RemoteStore] " << command << " " << prefix << " timed out, outcome unknown. Connection dropped.");
        }
        else if (s != Status::Ok) {
            VF_ERROR("[RemoteStore] " << command << " " << prefix << " failed: " << protocol::kv::to_string(e));
        }
        return s;
    }

private:
    transport::ParsedUrl endpoint_;
    std::string password_;
    ClientFactory factory_;
    std::size_t pool_size_;

    mutable std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
    std::vector<std::unique_ptr<Client>> idle_;
    std::size_t created_ = 0;
};


// Production backend over a plain TCP connection
using TcpRemoteStore = RemoteStore<protocol::kv::Client<transport::tcp::Socket>>;

} // namespace vinforge::core::store
