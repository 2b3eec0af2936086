#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <utility>
#include <cstdint>
#include <cstddef>

#include "vinforge/core/transport/stream_concept.hpp"
#include "vinforge/core/transport/parse_url.hpp"
#include "vinforge/core/protocol/kv/error.hpp"
#include "vinforge/core/protocol/resp/reply.hpp"
#include "vinforge/core/protocol/resp/encoder.hpp"
#include "vinforge/core/protocol/resp/parser.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace vinforge::core::protocol::kv {

/*
===============================================================================
 vinforge::core::protocol::kv::Client
===============================================================================

Blocking RESP2 client for the handful of commands a counter store needs:

  AUTH, INCR, GET, SET, KEYS, DEL

The client is parameterized by a byte stream conforming to
transport::StreamConcept so tests can replace the TCP socket with an
in-process server.

-------------------------------------------------------------------------------
 Request / reply pairing
-------------------------------------------------------------------------------
- One request in flight at a time. Every call sends one command and reads
  exactly one reply before returning.
- Any error other than ServerError leaves the stream in an unknown position
  (a late reply could be paired with the next request). The client closes
  the connection in that case; the owner reconnects lazily.

-------------------------------------------------------------------------------
 Threading
-------------------------------------------------------------------------------
Not thread-safe. RemoteStore serialises access.
===============================================================================
*/

template<transport::StreamConcept S>
class Client {
public:
    Client() = default;
    explicit Client(S stream) noexcept
        : stream_(std::move(stream))
    {}

    ~Client() { close(); }

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;
    Client(Client&&) noexcept = default;
    Client& operator=(Client&&) noexcept = default;

    // Opens the connection and authenticates when a password is supplied
    [[nodiscard]]
    Error connect(const transport::ParsedUrl& endpoint, std::string_view password, transport::Deadline deadline) {
        close();
        const transport::Error te = stream_.connect(endpoint.host, endpoint.port, deadline);
        if (te != transport::Error::None) {
            VF_DEBUG("[kv::Client] connect to " << endpoint.host << ":" << endpoint.port
                     << " failed: " << transport::to_string(te));
            return from_transport(te);
        }
        if (!password.empty()) {
            resp::Reply reply;
            const Error e = call_(resp::encode({"AUTH", password}), reply, deadline);
            if (e != Error::None) {
                VF_WARN("[kv::Client] AUTH rejected: " << (reply.is_error() ? reply.text : std::string(to_string(e))));
                close();
                return e;
            }
        }
        return Error::None;
    }

    void close() noexcept {
        stream_.close();
        rx_.clear();
    }

    [[nodiscard]] bool is_connected() const noexcept {
        return stream_.is_open();
    }

    // INCR key -> new value
    [[nodiscard]]
    Error incr(std::string_view key, std::int64_t& value, transport::Deadline deadline) {
        resp::Reply reply;
        const Error e = call_(resp::encode({"INCR", key}), reply, deadline);
        if (e != Error::None) {
            return e;
        }
        if (reply.type != resp::Type::Integer) {
            return unexpected_("INCR", reply);
        }
        value = reply.integer;
        return Error::None;
    }

    // GET key -> value, or nullopt when the key does not exist
    [[nodiscard]]
    Error get(std::string_view key, std::optional<std::int64_t>& value, transport::Deadline deadline) {
        value.reset();
        resp::Reply reply;
        const Error e = call_(resp::encode({"GET", key}), reply, deadline);
        if (e != Error::None) {
            return e;
        }
        if (reply.is_null()) {
            return Error::None;
        }
        std::int64_t v = 0;
        if (reply.type == resp::Type::Integer) {
            v = reply.integer;
        }
        else if (reply.type != resp::Type::BulkString || !resp::parse_integer(reply.text, v)) {
            return unexpected_("GET", reply);
        }
        value = v;
        return Error::None;
    }

    // SET key value
    [[nodiscard]]
    Error set(std::string_view key, std::uint64_t value, transport::Deadline deadline) {
        resp::Reply reply;
        const std::string arg = resp::to_argument(value);
        const Error e = call_(resp::encode({"SET", key, arg}), reply, deadline);
        if (e != Error::None) {
            return e;
        }
        if (reply.type != resp::Type::SimpleString) {
            return unexpected_("SET", reply);
        }
        return Error::None;
    }

    // KEYS pattern -> matching key names
    [[nodiscard]]
    Error keys(std::string_view pattern, std::vector<std::string>& out, transport::Deadline deadline) {
        out.clear();
        resp::Reply reply;
        const Error e = call_(resp::encode({"KEYS", pattern}), reply, deadline);
        if (e != Error::None) {
            return e;
        }
        if (reply.type != resp::Type::Array) {
            return unexpected_("KEYS", reply);
        }
        out.reserve(reply.elements.size());
        for (auto& element : reply.elements) {
            if (element.type != resp::Type::BulkString) {
                out.clear();
                return unexpected_("KEYS", element);
            }
            out.push_back(std::move(element.text));
        }
        return Error::None;
    }

    // DEL key [key ...] -> number of keys removed
    [[nodiscard]]
    Error del(const std::vector<std::string>& keys, std::int64_t& removed, transport::Deadline deadline) {
        removed = 0;
        if (keys.empty()) {
            return Error::None;
        }
        std::string request = "*";
        lcr::json::append(request, keys.size() + 1);
        request += "\r\n";
        resp::append_bulk(request, "DEL");
        for (const auto& k : keys) {
            resp::append_bulk(request, k);
        }
        resp::Reply reply;
        const Error e = call_(request, reply, deadline);
        if (e != Error::None) {
            return e;
        }
        if (reply.type != resp::Type::Integer) {
            return unexpected_("DEL", reply);
        }
        removed = reply.integer;
        return Error::None;
    }

    // Accessor for tests
    [[nodiscard]] S& stream() noexcept { return stream_; }

private:
    // Sends one request and reads exactly one reply
    [[nodiscard]]
    Error call_(const std::string& request, resp::Reply& reply, transport::Deadline deadline) {
        if (!stream_.is_open()) {
            return Error::NotConnected;
        }
        transport::Error te = stream_.send(request, deadline);
        if (te != transport::Error::None) {
            close();
            return from_transport(te);
        }
        for (;;) {
            std::size_t consumed = 0;
            const resp::Result r = resp::parse(rx_, reply, consumed);
            if (r == resp::Result::Complete) {
                rx_.erase(0, consumed);
                if (reply.is_error()) {
                    VF_DEBUG("[kv::Client] server error: " << reply.text);
                    return Error::ServerError;
                }
                return Error::None;
            }
            if (r == resp::Result::Invalid) {
                VF_ERROR("[kv::Client] malformed reply stream, dropping connection");
                close();
                return Error::UnexpectedReply;
            }
            std::size_t received = 0;
            te = stream_.receive(chunk_.data(), chunk_.size(), received, deadline);
            if (te != transport::Error::None) {
                close();
                return from_transport(te);
            }
            rx_.append(chunk_.data(), received);
        }
    }

    [[nodiscard]]
    Error unexpected_(std::string_view command, const resp::Reply& reply) {
        VF_ERROR("[kv::Client] unexpected " << resp::to_string(reply.type) << " reply to " << command);
        return Error::UnexpectedReply;
    }

private:
    S stream_;
    std::string rx_;
    std::array<char, 4096> chunk_{};
};

} // namespace vinforge::core::protocol::kv
