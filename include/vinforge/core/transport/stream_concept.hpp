/*
===============================================================================
StreamConcept (Blocking, Deadline-Bounded)
===============================================================================

Defines the minimal byte-stream contract required by kv::Client.

The stream implementation:

  • Owns exactly one connection at a time
  • Blocks the calling thread, never beyond the supplied deadline
  • Reports failures as transport::Error, never by throwing
  • Runs no background threads and invokes no callbacks

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

Not thread-safe. The owner (kv::Client, guarded by its RemoteStore) must
serialise access so that requests and replies stay paired.

-------------------------------------------------------------------------------
Failure Model
-------------------------------------------------------------------------------

After any error other than None the connection state is unspecified. The
owner must close() and reconnect before issuing further requests.

===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <concepts>
#include <cstddef>

#include "vinforge/core/transport/error.hpp"


namespace vinforge::core::transport {

using Deadline = std::chrono::steady_clock::time_point;

template<class S>
concept StreamConcept =
    requires(
        S s,
        const S cs,
        const std::string& host,
        const std::string& port,
        std::string_view bytes,
        char* buffer,
        std::size_t capacity,
        std::size_t& received,
        Deadline deadline
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { s.connect(host, port, deadline) } noexcept -> std::same_as<Error>;
    { s.close() } noexcept -> std::same_as<void>;
    { cs.is_open() } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // I/O
    // ---------------------------------------------------------------------

    { s.send(bytes, deadline) } noexcept -> std::same_as<Error>;
    { s.receive(buffer, capacity, received, deadline) } noexcept -> std::same_as<Error>;
};

} // namespace vinforge::core::transport
