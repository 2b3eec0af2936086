#pragma once

#include <string>
#include <string_view>
#include <cstddef>

#include "vinforge/core/transport/error.hpp"
#include "vinforge/core/transport/stream_concept.hpp"


namespace vinforge::core::transport::tcp {

// -----------------------------------------------------------------------------
// POSIX TCP stream
// -----------------------------------------------------------------------------
//
// Non-blocking socket driven by poll(2) so that every call honours its
// deadline. Name resolution uses getaddrinfo(), which cannot be bounded; the
// deadline applies from the first connect attempt onwards.
//
// SIGPIPE is suppressed per call (MSG_NOSIGNAL).
//
class Socket {
public:
    Socket() = default;
    ~Socket() { close(); }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Socket& operator=(Socket&& other) noexcept {
        if (this != &other) {
            close();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    [[nodiscard]] Error connect(const std::string& host, const std::string& port, Deadline deadline) noexcept;
    void close() noexcept;
    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    [[nodiscard]] Error send(std::string_view bytes, Deadline deadline) noexcept;
    [[nodiscard]] Error receive(char* buffer, std::size_t capacity, std::size_t& received, Deadline deadline) noexcept;

private:
    // Waits for `events` on fd_; returns None, Timeout or TransportFailure
    [[nodiscard]] Error wait_(short events, Deadline deadline) noexcept;

private:
    int fd_ = -1;
};

static_assert(StreamConcept<Socket>);

} // namespace vinforge::core::transport::tcp
