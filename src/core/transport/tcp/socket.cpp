#include "vinforge/core/transport/tcp/socket.hpp"

#include <chrono>
#include <cerrno>
#include <cstring>
// POSIX / Linux
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>

#include "lcr/log/logger.hpp"


namespace vinforge::core::transport::tcp {

namespace {

// Milliseconds left until `deadline`, clamped to [0, INT_MAX]
[[nodiscard]] int remaining_ms(Deadline deadline) noexcept {
    using namespace std::chrono;
    const auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    if (left <= 0) return 0;
    if (left > 0x7fffffff) return 0x7fffffff;
    return static_cast<int>(left);
}

[[nodiscard]] bool set_nonblocking(int fd) noexcept {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

} // namespace


Error Socket::wait_(short events, Deadline deadline) noexcept {
    for (;;) {
        pollfd pfd{fd_, events, 0};
        const int rc = ::poll(&pfd, 1, remaining_ms(deadline));
        if (rc > 0) {
            if (pfd.revents & (POLLERR | POLLNVAL)) {
                return Error::TransportFailure;
            }
            // POLLHUP with pending data still lets recv() drain; recv() reports the close
            return Error::None;
        }
        if (rc == 0) {
            return Error::Timeout;
        }
        if (errno != EINTR) {
            return Error::TransportFailure;
        }
    }
}

Error Socket::connect(const std::string& host, const std::string& port, Deadline deadline) noexcept {
    if (is_open()) {
        return Error::InvalidState;
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    const int gai = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &result);
    if (gai != 0) {
        VF_DEBUG("[tcp::Socket] getaddrinfo(" << host << ":" << port << ") failed: " << ::gai_strerror(gai));
        return Error::ConnectionFailed;
    }

    Error last = Error::ConnectionFailed;
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        if (!set_nonblocking(fd)) {
            ::close(fd);
            continue;
        }
        fd_ = fd;
        int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
        if (rc != 0 && errno == EINPROGRESS) {
            last = wait_(POLLOUT, deadline);
            if (last == Error::None) {
                int so_error = 0;
                socklen_t len = sizeof(so_error);
                if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
                    last = Error::ConnectionFailed;
                }
            }
            rc = (last == Error::None) ? 0 : -1;
        }
        else if (rc != 0) {
            last = Error::ConnectionFailed;
        }
        if (rc == 0) {
            int one = 1;
            (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)); // latency only
            ::freeaddrinfo(result);
            VF_DEBUG("[tcp::Socket] connected to " << host << ":" << port);
            return Error::None;
        }
        ::close(fd);
        fd_ = -1;
        if (last == Error::Timeout) {
            break;
        }
    }
    ::freeaddrinfo(result);
    return last;
}

void Socket::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Error Socket::send(std::string_view bytes, Deadline deadline) noexcept {
    if (!is_open()) {
        return Error::InvalidState;
    }
    const char* data = bytes.data();
    std::size_t left = bytes.size();
    while (left > 0) {
        const ssize_t n = ::send(fd_, data, left, MSG_NOSIGNAL);
        if (n > 0) {
            data += n;
            left -= static_cast<std::size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            const Error e = wait_(POLLOUT, deadline);
            if (e != Error::None) return e;
            continue;
        }
        if (n < 0 && (errno == EPIPE || errno == ECONNRESET)) {
            return Error::RemoteClosed;
        }
        return Error::TransportFailure;
    }
    return Error::None;
}

Error Socket::receive(char* buffer, std::size_t capacity, std::size_t& received, Deadline deadline) noexcept {
    received = 0;
    if (!is_open()) {
        return Error::InvalidState;
    }
    for (;;) {
        const ssize_t n = ::recv(fd_, buffer, capacity, 0);
        if (n > 0) {
            received = static_cast<std::size_t>(n);
            return Error::None;
        }
        if (n == 0) {
            return Error::RemoteClosed;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            const Error e = wait_(POLLIN, deadline);
            if (e != Error::None) return e;
            continue;
        }
        if (errno == ECONNRESET) {
            return Error::RemoteClosed;
        }
        return Error::TransportFailure;
    }
}

} // namespace vinforge::core::transport::tcp
