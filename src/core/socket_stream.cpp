/**
 * @file socket_stream.cpp
 * @brief POSIX socket stream implementation
 */

#include "rawxfer/core/socket_stream.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace rawxfer {

namespace {

auto errno_message(const std::string& what) -> std::string {
    return what + ": " + std::strerror(errno);
}

auto format_peer(const sockaddr_storage& addr) -> std::string {
    char host[NI_MAXHOST] = {};
    char port[NI_MAXSERV] = {};
    auto rc = ::getnameinfo(reinterpret_cast<const sockaddr*>(&addr), sizeof(addr),
                            host, sizeof(host), port, sizeof(port),
                            NI_NUMERICHOST | NI_NUMERICSERV);
    if (rc != 0) {
        return "unknown";
    }
    return std::string(host) + ":" + port;
}

}  // namespace

// ============================================================================
// socket_handle
// ============================================================================

socket_handle::~socket_handle() {
    close();
}

socket_handle::socket_handle(socket_handle&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

auto socket_handle::operator=(socket_handle&& other) noexcept -> socket_handle& {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

auto socket_handle::release() noexcept -> int {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void socket_handle::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

// ============================================================================
// socket_stream
// ============================================================================

socket_stream::socket_stream(socket_handle socket) : socket_(std::move(socket)) {}

auto socket_stream::read_some(std::span<std::byte> buffer) -> result<std::size_t> {
    if (!socket_.valid()) {
        return unexpected{error{error_code::connection_broken, "read on closed socket"}};
    }

    while (true) {
        ssize_t n = ::recv(socket_.get(), buffer.data(), buffer.size(), 0);
        if (n >= 0) {
            return static_cast<std::size_t>(n);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return unexpected{error{error_code::connection_timeout, "receive timed out"}};
        }
        return unexpected{error{error_code::connection_broken, errno_message("recv failed")}};
    }
}

auto socket_stream::write_some(std::span<const std::byte> data) -> result<std::size_t> {
    if (!socket_.valid()) {
        return unexpected{error{error_code::connection_broken, "write on closed socket"}};
    }

    while (true) {
        ssize_t n = ::send(socket_.get(), data.data(), data.size(), MSG_NOSIGNAL);
        if (n > 0) {
            return static_cast<std::size_t>(n);
        }
        if (n == 0) {
            return unexpected{error{error_code::connection_broken, "Socket connection broken"}};
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return unexpected{error{error_code::connection_timeout, "send timed out"}};
        }
        return unexpected{error{error_code::connection_broken, errno_message("send failed")}};
    }
}

auto socket_stream::set_io_timeout(std::chrono::milliseconds timeout) -> result<void> {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    if (::setsockopt(socket_.get(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
        ::setsockopt(socket_.get(), SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0) {
        return unexpected{error{error_code::invalid_configuration,
                                errno_message("setsockopt timeout failed")}};
    }
    return {};
}

auto socket_stream::shutdown_write() -> result<void> {
    if (::shutdown(socket_.get(), SHUT_WR) != 0) {
        return unexpected{error{error_code::connection_broken, errno_message("shutdown failed")}};
    }
    return {};
}

// ============================================================================
// Free functions
// ============================================================================

auto connect_to(const endpoint& remote) -> result<socket_handle> {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    const std::string port_str = std::to_string(remote.port);
    int rc = ::getaddrinfo(remote.host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0 || res == nullptr) {
        return unexpected{error{error_code::connection_failed,
            "Cannot resolve " + remote.to_string() + ": " + ::gai_strerror(rc)}};
    }

    socket_handle socket;
    std::string last_error = "no usable address";
    for (auto* p = res; p != nullptr; p = p->ai_next) {
        socket_handle candidate(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
        if (!candidate) {
            last_error = errno_message("socket failed");
            continue;
        }
        if (::connect(candidate.get(), p->ai_addr, p->ai_addrlen) == 0) {
            socket = std::move(candidate);
            break;
        }
        last_error = errno_message("connect failed");
    }
    ::freeaddrinfo(res);

    if (!socket) {
        return unexpected{error{error_code::connection_failed,
            "Connection to " + remote.to_string() + " failed: " + last_error}};
    }
    return result<socket_handle>(std::move(socket));
}

auto listen_on(const endpoint& local, int backlog) -> result<socket_handle> {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE;

    addrinfo* res = nullptr;
    const std::string port_str = std::to_string(local.port);
    int rc = ::getaddrinfo(local.host.empty() ? nullptr : local.host.c_str(),
                           port_str.c_str(), &hints, &res);
    if (rc != 0 || res == nullptr) {
        return unexpected{error{error_code::invalid_configuration,
            "Cannot resolve listen address " + local.to_string() + ": " + ::gai_strerror(rc)}};
    }

    socket_handle listener;
    std::string last_error = "no usable address";
    for (auto* p = res; p != nullptr; p = p->ai_next) {
        socket_handle candidate(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
        if (!candidate) {
            last_error = errno_message("socket failed");
            continue;
        }

        int yes = 1;
        ::setsockopt(candidate.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        if (::bind(candidate.get(), p->ai_addr, p->ai_addrlen) != 0) {
            last_error = errno_message("bind failed");
            continue;
        }
        if (::listen(candidate.get(), backlog) != 0) {
            last_error = errno_message("listen failed");
            continue;
        }
        listener = std::move(candidate);
        break;
    }
    ::freeaddrinfo(res);

    if (!listener) {
        return unexpected{error{error_code::connection_failed,
            "Cannot listen on " + local.to_string() + ": " + last_error}};
    }
    return result<socket_handle>(std::move(listener));
}

auto accept_connection(const socket_handle& listener) -> result<accepted_connection> {
    while (true) {
        sockaddr_storage addr{};
        socklen_t len = sizeof(addr);
        int fd = ::accept(listener.get(), reinterpret_cast<sockaddr*>(&addr), &len);
        if (fd >= 0) {
            return accepted_connection{socket_handle(fd), format_peer(addr)};
        }
        if (errno == EINTR || errno == ECONNABORTED) {
            continue;
        }
        if (errno == EINVAL || errno == EBADF || errno == ENOTSOCK) {
            return unexpected{error{error_code::not_running, "listener closed"}};
        }
        return unexpected{error{error_code::connection_failed, errno_message("accept failed")}};
    }
}

auto bound_port(const socket_handle& socket) -> result<uint16_t> {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(socket.get(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return unexpected{error{error_code::internal_error, errno_message("getsockname failed")}};
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
}

}  // namespace rawxfer
