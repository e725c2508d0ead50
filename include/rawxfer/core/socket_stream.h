/**
 * @file socket_stream.h
 * @brief Blocking byte streams over POSIX TCP sockets
 *
 * The frame codec and transfer engine only see byte_stream. socket_stream is
 * the production implementation; tests substitute in-memory streams.
 */

#ifndef RAWXFER_CORE_SOCKET_STREAM_H
#define RAWXFER_CORE_SOCKET_STREAM_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "rawxfer/core/types.h"

namespace rawxfer {

/**
 * @brief Bidirectional blocking byte stream
 *
 * Neither call guarantees a full transfer. read_some() returning 0 means the
 * peer closed its sending side.
 */
class byte_stream {
public:
    virtual ~byte_stream() = default;

    [[nodiscard]] virtual auto read_some(std::span<std::byte> buffer)
        -> result<std::size_t> = 0;

    [[nodiscard]] virtual auto write_some(std::span<const std::byte> data)
        -> result<std::size_t> = 0;

    /**
     * @brief Signal end of data to the peer while keeping the read side open
     */
    [[nodiscard]] virtual auto shutdown_write() -> result<void> { return {}; }
};

/**
 * @brief Owning wrapper around a socket descriptor
 */
class socket_handle {
public:
    socket_handle() = default;
    explicit socket_handle(int fd) noexcept : fd_(fd) {}
    ~socket_handle();

    // Non-copyable, movable
    socket_handle(const socket_handle&) = delete;
    auto operator=(const socket_handle&) -> socket_handle& = delete;
    socket_handle(socket_handle&& other) noexcept;
    auto operator=(socket_handle&& other) noexcept -> socket_handle&;

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return valid(); }

    /**
     * @brief Give up ownership without closing
     */
    [[nodiscard]] auto release() noexcept -> int;

    void close() noexcept;

private:
    int fd_{-1};
};

/**
 * @brief Connection returned by accept_connection()
 */
struct accepted_connection {
    socket_handle socket;
    std::string peer;
};

/**
 * @brief byte_stream over a connected TCP socket
 */
class socket_stream : public byte_stream {
public:
    explicit socket_stream(socket_handle socket);
    ~socket_stream() override = default;

    socket_stream(const socket_stream&) = delete;
    auto operator=(const socket_stream&) -> socket_stream& = delete;
    socket_stream(socket_stream&&) noexcept = default;
    auto operator=(socket_stream&&) noexcept -> socket_stream& = default;

    [[nodiscard]] auto read_some(std::span<std::byte> buffer)
        -> result<std::size_t> override;

    [[nodiscard]] auto write_some(std::span<const std::byte> data)
        -> result<std::size_t> override;

    /**
     * @brief Apply receive and send deadlines (zero disables them)
     */
    [[nodiscard]] auto set_io_timeout(std::chrono::milliseconds timeout) -> result<void>;

    [[nodiscard]] auto shutdown_write() -> result<void> override;

    [[nodiscard]] auto handle() const noexcept -> const socket_handle& { return socket_; }

private:
    socket_handle socket_;
};

/**
 * @brief Open a TCP connection to host:port
 */
[[nodiscard]] auto connect_to(const endpoint& remote) -> result<socket_handle>;

/**
 * @brief Create a listening socket bound to host:port (port 0 picks a free port)
 */
[[nodiscard]] auto listen_on(const endpoint& local, int backlog) -> result<socket_handle>;

/**
 * @brief Wait for the next inbound connection
 *
 * Fails with not_running once the listener has been shut down or closed.
 */
[[nodiscard]] auto accept_connection(const socket_handle& listener)
    -> result<accepted_connection>;

/**
 * @brief Port a bound socket is actually using
 */
[[nodiscard]] auto bound_port(const socket_handle& socket) -> result<uint16_t>;

}  // namespace rawxfer

#endif  // RAWXFER_CORE_SOCKET_STREAM_H
