/**
 * @file file_server.h
 * @brief File transfer server
 */

#ifndef RAWXFER_SERVER_FILE_SERVER_H
#define RAWXFER_SERVER_FILE_SERVER_H

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>

#include "rawxfer/core/types.h"
#include "rawxfer/server/server_types.h"

namespace rawxfer {

/**
 * @brief File transfer server
 *
 * Owns the storage directory, the listening socket and a connection
 * dispatcher running the transfer engine for every accepted connection.
 *
 * @code
 * auto server_result = file_server::builder()
 *     .with_storage_directory("storage")
 *     .with_dispatch_policy(dispatch_policy::shared_pool)
 *     .with_worker_count(4)
 *     .build();
 *
 * if (server_result.has_value()) {
 *     auto& server = server_result.value();
 *     auto started = server.start(endpoint{10001});
 * }
 * @endcode
 */
class file_server {
public:
    /**
     * @brief Builder for file_server
     */
    class builder {
    public:
        builder();

        /**
         * @brief Directory holding stored files (created if absent)
         */
        auto with_storage_directory(const std::filesystem::path& dir) -> builder&;

        /**
         * @brief Connection scheduling policy (default: sequential)
         */
        auto with_dispatch_policy(dispatch_policy policy) -> builder&;

        /**
         * @brief Worker threads or processes for the pool policies (default: 1)
         */
        auto with_worker_count(std::size_t count) -> builder&;

        /**
         * @brief Read/write chunk size (default: 512KB)
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        /**
         * @brief Largest request header accepted (default: 64KB)
         */
        auto with_max_header_size(std::size_t size) -> builder&;

        /**
         * @brief Per-operation socket deadline (default: none)
         */
        auto with_io_timeout(std::chrono::milliseconds timeout) -> builder&;

        auto with_listen_backlog(int backlog) -> builder&;

        /**
         * @brief Validate the configuration and create the server
         */
        [[nodiscard]] auto build() -> result<file_server>;

    private:
        server_config config_;
    };

    // Non-copyable, movable
    file_server(const file_server&) = delete;
    auto operator=(const file_server&) -> file_server& = delete;
    file_server(file_server&&) noexcept;
    auto operator=(file_server&&) noexcept -> file_server&;
    ~file_server();

    /**
     * @brief Bind, listen and start dispatching connections
     *
     * Port 0 binds an ephemeral port; port() reports the one chosen.
     */
    [[nodiscard]] auto start(const endpoint& listen_addr) -> result<void>;

    /**
     * @brief Stop accepting and wait for running handlers
     */
    [[nodiscard]] auto stop() -> result<void>;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto state() const -> server_state;

    /**
     * @brief Port the server is listening on, or 0 if not running
     */
    [[nodiscard]] auto port() const -> uint16_t;

    /**
     * @brief Called after every connection handled in this process
     */
    void on_connection_complete(std::function<void(const connection_outcome&)> callback);

    [[nodiscard]] auto get_statistics() const -> server_statistics;

    [[nodiscard]] auto config() const -> const server_config&;

private:
    explicit file_server(server_config config);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace rawxfer

#endif  // RAWXFER_SERVER_FILE_SERVER_H
