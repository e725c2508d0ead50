/**
 * @file connection_dispatcher.h
 * @brief Accept loop and connection-to-worker mapping
 */

#ifndef RAWXFER_SERVER_CONNECTION_DISPATCHER_H
#define RAWXFER_SERVER_CONNECTION_DISPATCHER_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

#include "rawxfer/core/socket_stream.h"
#include "rawxfer/core/types.h"
#include "rawxfer/server/server_types.h"

namespace rawxfer {

/**
 * @brief Runs one connection to completion; the socket closes when it returns
 */
using connection_handler = std::function<void(accepted_connection)>;

/**
 * @brief Maps accepted connections to execution units
 *
 * - sequential: one accept thread runs each handler inline.
 * - shared_pool: the accept thread only accepts while one of the N worker
 *   threads is free, so extra connections wait in the listen backlog.
 * - isolated_pool: N forked processes each run a sequential accept loop on
 *   the inherited listening socket. Workers that die are respawned.
 *
 * The dispatcher keeps accepting after any single handler failure.
 *
 * @code
 * connection_dispatcher dispatcher(dispatch_policy::shared_pool, 4,
 *     [&](accepted_connection conn) { serve(std::move(conn)); });
 * auto started = dispatcher.start(std::move(listener));
 * // ...
 * auto stopped = dispatcher.stop();
 * @endcode
 */
class connection_dispatcher {
public:
    connection_dispatcher(dispatch_policy policy,
                          std::size_t worker_count,
                          connection_handler handler);

    connection_dispatcher(const connection_dispatcher&) = delete;
    auto operator=(const connection_dispatcher&) -> connection_dispatcher& = delete;
    connection_dispatcher(connection_dispatcher&&) noexcept;
    auto operator=(connection_dispatcher&&) noexcept -> connection_dispatcher&;

    /**
     * @brief Stops the dispatcher if it is still running
     */
    ~connection_dispatcher();

    /**
     * @brief Take ownership of a listening socket and begin accepting
     */
    [[nodiscard]] auto start(socket_handle listener) -> result<void>;

    /**
     * @brief Close the listener, then wait for in-flight handlers and workers
     */
    [[nodiscard]] auto stop() -> result<void>;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto policy() const -> dispatch_policy;

    [[nodiscard]] auto worker_count() const -> std::size_t;

    /**
     * @brief Connections handed to a handler in this process
     *
     * Always 0 under isolated_pool, where accepting happens in the workers.
     */
    [[nodiscard]] auto connections_dispatched() const -> uint64_t;

    /**
     * @brief Worker processes started so far, including respawns
     */
    [[nodiscard]] auto workers_spawned() const -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace rawxfer

#endif  // RAWXFER_SERVER_CONNECTION_DISPATCHER_H
