/**
 * @file server_types.h
 * @brief Server-related type definitions for rawxfer
 */

#ifndef RAWXFER_SERVER_SERVER_TYPES_H
#define RAWXFER_SERVER_SERVER_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "rawxfer/core/frame_codec.h"
#include "rawxfer/core/protocol.h"
#include "rawxfer/core/types.h"

namespace rawxfer {

/**
 * @brief Server state enumeration
 */
enum class server_state {
    stopped,
    starting,
    running,
    stopping
};

[[nodiscard]] constexpr auto to_string(server_state state) -> const char* {
    switch (state) {
        case server_state::stopped: return "stopped";
        case server_state::starting: return "starting";
        case server_state::running: return "running";
        case server_state::stopping: return "stopping";
        default: return "unknown";
    }
}

/**
 * @brief How accepted connections are mapped to execution units
 */
enum class dispatch_policy {
    sequential,     ///< Accept loop runs each handler inline
    shared_pool,    ///< Fixed pool of worker threads
    isolated_pool   ///< Fixed set of forked worker processes
};

/**
 * @brief Command-line name of a policy ("single", "thread", "process")
 */
[[nodiscard]] constexpr auto to_string(dispatch_policy policy) -> const char* {
    switch (policy) {
        case dispatch_policy::sequential: return "single";
        case dispatch_policy::shared_pool: return "thread";
        case dispatch_policy::isolated_pool: return "process";
        default: return "unknown";
    }
}

[[nodiscard]] inline auto parse_dispatch_policy(std::string_view name)
    -> std::optional<dispatch_policy> {
    if (name == "single" || name == "sequential") return dispatch_policy::sequential;
    if (name == "thread" || name == "shared_pool") return dispatch_policy::shared_pool;
    if (name == "process" || name == "isolated_pool") return dispatch_policy::isolated_pool;
    return std::nullopt;
}

/**
 * @brief Server configuration
 */
struct server_config {
    std::filesystem::path storage_directory;
    dispatch_policy policy = dispatch_policy::sequential;
    std::size_t worker_count = 1;
    std::size_t chunk_size = default_chunk_size;
    std::size_t max_header_size = 64 * 1024;                  // 64KB
    std::chrono::milliseconds io_timeout{0};                  // 0 = none
    int listen_backlog = 128;

    [[nodiscard]] auto is_valid() const -> bool {
        return !storage_directory.empty() && worker_count > 0 && chunk_size > 0 &&
               max_header_size > 0 && io_timeout.count() >= 0 && listen_backlog > 0;
    }
};

/**
 * @brief Server statistics
 *
 * Under the isolated-pool policy handlers run in child processes, so these
 * counters only reflect connections handled in the server process itself.
 */
struct server_statistics {
    uint64_t total_connections = 0;
    uint64_t requests_succeeded = 0;
    uint64_t requests_failed = 0;
    uint64_t total_bytes_received = 0;
    uint64_t total_bytes_sent = 0;
};

/**
 * @brief What happened on one connection
 */
struct connection_outcome {
    std::optional<command_type> command;
    std::string filename;
    bool success = false;
    uint64_t bytes_received = 0;
    uint64_t bytes_sent = 0;
    std::optional<error> failure;
};

}  // namespace rawxfer

#endif  // RAWXFER_SERVER_SERVER_TYPES_H
