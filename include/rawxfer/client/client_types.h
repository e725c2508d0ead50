/**
 * @file client_types.h
 * @brief Client-related type definitions for rawxfer
 */

#ifndef RAWXFER_CLIENT_CLIENT_TYPES_H
#define RAWXFER_CLIENT_CLIENT_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rawxfer/core/frame_codec.h"
#include "rawxfer/core/protocol.h"
#include "rawxfer/core/types.h"

namespace rawxfer {

/**
 * @brief Client configuration
 */
struct client_config {
    endpoint server{"127.0.0.1", 10001};
    std::size_t chunk_size = default_chunk_size;
    std::chrono::milliseconds io_timeout{0};                  // 0 = none
    std::filesystem::path download_directory = ".";

    [[nodiscard]] auto is_valid() const -> bool {
        return !server.host.empty() && server.port != 0 && chunk_size > 0 &&
               io_timeout.count() >= 0;
    }
};

/**
 * @brief Response as seen by the caller
 *
 * A protocol-level ERROR is still a response: status is error and message
 * carries the server's reason.
 */
struct server_response {
    response_status status = response_status::error;
    std::string message;
    std::optional<file_entry> file;

    /// Payload bytes collected in memory (send_command only)
    std::vector<std::byte> file_data;

    /// Where a download was written
    std::optional<std::filesystem::path> download_path;

    [[nodiscard]] auto is_ok() const noexcept -> bool { return status == response_status::ok; }

    /**
     * @brief All announced payload bytes arrived
     */
    [[nodiscard]] auto payload_complete() const noexcept -> bool {
        return !file || file_data.size() >= file->filesize;
    }

    /**
     * @brief One-line rendering for program output
     */
    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Client operations that can be timed and stress tested
 */
enum class transfer_operation {
    upload,
    download
};

[[nodiscard]] constexpr auto to_string(transfer_operation op) -> const char* {
    switch (op) {
        case transfer_operation::upload: return "upload";
        case transfer_operation::download: return "download";
        default: return "unknown";
    }
}

[[nodiscard]] inline auto parse_transfer_operation(std::string_view name)
    -> std::optional<transfer_operation> {
    if (name == "upload") return transfer_operation::upload;
    if (name == "download") return transfer_operation::download;
    return std::nullopt;
}

/**
 * @brief Outcome of one timed client operation
 */
struct transfer_result {
    bool success = false;
    std::chrono::duration<double> elapsed{0};

    /// Bytes moved; 0 when the operation failed
    uint64_t byte_count = 0;
};

}  // namespace rawxfer

#endif  // RAWXFER_CLIENT_CLIENT_TYPES_H
