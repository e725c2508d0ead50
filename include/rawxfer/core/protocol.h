/**
 * @file protocol.h
 * @brief Request line grammar and JSON response header
 *
 * Request:  "<COMMAND> <FILENAME> <SIZE>"
 * Response: {"status": "OK"|"ERROR", "data": <string|object>}
 */

#ifndef RAWXFER_CORE_PROTOCOL_H
#define RAWXFER_CORE_PROTOCOL_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "rawxfer/core/types.h"

namespace rawxfer {

/**
 * @brief Request commands
 */
enum class command_type {
    upload,
    get,
};

[[nodiscard]] constexpr auto to_string(command_type cmd) -> const char* {
    switch (cmd) {
        case command_type::upload:
            return "UPLOAD";
        case command_type::get:
            return "GET";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Parsed request header
 */
struct request {
    command_type command = command_type::get;
    std::string filename;
    uint64_t declared_size = 0;
};

/**
 * @brief Check a name against the flat storage namespace rules
 *
 * Accepts non-empty ASCII letters, digits, '_', '-' and '.', except the
 * names "." and ".." and anything containing "..".
 */
[[nodiscard]] auto is_valid_filename(std::string_view filename) -> bool;

/**
 * @brief Parse a request header line
 *
 * Checks run in order: token count (malformed_request), filename
 * (invalid_filename), size (invalid_size), command (invalid_command).
 * The command is case-insensitive; tokens past the third are ignored.
 * The error message is the text sent back to the peer.
 */
[[nodiscard]] auto parse_request(std::string_view header) -> result<request>;

/**
 * @brief Format a request header line (without the delimiter)
 */
[[nodiscard]] auto format_request(command_type command,
                                  std::string_view filename,
                                  uint64_t declared_size) -> std::string;

/**
 * @brief Message sent to the peer for a request error
 */
[[nodiscard]] auto wire_message(error_code code) -> std::string;

enum class response_status {
    ok,
    error,
};

[[nodiscard]] constexpr auto to_string(response_status status) -> const char* {
    return status == response_status::ok ? "OK" : "ERROR";
}

/**
 * @brief Description of the payload following a successful GET response
 */
struct file_entry {
    std::string filename;
    uint64_t filesize = 0;

    auto operator==(const file_entry&) const -> bool = default;
};

/**
 * @brief Response header
 *
 * Exactly one of message or file is meaningful: file is set when "data" is an
 * object, message holds "data" when it is a string.
 */
struct response_header {
    response_status status = response_status::ok;
    std::string message;
    std::optional<file_entry> file;

    [[nodiscard]] static auto ok_message(std::string text) -> response_header;
    [[nodiscard]] static auto ok_file(std::string filename, uint64_t filesize) -> response_header;
    [[nodiscard]] static auto failure(std::string text) -> response_header;

    [[nodiscard]] auto is_ok() const noexcept -> bool { return status == response_status::ok; }

    /**
     * @brief Serialize as a single JSON object
     *
     * Uses ", " and ": " separators, e.g.
     * {"status": "OK", "data": {"filename": "a.bin", "filesize": 3}}
     */
    [[nodiscard]] auto to_json() const -> std::string;

    /**
     * @brief Parse a JSON response header
     * @return invalid_response when the text is not a response object
     */
    [[nodiscard]] static auto parse(std::string_view json) -> result<response_header>;
};

}  // namespace rawxfer

#endif  // RAWXFER_CORE_PROTOCOL_H
