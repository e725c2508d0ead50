/**
 * @file types.h
 * @brief Core type definitions for rawxfer
 */

#ifndef RAWXFER_CORE_TYPES_H
#define RAWXFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace rawxfer {

/**
 * @brief Error codes for file transfer operations
 */
enum class error_code {
    success = 0,

    // Request errors (-100 to -119)
    malformed_request = -100,
    invalid_filename = -101,
    invalid_size = -102,
    invalid_command = -103,
    header_too_large = -104,

    // Transfer errors (-120 to -139)
    file_not_found = -120,
    size_mismatch = -121,
    incomplete_transfer = -122,
    invalid_response = -123,

    // File I/O errors (-140 to -159)
    file_read_error = -140,
    file_write_error = -141,

    // Network errors (-160 to -179)
    connection_failed = -160,
    connection_timeout = -161,
    connection_broken = -162,

    // Configuration and lifecycle errors (-200 to -219)
    invalid_configuration = -200,
    already_running = -201,
    not_running = -202,
    internal_error = -203,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::malformed_request:
            return "malformed request";
        case error_code::invalid_filename:
            return "invalid filename";
        case error_code::invalid_size:
            return "invalid size";
        case error_code::invalid_command:
            return "invalid command";
        case error_code::header_too_large:
            return "header too large";
        case error_code::file_not_found:
            return "file not found";
        case error_code::size_mismatch:
            return "size mismatch";
        case error_code::incomplete_transfer:
            return "incomplete transfer";
        case error_code::invalid_response:
            return "invalid response";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_broken:
            return "connection broken";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::already_running:
            return "already running";
        case error_code::not_running:
            return "not running";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if the error was raised by the transport rather than the peer's request
 */
[[nodiscard]] constexpr auto is_connection_error(error_code code) -> bool {
    return code == error_code::connection_failed ||
           code == error_code::connection_timeout ||
           code == error_code::connection_broken;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Network endpoint (host and port)
 */
struct endpoint {
    std::string host;
    uint16_t port;

    endpoint() : port(0) {}
    endpoint(std::string h, uint16_t p) : host(std::move(h)), port(p) {}
    explicit endpoint(uint16_t p) : host("0.0.0.0"), port(p) {}

    [[nodiscard]] auto to_string() const -> std::string {
        return host + ":" + std::to_string(port);
    }
};

}  // namespace rawxfer

#endif  // RAWXFER_CORE_TYPES_H
