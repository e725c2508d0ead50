/**
 * @file file_transfer_client.h
 * @brief File transfer client
 */

#ifndef RAWXFER_CLIENT_FILE_TRANSFER_CLIENT_H
#define RAWXFER_CLIENT_FILE_TRANSFER_CLIENT_H

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "rawxfer/client/client_types.h"
#include "rawxfer/core/frame_codec.h"
#include "rawxfer/core/socket_stream.h"
#include "rawxfer/core/types.h"

namespace rawxfer {

/**
 * @brief Response header plus payload bytes read along with it
 */
struct received_header {
    response_header header;
    std::vector<std::byte> leftover;
};

/**
 * @brief One connection carrying one request and its response
 */
class request_session {
public:
    /**
     * @brief Connect to the configured server
     */
    [[nodiscard]] static auto open(const client_config& config) -> result<request_session>;

    /**
     * @brief Wrap an already connected stream
     */
    request_session(std::unique_ptr<byte_stream> stream, std::size_t chunk_size);

    request_session(request_session&&) noexcept = default;
    auto operator=(request_session&&) noexcept -> request_session& = default;
    ~request_session() = default;

    /**
     * @brief Send the header frame followed by an in-memory payload
     */
    [[nodiscard]] auto send_request(std::string_view header,
                                    std::span<const std::byte> payload = {}) -> result<void>;

    /**
     * @brief Send the header frame followed by @p length bytes from @p source
     */
    [[nodiscard]] auto send_request(std::string_view header,
                                    std::istream& source,
                                    uint64_t length) -> result<void>;

    /**
     * @brief Read and parse the response header
     */
    [[nodiscard]] auto receive_header() -> result<received_header>;

    /**
     * @brief Stream up to @p length payload bytes into @p sink
     * @return Bytes delivered; short when the server closed early
     */
    [[nodiscard]] auto receive_payload(std::span<const std::byte> leftover,
                                       uint64_t length,
                                       const payload_sink& sink) -> result<uint64_t>;

    /**
     * @brief Read the response header and any announced payload into memory
     */
    [[nodiscard]] auto receive_response() -> result<server_response>;

private:
    /**
     * @brief Tell the server no more request bytes follow
     */
    void finish_sending();

    std::unique_ptr<byte_stream> stream_;
    frame_codec codec_;
};

/**
 * @brief File transfer client
 *
 * Every call opens its own connection, sends one request and closes.
 *
 * @code
 * auto client_result = file_transfer_client::builder()
 *     .with_server(endpoint{"127.0.0.1", 10001})
 *     .build();
 *
 * if (client_result.has_value()) {
 *     auto& client = client_result.value();
 *     auto response = client.upload("data.bin");
 *     if (response.has_value() && response.value().is_ok()) {
 *         // stored
 *     }
 * }
 * @endcode
 */
class file_transfer_client {
public:
    /**
     * @brief Builder for file_transfer_client
     */
    class builder {
    public:
        builder();

        auto with_server(const endpoint& server) -> builder&;

        /**
         * @brief Payload chunk size (default: 512KB)
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        /**
         * @brief Per-operation socket deadline (default: none)
         */
        auto with_io_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Directory receiving download_<filename> files (default: ".")
         */
        auto with_download_directory(const std::filesystem::path& dir) -> builder&;

        [[nodiscard]] auto build() -> result<file_transfer_client>;

    private:
        client_config config_;
    };

    /**
     * @brief Send a raw header line and optional payload, return the response
     */
    [[nodiscard]] auto send_command(std::string_view header,
                                    std::span<const std::byte> payload = {}) const
        -> result<server_response>;

    /**
     * @brief Upload a local file under its base name
     *
     * Local read failures come back as file_read_error; a server refusal is
     * a response with status error.
     */
    [[nodiscard]] auto upload(const std::filesystem::path& file_path) const
        -> result<server_response>;

    /**
     * @brief Download a stored file to download_<filename>
     */
    [[nodiscard]] auto download(std::string_view filename) const -> result<server_response>;

    /**
     * @brief Run one operation and measure it
     *
     * @param target Local path for upload, stored name for download
     */
    [[nodiscard]] auto timed(transfer_operation operation,
                             const std::filesystem::path& target) const -> transfer_result;

    [[nodiscard]] auto config() const -> const client_config& { return config_; }

private:
    explicit file_transfer_client(client_config config);

    client_config config_;
};

}  // namespace rawxfer

#endif  // RAWXFER_CLIENT_FILE_TRANSFER_CLIENT_H
