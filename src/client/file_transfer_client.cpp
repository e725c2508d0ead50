/**
 * @file file_transfer_client.cpp
 * @brief File transfer client implementation
 */

#include "rawxfer/client/file_transfer_client.h"

#include "rawxfer/core/logging.h"
#include "rawxfer/core/protocol.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace rawxfer {

// ============================================================================
// server_response
// ============================================================================

auto server_response::to_string() const -> std::string {
    response_header header{status, message, file};
    std::string json = header.to_json();
    if (download_path) {
        json.pop_back();
        json += ", \"download_path\": \"" + escape_json_string(download_path->string()) + "\"}";
    }
    return json;
}

// ============================================================================
// request_session
// ============================================================================

request_session::request_session(std::unique_ptr<byte_stream> stream, std::size_t chunk_size)
    : stream_(std::move(stream)), codec_(chunk_size) {}

auto request_session::open(const client_config& config) -> result<request_session> {
    auto socket = connect_to(config.server);
    if (!socket) {
        RX_LOG_ERROR(log_category::client, socket.error().message);
        return unexpected{socket.error()};
    }

    auto stream = std::make_unique<socket_stream>(std::move(socket.value()));
    if (config.io_timeout.count() > 0) {
        auto applied = stream->set_io_timeout(config.io_timeout);
        if (!applied) {
            return unexpected{applied.error()};
        }
    }

    return request_session(std::move(stream), config.chunk_size);
}

auto request_session::send_request(std::string_view header,
                                   std::span<const std::byte> payload) -> result<void> {
    auto written = codec_.write_header(*stream_, header);
    if (!written) {
        return written;
    }
    auto sent = codec_.write_payload(*stream_, payload);
    if (!sent) {
        return sent;
    }
    finish_sending();
    return {};
}

auto request_session::send_request(std::string_view header,
                                   std::istream& source,
                                   uint64_t length) -> result<void> {
    auto written = codec_.write_header(*stream_, header);
    if (!written) {
        return written;
    }
    auto sent = codec_.write_payload(*stream_, source, length);
    if (!sent) {
        return unexpected{sent.error()};
    }
    finish_sending();
    return {};
}

auto request_session::receive_header() -> result<received_header> {
    auto frame = codec_.read_header(*stream_);
    if (!frame) {
        return unexpected{frame.error()};
    }
    if (frame.value().truncated) {
        return unexpected{error{error_code::connection_broken,
                                "Connection closed before response header was complete"}};
    }

    auto header = response_header::parse(frame.value().text);
    if (!header) {
        RX_LOG_WARN(log_category::client,
            "Unparseable response header: " + header.error().message);
        return unexpected{header.error()};
    }

    return received_header{std::move(header.value()), std::move(frame.value().leftover)};
}

auto request_session::receive_payload(std::span<const std::byte> leftover,
                                      uint64_t length,
                                      const payload_sink& sink) -> result<uint64_t> {
    return codec_.read_payload(*stream_, leftover, length, sink);
}

auto request_session::receive_response() -> result<server_response> {
    auto head = receive_header();
    if (!head) {
        return unexpected{head.error()};
    }

    server_response response;
    response.status = head.value().header.status;
    response.message = std::move(head.value().header.message);
    response.file = head.value().header.file;

    if (response.is_ok() && response.file) {
        auto payload = codec_.read_payload_exact(*stream_, head.value().leftover,
                                                 response.file->filesize);
        if (!payload) {
            return unexpected{payload.error()};
        }
        response.file_data = std::move(payload.value());
    }
    return response;
}

void request_session::finish_sending() {
    auto closed = stream_->shutdown_write();
    if (!closed) {
        RX_LOG_DEBUG(log_category::client, "Half-close failed: " + closed.error().message);
    }
}

// ============================================================================
// file_transfer_client
// ============================================================================

file_transfer_client::builder::builder() = default;

auto file_transfer_client::builder::with_server(const endpoint& server) -> builder& {
    config_.server = server;
    return *this;
}

auto file_transfer_client::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto file_transfer_client::builder::with_io_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.io_timeout = timeout;
    return *this;
}

auto file_transfer_client::builder::with_download_directory(const std::filesystem::path& dir)
    -> builder& {
    config_.download_directory = dir;
    return *this;
}

auto file_transfer_client::builder::build() -> result<file_transfer_client> {
    if (!config_.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
                                "Invalid client configuration for " + config_.server.to_string()}};
    }
    return file_transfer_client{std::move(config_)};
}

file_transfer_client::file_transfer_client(client_config config) : config_(std::move(config)) {
    get_logger().initialize();
}

auto file_transfer_client::send_command(std::string_view header,
                                        std::span<const std::byte> payload) const
    -> result<server_response> {
    auto session = request_session::open(config_);
    if (!session) {
        return unexpected{session.error()};
    }

    auto sent = session.value().send_request(header, payload);
    if (!sent) {
        RX_LOG_WARN(log_category::client, "send_command error: " + sent.error().message);
        // The server may have answered before dropping the connection
        auto reply = session.value().receive_response();
        if (reply) {
            return reply;
        }
        return unexpected{sent.error()};
    }
    return session.value().receive_response();
}

auto file_transfer_client::upload(const std::filesystem::path& file_path) const
    -> result<server_response> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec)) {
        return unexpected{error{error_code::file_read_error,
                                "File not found: " + file_path.string()}};
    }
    auto size = std::filesystem::file_size(file_path, ec);
    if (ec) {
        return unexpected{error{error_code::file_read_error,
                                "Cannot stat " + file_path.string() + ": " + ec.message()}};
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        return unexpected{error{error_code::file_read_error,
                                "Failed to open file: " + file_path.string()}};
    }

    const auto filename = file_path.filename().string();

    transfer_log_context ctx;
    ctx.filename = filename;
    ctx.file_size = size;
    RX_LOG_DEBUG_CTX(log_category::client, "Uploading", ctx);

    auto session = request_session::open(config_);
    if (!session) {
        return unexpected{session.error()};
    }

    auto sent = session.value().send_request(
        format_request(command_type::upload, filename, size), in, size);
    if (!sent) {
        if (sent.error().code == error_code::file_read_error) {
            return unexpected{sent.error()};
        }
        ctx.error_message = sent.error().message;
        RX_LOG_WARN_CTX(log_category::client, "Upload send failed", ctx);
        auto reply = session.value().receive_response();
        if (reply) {
            return reply;
        }
        return unexpected{sent.error()};
    }

    auto response = session.value().receive_response();
    if (response && !response.value().is_ok()) {
        ctx.error_message = response.value().message;
        RX_LOG_WARN_CTX(log_category::client, "Upload rejected", ctx);
    }
    return response;
}

auto file_transfer_client::download(std::string_view filename) const -> result<server_response> {
    auto session = request_session::open(config_);
    if (!session) {
        return unexpected{session.error()};
    }

    auto sent = session.value().send_request(format_request(command_type::get, filename, 0));
    if (!sent) {
        return unexpected{sent.error()};
    }

    auto head = session.value().receive_header();
    if (!head) {
        return unexpected{head.error()};
    }

    server_response response;
    response.status = head.value().header.status;
    response.message = head.value().header.message;
    response.file = head.value().header.file;

    transfer_log_context ctx;
    ctx.filename = std::string(filename);

    if (!response.is_ok()) {
        ctx.error_message = response.message;
        RX_LOG_ERROR_CTX(log_category::client, "Download failed", ctx);
        return response;
    }

    if (!response.file) {
        return unexpected{error{error_code::invalid_response,
                                "Missing filename or filesize in server response data"}};
    }
    if (!is_valid_filename(response.file->filename)) {
        return unexpected{error{error_code::invalid_response,
                                "Server sent an unusable filename: " + response.file->filename}};
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.download_directory, ec);
    if (ec) {
        return unexpected{error{error_code::file_write_error,
                                "Cannot create download directory: " + ec.message()}};
    }

    auto save_path = config_.download_directory / ("download_" + response.file->filename);
    std::ofstream out(save_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected{error{error_code::file_write_error,
                                "Failed to open " + save_path.string() + " for writing"}};
    }

    auto received = session.value().receive_payload(
        head.value().leftover, response.file->filesize,
        [&out](std::span<const std::byte> piece) -> result<void> {
            out.write(reinterpret_cast<const char*>(piece.data()),
                      static_cast<std::streamsize>(piece.size()));
            if (!out) {
                return unexpected{error{error_code::file_write_error,
                                        "Failed to write downloaded data"}};
            }
            return {};
        });
    out.close();

    if (!received) {
        return unexpected{received.error()};
    }
    if (!out) {
        return unexpected{error{error_code::file_write_error,
                                "Failed to write " + save_path.string()}};
    }
    if (received.value() < response.file->filesize) {
        ctx.file_size = response.file->filesize;
        ctx.bytes_transferred = received.value();
        RX_LOG_ERROR_CTX(log_category::client, "Download ended early", ctx);
        return unexpected{error{error_code::incomplete_transfer,
                                "File data incomplete or missing"}};
    }

    response.download_path = save_path;
    ctx.file_size = response.file->filesize;
    RX_LOG_DEBUG_CTX(log_category::client, "Download saved", ctx);
    return response;
}

auto file_transfer_client::timed(transfer_operation operation,
                                 const std::filesystem::path& target) const -> transfer_result {
    transfer_result outcome;
    auto start = std::chrono::steady_clock::now();

    std::error_code ec;
    if (operation == transfer_operation::upload) {
        auto response = upload(target);
        outcome.success = response.has_value() && response.value().is_ok();
        if (outcome.success) {
            auto size = std::filesystem::file_size(target, ec);
            outcome.byte_count = ec ? 0 : static_cast<uint64_t>(size);
        } else if (!response) {
            RX_LOG_ERROR(log_category::client, "Upload failed: " + response.error().message);
        }
    } else {
        auto response = download(target.string());
        outcome.success = response.has_value() && response.value().is_ok();
        if (outcome.success && response.value().download_path) {
            auto size = std::filesystem::file_size(*response.value().download_path, ec);
            outcome.byte_count = ec ? 0 : static_cast<uint64_t>(size);
        } else if (!response) {
            RX_LOG_ERROR(log_category::client, "Download failed: " + response.error().message);
        }
    }

    outcome.elapsed = std::chrono::steady_clock::now() - start;
    return outcome;
}

}  // namespace rawxfer
