/**
 * @file transfer_engine.cpp
 * @brief Transfer engine implementation
 */

#include "rawxfer/server/transfer_engine.h"

#include "rawxfer/core/logging.h"

#include <chrono>
#include <exception>
#include <fstream>

namespace rawxfer {

namespace {

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> uint64_t {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

}  // namespace

transfer_engine::transfer_engine(storage_directory storage,
                                 std::size_t chunk_size,
                                 std::size_t max_header_size)
    : storage_(std::move(storage)), codec_(chunk_size, max_header_size) {}

auto transfer_engine::handle_connection(byte_stream& stream, std::string_view peer) const
    -> connection_outcome {
    connection_outcome outcome;

    try {
        auto header = codec_.read_header(stream);
        if (!header) {
            if (header.error().code == error_code::header_too_large) {
                transfer_log_context ctx;
                ctx.peer = std::string(peer);
                ctx.error_message = header.error().message;
                RX_LOG_WARN_CTX(log_category::transfer, "Request header too large", ctx);
                return fail(stream, error{error_code::header_too_large,
                                          wire_message(error_code::header_too_large)}, outcome);
            }
            outcome.failure = header.error();
            RX_LOG_WARN(log_category::transfer,
                "Failed to read request header: " + header.error().message);
            return outcome;
        }

        if (header.value().truncated) {
            transfer_log_context ctx;
            ctx.peer = std::string(peer);
            ctx.bytes_transferred = header.value().text.size();
            RX_LOG_WARN_CTX(log_category::transfer,
                "Connection closed before request header was complete", ctx);
            outcome.failure = error{error_code::malformed_request, "Incomplete header received"};
            return outcome;
        }

        auto req = parse_request(header.value().text);
        if (!req) {
            transfer_log_context ctx;
            ctx.peer = std::string(peer);
            ctx.error_message = req.error().message;
            RX_LOG_WARN_CTX(log_category::transfer, "Rejected request", ctx);
            return fail(stream, req.error(), outcome);
        }

        RX_LOG_DEBUG(log_category::transfer,
            std::string("Request ") + to_string(req.value().command) + " " +
            req.value().filename + " " + std::to_string(req.value().declared_size));

        if (req.value().command == command_type::upload) {
            return handle_upload(req.value(), header.value().leftover, stream);
        }
        return handle_get(req.value(), stream);
    } catch (const std::exception& e) {
        transfer_log_context ctx;
        ctx.filename = outcome.filename;
        ctx.peer = std::string(peer);
        ctx.error_message = e.what();
        RX_LOG_ERROR_CTX(log_category::transfer, "Unhandled exception in connection handler", ctx);
        return fail(stream, error{error_code::internal_error, e.what()}, outcome);
    }
}

auto transfer_engine::handle_upload(const request& req,
                                    std::span<const std::byte> leftover,
                                    byte_stream& stream) const -> connection_outcome {
    connection_outcome outcome;
    outcome.command = command_type::upload;
    outcome.filename = req.filename;

    if (!is_valid_filename(req.filename)) {
        return fail(stream, error{error_code::invalid_filename,
                                  wire_message(error_code::invalid_filename)}, outcome);
    }

    if (leftover.size() > req.declared_size) {
        transfer_log_context ctx;
        ctx.filename = req.filename;
        ctx.file_size = req.declared_size;
        ctx.bytes_transferred = leftover.size();
        RX_LOG_WARN_CTX(log_category::transfer, "Upload sent more data than declared", ctx);
        return fail(stream, error{error_code::size_mismatch,
                                  wire_message(error_code::size_mismatch)}, outcome);
    }

    auto start = std::chrono::steady_clock::now();

    auto file = storage_.open_for_write_truncate(req.filename);
    if (!file) {
        return fail(stream, file.error(), outcome);
    }
    auto& out = file.value();

    auto received = codec_.read_payload(stream, leftover, req.declared_size,
        [&out](std::span<const std::byte> piece) -> result<void> {
            out.write(reinterpret_cast<const char*>(piece.data()),
                      static_cast<std::streamsize>(piece.size()));
            if (!out) {
                return unexpected{error{error_code::file_write_error,
                                        "Failed to write uploaded data"}};
            }
            return {};
        });
    out.close();

    if (received && !out) {
        outcome.bytes_received = received.value();
        transfer_log_context ctx;
        ctx.filename = req.filename;
        ctx.file_size = req.declared_size;
        ctx.error_message = "flush on close failed";
        RX_LOG_ERROR_CTX(log_category::transfer, "Upload not stored", ctx);
        return fail(stream, error{error_code::file_write_error,
                                  "Failed to write uploaded data"}, outcome);
    }

    if (!received) {
        if (received.error().code == error_code::file_write_error) {
            return fail(stream, received.error(), outcome);
        }
        // Transport failure: the peer is unreachable, no response
        outcome.failure = received.error();
        transfer_log_context ctx;
        ctx.filename = req.filename;
        ctx.file_size = req.declared_size;
        ctx.error_message = received.error().message;
        RX_LOG_ERROR_CTX(log_category::transfer, "Upload aborted", ctx);
        return outcome;
    }

    outcome.bytes_received = received.value();

    if (received.value() < req.declared_size) {
        transfer_log_context ctx;
        ctx.filename = req.filename;
        ctx.file_size = req.declared_size;
        ctx.bytes_transferred = received.value();
        RX_LOG_WARN_CTX(log_category::transfer, "Upload ended before declared size", ctx);
        return fail(stream, error{error_code::incomplete_transfer,
                                  wire_message(error_code::incomplete_transfer)}, outcome);
    }

    transfer_log_context ctx;
    ctx.filename = req.filename;
    ctx.file_size = req.declared_size;
    ctx.duration_ms = elapsed_ms(start);
    RX_LOG_INFO_CTX(log_category::transfer, "Upload stored", ctx);

    outcome.success = respond(stream, response_header::ok_message("Uploaded " + req.filename),
                              outcome);
    return outcome;
}

auto transfer_engine::handle_get(const request& req, byte_stream& stream) const
    -> connection_outcome {
    connection_outcome outcome;
    outcome.command = command_type::get;
    outcome.filename = req.filename;

    if (!storage_.exists(req.filename)) {
        return fail(stream, error{error_code::file_not_found,
                                  wire_message(error_code::file_not_found)}, outcome);
    }

    auto size = storage_.size(req.filename);
    if (!size) {
        return fail(stream, error{error_code::file_not_found,
                                  wire_message(error_code::file_not_found)}, outcome);
    }

    auto file = storage_.open_for_read(req.filename);
    if (!file) {
        return fail(stream, file.error(), outcome);
    }

    auto start = std::chrono::steady_clock::now();

    if (!respond(stream, response_header::ok_file(req.filename, size.value()), outcome)) {
        return outcome;
    }

    auto sent = codec_.write_payload(stream, file.value(), size.value());
    if (!sent) {
        // Header already promised filesize bytes; closing is the only signal left
        outcome.failure = sent.error();
        transfer_log_context ctx;
        ctx.filename = req.filename;
        ctx.file_size = size.value();
        ctx.error_message = sent.error().message;
        RX_LOG_ERROR_CTX(log_category::transfer, "Download aborted", ctx);
        return outcome;
    }

    outcome.bytes_sent = sent.value();
    outcome.success = true;

    transfer_log_context ctx;
    ctx.filename = req.filename;
    ctx.file_size = size.value();
    ctx.duration_ms = elapsed_ms(start);
    RX_LOG_INFO_CTX(log_category::transfer, "Download sent", ctx);
    return outcome;
}

auto transfer_engine::respond(byte_stream& stream,
                              const response_header& header,
                              connection_outcome& outcome) const -> bool {
    auto written = codec_.write_header(stream, header.to_json());
    if (!written) {
        outcome.failure = written.error();
        RX_LOG_WARN(log_category::transfer,
            "Failed to send response: " + written.error().message);
        return false;
    }
    return true;
}

auto transfer_engine::fail(byte_stream& stream,
                           error err,
                           connection_outcome& outcome) const -> connection_outcome {
    outcome.success = false;
    outcome.failure = err;
    (void)respond(stream, response_header::failure(err.message), outcome);
    // Keep the original cause even if the response could not be sent
    outcome.failure = std::move(err);
    return outcome;
}

}  // namespace rawxfer
