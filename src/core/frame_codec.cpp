/**
 * @file frame_codec.cpp
 * @brief Frame codec implementation
 */

#include "rawxfer/core/frame_codec.h"

#include <algorithm>

namespace rawxfer {

namespace {

auto find_delimiter(const std::vector<std::byte>& buffer, std::size_t from) -> std::size_t {
    const auto* delim = reinterpret_cast<const std::byte*>(frame_delimiter.data());
    auto it = std::search(buffer.begin() + static_cast<std::ptrdiff_t>(from), buffer.end(),
                          delim, delim + frame_delimiter.size());
    if (it == buffer.end()) {
        return std::string::npos;
    }
    return static_cast<std::size_t>(it - buffer.begin());
}

auto to_text(const std::vector<std::byte>& buffer, std::size_t length) -> std::string {
    return std::string(reinterpret_cast<const char*>(buffer.data()), length);
}

}  // namespace

frame_codec::frame_codec(std::size_t chunk_size, std::size_t max_header_size)
    : chunk_size_(chunk_size == 0 ? default_chunk_size : chunk_size),
      max_header_size_(max_header_size) {}

auto frame_codec::read_header(byte_stream& stream) const -> result<header_frame> {
    std::vector<std::byte> buffer;
    std::vector<std::byte> chunk(chunk_size_);
    std::size_t scan_from = 0;

    while (true) {
        auto received = stream.read_some(chunk);
        if (!received) {
            return unexpected{received.error()};
        }

        auto n = received.value();
        if (n == 0) {
            header_frame frame;
            frame.text = to_text(buffer, buffer.size());
            frame.truncated = true;
            return frame;
        }

        buffer.insert(buffer.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));

        auto pos = find_delimiter(buffer, scan_from);
        if (pos != std::string::npos) {
            header_frame frame;
            frame.text = to_text(buffer, pos);
            frame.leftover.assign(
                buffer.begin() + static_cast<std::ptrdiff_t>(pos + frame_delimiter.size()),
                buffer.end());
            return frame;
        }

        // The delimiter may straddle two reads
        scan_from = buffer.size() >= frame_delimiter.size() - 1
                        ? buffer.size() - (frame_delimiter.size() - 1)
                        : 0;

        if (max_header_size_ > 0 && buffer.size() > max_header_size_) {
            return unexpected{error{error_code::header_too_large,
                "No header delimiter within " + std::to_string(max_header_size_) + " bytes"}};
        }
    }
}

auto frame_codec::write_header(byte_stream& stream, std::string_view text) const
    -> result<void> {
    std::string framed;
    framed.reserve(text.size() + frame_delimiter.size());
    framed.append(text);
    framed.append(frame_delimiter);

    return write_all(stream, std::as_bytes(std::span<const char>(framed.data(), framed.size())));
}

auto frame_codec::write_payload(byte_stream& stream,
                                std::span<const std::byte> payload) const -> result<void> {
    while (!payload.empty()) {
        auto piece = payload.first(std::min(payload.size(), chunk_size_));
        auto written = write_all(stream, piece);
        if (!written) {
            return written;
        }
        payload = payload.subspan(piece.size());
    }
    return {};
}

auto frame_codec::write_payload(byte_stream& stream,
                                std::istream& source,
                                uint64_t length) const -> result<uint64_t> {
    std::vector<char> buffer(chunk_size_);
    uint64_t sent = 0;

    while (sent < length) {
        auto want = static_cast<std::size_t>(
            std::min<uint64_t>(chunk_size_, length - sent));
        source.read(buffer.data(), static_cast<std::streamsize>(want));
        auto got = static_cast<std::size_t>(source.gcount());
        if (got == 0) {
            return unexpected{error{error_code::file_read_error,
                "Source ended after " + std::to_string(sent) + " of " +
                std::to_string(length) + " bytes"}};
        }

        auto written = write_all(stream, std::as_bytes(std::span<const char>(buffer.data(), got)));
        if (!written) {
            return unexpected{written.error()};
        }
        sent += got;
    }
    return sent;
}

auto frame_codec::read_payload(byte_stream& stream,
                               std::span<const std::byte> leftover,
                               uint64_t length,
                               const payload_sink& sink) const -> result<uint64_t> {
    uint64_t received = 0;

    if (!leftover.empty() && length > 0) {
        auto head = leftover.first(static_cast<std::size_t>(
            std::min<uint64_t>(leftover.size(), length)));
        auto delivered = sink(head);
        if (!delivered) {
            return unexpected{delivered.error()};
        }
        received += head.size();
    }

    std::vector<std::byte> chunk(static_cast<std::size_t>(
        std::min<uint64_t>(chunk_size_, length - received)));

    while (received < length) {
        auto want = static_cast<std::size_t>(std::min<uint64_t>(chunk.size(), length - received));
        auto got = stream.read_some(std::span<std::byte>(chunk.data(), want));
        if (!got) {
            return unexpected{got.error()};
        }
        if (got.value() == 0) {
            break;
        }

        auto delivered = sink(std::span<const std::byte>(chunk.data(), got.value()));
        if (!delivered) {
            return unexpected{delivered.error()};
        }
        received += got.value();
    }
    return received;
}

auto frame_codec::read_payload_exact(byte_stream& stream,
                                     std::span<const std::byte> leftover,
                                     uint64_t length) const
    -> result<std::vector<std::byte>> {
    std::vector<std::byte> payload;
    payload.reserve(static_cast<std::size_t>(std::min<uint64_t>(length, 64ULL * 1024 * 1024)));

    auto received = read_payload(stream, leftover, length,
        [&payload](std::span<const std::byte> piece) -> result<void> {
            payload.insert(payload.end(), piece.begin(), piece.end());
            return {};
        });
    if (!received) {
        return unexpected{received.error()};
    }
    return payload;
}

auto frame_codec::write_all(byte_stream& stream, std::span<const std::byte> data)
    -> result<void> {
    while (!data.empty()) {
        auto written = stream.write_some(data);
        if (!written) {
            return unexpected{written.error()};
        }
        if (written.value() == 0) {
            return unexpected{error{error_code::connection_broken, "Socket connection broken"}};
        }
        data = data.subspan(written.value());
    }
    return {};
}

}  // namespace rawxfer
