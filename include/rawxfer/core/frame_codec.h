/**
 * @file frame_codec.h
 * @brief Text-header plus binary-payload framing over a byte stream
 *
 * A frame is a UTF-8 header terminated by "\r\n\r\n", optionally followed by
 * raw payload bytes. The payload length always comes from a length field in
 * the header, never from scanning for a terminator.
 */

#ifndef RAWXFER_CORE_FRAME_CODEC_H
#define RAWXFER_CORE_FRAME_CODEC_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "rawxfer/core/socket_stream.h"
#include "rawxfer/core/types.h"

namespace rawxfer {

/// Header terminator on the wire
inline constexpr std::string_view frame_delimiter = "\r\n\r\n";

/// Default read/write chunk size (512 KiB)
inline constexpr std::size_t default_chunk_size = 512 * 1024;

/**
 * @brief Header text plus any payload bytes read past the delimiter
 */
struct header_frame {
    std::string text;
    std::vector<std::byte> leftover;

    /// The stream closed before the delimiter arrived; text holds what was read
    bool truncated = false;
};

/**
 * @brief Receives payload chunks as they arrive
 */
using payload_sink = std::function<result<void>(std::span<const std::byte>)>;

/**
 * @brief Frame reader/writer shared by client and server
 *
 * @code
 * frame_codec codec;
 * auto header = codec.read_header(stream);
 * if (header.has_value() && !header.value().truncated) {
 *     auto payload = codec.read_payload_exact(stream, header.value().leftover, size);
 * }
 * @endcode
 */
class frame_codec {
public:
    /**
     * @param chunk_size Maximum bytes per read or write call
     * @param max_header_size Fail with header_too_large when this many bytes
     *        arrive without a delimiter (0 = unlimited)
     */
    explicit frame_codec(std::size_t chunk_size = default_chunk_size,
                         std::size_t max_header_size = 0);

    /**
     * @brief Read until the header delimiter is seen or the stream closes
     */
    [[nodiscard]] auto read_header(byte_stream& stream) const -> result<header_frame>;

    /**
     * @brief Write header text followed by the delimiter
     */
    [[nodiscard]] auto write_header(byte_stream& stream, std::string_view text) const
        -> result<void>;

    /**
     * @brief Write an in-memory payload in chunks
     */
    [[nodiscard]] auto write_payload(byte_stream& stream,
                                     std::span<const std::byte> payload) const
        -> result<void>;

    /**
     * @brief Copy exactly @p length bytes from @p source to the stream
     * @return Bytes written; file_read_error if the source runs dry first
     */
    [[nodiscard]] auto write_payload(byte_stream& stream,
                                     std::istream& source,
                                     uint64_t length) const -> result<uint64_t>;

    /**
     * @brief Deliver up to @p length payload bytes to @p sink
     *
     * Leftover bytes are delivered first. Reads never ask for more than the
     * outstanding count, so bytes past @p length stay in the stream.
     *
     * @return Bytes delivered; less than @p length when the peer closed early
     */
    [[nodiscard]] auto read_payload(byte_stream& stream,
                                    std::span<const std::byte> leftover,
                                    uint64_t length,
                                    const payload_sink& sink) const -> result<uint64_t>;

    /**
     * @brief Collect up to @p length payload bytes into memory
     *
     * A result shorter than @p length means the peer closed early.
     */
    [[nodiscard]] auto read_payload_exact(byte_stream& stream,
                                          std::span<const std::byte> leftover,
                                          uint64_t length) const
        -> result<std::vector<std::byte>>;

    [[nodiscard]] auto chunk_size() const noexcept -> std::size_t { return chunk_size_; }
    [[nodiscard]] auto max_header_size() const noexcept -> std::size_t { return max_header_size_; }

private:
    [[nodiscard]] static auto write_all(byte_stream& stream,
                                        std::span<const std::byte> data) -> result<void>;

    std::size_t chunk_size_;
    std::size_t max_header_size_;
};

}  // namespace rawxfer

#endif  // RAWXFER_CORE_FRAME_CODEC_H
