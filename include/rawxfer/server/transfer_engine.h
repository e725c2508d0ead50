/**
 * @file transfer_engine.h
 * @brief Server-side UPLOAD and GET semantics
 */

#ifndef RAWXFER_SERVER_TRANSFER_ENGINE_H
#define RAWXFER_SERVER_TRANSFER_ENGINE_H

#include <cstddef>
#include <span>
#include <string_view>

#include "rawxfer/core/frame_codec.h"
#include "rawxfer/core/protocol.h"
#include "rawxfer/core/socket_stream.h"
#include "rawxfer/server/server_types.h"
#include "rawxfer/server/storage_directory.h"

namespace rawxfer {

/**
 * @brief Executes one request per connection against a storage directory
 *
 * Every path through handle_connection() writes at most one response header.
 * The only case with no response at all is a header cut off by the peer.
 *
 * The engine holds no mutable state, so one instance may serve any number of
 * connections concurrently.
 */
class transfer_engine {
public:
    transfer_engine(storage_directory storage,
                    std::size_t chunk_size = default_chunk_size,
                    std::size_t max_header_size = 64 * 1024);

    /**
     * @brief Read one request from @p stream, execute it and respond
     *
     * Exceptions thrown while handling are logged and turned into an ERROR
     * response when the stream still accepts writes.
     */
    auto handle_connection(byte_stream& stream, std::string_view peer = {}) const
        -> connection_outcome;

    /**
     * @brief Receive @p req.declared_size bytes into storage
     *
     * @param leftover Payload bytes already read with the header
     */
    auto handle_upload(const request& req,
                       std::span<const std::byte> leftover,
                       byte_stream& stream) const -> connection_outcome;

    /**
     * @brief Send a stored file with its size header
     */
    auto handle_get(const request& req, byte_stream& stream) const -> connection_outcome;

    [[nodiscard]] auto storage() const -> const storage_directory& { return storage_; }
    [[nodiscard]] auto codec() const -> const frame_codec& { return codec_; }

private:
    auto respond(byte_stream& stream,
                 const response_header& header,
                 connection_outcome& outcome) const -> bool;

    auto fail(byte_stream& stream,
              error err,
              connection_outcome& outcome) const -> connection_outcome;

    storage_directory storage_;
    frame_codec codec_;
};

}  // namespace rawxfer

#endif  // RAWXFER_SERVER_TRANSFER_ENGINE_H
