/**
 * @file rawxfer.h
 * @brief Main header for the rawxfer library
 * @version 0.1.0
 *
 * Include this header to access the server, client and stress runner.
 *
 * @code
 * #include <rawxfer/rawxfer.h>
 *
 * using namespace rawxfer;
 *
 * // Create a server
 * auto server = file_server::builder()
 *     .with_storage_directory("storage")
 *     .build();
 *
 * // Create a client
 * auto client = file_transfer_client::builder()
 *     .build();
 * @endcode
 */

#ifndef RAWXFER_RAWXFER_H
#define RAWXFER_RAWXFER_H

#include <cstdint>
#include <string>

// Core types
#include "rawxfer/core/types.h"
#include "rawxfer/core/protocol.h"
#include "rawxfer/core/frame_codec.h"
#include "rawxfer/core/socket_stream.h"

// Server
#include "rawxfer/server/server_types.h"
#include "rawxfer/server/file_server.h"

// Client
#include "rawxfer/client/client_types.h"
#include "rawxfer/client/file_transfer_client.h"
#include "rawxfer/client/stress_runner.h"

namespace rawxfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace rawxfer

#endif  // RAWXFER_RAWXFER_H
