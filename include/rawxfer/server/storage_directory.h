/**
 * @file storage_directory.h
 * @brief Flat directory of stored files
 */

#ifndef RAWXFER_SERVER_STORAGE_DIRECTORY_H
#define RAWXFER_SERVER_STORAGE_DIRECTORY_H

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string_view>

#include "rawxfer/core/types.h"

namespace rawxfer {

/**
 * @brief Storage backend for the transfer engine
 *
 * Names are expected to have passed is_valid_filename() already; every
 * operation rejects anything else with invalid_filename so no path outside
 * the root is ever touched. No locking: concurrent writers to one name
 * interleave.
 *
 * @code
 * auto storage = storage_directory::create("storage");
 * if (storage.has_value() && storage.value().exists("a.bin")) {
 *     auto in = storage.value().open_for_read("a.bin");
 * }
 * @endcode
 */
class storage_directory {
public:
    /**
     * @brief Use @p root as the storage directory, creating it if absent
     */
    [[nodiscard]] static auto create(const std::filesystem::path& root)
        -> result<storage_directory>;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

    [[nodiscard]] auto path_for(std::string_view filename) const -> result<std::filesystem::path>;

    /**
     * @brief True if a regular file with this name is stored
     */
    [[nodiscard]] auto exists(std::string_view filename) const -> bool;

    [[nodiscard]] auto size(std::string_view filename) const -> result<uint64_t>;

    [[nodiscard]] auto open_for_read(std::string_view filename) const -> result<std::ifstream>;

    /**
     * @brief Create or truncate the named file for writing
     */
    [[nodiscard]] auto open_for_write_truncate(std::string_view filename) const
        -> result<std::ofstream>;

private:
    explicit storage_directory(std::filesystem::path root);

    std::filesystem::path root_;
};

}  // namespace rawxfer

#endif  // RAWXFER_SERVER_STORAGE_DIRECTORY_H
