/**
 * @file storage_directory.cpp
 * @brief Storage directory implementation
 */

#include "rawxfer/server/storage_directory.h"

#include "rawxfer/core/protocol.h"

#include <system_error>

namespace rawxfer {

storage_directory::storage_directory(std::filesystem::path root) : root_(std::move(root)) {}

auto storage_directory::create(const std::filesystem::path& root) -> result<storage_directory> {
    if (root.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                                "storage_directory is required"}};
    }

    std::error_code ec;
    if (!std::filesystem::exists(root, ec)) {
        std::filesystem::create_directories(root, ec);
        if (ec) {
            return unexpected{error{error_code::file_write_error,
                                    "Failed to create storage directory: " + ec.message()}};
        }
    } else if (!std::filesystem::is_directory(root, ec)) {
        return unexpected{error{error_code::invalid_configuration,
                                "Storage path is not a directory: " + root.string()}};
    }

    return storage_directory{root};
}

auto storage_directory::path_for(std::string_view filename) const
    -> result<std::filesystem::path> {
    if (!is_valid_filename(filename)) {
        return unexpected{error{error_code::invalid_filename,
                                "Invalid filename: " + std::string(filename)}};
    }
    return root_ / std::filesystem::path(std::string(filename));
}

auto storage_directory::exists(std::string_view filename) const -> bool {
    auto path = path_for(filename);
    if (!path) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(path.value(), ec);
}

auto storage_directory::size(std::string_view filename) const -> result<uint64_t> {
    auto path = path_for(filename);
    if (!path) {
        return unexpected{path.error()};
    }

    std::error_code ec;
    auto bytes = std::filesystem::file_size(path.value(), ec);
    if (ec) {
        return unexpected{error{error_code::file_not_found,
                                "Cannot stat " + std::string(filename) + ": " + ec.message()}};
    }
    return static_cast<uint64_t>(bytes);
}

auto storage_directory::open_for_read(std::string_view filename) const -> result<std::ifstream> {
    auto path = path_for(filename);
    if (!path) {
        return unexpected{path.error()};
    }

    std::ifstream file(path.value(), std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
                                "Failed to open file for reading: " + path.value().string()}};
    }
    return result<std::ifstream>(std::move(file));
}

auto storage_directory::open_for_write_truncate(std::string_view filename) const
    -> result<std::ofstream> {
    auto path = path_for(filename);
    if (!path) {
        return unexpected{path.error()};
    }

    std::ofstream file(path.value(), std::ios::binary | std::ios::trunc);
    if (!file) {
        return unexpected{error{error_code::file_write_error,
                                "Failed to open file for writing: " + path.value().string()}};
    }
    return result<std::ofstream>(std::move(file));
}

}  // namespace rawxfer
