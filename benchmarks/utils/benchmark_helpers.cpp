/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <rawxfer/core/frame_codec.h>

#include <algorithm>
#include <cstring>
#include <fstream>

namespace rawxfer::benchmark {

// test_data_generator implementation

auto test_data_generator::generate_random_data(std::size_t size, uint32_t seed)
    -> std::vector<std::byte> {
    std::vector<std::byte> data(size);

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<std::byte>(dis(gen));
    }

    return data;
}

// temp_file_manager implementation

temp_file_manager::temp_file_manager(const std::filesystem::path& base_dir) {
    if (base_dir.empty()) {
        base_dir_ = std::filesystem::temp_directory_path() /
                    ("rawxfer_benchmarks_" + std::to_string(std::random_device{}()));
        owns_dir_ = true;
    } else {
        base_dir_ = base_dir;
        owns_dir_ = false;
    }

    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    cleanup();
}

temp_file_manager::temp_file_manager(temp_file_manager&& other) noexcept
    : base_dir_(std::move(other.base_dir_)),
      created_files_(std::move(other.created_files_)),
      owns_dir_(other.owns_dir_) {
    other.owns_dir_ = false;
}

auto temp_file_manager::operator=(temp_file_manager&& other) noexcept -> temp_file_manager& {
    if (this != &other) {
        cleanup();
        base_dir_ = std::move(other.base_dir_);
        created_files_ = std::move(other.created_files_);
        owns_dir_ = other.owns_dir_;
        other.owns_dir_ = false;
    }
    return *this;
}

auto temp_file_manager::create_random_file(
    const std::string& name,
    std::size_t size,
    uint32_t seed) -> std::filesystem::path {
    auto data = test_data_generator::generate_random_data(size, seed);
    auto path = base_dir_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    created_files_.push_back(path);
    return path;
}

auto temp_file_manager::create_directory(const std::string& name) -> std::filesystem::path {
    auto path = base_dir_ / name;
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    created_files_.push_back(path);
    return path;
}

void temp_file_manager::cleanup() {
    std::error_code ec;

    for (const auto& path : created_files_) {
        std::filesystem::remove_all(path, ec);
    }
    created_files_.clear();

    if (owns_dir_) {
        std::filesystem::remove_all(base_dir_, ec);
    }
}

// replay_stream implementation

replay_stream::replay_stream(std::vector<std::byte> input, std::size_t read_size)
    : input_(std::move(input)), read_size_(read_size == 0 ? 1 : read_size) {}

auto replay_stream::read_some(std::span<std::byte> buffer) -> result<std::size_t> {
    auto n = std::min({buffer.size(), read_size_, input_.size() - position_});
    if (n > 0) {
        std::memcpy(buffer.data(), input_.data() + position_, n);
        position_ += n;
    }
    return n;
}

auto replay_stream::write_some(std::span<const std::byte> data) -> result<std::size_t> {
    written_ += data.size();
    return data.size();
}

auto replay_stream::shutdown_write() -> result<void> {
    return {};
}

void replay_stream::rewind() {
    position_ = 0;
    written_ = 0;
}

auto make_request(std::string_view header, const std::vector<std::byte>& payload)
    -> std::vector<std::byte> {
    std::vector<std::byte> request;
    request.reserve(header.size() + frame_delimiter.size() + payload.size());
    for (char c : header) {
        request.push_back(static_cast<std::byte>(c));
    }
    for (char c : frame_delimiter) {
        request.push_back(static_cast<std::byte>(c));
    }
    request.insert(request.end(), payload.begin(), payload.end());
    return request;
}

}  // namespace rawxfer::benchmark
