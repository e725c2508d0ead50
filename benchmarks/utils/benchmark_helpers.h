/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef RAWXFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define RAWXFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <rawxfer/core/socket_stream.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace rawxfer::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @brief Constructor
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    // Movable
    temp_file_manager(temp_file_manager&&) noexcept;
    auto operator=(temp_file_manager&&) noexcept -> temp_file_manager&;

    /**
     * @brief Create a temporary file with random data
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    /**
     * @brief Create and register a subdirectory removed on cleanup
     */
    auto create_directory(const std::string& name) -> std::filesystem::path;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief In-memory byte_stream replaying a fixed input
 *
 * Reads hand out at most read_size bytes per call; writes are counted and
 * dropped.
 */
class replay_stream : public byte_stream {
public:
    replay_stream(std::vector<std::byte> input, std::size_t read_size);

    auto read_some(std::span<std::byte> buffer) -> result<std::size_t> override;
    auto write_some(std::span<const std::byte> data) -> result<std::size_t> override;
    auto shutdown_write() -> result<void> override;

    /**
     * @brief Rewind to the start of the input and reset counters
     */
    void rewind();

    [[nodiscard]] auto bytes_written() const -> uint64_t { return written_; }

private:
    std::vector<std::byte> input_;
    std::size_t read_size_;
    std::size_t position_ = 0;
    uint64_t written_ = 0;
};

/**
 * @brief Concatenate a request header line, the frame delimiter and a payload
 */
auto make_request(std::string_view header, const std::vector<std::byte>& payload)
    -> std::vector<std::byte>;

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;
constexpr std::size_t GB = 1024 * MB;

constexpr std::size_t small_file = 100 * KB;    // 100 KB
constexpr std::size_t medium_file = 10 * MB;    // 10 MB
constexpr std::size_t large_file = 50 * MB;     // 50 MB

// Chunk sizes for testing
constexpr std::size_t min_chunk = 4 * KB;       // 4 KB
constexpr std::size_t default_chunk = 64 * KB;  // 64 KB
constexpr std::size_t max_chunk = 1 * MB;       // 1 MB
}  // namespace sizes

}  // namespace rawxfer::benchmark

#endif  // RAWXFER_BENCHMARKS_BENCHMARK_HELPERS_H
