/**
 * @file stress_runner.h
 * @brief Concurrent client load generator with CSV reporting
 */

#ifndef RAWXFER_CLIENT_STRESS_RUNNER_H
#define RAWXFER_CLIENT_STRESS_RUNNER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rawxfer/client/client_types.h"
#include "rawxfer/core/types.h"

namespace rawxfer {

/**
 * @brief Where concurrent client operations run
 */
enum class pool_mode {
    thread,   ///< Worker threads in this process
    process   ///< One forked child process per operation
};

[[nodiscard]] constexpr auto to_string(pool_mode mode) -> const char* {
    switch (mode) {
        case pool_mode::thread: return "thread";
        case pool_mode::process: return "process";
        default: return "unknown";
    }
}

[[nodiscard]] inline auto parse_pool_mode(std::string_view name) -> std::optional<pool_mode> {
    if (name == "thread") return pool_mode::thread;
    if (name == "process") return pool_mode::process;
    return std::nullopt;
}

/**
 * @brief Stress test parameters
 */
struct stress_config {
    client_config client;
    transfer_operation operation = transfer_operation::upload;

    /// Local path for upload, stored name for download
    std::filesystem::path file;

    pool_mode mode = pool_mode::thread;
    std::size_t pool_size = 1;

    /// Server worker count, reported only
    std::size_t server_workers = 1;

    /// Test case number, reported only
    int test_number = 1;

    std::filesystem::path report_path = "stress_test_report.csv";

    [[nodiscard]] auto is_valid() const -> bool {
        return client.is_valid() && !file.empty() && pool_size > 0;
    }
};

/**
 * @brief Aggregated results of one stress run
 */
struct stress_summary {
    transfer_operation operation = transfer_operation::upload;
    uint64_t volume_bytes = 0;
    std::size_t pool_size = 0;
    std::size_t server_workers = 0;
    std::size_t success_count = 0;
    std::size_t fail_count = 0;
    uint64_t total_bytes = 0;

    /// Sum of every operation's own duration, in seconds
    double total_elapsed = 0.0;

    /// Wall-clock time of the whole run, in seconds
    double wall_elapsed = 0.0;

    [[nodiscard]] auto average_seconds() const -> double {
        return pool_size > 0 ? total_elapsed / static_cast<double>(pool_size) : 0.0;
    }

    [[nodiscard]] auto throughput_per_client() const -> double {
        return total_elapsed > 0.0 ? static_cast<double>(total_bytes) / total_elapsed : 0.0;
    }

    /**
     * @brief Volume as whole mebibytes, e.g. "10MB"
     */
    [[nodiscard]] auto volume_label() const -> std::string;
};

/**
 * @brief Runs pool_size copies of one client operation concurrently
 *
 * @code
 * stress_config config;
 * config.file = "payload.bin";
 * config.pool_size = 8;
 * stress_runner runner(config);
 * auto summary = runner.run();
 * if (summary.has_value()) {
 *     auto written = stress_runner::append_report(config.report_path, config.test_number,
 *                                                 summary.value());
 * }
 * @endcode
 */
class stress_runner {
public:
    explicit stress_runner(stress_config config);

    /**
     * @brief Execute the run and aggregate the per-operation results
     */
    [[nodiscard]] auto run() const -> result<stress_summary>;

    /**
     * @brief Aggregate individual results
     */
    [[nodiscard]] static auto summarize(const stress_config& config,
                                        const std::vector<transfer_result>& results)
        -> stress_summary;

    /**
     * @brief Append one CSV row, writing the header row first for a new file
     */
    [[nodiscard]] static auto append_report(const std::filesystem::path& path,
                                            int test_number,
                                            const stress_summary& summary) -> result<void>;

    [[nodiscard]] static auto report_header() -> std::string;

    [[nodiscard]] static auto report_row(int test_number, const stress_summary& summary)
        -> std::string;

    [[nodiscard]] auto config() const -> const stress_config& { return config_; }

private:
    [[nodiscard]] auto run_in_threads() const -> result<std::vector<transfer_result>>;
    [[nodiscard]] auto run_in_processes() const -> result<std::vector<transfer_result>>;

    stress_config config_;
};

}  // namespace rawxfer

#endif  // RAWXFER_CLIENT_STRESS_RUNNER_H
