/**
 * @file stress_runner.cpp
 * @brief Stress runner implementation
 */

#include "rawxfer/client/stress_runner.h"

#include "rawxfer/adapters/thread_pool_adapter.h"
#include "rawxfer/client/file_transfer_client.h"
#include "rawxfer/core/logging.h"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <future>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace rawxfer {

namespace {

auto csv_field(const std::string& value) -> std::string {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

auto fixed3(double value) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << value;
    return oss.str();
}

/**
 * @brief Result line a child process writes to its pipe
 */
auto encode_result(const transfer_result& r) -> std::string {
    char line[96];
    std::snprintf(line, sizeof(line), "%d %.9f %llu\n",
                  r.success ? 1 : 0, r.elapsed.count(),
                  static_cast<unsigned long long>(r.byte_count));
    return line;
}

auto decode_result(const std::string& line) -> std::optional<transfer_result> {
    std::istringstream iss(line);
    int ok = 0;
    double seconds = 0.0;
    unsigned long long bytes = 0;
    if (!(iss >> ok >> seconds >> bytes)) {
        return std::nullopt;
    }
    transfer_result r;
    r.success = ok != 0;
    r.elapsed = std::chrono::duration<double>(seconds);
    r.byte_count = bytes;
    return r;
}

auto read_all(int fd) -> std::string {
    std::string data;
    char buffer[256];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            data.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        break;
    }
    return data;
}

}  // namespace

auto stress_summary::volume_label() const -> std::string {
    auto mb = std::llround(static_cast<double>(volume_bytes) / 1024.0 / 1024.0);
    return std::to_string(mb) + "MB";
}

stress_runner::stress_runner(stress_config config) : config_(std::move(config)) {}

auto stress_runner::run() const -> result<stress_summary> {
    if (!config_.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
                                "Stress test needs a file and a pool size of at least 1"}};
    }

    RX_LOG_INFO(log_category::stress,
        std::string("Starting stress test: ") + to_string(config_.operation) + " " +
        config_.file.string() + " x" + std::to_string(config_.pool_size) +
        " (" + to_string(config_.mode) + " pool)");

    auto start = std::chrono::steady_clock::now();
    auto results = config_.mode == pool_mode::thread ? run_in_threads() : run_in_processes();
    if (!results) {
        return unexpected{results.error()};
    }

    auto summary = summarize(config_, results.value());
    summary.wall_elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    RX_LOG_INFO(log_category::stress,
        "Stress test finished: " + std::to_string(summary.success_count) + " succeeded, " +
        std::to_string(summary.fail_count) + " failed");
    return summary;
}

auto stress_runner::summarize(const stress_config& config,
                              const std::vector<transfer_result>& results) -> stress_summary {
    stress_summary summary;
    summary.operation = config.operation;
    summary.pool_size = config.pool_size;
    summary.server_workers = config.server_workers;

    uint64_t largest = 0;
    for (const auto& r : results) {
        summary.total_elapsed += r.elapsed.count();
        summary.total_bytes += r.byte_count;
        if (r.success) {
            ++summary.success_count;
        }
        largest = std::max(largest, r.byte_count);
    }
    summary.fail_count = config.pool_size > summary.success_count
                             ? config.pool_size - summary.success_count
                             : 0;

    std::error_code ec;
    if (std::filesystem::is_regular_file(config.file, ec)) {
        auto size = std::filesystem::file_size(config.file, ec);
        summary.volume_bytes = ec ? largest : static_cast<uint64_t>(size);
    } else {
        summary.volume_bytes = largest;
    }
    return summary;
}

auto stress_runner::report_header() -> std::string {
    return "Test No,Operation,Volume,Client Pool Size,Server Pool Size,"
           "Avg Time per Client (s),Throughput per Client (bytes/s),"
           "Client Workers Succeeded/Failed,Server Workers Succeeded/Failed";
}

auto stress_runner::report_row(int test_number, const stress_summary& summary) -> std::string {
    std::ostringstream row;
    row << test_number << ','
        << to_string(summary.operation) << ','
        << summary.volume_label() << ','
        << summary.pool_size << ','
        << summary.server_workers << ','
        << fixed3(summary.average_seconds()) << ','
        << fixed3(summary.throughput_per_client()) << ','
        << csv_field(std::to_string(summary.success_count) + " succeeded, " +
                     std::to_string(summary.fail_count) + " failed") << ','
        << csv_field(std::to_string(summary.server_workers) + " server workers, 0 failed");
    return row.str();
}

auto stress_runner::append_report(const std::filesystem::path& path,
                                  int test_number,
                                  const stress_summary& summary) -> result<void> {
    std::error_code ec;
    const bool write_header = !std::filesystem::exists(path, ec);

    std::ofstream out(path, std::ios::app);
    if (!out) {
        return unexpected{error{error_code::file_write_error,
                                "Failed to open report " + path.string()}};
    }
    if (write_header) {
        out << report_header() << "\n";
    }
    out << report_row(test_number, summary) << "\n";
    out.flush();
    if (!out) {
        return unexpected{error{error_code::file_write_error,
                                "Failed to write report " + path.string()}};
    }
    return {};
}

auto stress_runner::run_in_threads() const -> result<std::vector<transfer_result>> {
    auto client = file_transfer_client::builder()
        .with_server(config_.client.server)
        .with_chunk_size(config_.client.chunk_size)
        .with_io_timeout(config_.client.io_timeout)
        .with_download_directory(config_.client.download_directory)
        .build();
    if (!client) {
        return unexpected{client.error()};
    }

    std::vector<transfer_result> results(config_.pool_size);
    auto pool = adapters::transfer_pool_factory::create(config_.pool_size, "rawxfer_stress");

    std::vector<std::future<void>> pending;
    pending.reserve(config_.pool_size);
    const auto& driver = client.value();
    for (std::size_t i = 0; i < config_.pool_size; ++i) {
        pending.push_back(pool->submit([&driver, &results, i, this] {
            results[i] = driver.timed(config_.operation, config_.file);
        }));
    }

    for (std::size_t i = 0; i < pending.size(); ++i) {
        try {
            pending[i].get();
        } catch (const std::exception& e) {
            RX_LOG_ERROR(log_category::stress,
                "Stress worker " + std::to_string(i) + " failed: " + e.what());
            results[i] = transfer_result{};
        }
    }
    pool->shutdown();
    return results;
}

auto stress_runner::run_in_processes() const -> result<std::vector<transfer_result>> {
    auto client = file_transfer_client::builder()
        .with_server(config_.client.server)
        .with_chunk_size(config_.client.chunk_size)
        .with_io_timeout(config_.client.io_timeout)
        .with_download_directory(config_.client.download_directory)
        .build();
    if (!client) {
        return unexpected{client.error()};
    }

    struct child_process {
        pid_t pid = -1;
        int read_fd = -1;
    };
    std::vector<child_process> children;
    children.reserve(config_.pool_size);

    for (std::size_t i = 0; i < config_.pool_size; ++i) {
        int fds[2];
        if (::pipe(fds) != 0) {
            RX_LOG_ERROR(log_category::stress,
                std::string("pipe failed: ") + std::strerror(errno));
            children.push_back(child_process{});
            continue;
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            RX_LOG_ERROR(log_category::stress,
                std::string("fork failed: ") + std::strerror(errno));
            ::close(fds[0]);
            ::close(fds[1]);
            children.push_back(child_process{});
            continue;
        }

        if (pid == 0) {
            ::close(fds[0]);
            for (const auto& other : children) {
                if (other.read_fd >= 0) {
                    ::close(other.read_fd);
                }
            }
            auto line = encode_result(client.value().timed(config_.operation, config_.file));
            std::size_t written = 0;
            while (written < line.size()) {
                ssize_t n = ::write(fds[1], line.data() + written, line.size() - written);
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    break;
                }
                written += static_cast<std::size_t>(n);
            }
            ::close(fds[1]);
            get_logger().flush();
            ::_exit(0);
        }

        ::close(fds[1]);
        children.push_back(child_process{pid, fds[0]});
    }

    std::vector<transfer_result> results;
    results.reserve(children.size());
    for (std::size_t i = 0; i < children.size(); ++i) {
        auto& child = children[i];
        if (child.pid < 0) {
            results.push_back(transfer_result{});
            continue;
        }

        auto decoded = decode_result(read_all(child.read_fd));
        ::close(child.read_fd);

        int status = 0;
        while (::waitpid(child.pid, &status, 0) < 0 && errno == EINTR) {
        }

        if (!decoded) {
            RX_LOG_ERROR(log_category::stress,
                "Stress process " + std::to_string(i) + " reported no result");
            results.push_back(transfer_result{});
            continue;
        }
        results.push_back(*decoded);
    }
    return results;
}

}  // namespace rawxfer
