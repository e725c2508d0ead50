/**
 * @file rawxfer_client.cpp
 * @brief File transfer client program
 *
 * Usage:
 *   rawxfer_client --mode upload --file data.bin
 *   rawxfer_client --mode download --file data.bin
 *   rawxfer_client --mode stress --file data.bin --pool_mode thread --pool_size 8
 */

#include <rawxfer/rawxfer.h>
#include <rawxfer/core/logging.h>

#include <charconv>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace rawxfer;

namespace {

enum class client_mode {
    upload,
    download,
    stress
};

struct client_options {
    std::string server = "127.0.0.1";
    uint16_t port = 10001;
    std::optional<client_mode> mode;
    std::string file;
    pool_mode pool = pool_mode::thread;
    std::size_t pool_size = 1;
    std::size_t server_workers = 1;
    int test_number = 1;
    std::string output = "stress_test_report.csv";
    log_level level = log_level::warn;
};

template <typename T>
auto parse_number(std::string_view text) -> std::optional<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " --mode upload|download|stress [options]\n"
              << "  --server <addr>           Server address (default: 127.0.0.1)\n"
              << "  --port <n>                Server port (default: 10001)\n"
              << "  --file <path|name>        Local file to upload, or stored name to download\n"
              << "  --pool_mode thread|process\n"
              << "                            Stress worker kind (default: thread)\n"
              << "  --pool_size <n>           Concurrent stress operations (default: 1)\n"
              << "  --server_workers <n>      Server worker count, for the report (default: 1)\n"
              << "  --nomor <n>               Test case number, for the report (default: 1)\n"
              << "  --output <csv>            Report file (default: stress_test_report.csv)\n"
              << "  --log-level <level>       trace|debug|info|warn|error (default: warn)\n"
              << "  --version                 Print version and exit\n";
}

auto parse_mode(std::string_view name) -> std::optional<client_mode> {
    if (name == "upload") return client_mode::upload;
    if (name == "download") return client_mode::download;
    if (name == "stress") return client_mode::stress;
    return std::nullopt;
}

auto parse_arguments(int argc, char* argv[]) -> std::optional<client_options> {
    client_options options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return std::nullopt;
        }
        std::string_view value = argv[++i];

        if (arg == "--server") {
            options.server = std::string(value);
        } else if (arg == "--port") {
            auto port = parse_number<uint16_t>(value);
            if (!port || *port == 0) {
                std::cerr << "Invalid port: " << value << std::endl;
                return std::nullopt;
            }
            options.port = *port;
        } else if (arg == "--mode") {
            options.mode = parse_mode(value);
            if (!options.mode) {
                std::cerr << "Invalid mode: " << value << std::endl;
                return std::nullopt;
            }
        } else if (arg == "--file") {
            options.file = std::string(value);
        } else if (arg == "--pool_mode") {
            auto pool = parse_pool_mode(value);
            if (!pool) {
                std::cerr << "Invalid pool mode: " << value << std::endl;
                return std::nullopt;
            }
            options.pool = *pool;
        } else if (arg == "--pool_size") {
            auto size = parse_number<std::size_t>(value);
            if (!size || *size == 0) {
                std::cerr << "Invalid pool size: " << value << std::endl;
                return std::nullopt;
            }
            options.pool_size = *size;
        } else if (arg == "--server_workers") {
            auto workers = parse_number<std::size_t>(value);
            if (!workers) {
                std::cerr << "Invalid server worker count: " << value << std::endl;
                return std::nullopt;
            }
            options.server_workers = *workers;
        } else if (arg == "--nomor") {
            auto number = parse_number<int>(value);
            if (!number) {
                std::cerr << "Invalid test number: " << value << std::endl;
                return std::nullopt;
            }
            options.test_number = *number;
        } else if (arg == "--output") {
            options.output = std::string(value);
        } else if (arg == "--log-level") {
            auto level = log_level_from_string(value);
            if (!level) {
                std::cerr << "Invalid log level: " << value << std::endl;
                return std::nullopt;
            }
            options.level = *level;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        }
    }

    if (!options.mode) {
        std::cerr << "--mode is required" << std::endl;
        return std::nullopt;
    }
    if (options.file.empty()) {
        std::cerr << "--file is required" << std::endl;
        return std::nullopt;
    }
    return options;
}

auto run_stress(const client_options& options) -> int {
    stress_config config;
    config.client.server = endpoint{options.server, options.port};
    config.operation = transfer_operation::upload;
    config.file = options.file;
    config.mode = options.pool;
    config.pool_size = options.pool_size;
    config.server_workers = options.server_workers;
    config.test_number = options.test_number;
    config.report_path = options.output;

    stress_runner runner(config);
    auto summary = runner.run();
    if (!summary.has_value()) {
        std::cerr << "Stress test failed: " << summary.error().message << std::endl;
        return 1;
    }

    const auto& s = summary.value();
    std::cout << std::fixed << std::setprecision(3)
              << "Operation: " << to_string(s.operation) << "\n"
              << "Volume: " << s.volume_label() << "\n"
              << "Client workers: " << s.pool_size
              << " (" << s.success_count << " succeeded, " << s.fail_count << " failed)\n"
              << "Average time per client: " << s.average_seconds() << " s\n"
              << "Throughput per client: " << s.throughput_per_client() << " bytes/s\n"
              << "Wall time: " << s.wall_elapsed << " s" << std::endl;

    auto written = stress_runner::append_report(config.report_path, config.test_number, s);
    if (!written.has_value()) {
        std::cerr << written.error().message << std::endl;
        return 1;
    }
    std::cout << "Report appended to " << config.report_path.string() << std::endl;
    return s.fail_count == 0 ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version") {
            std::cout << "rawxfer_client " << version::to_string() << std::endl;
            return 0;
        }
    }

    auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    get_logger().set_level(options->level);
    get_logger().initialize();

    if (*options->mode == client_mode::stress) {
        int code = run_stress(*options);
        get_logger().shutdown();
        return code;
    }

    auto client_result = file_transfer_client::builder()
        .with_server(endpoint{options->server, options->port})
        .build();
    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: "
                  << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    auto response = *options->mode == client_mode::upload
                        ? client.upload(options->file)
                        : client.download(options->file);

    int code = 0;
    if (!response.has_value()) {
        std::cerr << "Error: " << response.error().message << std::endl;
        code = 1;
    } else {
        std::cout << response.value().to_string() << std::endl;
        code = response.value().is_ok() ? 0 : 1;
    }

    get_logger().shutdown();
    return code;
}
