/**
 * @file rawxfer_server.cpp
 * @brief File transfer server program
 *
 * Usage:
 *   rawxfer_server [--host 0.0.0.0] [--port 10001] [--mode single|thread|process]
 *                  [--workers 1] [--storage storage] [--io-timeout ms]
 *                  [--log-level info] [--json-log]
 */

#include <rawxfer/rawxfer.h>
#include <rawxfer/core/logging.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

using namespace rawxfer;

// Global flag for graceful shutdown
static std::atomic<bool> running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

namespace {

struct server_options {
    std::string host = "0.0.0.0";
    uint16_t port = 10001;
    dispatch_policy policy = dispatch_policy::sequential;
    std::size_t workers = 1;
    std::string storage = "storage";
    std::chrono::milliseconds io_timeout{0};
    log_level level = log_level::info;
    bool json_log = false;
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
    std::cout << "Usage: " << program << " [options]\n"
              << "  --host <addr>             Listen address (default: 0.0.0.0)\n"
              << "  --port <n>                Listen port (default: 10001)\n"
              << "  --mode single|thread|process\n"
              << "                            Connection dispatch policy (default: single)\n"
              << "  --workers <n>             Pool size for thread/process (default: 1)\n"
              << "  --storage <dir>           Storage directory (default: storage)\n"
              << "  --io-timeout <ms>         Per-operation socket deadline (default: none)\n"
              << "  --log-level <level>       trace|debug|info|warn|error (default: info)\n"
              << "  --json-log                Emit structured JSON log lines\n"
              << "  --version                 Print version and exit\n";
}

auto parse_arguments(int argc, char* argv[]) -> std::optional<server_options> {
    server_options options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        if (arg == "--json-log") {
            options.json_log = true;
            continue;
        }

        if (arg != "--host" && arg != "--port" && arg != "--mode" && arg != "--workers" &&
            arg != "--storage" && arg != "--io-timeout" && arg != "--log-level") {
            std::cerr << "Unknown option: " << arg << std::endl;
            return std::nullopt;
        }

        auto value = next();
        if (!value) {
            return std::nullopt;
        }

        if (arg == "--host") {
            options.host = std::string(*value);
        } else if (arg == "--port") {
            auto port = parse_number<uint16_t>(*value);
            if (!port) {
                std::cerr << "Invalid port: " << *value << std::endl;
                return std::nullopt;
            }
            options.port = *port;
        } else if (arg == "--mode") {
            auto policy = parse_dispatch_policy(*value);
            if (!policy) {
                std::cerr << "Invalid mode: " << *value << std::endl;
                return std::nullopt;
            }
            options.policy = *policy;
        } else if (arg == "--workers") {
            auto workers = parse_number<std::size_t>(*value);
            if (!workers || *workers == 0) {
                std::cerr << "Invalid worker count: " << *value << std::endl;
                return std::nullopt;
            }
            options.workers = *workers;
        } else if (arg == "--storage") {
            options.storage = std::string(*value);
        } else if (arg == "--io-timeout") {
            auto ms = parse_number<long long>(*value);
            if (!ms || *ms < 0) {
                std::cerr << "Invalid timeout: " << *value << std::endl;
                return std::nullopt;
            }
            options.io_timeout = std::chrono::milliseconds(*ms);
        } else if (arg == "--log-level") {
            auto level = log_level_from_string(*value);
            if (!level) {
                std::cerr << "Invalid log level: " << *value << std::endl;
                return std::nullopt;
            }
            options.level = *level;
        }
    }

    return options;
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
            std::cout << "rawxfer_server " << version::to_string() << std::endl;
            return 0;
        }
    }

    auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    auto& logger = get_logger();
    logger.set_level(options->level);
    logger.enable_json_output(options->json_log);
    logger.initialize();

    auto server_result = file_server::builder()
        .with_storage_directory(options->storage)
        .with_dispatch_policy(options->policy)
        .with_worker_count(options->workers)
        .with_io_timeout(options->io_timeout)
        .build();

    if (!server_result.has_value()) {
        std::cerr << "Failed to create server: "
                  << server_result.error().message << std::endl;
        return 1;
    }

    auto& server = server_result.value();

    server.on_connection_complete([](const connection_outcome& outcome) {
        if (!outcome.success && outcome.failure) {
            RX_LOG_DEBUG(log_category::server,
                "Connection ended with " + std::string(to_string(outcome.failure->code)));
        }
    });

    // Install handlers before start so forked workers inherit and reset them
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto start_result = server.start(endpoint{options->host, options->port});
    if (!start_result.has_value()) {
        std::cerr << "Failed to start server: "
                  << start_result.error().message << std::endl;
        return 1;
    }

    std::cout << "rawxfer_server " << version::to_string()
              << " listening on " << options->host << ":" << server.port()
              << " (mode: " << to_string(options->policy)
              << ", workers: " << options->workers
              << ", storage: " << options->storage << ")" << std::endl;

    while (running && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "Stopping server..." << std::endl;
    auto stop_result = server.stop();
    if (!stop_result.has_value()) {
        std::cerr << "Error during shutdown: "
                  << stop_result.error().message << std::endl;
    }

    auto stats = server.get_statistics();
    std::cout << "Connections: " << stats.total_connections
              << " | Succeeded: " << stats.requests_succeeded
              << " | Failed: " << stats.requests_failed
              << " | Received: " << stats.total_bytes_received
              << " | Sent: " << stats.total_bytes_sent << std::endl;

    logger.shutdown();
    return 0;
}
