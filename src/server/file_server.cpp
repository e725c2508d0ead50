/**
 * @file file_server.cpp
 * @brief File transfer server implementation
 */

#include "rawxfer/server/file_server.h"

#include "rawxfer/core/logging.h"
#include "rawxfer/core/socket_stream.h"
#include "rawxfer/server/connection_dispatcher.h"
#include "rawxfer/server/storage_directory.h"
#include "rawxfer/server/transfer_engine.h"

#include <array>
#include <atomic>
#include <mutex>
#include <optional>

namespace rawxfer {

namespace {

constexpr auto drain_timeout = std::chrono::milliseconds(2000);

/**
 * @brief Consume what the peer is still sending after an error response
 *
 * Closing with unread input makes the kernel reset the connection, which can
 * discard the response before the peer reads it.
 */
void drain_input(socket_stream& stream) {
    if (!stream.shutdown_write()) {
        return;
    }
    if (!stream.set_io_timeout(drain_timeout)) {
        return;
    }
    std::array<std::byte, 64 * 1024> sink{};
    auto deadline = std::chrono::steady_clock::now() + drain_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        auto n = stream.read_some(sink);
        if (!n || n.value() == 0) {
            return;
        }
    }
}

}  // namespace

struct file_server::impl {
    server_config config;
    std::atomic<server_state> current_state{server_state::stopped};
    uint16_t listen_port{0};

    std::optional<transfer_engine> engine;
    std::unique_ptr<connection_dispatcher> dispatcher;

    std::function<void(const connection_outcome&)> complete_callback;
    std::mutex callback_mutex;

    mutable std::mutex stats_mutex;
    server_statistics statistics;

    explicit impl(server_config cfg) : config(std::move(cfg)) {}

    void handle(accepted_connection conn) {
        socket_stream stream(std::move(conn.socket));

        if (config.io_timeout.count() > 0) {
            auto applied = stream.set_io_timeout(config.io_timeout);
            if (!applied) {
                RX_LOG_WARN(log_category::server,
                    "Failed to apply I/O timeout: " + applied.error().message);
            }
        }

        transfer_log_context ctx;
        ctx.peer = conn.peer;
        RX_LOG_DEBUG_CTX(log_category::server, "Client connected", ctx);

        auto outcome = engine->handle_connection(stream, conn.peer);

        if (!outcome.success && outcome.failure &&
            !is_connection_error(outcome.failure->code)) {
            drain_input(stream);
        }

        {
            std::lock_guard<std::mutex> lock(stats_mutex);
            ++statistics.total_connections;
            if (outcome.success) {
                ++statistics.requests_succeeded;
            } else {
                ++statistics.requests_failed;
            }
            statistics.total_bytes_received += outcome.bytes_received;
            statistics.total_bytes_sent += outcome.bytes_sent;
        }

        {
            std::lock_guard<std::mutex> lock(callback_mutex);
            if (complete_callback) {
                complete_callback(outcome);
            }
        }

        RX_LOG_DEBUG_CTX(log_category::server, "Client disconnected", ctx);
    }
};

// Builder implementation
file_server::builder::builder() {
    config_.storage_directory = "storage";
}

auto file_server::builder::with_storage_directory(const std::filesystem::path& dir) -> builder& {
    config_.storage_directory = dir;
    return *this;
}

auto file_server::builder::with_dispatch_policy(dispatch_policy policy) -> builder& {
    config_.policy = policy;
    return *this;
}

auto file_server::builder::with_worker_count(std::size_t count) -> builder& {
    config_.worker_count = count;
    return *this;
}

auto file_server::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto file_server::builder::with_max_header_size(std::size_t size) -> builder& {
    config_.max_header_size = size;
    return *this;
}

auto file_server::builder::with_io_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.io_timeout = timeout;
    return *this;
}

auto file_server::builder::with_listen_backlog(int backlog) -> builder& {
    config_.listen_backlog = backlog;
    return *this;
}

auto file_server::builder::build() -> result<file_server> {
    if (config_.storage_directory.empty()) {
        return unexpected{error{error_code::invalid_configuration,
                               "storage_directory is required"}};
    }
    if (config_.worker_count == 0) {
        return unexpected{error{error_code::invalid_configuration,
                               "worker_count must be at least 1"}};
    }
    if (!config_.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
                               "Invalid server configuration"}};
    }

    auto storage = storage_directory::create(config_.storage_directory);
    if (!storage) {
        return unexpected{storage.error()};
    }

    return file_server{std::move(config_)};
}

// file_server implementation
file_server::file_server(server_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    get_logger().initialize();
}

file_server::file_server(file_server&&) noexcept = default;
auto file_server::operator=(file_server&&) noexcept -> file_server& = default;

file_server::~file_server() {
    if (impl_ && is_running()) {
        auto stopped = stop();
        if (!stopped) {
            RX_LOG_ERROR(log_category::server,
                "Failed to stop server: " + stopped.error().message);
        }
    }
}

auto file_server::start(const endpoint& listen_addr) -> result<void> {
    if (impl_->current_state != server_state::stopped) {
        RX_LOG_WARN(log_category::server, "Server start failed: already running");
        return unexpected{error{error_code::already_running, "Server is already running"}};
    }

    RX_LOG_INFO(log_category::server, "Starting server on " + listen_addr.to_string());
    impl_->current_state = server_state::starting;

    auto storage = storage_directory::create(impl_->config.storage_directory);
    if (!storage) {
        impl_->current_state = server_state::stopped;
        return unexpected{storage.error()};
    }
    impl_->engine.emplace(std::move(storage.value()),
                          impl_->config.chunk_size,
                          impl_->config.max_header_size);

    auto listener = listen_on(listen_addr, impl_->config.listen_backlog);
    if (!listener) {
        impl_->current_state = server_state::stopped;
        RX_LOG_ERROR(log_category::server, "Failed to listen: " + listener.error().message);
        return unexpected{listener.error()};
    }

    auto port = bound_port(listener.value());
    if (!port) {
        impl_->current_state = server_state::stopped;
        return unexpected{port.error()};
    }
    impl_->listen_port = port.value();

    auto* state = impl_.get();
    impl_->dispatcher = std::make_unique<connection_dispatcher>(
        impl_->config.policy, impl_->config.worker_count,
        [state](accepted_connection conn) { state->handle(std::move(conn)); });

    auto started = impl_->dispatcher->start(std::move(listener.value()));
    if (!started) {
        impl_->dispatcher.reset();
        impl_->listen_port = 0;
        impl_->current_state = server_state::stopped;
        RX_LOG_ERROR(log_category::server, "Failed to start dispatcher: " + started.error().message);
        return started;
    }

    impl_->current_state = server_state::running;
    RX_LOG_INFO(log_category::server,
        "Server listening on port " + std::to_string(impl_->listen_port) +
        " (mode " + to_string(impl_->config.policy) + ", workers " +
        std::to_string(impl_->config.worker_count) + ", storage " +
        impl_->config.storage_directory.string() + ")");
    return {};
}

auto file_server::stop() -> result<void> {
    if (impl_->current_state != server_state::running) {
        return unexpected{error{error_code::not_running, "Server is not running"}};
    }

    RX_LOG_INFO(log_category::server, "Stopping server");
    impl_->current_state = server_state::stopping;

    auto stopped = impl_->dispatcher->stop();
    impl_->dispatcher.reset();
    impl_->listen_port = 0;
    impl_->current_state = server_state::stopped;

    if (!stopped) {
        RX_LOG_ERROR(log_category::server, "Dispatcher stop failed: " + stopped.error().message);
        return stopped;
    }

    RX_LOG_INFO(log_category::server, "Server stopped");
    return {};
}

auto file_server::is_running() const -> bool {
    return impl_->current_state == server_state::running;
}

auto file_server::state() const -> server_state {
    return impl_->current_state;
}

auto file_server::port() const -> uint16_t {
    return impl_->listen_port;
}

void file_server::on_connection_complete(std::function<void(const connection_outcome&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->callback_mutex);
    impl_->complete_callback = std::move(callback);
}

auto file_server::get_statistics() const -> server_statistics {
    std::lock_guard<std::mutex> lock(impl_->stats_mutex);
    return impl_->statistics;
}

auto file_server::config() const -> const server_config& {
    return impl_->config;
}

}  // namespace rawxfer
