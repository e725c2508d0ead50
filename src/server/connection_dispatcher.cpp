/**
 * @file connection_dispatcher.cpp
 * @brief Connection dispatcher implementation
 */

#include "rawxfer/server/connection_dispatcher.h"

#include "rawxfer/adapters/thread_pool_adapter.h"
#include "rawxfer/core/logging.h"

#include <sys/socket.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace rawxfer {

namespace {

constexpr auto supervise_interval = std::chrono::milliseconds(100);
constexpr auto worker_exit_grace = std::chrono::seconds(2);

/**
 * @brief Run a handler, logging anything it throws
 */
void run_handler(const connection_handler& handler, accepted_connection conn) {
    std::string peer = conn.peer;
    try {
        handler(std::move(conn));
    } catch (const std::exception& e) {
        transfer_log_context ctx;
        ctx.peer = peer;
        ctx.error_message = e.what();
        RX_LOG_ERROR_CTX(log_category::dispatcher, "Connection handler failed", ctx);
    } catch (...) {
        transfer_log_context ctx;
        ctx.peer = peer;
        ctx.error_message = "non-standard exception";
        RX_LOG_ERROR_CTX(log_category::dispatcher, "Connection handler failed", ctx);
    }
}

}  // namespace

struct connection_dispatcher::impl {
    dispatch_policy policy;
    std::size_t worker_count;
    connection_handler handler;

    socket_handle listener;
    std::atomic<bool> running{false};
    std::atomic<uint64_t> dispatched{0};
    std::atomic<uint64_t> spawned{0};

    // sequential and shared_pool
    std::thread accept_thread;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;
    std::mutex slot_mutex;
    std::condition_variable slot_cv;
    std::size_t free_slots{0};

    // isolated_pool
    std::thread supervisor_thread;
    std::vector<pid_t> children;
    std::mutex supervisor_mutex;
    std::condition_variable supervisor_cv;

    impl(dispatch_policy p, std::size_t workers, connection_handler h)
        : policy(p), worker_count(workers), handler(std::move(h)) {}

    void sequential_loop() {
        RX_LOG_DEBUG(log_category::dispatcher, "Sequential accept loop started");
        while (running.load()) {
            auto conn = accept_connection(listener);
            if (!conn) {
                if (!running.load() || conn.error().code == error_code::not_running) {
                    break;
                }
                RX_LOG_WARN(log_category::dispatcher, "accept failed: " + conn.error().message);
                continue;
            }
            ++dispatched;
            run_handler(handler, std::move(conn.value()));
        }
        RX_LOG_DEBUG(log_category::dispatcher, "Sequential accept loop finished");
    }

    auto wait_for_slot() -> bool {
        std::unique_lock<std::mutex> lock(slot_mutex);
        slot_cv.wait(lock, [this] { return free_slots > 0 || !running.load(); });
        if (!running.load()) {
            return false;
        }
        --free_slots;
        return true;
    }

    void release_slot() {
        {
            std::lock_guard<std::mutex> lock(slot_mutex);
            ++free_slots;
        }
        slot_cv.notify_all();
    }

    void shared_pool_loop() {
        RX_LOG_DEBUG(log_category::dispatcher,
            "Shared-pool accept loop started with " + std::to_string(worker_count) + " workers");
        while (wait_for_slot()) {
            auto conn = accept_connection(listener);
            if (!conn) {
                release_slot();
                if (!running.load() || conn.error().code == error_code::not_running) {
                    break;
                }
                RX_LOG_WARN(log_category::dispatcher, "accept failed: " + conn.error().message);
                continue;
            }
            ++dispatched;

            auto shared_conn = std::make_shared<accepted_connection>(std::move(conn.value()));
            auto done = pool->submit([this, shared_conn] {
                run_handler(handler, std::move(*shared_conn));
                release_slot();
            });
            // The future only matters if the pool refused the task
            if (done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                try {
                    done.get();
                } catch (const std::exception& e) {
                    RX_LOG_ERROR(log_category::dispatcher,
                        std::string("Failed to dispatch connection: ") + e.what());
                    release_slot();
                }
            }
        }
        RX_LOG_DEBUG(log_category::dispatcher, "Shared-pool accept loop finished");
    }

    /**
     * @brief Body of a forked worker process; never returns
     */
    [[noreturn]] void worker_process_main(std::size_t index) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);

        transfer_log_context ctx;
        ctx.worker = index;
        RX_LOG_DEBUG_CTX(log_category::dispatcher, "Worker process started", ctx);

        while (true) {
            auto conn = accept_connection(listener);
            if (!conn) {
                if (conn.error().code == error_code::not_running) {
                    break;
                }
                RX_LOG_WARN_CTX(log_category::dispatcher,
                    "accept failed in worker: " + conn.error().message, ctx);
                continue;
            }
            run_handler(handler, std::move(conn.value()));
        }

        get_logger().flush();
        ::_exit(0);
    }

    auto spawn_worker(std::size_t index) -> result<pid_t> {
        pid_t pid = ::fork();
        if (pid < 0) {
            return unexpected{error{error_code::internal_error,
                std::string("fork failed: ") + std::strerror(errno)}};
        }
        if (pid == 0) {
            worker_process_main(index);
        }
        ++spawned;
        return pid;
    }

    void supervise() {
        std::unique_lock<std::mutex> lock(supervisor_mutex);
        while (running.load()) {
            supervisor_cv.wait_for(lock, supervise_interval, [this] { return !running.load(); });
            if (!running.load()) {
                break;
            }

            for (std::size_t i = 0; i < children.size(); ++i) {
                if (children[i] <= 0) {
                    continue;
                }
                int status = 0;
                pid_t rc = ::waitpid(children[i], &status, WNOHANG);
                if (rc != children[i]) {
                    continue;
                }

                transfer_log_context ctx;
                ctx.worker = i;
                ctx.error_message = WIFSIGNALED(status)
                    ? "terminated by signal " + std::to_string(WTERMSIG(status))
                    : "exited with status " + std::to_string(WEXITSTATUS(status));
                RX_LOG_WARN_CTX(log_category::dispatcher, "Worker process exited, respawning", ctx);

                auto pid = spawn_worker(i);
                if (pid) {
                    children[i] = pid.value();
                } else {
                    children[i] = -1;
                    RX_LOG_ERROR_CTX(log_category::dispatcher,
                        "Failed to respawn worker: " + pid.error().message, ctx);
                }
            }
        }
    }

    void reap_children() {
        std::lock_guard<std::mutex> lock(supervisor_mutex);

        // Workers leave on their own once the listener is shut down, unless
        // they are stuck inside a handler
        auto deadline = std::chrono::steady_clock::now() + worker_exit_grace;
        bool all_exited = false;
        while (!all_exited && std::chrono::steady_clock::now() < deadline) {
            all_exited = true;
            for (auto& pid : children) {
                if (pid <= 0) {
                    continue;
                }
                int status = 0;
                if (::waitpid(pid, &status, WNOHANG) == pid) {
                    pid = -1;
                } else {
                    all_exited = false;
                }
            }
            if (!all_exited) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }

        for (auto& pid : children) {
            if (pid <= 0) {
                continue;
            }
            ::kill(pid, SIGTERM);
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            pid = -1;
        }
        children.clear();
    }

    auto start_isolated_pool() -> result<void> {
        std::lock_guard<std::mutex> lock(supervisor_mutex);
        children.assign(worker_count, -1);
        for (std::size_t i = 0; i < worker_count; ++i) {
            auto pid = spawn_worker(i);
            if (!pid) {
                return unexpected{pid.error()};
            }
            children[i] = pid.value();
        }
        supervisor_thread = std::thread([this] { supervise(); });
        return {};
    }
};

connection_dispatcher::connection_dispatcher(dispatch_policy policy,
                                             std::size_t worker_count,
                                             connection_handler handler)
    : impl_(std::make_unique<impl>(policy, worker_count, std::move(handler))) {}

connection_dispatcher::connection_dispatcher(connection_dispatcher&&) noexcept = default;
auto connection_dispatcher::operator=(connection_dispatcher&&) noexcept
    -> connection_dispatcher& = default;

connection_dispatcher::~connection_dispatcher() {
    if (impl_ && is_running()) {
        auto stopped = stop();
        if (!stopped) {
            RX_LOG_ERROR(log_category::dispatcher,
                "Failed to stop dispatcher: " + stopped.error().message);
        }
    }
}

auto connection_dispatcher::start(socket_handle listener) -> result<void> {
    if (impl_->running.load()) {
        return unexpected{error{error_code::already_running, "Dispatcher is already running"}};
    }
    if (!listener) {
        return unexpected{error{error_code::invalid_configuration,
                                "Dispatcher needs a listening socket"}};
    }
    if (!impl_->handler) {
        return unexpected{error{error_code::invalid_configuration,
                                "Dispatcher needs a connection handler"}};
    }
    if (impl_->policy != dispatch_policy::sequential && impl_->worker_count == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "Worker count must be at least 1"}};
    }

    impl_->listener = std::move(listener);
    impl_->running = true;

    RX_LOG_INFO(log_category::dispatcher,
        std::string("Dispatching with policy ") + to_string(impl_->policy) +
        ", workers " + std::to_string(impl_->worker_count));

    switch (impl_->policy) {
        case dispatch_policy::sequential:
            impl_->accept_thread = std::thread([p = impl_.get()] { p->sequential_loop(); });
            break;

        case dispatch_policy::shared_pool:
            impl_->free_slots = impl_->worker_count;
            impl_->pool = adapters::transfer_pool_factory::create(
                impl_->worker_count, "rawxfer_connections");
            impl_->accept_thread = std::thread([p = impl_.get()] { p->shared_pool_loop(); });
            break;

        case dispatch_policy::isolated_pool: {
            auto started = impl_->start_isolated_pool();
            if (!started) {
                impl_->running = false;
                ::shutdown(impl_->listener.get(), SHUT_RDWR);
                impl_->reap_children();
                impl_->listener.close();
                return started;
            }
            break;
        }
    }

    return {};
}

auto connection_dispatcher::stop() -> result<void> {
    if (!impl_->running.exchange(false)) {
        return unexpected{error{error_code::not_running, "Dispatcher is not running"}};
    }

    RX_LOG_INFO(log_category::dispatcher, "Stopping dispatcher");

    // Wakes every accept() blocked on this socket, in this process and in workers
    ::shutdown(impl_->listener.get(), SHUT_RDWR);
    impl_->slot_cv.notify_all();
    impl_->supervisor_cv.notify_all();

    if (impl_->accept_thread.joinable()) {
        impl_->accept_thread.join();
    }
    if (impl_->supervisor_thread.joinable()) {
        impl_->supervisor_thread.join();
    }

    if (impl_->policy == dispatch_policy::shared_pool && impl_->pool) {
        {
            std::unique_lock<std::mutex> lock(impl_->slot_mutex);
            impl_->slot_cv.wait(lock, [this] { return impl_->free_slots == impl_->worker_count; });
        }
        impl_->pool->shutdown();
        impl_->pool.reset();
    }

    if (impl_->policy == dispatch_policy::isolated_pool) {
        impl_->reap_children();
    }

    impl_->listener.close();
    RX_LOG_INFO(log_category::dispatcher, "Dispatcher stopped");
    return {};
}

auto connection_dispatcher::is_running() const -> bool {
    return impl_->running.load();
}

auto connection_dispatcher::policy() const -> dispatch_policy {
    return impl_->policy;
}

auto connection_dispatcher::worker_count() const -> std::size_t {
    return impl_->worker_count;
}

auto connection_dispatcher::connections_dispatched() const -> uint64_t {
    return impl_->dispatched.load();
}

auto connection_dispatcher::workers_spawned() const -> uint64_t {
    return impl_->spawned.load();
}

}  // namespace rawxfer
