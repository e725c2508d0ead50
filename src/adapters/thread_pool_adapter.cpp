// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pool adapter implementation
 */

#include "rawxfer/adapters/thread_pool_adapter.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace rawxfer::adapters {

namespace {

auto resolve_worker_count(size_t worker_count) -> size_t {
    if (worker_count == 0) {
        worker_count = std::thread::hardware_concurrency();
        if (worker_count == 0) {
            worker_count = 4;
        }
    }
    return worker_count;
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that runs a std::function on a thread_system worker
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "function_job")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> kcenon::common::VoidResult override {
        if (func_) {
            func_();
        }
        return kcenon::common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::atomic<bool> running{true};
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() {
    shutdown();
}

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                                const std::string& pool_name) {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    if (!pimpl_->running.load()) {
        promise->set_exception(std::make_exception_ptr(
            std::runtime_error("pool " + pimpl_->pool_name + " is shut down")));
        return future;
    }

    auto wrapped_task = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    auto job = std::make_unique<function_job>(std::move(wrapped_task), "transfer_task");
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->pool != nullptr && pimpl_->running.load();
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

void thread_system_transfer_adapter::shutdown() {
    if (!pimpl_) {
        return;
    }
    bool expected = true;
    if (pimpl_->running.compare_exchange_strong(expected, false) && pimpl_->pool) {
        pimpl_->pool->stop(false);
    }
}

std::string thread_system_transfer_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// basic_transfer_pool implementation
// ============================================================================

struct basic_transfer_pool::impl {
    std::string pool_name;
    std::vector<std::thread> workers;
    std::deque<std::function<void()>> queue;
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool stopping{false};

    void run() {
        while (true) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !queue.empty(); });
                if (queue.empty()) {
                    return;
                }
                task = std::move(queue.front());
                queue.pop_front();
            }
            task();
        }
    }
};

basic_transfer_pool::basic_transfer_pool(size_t worker_count, const std::string& pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool_name = pool_name;
    worker_count = resolve_worker_count(worker_count);
    pimpl_->workers.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i) {
        pimpl_->workers.emplace_back([p = pimpl_.get()] { p->run(); });
    }
}

basic_transfer_pool::~basic_transfer_pool() {
    shutdown();
}

std::future<void> basic_transfer_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped_task = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        if (pimpl_->stopping) {
            promise->set_exception(std::make_exception_ptr(
                std::runtime_error("pool " + pimpl_->pool_name + " is shut down")));
            return future;
        }
        pimpl_->queue.push_back(std::move(wrapped_task));
    }
    pimpl_->cv.notify_one();
    return future;
}

size_t basic_transfer_pool::worker_count() const {
    return pimpl_->workers.size();
}

bool basic_transfer_pool::is_running() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t basic_transfer_pool::pending_tasks() const {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    return pimpl_->queue.size();
}

void basic_transfer_pool::shutdown() {
    if (!pimpl_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        pimpl_->stopping = true;
    }
    pimpl_->cv.notify_all();
    for (auto& worker : pimpl_->workers) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count, pool_name);
#else
    return std::make_shared<basic_transfer_pool>(worker_count, pool_name);
#endif
}

}  // namespace rawxfer::adapters
