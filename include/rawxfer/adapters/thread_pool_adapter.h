// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Fixed-size worker pools for connection handlers and stress clients
 *
 * Uses thread_system's thread_pool when it is built in, otherwise a pool of
 * std::thread workers draining a shared queue.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace rawxfer::adapters {

/**
 * @brief Interface for worker pool operations
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Queue a task for the next free worker
     * @return Future for the task completion; carries any exception it threw
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Number of submitted tasks not yet picked up by a worker
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Finish queued tasks and join the workers
     *
     * Further submissions fail. Safe to call more than once.
     */
    virtual void shutdown() = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter over kcenon::thread::thread_pool
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "rawxfer_pool",
        size_t worker_count = 0);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Create and start a pool with @p worker_count thread_workers
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count,
        const std::string& pool_name = "rawxfer_pool");

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    void shutdown() override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool of N std::thread workers sharing one task queue
 */
class basic_transfer_pool : public transfer_thread_pool_interface {
public:
    explicit basic_transfer_pool(size_t worker_count,
                                 const std::string& pool_name = "rawxfer_pool");
    ~basic_transfer_pool() override;

    basic_transfer_pool(const basic_transfer_pool&) = delete;
    basic_transfer_pool& operator=(const basic_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    void shutdown() override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Picks thread_system when available, basic_transfer_pool otherwise
 */
class transfer_pool_factory {
public:
    /**
     * @param worker_count Number of workers (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count,
        const std::string& pool_name = "rawxfer_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace rawxfer::adapters
