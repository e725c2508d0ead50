/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for worker pool adapters
 */

#include <gtest/gtest.h>

#include <rawxfer/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

namespace rawxfer::adapters::test {

class BasicTransferPoolTest : public ::testing::Test {};

TEST_F(BasicTransferPoolTest, RunsSubmittedTasks) {
    basic_transfer_pool pool(2);
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.submit([&counter] { ++counter; }));
    }
    for (auto& f : futures) {
        f.get();
    }

    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(pool.worker_count(), 2u);
    EXPECT_TRUE(pool.is_running());
}

TEST_F(BasicTransferPoolTest, RunsTasksOnSeparateThreads) {
    basic_transfer_pool pool(4);
    std::mutex mutex;
    std::set<std::thread::id> ids;
    std::promise<void> release;
    auto gate = release.get_future().share();
    std::atomic<int> started{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(pool.submit([&, gate] {
            {
                std::lock_guard<std::mutex> lock(mutex);
                ids.insert(std::this_thread::get_id());
            }
            ++started;
            gate.wait();
        }));
    }

    // All four tasks must be running at once before any is released
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (started.load() < 4 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(started.load(), 4);

    release.set_value();
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(ids.size(), 4u);
}

TEST_F(BasicTransferPoolTest, ExceptionReachesFuture) {
    basic_transfer_pool pool(1);

    auto future = pool.submit([] { throw std::runtime_error("handler failed"); });

    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives the exception
    auto next = pool.submit([] {});
    EXPECT_NO_THROW(next.get());
}

TEST_F(BasicTransferPoolTest, ShutdownDrainsQueue) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;
    {
        basic_transfer_pool pool(1);
        for (int i = 0; i < 5; ++i) {
            futures.push_back(pool.submit([&counter] {
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                ++counter;
            }));
        }
        pool.shutdown();
        EXPECT_FALSE(pool.is_running());
    }

    EXPECT_EQ(counter.load(), 5);
}

TEST_F(BasicTransferPoolTest, SubmitAfterShutdownFails) {
    basic_transfer_pool pool(1);
    pool.shutdown();

    auto future = pool.submit([] {});

    EXPECT_THROW(future.get(), std::runtime_error);
}

class TransferPoolFactoryTest : public ::testing::Test {};

TEST_F(TransferPoolFactoryTest, CreatesRunningPool) {
    auto pool = transfer_pool_factory::create(3, "factory_test");

    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(pool->is_running());
    EXPECT_EQ(pool->worker_count(), 3u);

    std::atomic<bool> ran{false};
    pool->submit([&ran] { ran = true; }).get();
    EXPECT_TRUE(ran.load());

    pool->shutdown();
    EXPECT_FALSE(pool->is_running());
}

}  // namespace rawxfer::adapters::test
