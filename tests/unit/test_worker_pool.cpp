/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for WorkerPool.
 */

#include "executor/worker_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace sandbox_orchestrator;

TEST(WorkerPoolTest, BasicSubmit) {
    WorkerPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(WorkerPoolTest, MultipleSubmissions) {
    WorkerPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(WorkerPoolTest, ExceptionReachesFuture) {
    WorkerPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives.
    EXPECT_EQ(pool.submit([] { return 7; }).get(), 7);
}

TEST(WorkerPoolTest, PostAndWaitIdle) {
    WorkerPool pool(4);
    std::atomic<int> counter{0};

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(pool.post([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    pool.wait_idle();
    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(pool.queued_count(), 0u);
    EXPECT_EQ(pool.active_count(), 0u);
}

TEST(WorkerPoolTest, ShutdownDrainsQueuedWork) {
    WorkerPool pool(1);
    std::atomic<int> counter{0};

    for (int i = 0; i < 10; ++i) {
        pool.post([&counter] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            counter.fetch_add(1);
        });
    }

    pool.shutdown();
    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(pool.thread_count(), 0u);
}

TEST(WorkerPoolTest, RejectsWorkAfterShutdown) {
    WorkerPool pool(2);
    pool.shutdown();

    EXPECT_FALSE(pool.post([] {}));
    auto future = pool.submit([] { return 1; });
    EXPECT_THROW(future.get(), std::runtime_error);

    pool.shutdown();  // second call is a no-op
}

TEST(WorkerPoolTest, ThreadCount) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}
