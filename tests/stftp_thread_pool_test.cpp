/**
 * @file stftp_thread_pool_test.cpp
 * @brief Unit tests for the transfer worker pool
 */

#include <gtest/gtest.h>
#include "internal/stftp_thread_pool.h"
#include <chrono>
#include <atomic>
#include <vector>
#include <future>
#include <memory>

using namespace stftp::internal;

class ThreadPoolTest : public ::testing::Test {
protected:
    // Active count drops just after a task's future becomes ready
    static void WaitForIdle(const ThreadPool& pool) {
        for (int i = 0; i < 1000 && pool.GetActiveTaskCount() != 0; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
};

TEST_F(ThreadPoolTest, BasicConstruction) {
    ThreadPool pool(4);
    EXPECT_EQ(pool.GetThreadCount(), 4u);
    EXPECT_FALSE(pool.IsShuttingDown());
    EXPECT_EQ(pool.GetActiveTaskCount(), 0u);
    EXPECT_EQ(pool.GetQueuedTaskCount(), 0u);
}

TEST_F(ThreadPoolTest, ZeroThreadsPicksHardwareConcurrency) {
    ThreadPool pool(0);
    EXPECT_GT(pool.GetThreadCount(), 0u);
}

TEST_F(ThreadPoolTest, SimpleTaskExecution) {
    ThreadPool pool(2);
    std::atomic<int> counter(0);

    auto future = pool.Submit([&counter]() {
        counter.fetch_add(1);
        return 42;
    });

    EXPECT_EQ(future.get(), 42);
    EXPECT_EQ(counter.load(), 1);
}

TEST_F(ThreadPoolTest, TaskWithParameters) {
    ThreadPool pool(2);

    auto future = pool.Submit([](int a, int b) {
        return a + b;
    }, 10, 20);

    EXPECT_EQ(future.get(), 30);
}

TEST_F(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(2);

    auto future = pool.Submit([]() -> int {
        throw std::runtime_error("Test exception");
    });

    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives the exception
    auto next = pool.Submit([]() { return 7; });
    EXPECT_EQ(next.get(), 7);
}

TEST_F(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> concurrent_count(0);
    std::atomic<int> max_concurrent(0);
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool.Submit([&concurrent_count, &max_concurrent]() {
            int current = concurrent_count.fetch_add(1) + 1;
            int expected_max = max_concurrent.load();
            while (current > expected_max &&
                   !max_concurrent.compare_exchange_weak(expected_max, current)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            concurrent_count.fetch_sub(1);
        }));
    }

    for (auto& future : futures) {
        future.get();
    }

    EXPECT_GE(max_concurrent.load(), 2);
    EXPECT_EQ(concurrent_count.load(), 0);
}

TEST_F(ThreadPoolTest, ShutdownRunsQueuedTasks) {
    auto pool = std::make_unique<ThreadPool>(1);
    std::atomic<int> completed(0);
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 5; ++i) {
        futures.push_back(pool->Submit([&completed]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            completed.fetch_add(1);
        }));
    }

    pool->Shutdown();
    EXPECT_TRUE(pool->IsShuttingDown());
    EXPECT_EQ(completed.load(), 5);
    EXPECT_EQ(pool->GetQueuedTaskCount(), 0u);

    EXPECT_THROW(pool->Submit([]() { return 1; }), std::runtime_error);
}

TEST_F(ThreadPoolTest, ShutdownIsIdempotent) {
    ThreadPool pool(2);
    pool.Shutdown();
    pool.Shutdown();
    EXPECT_TRUE(pool.IsShuttingDown());
}

TEST_F(ThreadPoolTest, TaskCountAccuracy) {
    ThreadPool pool(2);
    std::vector<std::future<void>> futures;

    const size_t task_count = 5;
    std::atomic<int> ready_count(0);
    std::atomic<bool> release_tasks(false);

    for (size_t i = 0; i < task_count; ++i) {
        futures.push_back(pool.Submit([&ready_count, &release_tasks]() {
            ready_count.fetch_add(1);
            while (!release_tasks.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }));
    }

    // Both workers are blocked, the rest is queued
    while (ready_count.load() < 2) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(pool.GetActiveTaskCount(), 2u);
    EXPECT_EQ(pool.GetQueuedTaskCount(), task_count - 2);

    release_tasks = true;
    for (auto& future : futures) {
        future.get();
    }

    WaitForIdle(pool);
    EXPECT_EQ(pool.GetActiveTaskCount(), 0u);
    EXPECT_EQ(pool.GetQueuedTaskCount(), 0u);
}
