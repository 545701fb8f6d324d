/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <thread>

using namespace cluster_gate;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ShutdownDrainsQueuedWork) {
    ThreadPool pool(1);
    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        pool.submit([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            done.fetch_add(1);
        });
    }
    pool.shutdown();
    EXPECT_EQ(done.load(), 10);
    EXPECT_FALSE(pool.accepting());
}

TEST(ThreadPoolTest, SubmitAfterShutdownIsBrokenPromise) {
    ThreadPool pool(1);
    pool.shutdown();
    auto future = pool.submit([] { return 1; });
    try {
        future.get();
        FAIL() << "expected broken promise";
    } catch (const std::future_error& e) {
        EXPECT_EQ(e.code(), std::future_errc::broken_promise);
    }
}

TEST(ThreadPoolTest, AbandonedDeadlineCallStillCompletes) {
    ThreadPool pool(2);
    auto source = std::make_shared<std::stop_source>();
    auto future = pool.submit([source] {
        while (!source->get_token().stop_requested()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return 7;
    });

    EXPECT_EQ(future.wait_for(std::chrono::milliseconds(20)), std::future_status::timeout);
    source->request_stop();
    EXPECT_EQ(future.get(), 7);
}
