// =============================================================================
// Thread Pool Tests
// =============================================================================

#include <gtest/gtest.h>
#include "covec/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace covec;

TEST(ThreadPoolTest, FuturesFollowSubmissionOrder) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.push_back(pool.submit([i]() {
            // Early tasks finish last
            std::this_thread::sleep_for(std::chrono::microseconds((32 - i) * 100));
            return i * i;
        }));
    }
    for (int i = 0; i < 32; ++i) {
        EXPECT_EQ(futures[static_cast<size_t>(i)].get(), i * i);
    }
}

TEST(ThreadPoolTest, ArgumentsAreForwarded) {
    ThreadPool pool(2);
    auto sum = pool.submit([](int a, int b) { return a + b; }, 40, 2);
    EXPECT_EQ(sum.get(), 42);
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(2);
    auto failing = pool.submit([]() -> int { throw std::runtime_error("job failed"); });
    auto fine = pool.submit([]() { return 7; });

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(fine.get(), 7);
}

TEST(ThreadPoolTest, DrainingShutdownRunsQueuedTasks) {
    std::atomic<int> done{0};
    ThreadPool pool(1);
    for (int i = 0; i < 50; ++i) {
        pool.submit([&done]() { done.fetch_add(1); });
    }
    pool.shutdown(true);
    EXPECT_EQ(done.load(), 50);
    EXPECT_EQ(pool.pending(), 0u);
}

TEST(ThreadPoolTest, AbortingShutdownDropsQueuedTasks) {
    std::atomic<int> done{0};
    std::promise<void> started;
    std::promise<void> gate;
    std::shared_future<void> gate_future = gate.get_future().share();

    ThreadPool pool(1);
    auto blocker = pool.submit([&started, gate_future]() {
        started.set_value();
        gate_future.wait();
    });
    std::vector<std::future<void>> queued;
    for (int i = 0; i < 10; ++i) {
        queued.push_back(pool.submit([&done]() { done.fetch_add(1); }));
    }
    started.get_future().wait();

    std::thread releaser([&gate]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        gate.set_value();
    });
    pool.shutdown(false);
    releaser.join();

    EXPECT_NO_THROW(blocker.get());
    EXPECT_EQ(done.load(), 0);
    for (auto& f : queued) {
        EXPECT_THROW(f.get(), std::future_error);
    }
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
    ThreadPool pool(2);
    pool.shutdown();
    EXPECT_THROW(pool.submit([]() { return 1; }), InvalidArgumentError);
    EXPECT_NO_THROW(pool.shutdown());
}

TEST(ThreadPoolTest, ZeroWorkersRejected) {
    EXPECT_THROW(ThreadPool pool(0), InvalidArgumentError);
}

TEST(ThreadPoolTest, ReportsWorkerCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.num_threads(), 3u);
}
