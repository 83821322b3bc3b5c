/**
 * Fixed-size worker pool for independent pipeline jobs.
 *
 * Tasks are consumed FIFO by a fixed number of threads. submit() hands back a
 * std::future, so results (and exceptions) are collected by the caller in
 * whatever order it chooses, independent of completion order.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "covec/error.hpp"

namespace covec {

class ThreadPool {
public:
    using Task = std::function<void()>;

    explicit ThreadPool(size_t num_threads) : num_threads_(num_threads) {
        COVEC_CHECK_ARGUMENT(num_threads > 0, "thread pool needs at least one worker");
        workers_.reserve(num_threads_);
        for (size_t i = 0; i < num_threads_; ++i) {
            workers_.emplace_back(&ThreadPool::worker_loop, this);
        }
    }

    ~ThreadPool() {
        shutdown(false);
    }

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Submit a task and get a future for the result
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using ReturnType = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw InvalidArgumentError("submit on a stopped thread pool", __func__);
            }
            queue_.emplace_back([task]() { (*task)(); });
        }
        cv_.notify_one();
        return result;
    }

    /**
     * Stop the workers. Running tasks always finish; queued tasks run first
     * when drain is true and are dropped otherwise (their futures then report
     * std::future_errc::broken_promise). Idempotent.
     */
    void shutdown(bool drain = true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && workers_.empty()) return;
            stopping_ = true;
            if (!drain) {
                queue_.clear();
            }
        }
        cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    size_t num_threads() const { return num_threads_; }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    void worker_loop() {
        while (true) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) {
                    return;
                }
                task = std::move(queue_.front());
                queue_.pop_front();
            }
            // packaged_task stores any exception in the future
            task();
        }
    }

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::deque<Task> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

} // namespace covec
