// filename: core/thread_pool.hpp
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// Fixed-size worker pool. The broker runs its io_context on it and tests use
// it to hammer the registry from several threads.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t n, std::string label = "thread_pool");
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Returns false once stop() has been called; the task is dropped.
    template <class F>
    bool post(F&& f) {
        if (stop_.load(std::memory_order_acquire)) return false;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (stop_) return false;
            tasks_.emplace(std::forward<F>(f));
            ++pending_;
        }
        cv_.notify_one();
        return true;
    }

    // Blocks until every posted task has finished.
    void wait_idle();

    // Drains queued tasks and joins the workers. Idempotent.
    void stop();

    std::size_t size() const noexcept { return threads_.size(); }

private:
    void worker_loop();

    std::string label_;
    std::atomic<bool> stop_{false};
    std::mutex mu_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::queue<std::function<void()>> tasks_;
    // queued plus running
    std::size_t pending_{0};
    std::vector<std::thread> threads_;
};
