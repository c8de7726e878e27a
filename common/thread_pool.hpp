#pragma once

// ============================================================
// thread_pool.hpp -- Header-only C++17 thread pool
//
// parallel_for_each() is the fan-out primitive used by indexing,
// dependency resolution and packing: one task per item, returns
// once every task has finished. It must not be called from inside
// a pool task (the caller blocks on futures the workers serve).
// ============================================================

#include <vector>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <exception>
#include <stdexcept>
#include <type_traits>

class ThreadPool {
public:
    // num_threads == 0 selects std::thread::hardware_concurrency()
    explicit ThreadPool(size_t num_threads = 0) : stop_(false) {
        if (num_threads == 0) num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) num_threads = 1;
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
    }

    // Enqueue a callable and return a future for its result
    template<typename F, typename... Args>
    auto enqueue(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>
    {
        using RetType = typename std::invoke_result<F, Args...>::type;

        auto task = std::make_shared<std::packaged_task<RetType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<RetType> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (stop_) throw std::runtime_error("ThreadPool is stopped");
            tasks_.emplace([task]() { (*task)(); });
        }
        cv_.notify_one();
        return res;
    }

    size_t size() const { return workers_.size(); }

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                if (stop_ && tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        mutex_;
    std::condition_variable           cv_;
    bool                              stop_;
};

// Run fn(item) for every item on the pool and wait for all of them.
// Every task runs to completion even if another one throws; the first
// exception (in item order) is rethrown afterwards.
template<typename Container, typename Fn>
void parallel_for_each(ThreadPool& pool, const Container& items, Fn fn) {
    std::vector<std::future<void>> pending;
    pending.reserve(items.size());
    for (const auto& item : items) {
        pending.push_back(pool.enqueue([&fn, &item]() { fn(item); }));
    }

    std::exception_ptr first_error;
    for (auto& f : pending) {
        try {
            f.get();
        } catch (...) {
            if (!first_error) first_error = std::current_exception();
        }
    }
    if (first_error) std::rethrow_exception(first_error);
}
