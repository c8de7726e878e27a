#pragma once

// ============================================================
// concurrent.hpp -- Lock-guarded queue and set shared by workers
// ============================================================

#include <mutex>
#include <queue>
#include <unordered_set>
#include <vector>

// Thread-safe FIFO queue
template<typename T>
class SafeQueue {
public:
    void push(T item) {
        std::lock_guard<std::mutex> lk(mutex_);
        queue_.push(std::move(item));
    }

    // Pop up to max_items in FIFO order
    std::vector<T> pop_batch(size_t max_items) {
        std::vector<T> batch;
        std::lock_guard<std::mutex> lk(mutex_);
        while (batch.size() < max_items && !queue_.empty()) {
            batch.push_back(std::move(queue_.front()));
            queue_.pop();
        }
        return batch;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return queue_.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::queue<T> queue_;
};

// Thread-safe set with an atomic insert-if-absent
template<typename T, typename Hash = std::hash<T>>
class ConcurrentSet {
public:
    // Returns true if the value was not present and has been inserted
    bool insert(const T& value) {
        std::lock_guard<std::mutex> lk(mutex_);
        return set_.insert(value).second;
    }

    void erase(const T& value) {
        std::lock_guard<std::mutex> lk(mutex_);
        set_.erase(value);
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return set_.size();
    }

    std::vector<T> snapshot() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return std::vector<T>(set_.begin(), set_.end());
    }

private:
    mutable std::mutex mutex_;
    std::unordered_set<T, Hash> set_;
};
