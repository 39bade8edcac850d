#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

// Unbounded job queue shared by the worker pool
template <typename T>
class ThreadSafeQueue {
public:
    void enqueue(T item) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    // Blocks until an item is available; nullopt once stopped and drained
    std::optional<T> dequeue() {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return !queue_.empty() || stop_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    // No more items will be enqueued
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            stop_ = true;
        }
        cv_.notify_all();
    }

    // Stop and discard whatever is still queued
    void clear() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            std::queue<T> empty;
            queue_.swap(empty);
            stop_ = true;
        }
        cv_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_ = false;
};
