#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <stdexcept>

// Single-producer FIFO with a fixed capacity. push blocks while the channel is full.
// close() ends the stream after the queued items are drained; terminate() ends it
// immediately on both sides.
template <typename T>
class BoundedChannel {
public:
    enum class PopStatus {
        Success,
        Timeout,
        Closed,
        Terminated
    };

    struct PopResult {
        std::optional<T> data;
        PopStatus status;
    };

    explicit BoundedChannel(size_t capacity, std::chrono::milliseconds pop_timeout = std::chrono::milliseconds(100))
        : capacity_(capacity), pop_timeout_(pop_timeout) {
        if (capacity_ == 0) {
            throw std::invalid_argument("Channel capacity must be positive");
        }
    }

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    // Returns false when the channel was closed or terminated; the item is dropped
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] {
            return queue_.size() < capacity_ || closed_ || terminated_;
        });
        if (closed_ || terminated_) {
            return false;
        }
        queue_.push(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    PopResult pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = not_empty_.wait_for(lock, pop_timeout_,
            [this] { return !queue_.empty() || closed_ || terminated_; });

        if (terminated_) {
            return PopResult{std::nullopt, PopStatus::Terminated};
        }
        if (!ready) {
            return PopResult{std::nullopt, PopStatus::Timeout};
        }
        if (queue_.empty()) {
            return PopResult{std::nullopt, PopStatus::Closed};
        }

        T item = std::move(queue_.front());
        queue_.pop();
        not_full_.notify_one();
        return PopResult{std::move(item), PopStatus::Success};
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    void terminate() {
        std::lock_guard<std::mutex> lock(mutex_);
        terminated_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

    bool terminated() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return terminated_;
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    size_t capacity_;
    std::chrono::milliseconds pop_timeout_;
    bool closed_ = false;
    bool terminated_ = false;
};
