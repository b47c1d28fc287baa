#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace desk::realtime {

enum class PopStatus { Item, Timeout, Closed };

// Fixed-capacity FIFO shared between producer threads and one consumer.
// Producers never block: a full or closed queue rejects the push. Closing
// wakes the consumer, which still drains what was queued before the close.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be positive");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool try_push(T value) {
        {
            std::lock_guard lock(mutex_);
            if (closed_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push_back(std::move(value));
        }
        condition_.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    // Waits until an item arrives, the queue is closed and empty, or the
    // timeout expires.
    PopStatus pop_for(std::chrono::milliseconds timeout, T& out) {
        std::unique_lock lock(mutex_);
        condition_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        if (!queue_.empty()) {
            out = std::move(queue_.front());
            queue_.pop_front();
            return PopStatus::Item;
        }
        return closed_ ? PopStatus::Closed : PopStatus::Timeout;
    }

    // Blocks until an item arrives; nullopt once closed and drained.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        condition_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    // Idempotent. Returns true only for the call that actually closed it.
    bool close() {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return false;
            closed_ = true;
        }
        condition_.notify_all();
        return true;
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const noexcept { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace desk::realtime
