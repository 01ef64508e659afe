#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

enum class PushStatus { Ok, Full, Closed };

// Bounded FIFO shared by many producers and one consumer.
// Producers never wait: try_push() either accepts the item or reports Full /
// Closed immediately. The consumer blocks in pop() only while the queue is
// empty and still open.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be positive");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // The item is moved from only when Ok is returned.
    PushStatus try_push(T&& item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_) return PushStatus::Closed;
            if (items_.size() >= capacity_) return PushStatus::Full;
            items_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return PushStatus::Ok;
    }

    // Returns nullopt once the queue is closed and drained.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) return std::nullopt;

        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Rejects further pushes. Items already queued are still handed out.
    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    bool closed_ = false;
};
