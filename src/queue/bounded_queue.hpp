#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace flowscope {

/// Multi-producer bounded FIFO that never blocks producers
///
/// When full, push() evicts the oldest element to make room and reports
/// the eviction so the caller can account for the lost item.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(capacity)
    {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// Enqueue, dropping the oldest element on overflow
    /// @return true if an element had to be dropped
    bool push(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool dropped = false;
        if (items_.size() >= capacity_) {
            items_.pop_front();
            ++dropped_;
            dropped = true;
        }
        items_.push_back(std::move(value));
        return dropped;
    }

    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    /// Move every queued element out in FIFO order
    [[nodiscard]] std::deque<T> drain() {
        std::deque<T> batch;
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(items_);
        return batch;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] bool empty() const {
        return size() == 0;
    }

    /// Total elements evicted by overflow
    [[nodiscard]] std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    [[nodiscard]] std::size_t capacity() const noexcept {
        return capacity_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<T> items_;
    std::size_t dropped_{0};
};

}  // namespace flowscope
