#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <new>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>

namespace flowscope {

/// Lock-free single-producer single-consumer ring buffer
///
/// Carries parsed events from the reader thread to the engine thread.
/// Exactly one thread may push and exactly one thread may pop. Each slot
/// carries a sequence number: pos means free for the producer at pos,
/// pos + 1 means filled for the consumer at pos.
///
/// @tparam T Element type (must be move-constructible)
/// @tparam Capacity Queue capacity (must be a power of 2)
template <typename T, std::size_t Capacity>
class SpscQueue {
    static_assert(Capacity > 0 && (Capacity & (Capacity - 1)) == 0,
                  "Capacity must be a non-zero power of 2");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

public:
    SpscQueue() noexcept {
        for (std::size_t i = 0; i < Capacity; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    ~SpscQueue() {
        while (try_pop().has_value()) {}
    }

    SpscQueue(const SpscQueue&) = delete;
    SpscQueue& operator=(const SpscQueue&) = delete;
    SpscQueue(SpscQueue&&) = delete;
    SpscQueue& operator=(SpscQueue&&) = delete;

    /// Construct an element in place
    /// @return false if the queue is full
    template <typename... Args>
    [[nodiscard]] bool try_emplace(Args&&... args) noexcept(std::is_nothrow_constructible_v<T, Args...>) {
        const std::size_t pos = tail_.load(std::memory_order_relaxed);
        Slot& slot = slots_[pos & kMask];

        if (slot.sequence.load(std::memory_order_acquire) != pos) {
            return false;
        }

        new (&slot.storage) T(std::forward<Args>(args)...);

        slot.sequence.store(pos + 1, std::memory_order_release);
        tail_.store(pos + 1, std::memory_order_relaxed);
        return true;
    }

    [[nodiscard]] bool try_push(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>) {
        return try_emplace(std::move(value));
    }

    [[nodiscard]] bool try_push(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
        requires std::is_copy_constructible_v<T>
    {
        return try_emplace(value);
    }

    /// Push, yielding while the consumer catches up
    /// @param cancelled Checked between attempts; gives up once it is true
    /// @return false if cancelled before the element was queued
    bool push_wait(T&& value, const std::atomic<bool>& cancelled) {
        while (!try_emplace(std::move(value))) {
            if (cancelled.load(std::memory_order_relaxed)) {
                return false;
            }
            std::this_thread::yield();
        }
        return true;
    }

    [[nodiscard]] std::optional<T> try_pop() noexcept(std::is_nothrow_move_constructible_v<T>) {
        const std::size_t pos = head_.load(std::memory_order_relaxed);
        Slot& slot = slots_[pos & kMask];

        if (slot.sequence.load(std::memory_order_acquire) != pos + 1) {
            return std::nullopt;
        }

        T* ptr = std::launder(reinterpret_cast<T*>(&slot.storage));
        std::optional<T> result(std::move(*ptr));
        ptr->~T();

        // Free the slot for the producer's next lap
        slot.sequence.store(pos + Capacity, std::memory_order_release);
        head_.store(pos + 1, std::memory_order_relaxed);
        return result;
    }

    /// Approximate size (may be stale under concurrent access)
    [[nodiscard]] std::size_t size_approx() const noexcept {
        return tail_.load(std::memory_order_relaxed) - head_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_empty() const noexcept {
        return size_approx() == 0;
    }

    [[nodiscard]] static constexpr std::size_t capacity() noexcept {
        return Capacity;
    }

private:
    static constexpr std::size_t kMask = Capacity - 1;
    static constexpr std::size_t kCacheLineSize = 64;

    struct Slot {
        std::atomic<std::size_t> sequence;
        alignas(T) std::byte storage[sizeof(T)];
    };

    // Producer and consumer indices on separate cache lines
    alignas(kCacheLineSize) std::atomic<std::size_t> head_{0};
    alignas(kCacheLineSize) std::atomic<std::size_t> tail_{0};

    std::array<Slot, Capacity> slots_;
};

}  // namespace flowscope
