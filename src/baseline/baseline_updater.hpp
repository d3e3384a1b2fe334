#pragma once

#include "aggregator/pressure_window.hpp"
#include "queue/bounded_queue.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <thread>

namespace flowscope {

/// Background writer for the baseline store
///
/// Owns one io_context thread. Records are queued without blocking the
/// caller and applied on that thread in submission order, so updates for
/// any key are single-writer and ordered. A steady_timer on the same
/// thread triggers the periodic full recompute.
class BaselineUpdater {
public:
    using ApplyFn = std::function<void(const PressureWindow&)>;
    using RecomputeFn = std::function<void()>;

    BaselineUpdater(std::size_t queue_capacity,
                    std::chrono::milliseconds recompute_interval,
                    ApplyFn apply,
                    RecomputeFn recompute);

    ~BaselineUpdater();

    BaselineUpdater(const BaselineUpdater&) = delete;
    BaselineUpdater& operator=(const BaselineUpdater&) = delete;

    /// Queue a closed window (never blocks)
    /// @return false if the queue overflowed and the oldest record was dropped
    bool submit(PressureWindow window);

    /// Launch the updater thread
    void start();

    /// Apply outstanding records, cancel the timer and join the thread
    void stop();

    /// Block until every record submitted so far has been applied
    /// Without a running thread, applies on the caller's thread.
    void flush();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::size_t pending() const;
    [[nodiscard]] std::size_t dropped() const;

private:
    void drain();
    void schedule_recompute();

    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    boost::asio::steady_timer recompute_timer_;
    std::chrono::milliseconds recompute_interval_;

    BoundedQueue<PressureWindow> queue_;
    ApplyFn apply_;
    RecomputeFn recompute_;

    std::mutex drain_mutex_;
    std::atomic<bool> drain_scheduled_{false};
    std::atomic<bool> running_{false};
    std::thread thread_;
};

}  // namespace flowscope
