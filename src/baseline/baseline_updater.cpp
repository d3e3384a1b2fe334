#include "baseline/baseline_updater.hpp"
#include <boost/asio/post.hpp>
#include <future>
#include <spdlog/spdlog.h>

namespace flowscope {

BaselineUpdater::BaselineUpdater(std::size_t queue_capacity,
                                 std::chrono::milliseconds recompute_interval,
                                 ApplyFn apply,
                                 RecomputeFn recompute)
    : recompute_timer_(ioc_)
    , recompute_interval_(recompute_interval)
    , queue_(queue_capacity)
    , apply_(std::move(apply))
    , recompute_(std::move(recompute))
{}

BaselineUpdater::~BaselineUpdater() {
    stop();
}

bool BaselineUpdater::submit(PressureWindow window) {
    const bool dropped = queue_.push(std::move(window));
    if (dropped) {
        spdlog::warn("Baseline update queue full ({}), dropped oldest record", queue_.capacity());
    }

    if (running_.load() && !drain_scheduled_.exchange(true)) {
        boost::asio::post(ioc_, [this]() {
            drain_scheduled_.store(false);
            drain();
        });
    }
    return !dropped;
}

void BaselineUpdater::start() {
    if (running_.exchange(true)) {
        return;
    }

    ioc_.restart();
    work_.emplace(boost::asio::make_work_guard(ioc_));
    schedule_recompute();

    thread_ = std::thread([this]() {
        spdlog::debug("Baseline updater thread started");
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            spdlog::error("Baseline updater stopped on exception: {}", e.what());
        }
        spdlog::debug("Baseline updater thread stopped");
    });

    // Records queued before start()
    if (!queue_.empty() && !drain_scheduled_.exchange(true)) {
        boost::asio::post(ioc_, [this]() {
            drain_scheduled_.store(false);
            drain();
        });
    }
}

void BaselineUpdater::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    boost::asio::post(ioc_, [this]() {
        recompute_timer_.cancel();
    });
    work_.reset();

    if (thread_.joinable()) {
        thread_.join();
    }

    // Anything submitted after the last drain ran
    drain();
}

void BaselineUpdater::flush() {
    if (!running_.load()) {
        drain();
        return;
    }

    std::promise<void> done;
    auto future = done.get_future();
    boost::asio::post(ioc_, [this, &done]() {
        drain();
        done.set_value();
    });
    future.wait();
}

bool BaselineUpdater::running() const noexcept {
    return running_.load();
}

std::size_t BaselineUpdater::pending() const {
    return queue_.size();
}

std::size_t BaselineUpdater::dropped() const {
    return queue_.dropped();
}

void BaselineUpdater::drain() {
    std::lock_guard<std::mutex> lock(drain_mutex_);

    auto batch = queue_.drain();
    for (const auto& window : batch) {
        try {
            apply_(window);
        } catch (const std::exception& e) {
            spdlog::error("Failed to apply baseline record for {}: {}",
                          to_string(window.key), e.what());
        }
    }
}

void BaselineUpdater::schedule_recompute() {
    recompute_timer_.expires_after(recompute_interval_);
    recompute_timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || !running_.load()) {
            return;
        }
        try {
            recompute_();
        } catch (const std::exception& e) {
            spdlog::error("Baseline recompute failed: {}", e.what());
        }
        schedule_recompute();
    });
}

}  // namespace flowscope
