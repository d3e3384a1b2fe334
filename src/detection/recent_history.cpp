#include "detection/recent_history.hpp"
#include <algorithm>

namespace flowscope {

RecentHistory::RecentHistory(TimestampMs horizon_ms, std::size_t capacity)
    : horizon_ms_(horizon_ms)
    , capacity_(capacity)
{}

void RecentHistory::push(const PressureWindow& window) {
    if (capacity_ == 0) {
        return;
    }

    if (!has_newest_ || window.window_start > newest_start_) {
        newest_start_ = window.window_start;
        has_newest_ = true;
    }

    const TimestampMs cutoff = newest_start_ - horizon_ms_;
    if (window.window_start < cutoff) {
        return;
    }

    // Late windows are placed by start so eviction from the front stays exact
    auto pos = std::upper_bound(windows_.begin(), windows_.end(), window.window_start,
                                [](TimestampMs start, const PressureWindow& w) {
                                    return start < w.window_start;
                                });
    windows_.insert(pos, window);

    while (!windows_.empty() && windows_.front().window_start < cutoff) {
        windows_.pop_front();
    }
    while (windows_.size() > capacity_) {
        windows_.pop_front();
    }
}

std::vector<const PressureWindow*> RecentHistory::for_strike(Strike strike) const {
    std::vector<const PressureWindow*> result;
    for (const auto& window : windows_) {
        if (window.key.strike == strike) {
            result.push_back(&window);
        }
    }
    return result;
}

void RecentHistory::clear() {
    windows_.clear();
    has_newest_ = false;
    newest_start_ = 0;
}

}  // namespace flowscope
