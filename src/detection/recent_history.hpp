#pragma once

#include "aggregator/pressure_window.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <deque>
#include <vector>

namespace flowscope {

/// Time-bounded ring buffer of recently evaluated windows across all keys
///
/// Holds windows whose start lies within the horizon of the newest start
/// pushed so far, and never more than capacity entries. Entries are kept
/// ordered by window start; equal starts keep insertion order.
class RecentHistory {
public:
    RecentHistory(TimestampMs horizon_ms, std::size_t capacity);

    void push(const PressureWindow& window);

    /// Windows at exactly this strike, both sides, ordered by window start
    [[nodiscard]] std::vector<const PressureWindow*> for_strike(Strike strike) const;

    void clear();

    [[nodiscard]] std::size_t size() const noexcept { return windows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return windows_.empty(); }
    [[nodiscard]] TimestampMs horizon() const noexcept { return horizon_ms_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] const std::deque<PressureWindow>& windows() const noexcept { return windows_; }

private:
    TimestampMs horizon_ms_;
    std::size_t capacity_;
    TimestampMs newest_start_{0};
    bool has_newest_{false};
    std::deque<PressureWindow> windows_;
};

}  // namespace flowscope
