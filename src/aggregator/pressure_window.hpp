#pragma once

#include "core/types.hpp"
#include <algorithm>
#include <cstddef>

namespace flowscope {

/// Aggregate of one fixed time bucket for one (strike, side) key
struct PressureWindow {
    InstrumentKey key;
    TimestampMs window_start{0};
    TimestampMs window_end{0};  // Exclusive

    Quantity bid_volume{0.0};
    Quantity ask_volume{0.0};
    Quantity unclassified_volume{0.0};
    std::size_t trade_count{0};
    std::size_t dropped_events{0};  // Out-of-order or malformed events

    Price open_price{0.0};
    Price high_price{0.0};
    Price low_price{0.0};
    Price close_price{0.0};
    double notional{0.0};  // Sum of price * size

    TimestampMs last_event_time{0};

    /// ask / max(bid, 1)
    [[nodiscard]] double pressure_ratio() const noexcept {
        return ask_volume / std::max(bid_volume, 1.0);
    }

    [[nodiscard]] Quantity classified_volume() const noexcept {
        return bid_volume + ask_volume;
    }

    [[nodiscard]] Quantity total_volume() const noexcept {
        return bid_volume + ask_volume + unclassified_volume;
    }

    /// Majority side with a 10% dead band
    [[nodiscard]] DominantSide dominant_side() const noexcept {
        if (ask_volume > bid_volume * 1.1) {
            return DominantSide::Buy;
        }
        if (bid_volume > ask_volume * 1.1) {
            return DominantSide::Sell;
        }
        return DominantSide::Neutral;
    }

    /// Fraction of delivered events that were usable, in [0, 1]
    [[nodiscard]] Percentage data_completeness() const noexcept {
        const std::size_t delivered = trade_count + dropped_events;
        if (delivered == 0) {
            return 0.0;
        }
        return static_cast<double>(trade_count) / static_cast<double>(delivered);
    }

    [[nodiscard]] Price vwap() const noexcept {
        const Quantity volume = total_volume();
        return volume > 0.0 ? notional / volume : 0.0;
    }

    /// Premium change across the window, in percent
    [[nodiscard]] double price_change_pct() const noexcept {
        if (open_price <= 0.0) {
            return 0.0;
        }
        return (close_price - open_price) / open_price * 100.0;
    }

    [[nodiscard]] DayIndex day() const noexcept {
        return day_of(window_start);
    }
};

}  // namespace flowscope
