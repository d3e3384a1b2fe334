#include "aggregator/pressure_aggregator.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <utility>

namespace flowscope {

PressureAggregator::PressureAggregator(const Config::Window& config)
    : window_ms_(static_cast<TimestampMs>(config.length.count()))
    , idle_timeout_ms_(static_cast<TimestampMs>(config.idle_timeout.count()))
{}

std::optional<PressureWindow> PressureAggregator::ingest(const Event& event) {
    auto it = open_.find(event.key);

    if (!event.is_valid()) {
        ++stats_.events_rejected;
        if (it != open_.end()) {
            ++it->second.window.dropped_events;
        }
        return std::nullopt;
    }

    const TimestampMs start = bucket_start(event.timestamp);

    if (it == open_.end()) {
        Slot slot{make_window(event.key, start), event.timestamp};
        accumulate(slot.window, event);
        open_.emplace(event.key, std::move(slot));
        ++stats_.events_accepted;
        return std::nullopt;
    }

    Slot& slot = it->second;

    // Late delivery for a bucket that already closed
    if (event.timestamp < slot.window.window_start) {
        ++stats_.events_out_of_order;
        ++slot.window.dropped_events;
        return std::nullopt;
    }

    slot.last_seen = std::max(slot.last_seen, event.timestamp);
    ++stats_.events_accepted;

    if (start == slot.window.window_start) {
        accumulate(slot.window, event);
        return std::nullopt;
    }

    PressureWindow closed = std::exchange(slot.window, make_window(event.key, start));
    accumulate(slot.window, event);
    ++stats_.windows_closed;
    return closed;
}

std::vector<PressureWindow> PressureAggregator::evict_idle(TimestampMs now) {
    std::vector<PressureWindow> evicted;

    for (auto it = open_.begin(); it != open_.end();) {
        if (now - it->second.last_seen > idle_timeout_ms_) {
            evicted.push_back(std::move(it->second.window));
            it = open_.erase(it);
        } else {
            ++it;
        }
    }

    if (!evicted.empty()) {
        stats_.keys_evicted += evicted.size();
        stats_.windows_closed += evicted.size();
        spdlog::debug("Evicted {} idle keys, {} still active", evicted.size(), open_.size());
    }

    sort_windows(evicted);
    return evicted;
}

std::vector<PressureWindow> PressureAggregator::flush() {
    std::vector<PressureWindow> closed;
    closed.reserve(open_.size());

    for (auto& [key, slot] : open_) {
        closed.push_back(std::move(slot.window));
    }
    stats_.windows_closed += closed.size();
    open_.clear();

    sort_windows(closed);
    return closed;
}

bool PressureAggregator::is_open(const InstrumentKey& key) const {
    return open_.contains(key);
}

std::optional<PressureWindow> PressureAggregator::open_window(const InstrumentKey& key) const {
    auto it = open_.find(key);
    if (it == open_.end()) {
        return std::nullopt;
    }
    return it->second.window;
}

std::size_t PressureAggregator::active_keys() const noexcept {
    return open_.size();
}

const AggregatorStats& PressureAggregator::stats() const noexcept {
    return stats_;
}

TimestampMs PressureAggregator::bucket_start(TimestampMs ts) const noexcept {
    TimestampMs remainder = ts % window_ms_;
    if (remainder < 0) {
        remainder += window_ms_;
    }
    return ts - remainder;
}

PressureWindow PressureAggregator::make_window(const InstrumentKey& key, TimestampMs start) const {
    PressureWindow window;
    window.key = key;
    window.window_start = start;
    window.window_end = start + window_ms_;
    return window;
}

void PressureAggregator::accumulate(PressureWindow& window, const Event& event) {
    switch (event.initiator) {
        case Initiator::Bid:
            window.bid_volume += event.size;
            break;
        case Initiator::Ask:
            window.ask_volume += event.size;
            break;
        case Initiator::None:
            window.unclassified_volume += event.size;
            break;
    }

    if (window.trade_count == 0) {
        window.open_price = event.price;
        window.high_price = event.price;
        window.low_price = event.price;
    } else {
        window.high_price = std::max(window.high_price, event.price);
        window.low_price = std::min(window.low_price, event.price);
    }

    // Close follows event time, not arrival order within the bucket
    if (event.timestamp >= window.last_event_time) {
        window.close_price = event.price;
        window.last_event_time = event.timestamp;
    }

    window.notional += event.price * event.size;
    ++window.trade_count;
}

void PressureAggregator::sort_windows(std::vector<PressureWindow>& windows) {
    std::sort(windows.begin(), windows.end(), [](const PressureWindow& a, const PressureWindow& b) {
        if (a.window_start != b.window_start) {
            return a.window_start < b.window_start;
        }
        return a.key < b.key;
    });
}

}  // namespace flowscope
