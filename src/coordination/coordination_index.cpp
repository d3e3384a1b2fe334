#include "coordination/coordination_index.hpp"
#include <algorithm>
#include <cmath>

namespace flowscope {

CoordinationIndex::CoordinationIndex(std::vector<PressureWindow> windows) {
    rebuild(std::move(windows));
}

void CoordinationIndex::rebuild(std::vector<PressureWindow> windows) {
    windows_ = std::move(windows);

    // Non-finite strikes cannot be ordered
    windows_.erase(std::remove_if(windows_.begin(), windows_.end(),
                                  [](const PressureWindow& w) {
                                      return !std::isfinite(w.key.strike);
                                  }),
                   windows_.end());

    std::sort(windows_.begin(), windows_.end(), [](const PressureWindow& a, const PressureWindow& b) {
        if (a.key.strike != b.key.strike) {
            return a.key.strike < b.key.strike;
        }
        if (a.key.side != b.key.side) {
            return a.key.side < b.key.side;
        }
        return a.window_start < b.window_start;
    });

    strikes_.clear();
    strikes_.reserve(windows_.size());
    for (const auto& window : windows_) {
        strikes_.push_back(window.key.strike);
    }
}

CoordinationIndex::Range CoordinationIndex::slice(Strike strike, double radius) const {
    if (!std::isfinite(strike) || !(radius >= 0.0)) {
        return Range{};
    }

    const auto [first, last] = strike_range(strikes_, strike - radius, strike + radius);
    return Range{first, last};
}

std::vector<const PressureWindow*> CoordinationIndex::nearby(Strike strike, double radius) const {
    const Range range = slice(strike, radius);

    std::vector<const PressureWindow*> result;
    result.reserve(range.last - range.first);
    for (std::size_t i = range.first; i < range.last; ++i) {
        result.push_back(&windows_[i]);
    }
    return result;
}

std::vector<const PressureWindow*> CoordinationIndex::nearby(Strike strike, double radius,
                                                             TimestampMs around,
                                                             TimestampMs max_offset) const {
    const Range range = slice(strike, radius);

    std::vector<const PressureWindow*> result;
    for (std::size_t i = range.first; i < range.last; ++i) {
        const TimestampMs offset = windows_[i].window_start - around;
        if (offset <= max_offset && offset >= -max_offset) {
            result.push_back(&windows_[i]);
        }
    }
    return result;
}

std::size_t CoordinationIndex::count_nearby(Strike strike, double radius) const {
    const Range range = slice(strike, radius);
    return range.last - range.first;
}

}  // namespace flowscope
