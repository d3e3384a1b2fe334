#pragma once

#include "aggregator/pressure_window.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace flowscope {

/// Index range [first, last) of the ascending strikes lying in [low, high]
///
/// Two binary searches, so the number of comparisons grows with log2(n)
/// regardless of how many strikes fall in the range.
template <typename Less = std::less<Strike>>
[[nodiscard]] std::pair<std::size_t, std::size_t> strike_range(const std::vector<Strike>& strikes,
                                                               Strike low, Strike high,
                                                               Less less = Less{}) {
    auto first = std::lower_bound(strikes.begin(), strikes.end(), low, less);
    auto last = std::upper_bound(first, strikes.end(), high, less);
    return {static_cast<std::size_t>(first - strikes.begin()),
            static_cast<std::size_t>(last - strikes.begin())};
}

/// Strike-sorted view of one evaluation batch
///
/// Built once per batch in O(n log n) and read-only afterwards, so any
/// number of scoring threads may query it concurrently. Lookups are two
/// binary searches for the strike bounds plus a scan of the matching slice.
class CoordinationIndex {
public:
    CoordinationIndex() = default;

    explicit CoordinationIndex(std::vector<PressureWindow> windows);

    /// Replace the contents with a new batch
    void rebuild(std::vector<PressureWindow> windows);

    /// Windows whose strike lies within [strike - radius, strike + radius]
    /// Ordered by strike, then side, then window start.
    [[nodiscard]] std::vector<const PressureWindow*> nearby(Strike strike, double radius) const;

    /// As nearby(), restricted to windows starting within max_offset of around
    [[nodiscard]] std::vector<const PressureWindow*> nearby(Strike strike, double radius,
                                                            TimestampMs around,
                                                            TimestampMs max_offset) const;

    /// Number of windows within the strike radius, without materializing them
    [[nodiscard]] std::size_t count_nearby(Strike strike, double radius) const;

    [[nodiscard]] std::size_t size() const noexcept { return windows_.size(); }
    [[nodiscard]] bool empty() const noexcept { return windows_.empty(); }

    /// Indexed windows in strike order
    [[nodiscard]] const std::vector<PressureWindow>& windows() const noexcept { return windows_; }

    /// Indexed strikes, ascending
    [[nodiscard]] const std::vector<Strike>& strikes() const noexcept { return strikes_; }

private:
    struct Range {
        std::size_t first{0};
        std::size_t last{0};  // Exclusive
    };

    [[nodiscard]] Range slice(Strike strike, double radius) const;

    std::vector<PressureWindow> windows_;
    std::vector<Strike> strikes_;  // strikes_[i] == windows_[i].key.strike
};

}  // namespace flowscope
