#pragma once

#include "core/types.hpp"
#include <algorithm>
#include <array>
#include <cstddef>

namespace flowscope {

/// Percentile levels kept in every ladder
inline constexpr std::array<double, 7> kPercentileLevels{10.0, 25.0, 50.0, 75.0, 90.0, 95.0, 99.0};

using PercentileLadder = std::array<double, kPercentileLevels.size()>;

/// Summary of the trailing lookback for one key
/// Published as an immutable snapshot; never mutated after construction
struct BaselineContext {
    InstrumentKey key;
    double mean{0.0};
    double std_dev{0.0};
    double min{0.0};
    double max{0.0};
    PercentileLadder percentiles{};  // Non-decreasing
    Percentage data_quality{0.0};
    std::size_t sample_count{0};
    int lookback_days{0};
    bool is_default{true};   // No history recorded yet
    bool memory_only{false}; // Persistence unavailable
    TimestampMs last_window_start{0};

    /// (value - mean) / max(std, epsilon)
    [[nodiscard]] double z_score(double value, double epsilon = 1e-6) const noexcept {
        return (value - mean) / std::max(std_dev, epsilon);
    }

    /// Position of value within the ladder, 0-100
    [[nodiscard]] double percentile_rank(double value) const noexcept {
        if (value <= percentiles.front()) {
            const double floor = std::min(min, percentiles.front());
            const double span = percentiles.front() - floor;
            if (span <= 0.0) {
                return value < percentiles.front() ? 0.0 : kPercentileLevels.front();
            }
            return std::max(0.0, (value - floor) / span) * kPercentileLevels.front();
        }

        for (std::size_t i = 1; i < percentiles.size(); ++i) {
            if (value <= percentiles[i]) {
                const double span = percentiles[i] - percentiles[i - 1];
                const double fraction = span > 0.0 ? (value - percentiles[i - 1]) / span : 1.0;
                return kPercentileLevels[i - 1] +
                       fraction * (kPercentileLevels[i] - kPercentileLevels[i - 1]);
            }
        }

        const double ceiling = std::max(max, percentiles.back());
        const double span = ceiling - percentiles.back();
        if (span <= 0.0 || value >= ceiling) {
            return 100.0;
        }
        return kPercentileLevels.back() +
               (value - percentiles.back()) / span * (100.0 - kPercentileLevels.back());
    }
};

}  // namespace flowscope
