#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>
#include <vector>

namespace flowscope {

/// Welford online mean/variance with Chan's parallel merge
class RunningStats {
public:
    void add(double value) noexcept;

    /// Fold another accumulator into this one
    void merge(const RunningStats& other) noexcept;

    void clear() noexcept;

    [[nodiscard]] std::size_t count() const noexcept { return count_; }
    [[nodiscard]] double mean() const noexcept { return count_ == 0 ? 0.0 : mean_; }

    /// Population variance (0 with fewer than two samples)
    [[nodiscard]] double variance() const noexcept;
    [[nodiscard]] double std_dev() const noexcept;

    [[nodiscard]] double min() const noexcept { return count_ == 0 ? 0.0 : min_; }
    [[nodiscard]] double max() const noexcept { return count_ == 0 ? 0.0 : max_; }

    /// Sum of squared deviations, exposed for persistence
    [[nodiscard]] double m2() const noexcept { return m2_; }

    /// Rebuild from persisted moments
    static RunningStats from_moments(std::size_t count, double mean, double m2,
                                     double min, double max) noexcept;

private:
    std::size_t count_{0};
    double mean_{0.0};
    double m2_{0.0};
    double min_{0.0};
    double max_{0.0};
};

/// Fixed-capacity uniform sample of a stream (Algorithm R)
class Reservoir {
public:
    explicit Reservoir(std::size_t capacity, std::uint32_t seed = 0x5eed);

    void add(double value);

    void clear();

    [[nodiscard]] const std::vector<double>& values() const noexcept { return values_; }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// Number of values offered since the last clear
    [[nodiscard]] std::uint64_t seen() const noexcept { return seen_; }

    /// Restore persisted contents without resampling
    void restore(std::vector<double> values, std::uint64_t seen);

private:
    std::size_t capacity_;
    std::vector<double> values_;
    std::uint64_t seen_{0};
    std::mt19937 rng_;
};

/// Linearly interpolated percentile of an ascending-sorted sample
/// @param sorted Values in ascending order
/// @param pct Percentile in [0, 100]
[[nodiscard]] double interpolate_percentile(const std::vector<double>& sorted, double pct) noexcept;

/// Per-(key, UTC day) statistics, the unit of persistence
struct DayAggregate {
    DayIndex day{0};
    RunningStats stats;
    std::vector<double> samples;
    std::uint64_t samples_seen{0};
};

}  // namespace flowscope
