#include "baseline/running_stats.hpp"
#include <algorithm>
#include <cmath>

namespace flowscope {

void RunningStats::add(double value) noexcept {
    if (count_ == 0) {
        min_ = value;
        max_ = value;
    } else {
        min_ = std::min(min_, value);
        max_ = std::max(max_, value);
    }

    ++count_;
    double delta = value - mean_;
    mean_ += delta / static_cast<double>(count_);
    double delta2 = value - mean_;
    m2_ += delta * delta2;
}

void RunningStats::merge(const RunningStats& other) noexcept {
    if (other.count_ == 0) {
        return;
    }
    if (count_ == 0) {
        *this = other;
        return;
    }

    const double n_a = static_cast<double>(count_);
    const double n_b = static_cast<double>(other.count_);
    const double n = n_a + n_b;
    const double delta = other.mean_ - mean_;

    mean_ += delta * n_b / n;
    m2_ += other.m2_ + delta * delta * n_a * n_b / n;
    count_ += other.count_;
    min_ = std::min(min_, other.min_);
    max_ = std::max(max_, other.max_);
}

void RunningStats::clear() noexcept {
    *this = RunningStats{};
}

double RunningStats::variance() const noexcept {
    if (count_ < 2) {
        return 0.0;
    }
    // Clamp tiny negatives from cancellation
    return std::max(m2_ / static_cast<double>(count_), 0.0);
}

double RunningStats::std_dev() const noexcept {
    return std::sqrt(variance());
}

RunningStats RunningStats::from_moments(std::size_t count, double mean, double m2,
                                        double min, double max) noexcept {
    RunningStats stats;
    if (count == 0) {
        return stats;
    }
    stats.count_ = count;
    stats.mean_ = mean;
    stats.m2_ = std::max(m2, 0.0);
    stats.min_ = min;
    stats.max_ = max;
    return stats;
}

Reservoir::Reservoir(std::size_t capacity, std::uint32_t seed)
    : capacity_(capacity)
    , rng_(seed)
{
    values_.reserve(capacity_);
}

void Reservoir::add(double value) {
    ++seen_;
    if (values_.size() < capacity_) {
        values_.push_back(value);
        return;
    }

    std::uniform_int_distribution<std::uint64_t> dist(0, seen_ - 1);
    std::uint64_t slot = dist(rng_);
    if (slot < capacity_) {
        values_[static_cast<std::size_t>(slot)] = value;
    }
}

void Reservoir::clear() {
    values_.clear();
    seen_ = 0;
}

void Reservoir::restore(std::vector<double> values, std::uint64_t seen) {
    if (values.size() > capacity_) {
        values.resize(capacity_);
    }
    values_ = std::move(values);
    seen_ = std::max<std::uint64_t>(seen, values_.size());
}

double interpolate_percentile(const std::vector<double>& sorted, double pct) noexcept {
    if (sorted.empty()) {
        return 0.0;
    }
    if (sorted.size() == 1) {
        return sorted.front();
    }

    pct = std::clamp(pct, 0.0, 100.0);
    double index = pct / 100.0 * static_cast<double>(sorted.size() - 1);
    auto lower = static_cast<std::size_t>(index);
    std::size_t upper = std::min(lower + 1, sorted.size() - 1);
    double fraction = index - static_cast<double>(lower);

    return sorted[lower] * (1.0 - fraction) + sorted[upper] * fraction;
}

}  // namespace flowscope
