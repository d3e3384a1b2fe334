#pragma once

#include "aggregator/pressure_window.hpp"
#include "baseline/baseline_context.hpp"
#include "coordination/coordination_index.hpp"
#include "core/config.hpp"
#include "detection/market_making_detector.hpp"
#include "scoring/signal.hpp"
#include "detection/recent_history.hpp"
#include <cstddef>
#include <vector>

namespace flowscope {

/// Combines pressure, baseline deviation, market-making evidence and
/// cross-strike coordination into a confidence in [0, 1]
///
/// confidence = wp * pressure + wb * deviation - wm * mm + bonus
///
/// The pressure term blends the window's ratio significance and volume
/// concentration with the key's recent trend and persistence. Both
/// positive terms saturate so a single extreme input cannot carry the
/// score on its own.
class ConfidenceScorer {
public:
    /// Trend and persistence when the key has no earlier window in view
    static constexpr double kNeutralProfile = 0.5;

    explicit ConfidenceScorer(const Config& config);

    /// Score a gated window
    /// Returns confidence 0 and StrengthClass::None if the window fails the
    /// volume or data-completeness gate.
    /// @param batch Current batch index for the coordination bonus, may be null
    /// @param history Recently evaluated windows for the trend and
    ///        persistence terms, may be null
    [[nodiscard]] ConfidenceBreakdown score(const PressureWindow& window,
                                            const BaselineContext& baseline,
                                            const MarketMakingAssessment& mm,
                                            const CoordinationIndex* batch = nullptr,
                                            const RecentHistory* history = nullptr) const;

    /// 1 - exp(-(ratio - 1) / (min_interest - 1)), 0 at or below parity
    [[nodiscard]] double pressure_significance(double pressure_ratio) const noexcept;

    /// Pressure ratios of the key's latest earlier windows, oldest first,
    /// followed by the window itself
    [[nodiscard]] std::vector<double> recent_ratios(const PressureWindow& window,
                                                    const RecentHistory* history) const;

    /// Least-squares slope of the ratios per window, scaled to [0, 1]
    /// Falling or flat pressure scores 0.
    [[nodiscard]] double trend_strength(const std::vector<double>& ratios) const noexcept;

    /// Share of volume on the dominant side, 0 when balanced and 1 when one-sided
    [[nodiscard]] static double volume_concentration(const PressureWindow& window) noexcept;

    /// Fraction of the ratios at or above the minimum-pressure gate
    [[nodiscard]] double time_persistence(const std::vector<double>& ratios) const noexcept;

    /// Weighted mean of the four pressure components
    [[nodiscard]] double pressure_term(double significance, double trend,
                                       double concentration, double persistence) const noexcept;

    /// tanh(z / saturation) scaled by baseline quality, 0 for z <= 0
    [[nodiscard]] double baseline_deviation(double z_score, Percentage data_quality) const noexcept;

    [[nodiscard]] double coordination_bonus(std::size_t peers) const noexcept;

    /// Same-side windows near the strike with elevated same-direction pressure
    [[nodiscard]] std::size_t coordinated_peers(const PressureWindow& window,
                                                const CoordinationIndex& batch) const;

    /// Bucket a confidence; a value equal to a cutoff takes the lower class
    [[nodiscard]] StrengthClass classify(double confidence) const noexcept;

    /// Volume and data-completeness gates
    [[nodiscard]] bool passes_guards(const PressureWindow& window) const noexcept;

private:
    Config::Scoring scoring_;
    Config::Gates gates_;
    Config::Coordination coordination_;
    double z_epsilon_;
};

/// Bucket a confidence against the configured cutoffs
/// A confidence exactly equal to a cutoff falls into the lower class.
[[nodiscard]] StrengthClass classify_confidence(const Config::Scoring& scoring, double confidence) noexcept;

}  // namespace flowscope
