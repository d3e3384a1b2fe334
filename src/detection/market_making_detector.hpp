#pragma once

#include "aggregator/pressure_window.hpp"
#include "coordination/coordination_index.hpp"
#include "core/config.hpp"
#include "detection/recent_history.hpp"
#include <cstdint>
#include <string_view>
#include <vector>

namespace flowscope {

/// Advice on whether a window looks like inventory management
enum class FilterRecommendation : std::uint8_t {
    Accept,
    Monitor,
    Reject
};

[[nodiscard]] inline std::string_view to_string(FilterRecommendation recommendation) noexcept {
    switch (recommendation) {
        case FilterRecommendation::Accept: return "ACCEPT";
        case FilterRecommendation::Monitor: return "MONITOR";
        case FilterRecommendation::Reject: return "REJECT";
    }
    return "ACCEPT";
}

/// Market-making evidence for one window
struct MarketMakingAssessment {
    double straddle_probability{0.0};
    bool straddle_detected{false};

    bool volatility_crush{false};
    double volatility_crush_probability{0.0};
    double call_price_change_pct{0.0};
    double put_price_change_pct{0.0};

    double score{0.0};  // Combined, in [0, 1]
    FilterRecommendation filter_recommendation{FilterRecommendation::Accept};
    double institutional_likelihood{1.0};  // 1 - score
};

/// Detects price-neutral activity: straddles and volatility crush
/// Stateless; every input is passed to assess().
class MarketMakingDetector {
public:
    explicit MarketMakingDetector(const Config::MarketMaking& config);

    /// Assess a window against the batch and the recent history
    /// @param window Window being evaluated
    /// @param history Recently evaluated windows, all keys
    /// @param batch Index over the current evaluation batch
    [[nodiscard]] MarketMakingAssessment assess(const PressureWindow& window,
                                                const RecentHistory& history,
                                                const CoordinationIndex& batch) const;

    /// Best opposite-side match at the same strike, 0 if none qualifies
    [[nodiscard]] double straddle_probability(const PressureWindow& window,
                                              const RecentHistory& history,
                                              const CoordinationIndex& batch) const;

    /// Fills the volatility crush fields of an assessment
    void assess_volatility_crush(const PressureWindow& window,
                                 const RecentHistory& history,
                                 const CoordinationIndex& batch,
                                 MarketMakingAssessment& assessment) const;

    [[nodiscard]] const Config::MarketMaking& config() const noexcept { return config_; }

private:
    [[nodiscard]] double candidate_score(const PressureWindow& window,
                                         const PressureWindow& candidate) const noexcept;

    Config::MarketMaking config_;
};

/// Premium change of one option side across a set of windows
struct SideChange {
    double pct{0.0};
    bool has_data{false};
};

/// Percent change from the earliest window's open to the latest window's close
[[nodiscard]] SideChange side_price_change(std::vector<const PressureWindow*> windows);

}  // namespace flowscope
