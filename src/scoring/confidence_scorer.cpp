#include "scoring/confidence_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace flowscope {

ConfidenceScorer::ConfidenceScorer(const Config& config)
    : scoring_(config.scoring)
    , gates_(config.gates)
    , coordination_(config.coordination)
    , z_epsilon_(config.baseline.z_epsilon)
{}

ConfidenceBreakdown ConfidenceScorer::score(const PressureWindow& window,
                                            const BaselineContext& baseline,
                                            const MarketMakingAssessment& mm,
                                            const CoordinationIndex* batch,
                                            const RecentHistory* history) const {
    ConfidenceBreakdown result;
    if (!passes_guards(window)) {
        return result;
    }

    const double ratio = window.pressure_ratio();
    const double z = baseline.z_score(ratio, z_epsilon_);
    const std::vector<double> ratios = recent_ratios(window, history);

    result.pressure_significance = pressure_significance(ratio);
    result.trend_strength = trend_strength(ratios);
    result.volume_concentration = volume_concentration(window);
    result.time_persistence = time_persistence(ratios);
    result.pressure_term = pressure_term(result.pressure_significance, result.trend_strength,
                                         result.volume_concentration, result.time_persistence);
    result.baseline_deviation = baseline_deviation(z, baseline.data_quality);
    result.market_making_penalty = scoring_.market_making_weight * std::clamp(mm.score, 0.0, 1.0);
    if (batch != nullptr) {
        result.coordinated_peers = coordinated_peers(window, *batch);
    }
    result.coordination_bonus = coordination_bonus(result.coordinated_peers);

    const double raw = scoring_.pressure_weight * result.pressure_term +
                       scoring_.baseline_weight * result.baseline_deviation -
                       result.market_making_penalty +
                       result.coordination_bonus;

    result.confidence = std::isfinite(raw) ? std::clamp(raw, 0.0, 1.0) : 0.0;
    result.strength = classify(result.confidence);
    return result;
}

double ConfidenceScorer::pressure_significance(double pressure_ratio) const noexcept {
    const double excess = std::max(0.0, pressure_ratio - 1.0);
    return 1.0 - std::exp(-excess / (scoring_.min_interest_ratio - 1.0));
}

std::vector<double> ConfidenceScorer::recent_ratios(const PressureWindow& window,
                                                    const RecentHistory* history) const {
    std::vector<double> ratios;
    if (history != nullptr) {
        // Ordered by start, so the tail holds the latest earlier windows
        for (const PressureWindow* earlier : history->for_strike(window.key.strike)) {
            if (earlier->key == window.key && earlier->window_start < window.window_start) {
                ratios.push_back(earlier->pressure_ratio());
            }
        }
        const std::size_t keep = scoring_.profile_lookback_windows - 1;
        if (ratios.size() > keep) {
            ratios.erase(ratios.begin(), ratios.end() - static_cast<std::ptrdiff_t>(keep));
        }
    }
    ratios.push_back(window.pressure_ratio());
    return ratios;
}

double ConfidenceScorer::trend_strength(const std::vector<double>& ratios) const noexcept {
    if (ratios.size() < 2) {
        return kNeutralProfile;
    }

    // Slope of the best-fit line through (i, ratio_i)
    const double n = static_cast<double>(ratios.size());
    double sum_x = 0.0;
    double sum_y = 0.0;
    double sum_xy = 0.0;
    double sum_xx = 0.0;
    for (std::size_t i = 0; i < ratios.size(); ++i) {
        const double x = static_cast<double>(i);
        sum_x += x;
        sum_y += ratios[i];
        sum_xy += x * ratios[i];
        sum_xx += x * x;
    }
    const double slope = (n * sum_xy - sum_x * sum_y) / (n * sum_xx - sum_x * sum_x);
    if (!(slope > 0.0)) {
        return 0.0;
    }
    return std::min(1.0, slope / scoring_.trend_slope_saturation);
}

double ConfidenceScorer::volume_concentration(const PressureWindow& window) noexcept {
    const double total = window.total_volume();
    if (!(total > 0.0)) {
        return 0.0;
    }

    double share = 0.5;
    switch (window.dominant_side()) {
        case DominantSide::Buy: share = window.ask_volume / total; break;
        case DominantSide::Sell: share = window.bid_volume / total; break;
        case DominantSide::Neutral: break;
    }
    return std::clamp((share - 0.5) * 2.0, 0.0, 1.0);
}

double ConfidenceScorer::time_persistence(const std::vector<double>& ratios) const noexcept {
    if (ratios.size() < 2) {
        return kNeutralProfile;
    }
    const auto elevated = std::count_if(ratios.begin(), ratios.end(), [this](double r) {
        return r >= gates_.min_pressure_ratio;
    });
    return static_cast<double>(elevated) / static_cast<double>(ratios.size());
}

double ConfidenceScorer::pressure_term(double significance, double trend,
                                       double concentration, double persistence) const noexcept {
    const double total_weight = scoring_.significance_weight + scoring_.trend_weight +
                                scoring_.concentration_weight + scoring_.persistence_weight;
    const double blended = scoring_.significance_weight * significance +
                           scoring_.trend_weight * trend +
                           scoring_.concentration_weight * concentration +
                           scoring_.persistence_weight * persistence;
    return std::clamp(blended / total_weight, 0.0, 1.0);
}

double ConfidenceScorer::baseline_deviation(double z_score, Percentage data_quality) const noexcept {
    if (!(z_score > 0.0)) {
        return 0.0;
    }
    return std::tanh(z_score / scoring_.z_saturation) * std::clamp(data_quality, 0.0, 1.0);
}

double ConfidenceScorer::coordination_bonus(std::size_t peers) const noexcept {
    if (peers == 0) {
        return 0.0;
    }
    const double saturation = static_cast<double>(scoring_.coordination_saturation_peers);
    return scoring_.coordination_bonus_max * std::min(1.0, static_cast<double>(peers) / saturation);
}

std::size_t ConfidenceScorer::coordinated_peers(const PressureWindow& window,
                                                const CoordinationIndex& batch) const {
    const DominantSide direction = window.dominant_side();
    if (direction == DominantSide::Neutral) {
        return 0;
    }

    std::size_t peers = 0;
    const auto candidates = batch.nearby(window.key.strike,
                                         coordination_.strike_radius,
                                         window.window_start,
                                         coordination_.time_offset.count());
    for (const PressureWindow* peer : candidates) {
        if (peer->key == window.key || peer->key.side != window.key.side) {
            continue;
        }
        if (peer->dominant_side() != direction) {
            continue;
        }
        if (peer->pressure_ratio() >= gates_.min_pressure_ratio) {
            ++peers;
        }
    }
    return peers;
}

StrengthClass ConfidenceScorer::classify(double confidence) const noexcept {
    return classify_confidence(scoring_, confidence);
}

bool ConfidenceScorer::passes_guards(const PressureWindow& window) const noexcept {
    return window.total_volume() >= gates_.min_volume &&
           window.data_completeness() >= gates_.min_data_quality;
}

StrengthClass classify_confidence(const Config::Scoring& scoring, double confidence) noexcept {
    if (confidence > scoring.extreme_cutoff) {
        return StrengthClass::Extreme;
    }
    if (confidence > scoring.very_high_cutoff) {
        return StrengthClass::VeryHigh;
    }
    if (confidence > scoring.high_cutoff) {
        return StrengthClass::High;
    }
    if (confidence > scoring.moderate_cutoff) {
        return StrengthClass::Moderate;
    }
    return StrengthClass::None;
}

}  // namespace flowscope
