#include "detection/market_making_detector.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace flowscope {

namespace {

double clamp01(double value) noexcept {
    return std::clamp(value, 0.0, 1.0);
}

}  // namespace

SideChange side_price_change(std::vector<const PressureWindow*> windows) {
    windows.erase(std::remove_if(windows.begin(), windows.end(),
                                 [](const PressureWindow* w) { return w->open_price <= 0.0; }),
                  windows.end());
    if (windows.empty()) {
        return SideChange{};
    }

    auto [first, last] = std::minmax_element(
        windows.begin(), windows.end(),
        [](const PressureWindow* a, const PressureWindow* b) { return a->window_start < b->window_start; });

    const double open = (*first)->open_price;
    const double close = (*last)->close_price;
    return SideChange{.pct = (close - open) / open * 100.0, .has_data = true};
}

MarketMakingDetector::MarketMakingDetector(const Config::MarketMaking& config)
    : config_(config)
{}

MarketMakingAssessment MarketMakingDetector::assess(const PressureWindow& window,
                                                    const RecentHistory& history,
                                                    const CoordinationIndex& batch) const {
    MarketMakingAssessment assessment;

    assessment.straddle_probability = straddle_probability(window, history, batch);
    assessment.straddle_detected = assessment.straddle_probability > 0.0;

    assess_volatility_crush(window, history, batch, assessment);

    assessment.score = clamp01(config_.straddle_weight * assessment.straddle_probability +
                               config_.crush_weight * assessment.volatility_crush_probability);
    assessment.institutional_likelihood = 1.0 - assessment.score;

    const double max_prob = config_.max_market_making_probability;
    if (assessment.score > max_prob) {
        assessment.filter_recommendation = FilterRecommendation::Reject;
    } else if (assessment.score > max_prob * 0.7) {
        assessment.filter_recommendation = FilterRecommendation::Monitor;
    } else {
        assessment.filter_recommendation = FilterRecommendation::Accept;
    }

    return assessment;
}

double MarketMakingDetector::candidate_score(const PressureWindow& window,
                                             const PressureWindow& candidate) const noexcept {
    const TimestampMs offset_ms = config_.straddle_time_offset.count();
    const TimestampMs dt = std::abs(candidate.window_start - window.window_start);
    if (dt > offset_ms) {
        return 0.0;
    }

    const double v1 = window.total_volume();
    const double v2 = candidate.total_volume();
    if (v1 <= 0.0 || v2 <= 0.0) {
        return 0.0;
    }

    const double volume_balance = 2.0 * std::min(v1, v2) / (v1 + v2);
    if (volume_balance < config_.min_volume_balance) {
        return 0.0;
    }

    const double time_score = offset_ms > 0
        ? 1.0 - static_cast<double>(dt) / static_cast<double>(offset_ms)
        : 1.0;

    return clamp01(config_.balance_weight * volume_balance + config_.time_weight * time_score);
}

double MarketMakingDetector::straddle_probability(const PressureWindow& window,
                                                  const RecentHistory& history,
                                                  const CoordinationIndex& batch) const {
    const InstrumentKey opposite = window.key.opposite();
    double best = 0.0;

    for (const PressureWindow* candidate : batch.nearby(window.key.strike, 0.0)) {
        if (candidate->key == opposite) {
            best = std::max(best, candidate_score(window, *candidate));
        }
    }
    for (const PressureWindow* candidate : history.for_strike(window.key.strike)) {
        if (candidate->key == opposite) {
            best = std::max(best, candidate_score(window, *candidate));
        }
    }
    return best;
}

void MarketMakingDetector::assess_volatility_crush(const PressureWindow& window,
                                                   const RecentHistory& history,
                                                   const CoordinationIndex& batch,
                                                   MarketMakingAssessment& assessment) const {
    std::vector<const PressureWindow*> calls;
    std::vector<const PressureWindow*> puts;
    std::set<std::pair<OptionSide, TimestampMs>> seen;

    auto consider = [&](const PressureWindow* w) {
        if (!seen.emplace(w->key.side, w->window_start).second) {
            return;
        }
        (w->key.side == OptionSide::Call ? calls : puts).push_back(w);
    };

    consider(&window);
    for (const PressureWindow* w : batch.nearby(window.key.strike, 0.0)) {
        consider(w);
    }
    for (const PressureWindow* w : history.for_strike(window.key.strike)) {
        consider(w);
    }

    const SideChange call_change = side_price_change(std::move(calls));
    const SideChange put_change = side_price_change(std::move(puts));
    assessment.call_price_change_pct = call_change.pct;
    assessment.put_price_change_pct = put_change.pct;

    if (!call_change.has_data || !put_change.has_data) {
        return;
    }

    const double threshold = config_.crush_decline_pct;
    const double magnitude = std::abs(threshold);
    const double smaller_decline = std::min(std::abs(call_change.pct), std::abs(put_change.pct));

    if (call_change.pct <= threshold && put_change.pct <= threshold) {
        assessment.volatility_crush = true;
        assessment.volatility_crush_probability = std::min(1.0, 0.5 + smaller_decline / (4.0 * magnitude));
    } else if (call_change.pct < 0.0 && put_change.pct < 0.0) {
        assessment.volatility_crush_probability = clamp01(0.5 * smaller_decline / magnitude);
    }
}

}  // namespace flowscope
