#include "engine/signal_engine.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace flowscope {

namespace {

const Config& validated(const Config& config) {
    if (auto problem = config.validate()) {
        throw ConfigError(*problem);
    }
    return config;
}

}  // namespace

std::string_view to_string(KeyState state) noexcept {
    switch (state) {
        case KeyState::Idle: return "IDLE";
        case KeyState::WindowOpen: return "WINDOW_OPEN";
        case KeyState::WindowClosed: return "WINDOW_CLOSED";
        case KeyState::Scored: return "SCORED";
        case KeyState::Emitted: return "EMITTED";
        case KeyState::Suppressed: return "SUPPRESSED";
    }
    return "IDLE";
}

std::string_view to_string(SuppressionReason reason) noexcept {
    switch (reason) {
        case SuppressionReason::PressureBelowMinimum: return "pressure_below_minimum";
        case SuppressionReason::VolumeBelowMinimum: return "volume_below_minimum";
        case SuppressionReason::DataQualityBelowMinimum: return "data_quality_below_minimum";
        case SuppressionReason::BaselineQualityBelowMinimum: return "baseline_quality_below_minimum";
        case SuppressionReason::ConfidenceBelowFloor: return "confidence_below_floor";
        case SuppressionReason::ComputationFailure: return "computation_failure";
    }
    return "unknown";
}

std::size_t EngineStats::suppressed_total() const noexcept {
    return std::accumulate(suppressed.begin(), suppressed.end(), std::size_t{0});
}

SignalEngine::SignalEngine(const Config& config, BaselineStore& store)
    : config_(validated(config))
    , store_(store)
    , detector_(config.market_making)
    , scorer_(config)
    , history_(std::chrono::duration_cast<std::chrono::milliseconds>(config.engine.history).count(),
               config.engine.history_capacity)
{}

std::vector<Signal> SignalEngine::evaluate(const std::vector<PressureWindow>& batch) {
    diagnostics_.clear();
    ++stats_.batches;

    std::vector<PressureWindow> ordered(batch);
    std::stable_sort(ordered.begin(), ordered.end(), [](const PressureWindow& a, const PressureWindow& b) {
        if (a.window_start != b.window_start) {
            return a.window_start < b.window_start;
        }
        return a.key < b.key;
    });

    CoordinationIndex index;
    try {
        index.rebuild(ordered);
    } catch (const std::exception& e) {
        // Score without cross-strike context rather than dropping the batch
        spdlog::error("Coordination index build failed for batch of {}: {}", ordered.size(), e.what());
        index = CoordinationIndex{};
    }

    std::vector<Signal> signals;
    for (const auto& window : ordered) {
        ++stats_.windows_evaluated;
        states_[window.key] = KeyState::WindowClosed;

        try {
            Outcome outcome = evaluate_window(window, index);

            store_.record(window);
            history_.push(window);

            if (outcome.signal) {
                states_[window.key] = KeyState::Emitted;
                ++stats_.signals_emitted;
                signals.push_back(std::move(*outcome.signal));
            } else if (outcome.suppression) {
                record_suppression(std::move(*outcome.suppression));
            }
        } catch (const std::exception& e) {
            const Error error{ErrorKind::ComputationFailure, e.what()};
            spdlog::error("Evaluation failed for {}: {}", to_string(window.key), error.describe());
            ++stats_.failures;
            record_suppression(SuppressionDiagnostic{
                .key = window.key,
                .window_start = window.window_start,
                .reason = SuppressionReason::ComputationFailure,
                .data_quality = 0.0,
                .window_completeness = window.data_completeness(),
                .confidence = 0.0,
                .detail = error.message
            });
        }
    }

    return signals;
}

SignalEngine::Outcome SignalEngine::evaluate_window(const PressureWindow& window,
                                                    const CoordinationIndex& index) {
    const double ratio = window.pressure_ratio();
    if (!std::isfinite(ratio) || window.bid_volume < 0.0 || window.ask_volume < 0.0 ||
        window.window_end <= window.window_start) {
        throw std::domain_error("malformed window at " + std::to_string(window.window_start));
    }

    const BaselineContext baseline = store_.get(window.key);
    const MarketMakingAssessment mm = detector_.assess(window, history_, index);

    Outcome outcome;
    if (auto reason = check_gates(window, baseline)) {
        states_[window.key] = KeyState::Suppressed;
        outcome.suppression = SuppressionDiagnostic{
            .key = window.key,
            .window_start = window.window_start,
            .reason = *reason,
            .data_quality = baseline.data_quality,
            .window_completeness = window.data_completeness(),
            .confidence = 0.0,
            .detail = {}
        };
        return outcome;
    }

    const ConfidenceBreakdown score = scorer_.score(window, baseline, mm, &index, &history_);
    states_[window.key] = KeyState::Scored;

    if (score.strength == StrengthClass::None) {
        states_[window.key] = KeyState::Suppressed;
        outcome.suppression = SuppressionDiagnostic{
            .key = window.key,
            .window_start = window.window_start,
            .reason = SuppressionReason::ConfidenceBelowFloor,
            .data_quality = baseline.data_quality,
            .window_completeness = window.data_completeness(),
            .confidence = score.confidence,
            .detail = mm.straddle_detected ? "market-making pattern" : ""
        };
        return outcome;
    }

    outcome.signal = make_signal(window, baseline, mm, score);
    return outcome;
}

std::optional<SuppressionReason> SignalEngine::check_gates(const PressureWindow& window,
                                                           const BaselineContext& baseline) const {
    const auto& gates = config_.gates;
    if (window.pressure_ratio() < gates.min_pressure_ratio) {
        return SuppressionReason::PressureBelowMinimum;
    }
    if (window.total_volume() < gates.min_volume) {
        return SuppressionReason::VolumeBelowMinimum;
    }
    if (window.data_completeness() < gates.min_data_quality) {
        return SuppressionReason::DataQualityBelowMinimum;
    }
    if (baseline.data_quality < gates.min_baseline_quality) {
        return SuppressionReason::BaselineQualityBelowMinimum;
    }
    return std::nullopt;
}

Signal SignalEngine::make_signal(const PressureWindow& window,
                                 const BaselineContext& baseline,
                                 const MarketMakingAssessment& mm,
                                 const ConfidenceBreakdown& score) const {
    const double ratio = window.pressure_ratio();

    Signal signal;
    signal.key = window.key;
    signal.timestamp = window.window_end;
    signal.window_start = window.window_start;

    signal.pressure_ratio = ratio;
    signal.bid_volume = window.bid_volume;
    signal.ask_volume = window.ask_volume;
    signal.total_volume = window.total_volume();
    signal.dominant_side = window.dominant_side();

    signal.z_score = baseline.z_score(ratio, config_.baseline.z_epsilon);
    signal.percentile_rank = baseline.percentile_rank(ratio);
    signal.baseline_quality = baseline.data_quality;

    signal.market_making_score = mm.score;
    signal.straddle_detected = mm.straddle_detected;
    signal.volatility_crush = mm.volatility_crush;

    signal.confidence = score.confidence;
    signal.strength = score.strength;
    signal.components = score;

    signal.direction = direction_for(window.key.side);
    signal.action = action_for(score.strength);
    signal.risk_score = 1.0 - score.confidence;
    signal.position_size_multiplier = position_size_multiplier(score.strength);
    signal.algorithm = std::string(name());
    return signal;
}

void SignalEngine::record_suppression(SuppressionDiagnostic diagnostic) {
    states_[diagnostic.key] = KeyState::Suppressed;
    ++stats_.suppressed[static_cast<std::size_t>(diagnostic.reason)];

    diagnostics_.push_back(std::move(diagnostic));
}

void SignalEngine::mark_window_open(const InstrumentKey& key) {
    states_[key] = KeyState::WindowOpen;
}

KeyState SignalEngine::key_state(const InstrumentKey& key) const {
    auto it = states_.find(key);
    return it != states_.end() ? it->second : KeyState::Idle;
}

}  // namespace flowscope
