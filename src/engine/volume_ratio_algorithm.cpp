#include "engine/volume_ratio_algorithm.hpp"
#include "core/errors.hpp"
#include "scoring/confidence_scorer.hpp"
#include <algorithm>
#include <cmath>

namespace flowscope {

VolumeRatioAlgorithm::VolumeRatioAlgorithm(const Config& config)
    : thresholds_(config.comparison)
    , scoring_(config.scoring)
{
    if (auto problem = config.validate()) {
        throw ConfigError(*problem);
    }
}

double VolumeRatioAlgorithm::confidence_for(double pressure_ratio) const noexcept {
    return std::min(1.0, pressure_ratio / (2.0 * thresholds_.reference_min_ratio));
}

std::vector<Signal> VolumeRatioAlgorithm::evaluate(const std::vector<PressureWindow>& batch) {
    std::vector<Signal> signals;

    for (const auto& window : batch) {
        const double ratio = window.pressure_ratio();
        if (!std::isfinite(ratio) || ratio < thresholds_.reference_min_ratio) {
            continue;
        }
        if (window.total_volume() < thresholds_.reference_min_volume) {
            continue;
        }

        const double confidence = confidence_for(ratio);
        const StrengthClass strength = classify_confidence(scoring_, confidence);
        if (strength == StrengthClass::None) {
            continue;
        }

        Signal signal;
        signal.key = window.key;
        signal.timestamp = window.window_end;
        signal.window_start = window.window_start;
        signal.pressure_ratio = ratio;
        signal.bid_volume = window.bid_volume;
        signal.ask_volume = window.ask_volume;
        signal.total_volume = window.total_volume();
        signal.dominant_side = window.dominant_side();
        signal.confidence = confidence;
        signal.strength = strength;
        signal.components.confidence = confidence;
        signal.components.strength = strength;
        signal.direction = direction_for(window.key.side);
        signal.action = action_for(strength);
        signal.risk_score = 1.0 - confidence;
        signal.position_size_multiplier = position_size_multiplier(strength);
        signal.algorithm = std::string(name());
        signals.push_back(std::move(signal));
    }

    std::sort(signals.begin(), signals.end(), [](const Signal& a, const Signal& b) {
        if (a.window_start != b.window_start) {
            return a.window_start < b.window_start;
        }
        return a.key < b.key;
    });
    return signals;
}

}  // namespace flowscope
