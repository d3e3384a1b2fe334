#pragma once

#include "core/config.hpp"
#include "engine/signal_algorithm.hpp"

namespace flowscope {

/// Reference algorithm: raw ask/bid volume ratio against fixed thresholds
///
/// No baseline, no market-making adjustment and no coordination bonus.
/// confidence = min(1, ratio / (2 * min_ratio)), classified with the
/// same cutoffs as the institutional engine. Stateless between batches.
class VolumeRatioAlgorithm final : public SignalAlgorithm {
public:
    /// @throws ConfigError if config fails validation
    explicit VolumeRatioAlgorithm(const Config& config);

    [[nodiscard]] std::string_view name() const noexcept override { return kVolumeRatioAlgorithm; }

    [[nodiscard]] std::vector<Signal> evaluate(const std::vector<PressureWindow>& batch) override;

    [[nodiscard]] double confidence_for(double pressure_ratio) const noexcept;

private:
    Config::Comparison thresholds_;
    Config::Scoring scoring_;
};

}  // namespace flowscope
