#pragma once

#include "aggregator/pressure_window.hpp"
#include "core/config.hpp"
#include "scoring/signal.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace flowscope {

class BaselineStore;

/// A way of turning a batch of closed windows into signals
/// The variant is chosen once at construction through make_algorithm().
class SignalAlgorithm {
public:
    virtual ~SignalAlgorithm() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Evaluate one batch; never throws for per-window problems
    [[nodiscard]] virtual std::vector<Signal> evaluate(const std::vector<PressureWindow>& batch) = 0;
};

inline constexpr std::string_view kInstitutionalAlgorithm = "institutional";
inline constexpr std::string_view kVolumeRatioAlgorithm = "volume_ratio";

/// Build the algorithm named by config.engine.algorithm
/// @throws ConfigError for an invalid config or unknown algorithm name
[[nodiscard]] std::unique_ptr<SignalAlgorithm> make_algorithm(const Config& config, BaselineStore& store);

}  // namespace flowscope
