#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace flowscope {

/// Discrete confidence class, ordered weakest to strongest
enum class StrengthClass : std::uint8_t {
    None,
    Moderate,
    High,
    VeryHigh,
    Extreme
};

/// Recommended handling of an emitted signal
enum class Action : std::uint8_t {
    StrongBuy,
    Buy,
    Monitor
};

[[nodiscard]] inline std::string_view to_string(StrengthClass strength) noexcept {
    switch (strength) {
        case StrengthClass::None: return "NONE";
        case StrengthClass::Moderate: return "MODERATE";
        case StrengthClass::High: return "HIGH";
        case StrengthClass::VeryHigh: return "VERY_HIGH";
        case StrengthClass::Extreme: return "EXTREME";
    }
    return "NONE";
}

[[nodiscard]] inline std::string_view to_string(Action action) noexcept {
    switch (action) {
        case Action::StrongBuy: return "STRONG_BUY";
        case Action::Buy: return "BUY";
        case Action::Monitor: return "MONITOR";
    }
    return "MONITOR";
}

[[nodiscard]] constexpr Action action_for(StrengthClass strength) noexcept {
    switch (strength) {
        case StrengthClass::Extreme: return Action::StrongBuy;
        case StrengthClass::VeryHigh:
        case StrengthClass::High: return Action::Buy;
        default: return Action::Monitor;
    }
}

[[nodiscard]] constexpr double position_size_multiplier(StrengthClass strength) noexcept {
    switch (strength) {
        case StrengthClass::Extreme: return 3.0;
        case StrengthClass::VeryHigh: return 2.0;
        case StrengthClass::High: return 1.5;
        default: return 1.0;
    }
}

/// Call buying is bullish for the underlying, put buying bearish
[[nodiscard]] constexpr Direction direction_for(OptionSide side) noexcept {
    return side == OptionSide::Call ? Direction::Long : Direction::Short;
}

/// Individual terms of a confidence score
struct ConfidenceBreakdown {
    double pressure_significance{0.0};
    double trend_strength{0.0};
    double volume_concentration{0.0};
    double time_persistence{0.0};
    double pressure_term{0.0};  // Weighted blend of the four above
    double baseline_deviation{0.0};
    double market_making_penalty{0.0};  // Weighted, subtracted
    double coordination_bonus{0.0};
    std::size_t coordinated_peers{0};
    double confidence{0.0};
    StrengthClass strength{StrengthClass::None};
};

/// Directional signal emitted for one window
struct Signal {
    InstrumentKey key;
    TimestampMs timestamp{0};  // Window end
    TimestampMs window_start{0};

    double pressure_ratio{0.0};
    Quantity bid_volume{0.0};
    Quantity ask_volume{0.0};
    Quantity total_volume{0.0};
    DominantSide dominant_side{DominantSide::Neutral};

    double z_score{0.0};
    double percentile_rank{0.0};
    Percentage baseline_quality{0.0};

    double market_making_score{0.0};
    bool straddle_detected{false};
    bool volatility_crush{false};

    double confidence{0.0};
    StrengthClass strength{StrengthClass::None};
    ConfidenceBreakdown components;

    Direction direction{Direction::Long};
    Action action{Action::Monitor};
    double risk_score{1.0};  // 1 - confidence
    double position_size_multiplier{1.0};

    std::string algorithm;
};

}  // namespace flowscope
