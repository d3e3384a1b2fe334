#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace flowscope {

/// Immutable configuration for the signal engine and its collaborators
struct Config {
    /// Pressure window aggregation
    struct Window {
        std::chrono::milliseconds length{std::chrono::minutes(5)};
        std::chrono::milliseconds idle_timeout{std::chrono::minutes(30)};
        std::size_t idle_check_events = 1000;  // Events between idle sweeps
    };

    /// Rolling baseline statistics
    struct Baseline {
        int lookback_days = 20;
        double expected_windows_per_day = 78.0;  // 6.5h session / 5 min
        std::size_t reservoir_capacity = 512;
        std::size_t samples_per_day = 64;
        double default_mean = 1.0;
        double default_std = 0.5;
        double memory_only_quality_factor = 0.8;
        double z_epsilon = 1e-6;
        std::size_t queue_capacity = 4096;
        std::chrono::milliseconds recompute_interval{std::chrono::hours(24)};
        std::string storage_dir;  // Empty = memory-only
    };

    /// Hard gates; failing any of them suppresses the window
    struct Gates {
        double min_pressure_ratio = 2.0;
        Quantity min_volume = 100.0;
        double min_data_quality = 0.5;      // Window data completeness
        double min_baseline_quality = 0.0;  // Baseline data quality
    };

    /// Confidence combination and strength cutoffs
    struct Scoring {
        double pressure_weight = 0.5;
        double baseline_weight = 0.5;
        double market_making_weight = 0.5;
        double coordination_bonus_max = 0.1;
        std::size_t coordination_saturation_peers = 2;
        double min_interest_ratio = 2.0;
        double z_saturation = 3.0;

        // Pressure term: blend of significance with the key's recent profile
        double significance_weight = 0.4;
        double trend_weight = 0.3;
        double concentration_weight = 0.2;
        double persistence_weight = 0.1;
        std::size_t profile_lookback_windows = 3;  // Including the scored window
        double trend_slope_saturation = 1.0;       // Ratio gain per window for full trend

        double extreme_cutoff = 0.85;
        double very_high_cutoff = 0.75;
        double high_cutoff = 0.65;
        double moderate_cutoff = 0.50;
    };

    /// Market-making pattern detection
    struct MarketMaking {
        std::chrono::milliseconds straddle_time_offset{std::chrono::minutes(5)};
        double min_volume_balance = 0.5;
        double balance_weight = 0.7;
        double time_weight = 0.3;
        double crush_decline_pct = -5.0;
        double straddle_weight = 0.7;
        double crush_weight = 0.3;
        double max_market_making_probability = 0.3;
    };

    /// Cross-strike coordination lookups
    struct Coordination {
        double strike_radius = 50.0;
        std::chrono::milliseconds time_offset{std::chrono::minutes(5)};
    };

    /// Orchestration
    struct Engine {
        std::string algorithm = "institutional";
        std::chrono::minutes history{60};
        std::size_t history_capacity = 4096;
    };

    /// Reference algorithm used by the comparison harness
    struct Comparison {
        double reference_min_ratio = 2.0;
        Quantity reference_min_volume = 100.0;
    };

    struct Logging {
        std::string level = "info";
        std::chrono::milliseconds stats_interval{10000};
    };

    Window window;
    Baseline baseline;
    Gates gates;
    Scoring scoring;
    MarketMaking market_making;
    Coordination coordination;
    Engine engine;
    Comparison comparison;
    Logging logging;

    [[nodiscard]] static Config defaults() {
        return Config{};
    }

    /// Load configuration from JSON file
    /// Falls back to defaults for any missing fields
    /// @param path Path to the JSON configuration file
    /// @return Config on success, error message on failure
    [[nodiscard]] static Result<Config, std::string> load_from_file(const std::string& path);

    /// Load configuration with optional file path and environment variable overrides
    /// Priority (highest to lowest): environment variables > config file > defaults
    [[nodiscard]] static Config load(const std::optional<std::string>& config_path = std::nullopt);

    /// Check every constraint
    /// @return Description of the first violated constraint, nullopt if valid
    [[nodiscard]] std::optional<std::string> validate() const;

    /// Window length in milliseconds
    [[nodiscard]] TimestampMs window_ms() const noexcept {
        return static_cast<TimestampMs>(window.length.count());
    }
};

}  // namespace flowscope
