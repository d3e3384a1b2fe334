#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sstream>

namespace flowscope {

using json = nlohmann::json;

namespace {

/// Get environment variable value, or nullopt if not set
std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value != nullptr) {
        return std::string(value);
    }
    return std::nullopt;
}

/// Get environment variable as integer within [min_val, max_val]
std::optional<long long> get_env_int(const char* name,
                                     long long min_val = std::numeric_limits<long long>::min(),
                                     long long max_val = std::numeric_limits<long long>::max()) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        long long result = std::stoll(*value);
        if (result < min_val || result > max_val) {
            spdlog::warn("{} value {} out of range [{}, {}], ignoring", name, result, min_val, max_val);
            return std::nullopt;
        }
        return result;
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer value for {}: {}, ignoring", name, *value);
        return std::nullopt;
    }
}

/// Get environment variable as double
std::optional<double> get_env_double(const char* name) {
    auto value = get_env(name);
    if (!value) {
        return std::nullopt;
    }
    try {
        return std::stod(*value);
    } catch (const std::exception&) {
        spdlog::warn("Invalid numeric value for {}: {}, ignoring", name, *value);
        return std::nullopt;
    }
}

void apply_env_overrides(Config& config) {
    if (auto v = get_env_int("FLOWSCOPE_WINDOW_MS", 1000, 86'400'000)) {
        config.window.length = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env_int("FLOWSCOPE_IDLE_TIMEOUT_MS", 1000)) {
        config.window.idle_timeout = std::chrono::milliseconds(*v);
    }
    if (auto v = get_env_int("FLOWSCOPE_LOOKBACK_DAYS", 1, 365)) {
        config.baseline.lookback_days = static_cast<int>(*v);
    }
    if (auto v = get_env("FLOWSCOPE_BASELINE_DIR")) {
        config.baseline.storage_dir = *v;
    }
    if (auto v = get_env_double("FLOWSCOPE_MIN_PRESSURE_RATIO")) {
        config.gates.min_pressure_ratio = *v;
    }
    if (auto v = get_env_double("FLOWSCOPE_MIN_VOLUME")) {
        config.gates.min_volume = *v;
    }
    if (auto v = get_env_double("FLOWSCOPE_MIN_DATA_QUALITY")) {
        config.gates.min_data_quality = *v;
    }
    if (auto v = get_env_double("FLOWSCOPE_COORDINATION_RADIUS")) {
        config.coordination.strike_radius = *v;
    }
    if (auto v = get_env("FLOWSCOPE_ALGORITHM")) {
        config.engine.algorithm = *v;
    }
    if (auto v = get_env("FLOWSCOPE_LOG_LEVEL")) {
        config.logging.level = *v;
    }
}

template <typename T>
void read_field(const json& section, const char* name, T& target) {
    if (section.contains(name)) {
        target = section[name].get<T>();
    }
}

void read_millis(const json& section, const char* name, std::chrono::milliseconds& target) {
    if (section.contains(name)) {
        target = std::chrono::milliseconds(section[name].get<long long>());
    }
}

}  // namespace

Result<Config, std::string> Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Result<Config, std::string>::Err("Failed to open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    json j;
    try {
        j = json::parse(buffer.str());
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Failed to parse JSON: " + std::string(e.what()));
    }

    Config config = Config::defaults();

    try {
        if (j.contains("window")) {
            const auto& w = j["window"];
            read_millis(w, "length_ms", config.window.length);
            read_millis(w, "idle_timeout_ms", config.window.idle_timeout);
            read_field(w, "idle_check_events", config.window.idle_check_events);
        }

        if (j.contains("baseline")) {
            const auto& b = j["baseline"];
            read_field(b, "lookback_days", config.baseline.lookback_days);
            read_field(b, "expected_windows_per_day", config.baseline.expected_windows_per_day);
            read_field(b, "reservoir_capacity", config.baseline.reservoir_capacity);
            read_field(b, "samples_per_day", config.baseline.samples_per_day);
            read_field(b, "default_mean", config.baseline.default_mean);
            read_field(b, "default_std", config.baseline.default_std);
            read_field(b, "memory_only_quality_factor", config.baseline.memory_only_quality_factor);
            read_field(b, "z_epsilon", config.baseline.z_epsilon);
            read_field(b, "queue_capacity", config.baseline.queue_capacity);
            read_millis(b, "recompute_interval_ms", config.baseline.recompute_interval);
            read_field(b, "storage_dir", config.baseline.storage_dir);
        }

        if (j.contains("gates")) {
            const auto& g = j["gates"];
            read_field(g, "min_pressure_ratio", config.gates.min_pressure_ratio);
            read_field(g, "min_volume", config.gates.min_volume);
            read_field(g, "min_data_quality", config.gates.min_data_quality);
            read_field(g, "min_baseline_quality", config.gates.min_baseline_quality);
        }

        if (j.contains("scoring")) {
            const auto& s = j["scoring"];
            read_field(s, "pressure_weight", config.scoring.pressure_weight);
            read_field(s, "baseline_weight", config.scoring.baseline_weight);
            read_field(s, "market_making_weight", config.scoring.market_making_weight);
            read_field(s, "coordination_bonus_max", config.scoring.coordination_bonus_max);
            read_field(s, "coordination_saturation_peers", config.scoring.coordination_saturation_peers);
            read_field(s, "min_interest_ratio", config.scoring.min_interest_ratio);
            read_field(s, "z_saturation", config.scoring.z_saturation);
            read_field(s, "significance_weight", config.scoring.significance_weight);
            read_field(s, "trend_weight", config.scoring.trend_weight);
            read_field(s, "concentration_weight", config.scoring.concentration_weight);
            read_field(s, "persistence_weight", config.scoring.persistence_weight);
            read_field(s, "profile_lookback_windows", config.scoring.profile_lookback_windows);
            read_field(s, "trend_slope_saturation", config.scoring.trend_slope_saturation);
            read_field(s, "extreme_cutoff", config.scoring.extreme_cutoff);
            read_field(s, "very_high_cutoff", config.scoring.very_high_cutoff);
            read_field(s, "high_cutoff", config.scoring.high_cutoff);
            read_field(s, "moderate_cutoff", config.scoring.moderate_cutoff);
        }

        if (j.contains("market_making")) {
            const auto& m = j["market_making"];
            read_millis(m, "straddle_time_offset_ms", config.market_making.straddle_time_offset);
            read_field(m, "min_volume_balance", config.market_making.min_volume_balance);
            read_field(m, "balance_weight", config.market_making.balance_weight);
            read_field(m, "time_weight", config.market_making.time_weight);
            read_field(m, "crush_decline_pct", config.market_making.crush_decline_pct);
            read_field(m, "straddle_weight", config.market_making.straddle_weight);
            read_field(m, "crush_weight", config.market_making.crush_weight);
            read_field(m, "max_market_making_probability",
                       config.market_making.max_market_making_probability);
        }

        if (j.contains("coordination")) {
            const auto& c = j["coordination"];
            read_field(c, "strike_radius", config.coordination.strike_radius);
            read_millis(c, "time_offset_ms", config.coordination.time_offset);
        }

        if (j.contains("engine")) {
            const auto& e = j["engine"];
            read_field(e, "algorithm", config.engine.algorithm);
            if (e.contains("history_minutes")) {
                config.engine.history = std::chrono::minutes(e["history_minutes"].get<long long>());
            }
            read_field(e, "history_capacity", config.engine.history_capacity);
        }

        if (j.contains("comparison")) {
            const auto& c = j["comparison"];
            read_field(c, "reference_min_ratio", config.comparison.reference_min_ratio);
            read_field(c, "reference_min_volume", config.comparison.reference_min_volume);
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            read_field(l, "level", config.logging.level);
            read_millis(l, "stats_interval_ms", config.logging.stats_interval);
        }
    } catch (const json::exception& e) {
        return Result<Config, std::string>::Err("Error reading config field: " + std::string(e.what()));
    }

    return Result<Config, std::string>::Ok(config);
}

Config Config::load(const std::optional<std::string>& config_path) {
    Config config = Config::defaults();

    if (config_path) {
        auto result = load_from_file(*config_path);
        if (result.is_ok()) {
            config = result.value();
        } else {
            spdlog::warn("Failed to load config from '{}': {} (using defaults with env overrides)",
                         *config_path, result.error());
        }
    }

    apply_env_overrides(config);

    return config;
}

std::optional<std::string> Config::validate() const {
    auto in_unit = [](double v) { return v >= 0.0 && v <= 1.0; };

    if (window.length.count() <= 0) {
        return "window.length_ms must be positive";
    }
    if (window.idle_timeout < window.length) {
        return "window.idle_timeout_ms must be at least one window length";
    }
    if (window.idle_check_events == 0) {
        return "window.idle_check_events must be positive";
    }

    if (baseline.lookback_days < 1) {
        return "baseline.lookback_days must be at least 1";
    }
    if (baseline.expected_windows_per_day <= 0.0) {
        return "baseline.expected_windows_per_day must be positive";
    }
    if (baseline.reservoir_capacity < 8) {
        return "baseline.reservoir_capacity must be at least 8";
    }
    if (baseline.samples_per_day == 0) {
        return "baseline.samples_per_day must be positive";
    }
    if (baseline.default_std < 0.0) {
        return "baseline.default_std must be non-negative";
    }
    if (!in_unit(baseline.memory_only_quality_factor)) {
        return "baseline.memory_only_quality_factor must be in [0, 1]";
    }
    if (baseline.z_epsilon <= 0.0) {
        return "baseline.z_epsilon must be positive";
    }
    if (baseline.queue_capacity == 0) {
        return "baseline.queue_capacity must be positive";
    }
    if (baseline.recompute_interval.count() <= 0) {
        return "baseline.recompute_interval_ms must be positive";
    }

    if (gates.min_pressure_ratio < 0.0 || gates.min_volume < 0.0) {
        return "gate thresholds must be non-negative";
    }
    if (!in_unit(gates.min_data_quality) || !in_unit(gates.min_baseline_quality)) {
        return "gates.min_data_quality and gates.min_baseline_quality must be in [0, 1]";
    }

    if (scoring.pressure_weight < 0.0 || scoring.baseline_weight < 0.0 ||
        scoring.market_making_weight < 0.0) {
        return "scoring weights must be non-negative";
    }
    if (scoring.pressure_weight + scoring.baseline_weight > 1.0 + 1e-9) {
        return "scoring.pressure_weight + scoring.baseline_weight must not exceed 1";
    }
    if (scoring.market_making_weight > 1.0) {
        return "scoring.market_making_weight must not exceed 1";
    }
    if (scoring.coordination_bonus_max < 0.0 || scoring.coordination_bonus_max > 0.25) {
        return "scoring.coordination_bonus_max must be in [0, 0.25]";
    }
    if (scoring.coordination_saturation_peers == 0) {
        return "scoring.coordination_saturation_peers must be positive";
    }
    if (scoring.min_interest_ratio <= 1.0) {
        return "scoring.min_interest_ratio must be greater than 1";
    }
    if (scoring.z_saturation <= 0.0) {
        return "scoring.z_saturation must be positive";
    }
    if (scoring.significance_weight < 0.0 || scoring.trend_weight < 0.0 ||
        scoring.concentration_weight < 0.0 || scoring.persistence_weight < 0.0) {
        return "scoring pressure sub-weights must be non-negative";
    }
    if (scoring.significance_weight + scoring.trend_weight +
            scoring.concentration_weight + scoring.persistence_weight <= 0.0) {
        return "scoring pressure sub-weights must not all be zero";
    }
    if (scoring.profile_lookback_windows < 2) {
        return "scoring.profile_lookback_windows must be >= 2";
    }
    if (scoring.trend_slope_saturation <= 0.0) {
        return "scoring.trend_slope_saturation must be positive";
    }
    if (!(scoring.extreme_cutoff < 1.0 && scoring.extreme_cutoff > scoring.very_high_cutoff &&
          scoring.very_high_cutoff > scoring.high_cutoff &&
          scoring.high_cutoff > scoring.moderate_cutoff && scoring.moderate_cutoff > 0.0)) {
        return "strength cutoffs must be strictly decreasing inside (0, 1)";
    }

    if (market_making.straddle_time_offset.count() <= 0) {
        return "market_making.straddle_time_offset_ms must be positive";
    }
    if (!in_unit(market_making.min_volume_balance)) {
        return "market_making.min_volume_balance must be in [0, 1]";
    }
    if (market_making.balance_weight < 0.0 || market_making.time_weight < 0.0 ||
        market_making.balance_weight + market_making.time_weight > 1.0 + 1e-9) {
        return "market_making balance/time weights must be non-negative and sum to at most 1";
    }
    if (market_making.straddle_weight < 0.0 || market_making.crush_weight < 0.0 ||
        market_making.straddle_weight + market_making.crush_weight > 1.0 + 1e-9) {
        return "market_making straddle/crush weights must be non-negative and sum to at most 1";
    }
    if (market_making.crush_decline_pct >= 0.0) {
        return "market_making.crush_decline_pct must be negative";
    }
    if (!in_unit(market_making.max_market_making_probability)) {
        return "market_making.max_market_making_probability must be in [0, 1]";
    }

    if (coordination.strike_radius < 0.0) {
        return "coordination.strike_radius must be non-negative";
    }
    if (coordination.time_offset.count() < 0) {
        return "coordination.time_offset_ms must be non-negative";
    }

    if (engine.algorithm != "institutional" && engine.algorithm != "volume_ratio") {
        return "engine.algorithm must be 'institutional' or 'volume_ratio'";
    }
    if (engine.history.count() <= 0) {
        return "engine.history_minutes must be positive";
    }
    if (engine.history_capacity == 0) {
        return "engine.history_capacity must be positive";
    }

    if (comparison.reference_min_ratio <= 0.0 || comparison.reference_min_volume < 0.0) {
        return "comparison reference thresholds must be positive";
    }

    return std::nullopt;
}

}  // namespace flowscope
