#include <gtest/gtest.h>
#include "core/config.hpp"
#include <fstream>
#include <cstdlib>

using namespace flowscope;

class ConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path;

    void SetUp() override {
        temp_config_path = "test_config_temp.json";
    }

    void TearDown() override {
        // Clean up temp file and any overrides a test set
        std::remove(temp_config_path.c_str());
        unsetenv("FLOWSCOPE_WINDOW_MS");
        unsetenv("FLOWSCOPE_ALGORITHM");
        unsetenv("FLOWSCOPE_LOOKBACK_DAYS");
    }

    void write_config(const std::string& content) {
        std::ofstream file(temp_config_path);
        file << content;
    }
};

TEST_F(ConfigTest, DefaultsAreReasonable) {
    auto config = Config::defaults();

    EXPECT_EQ(config.window.length.count(), 300000);
    EXPECT_EQ(config.baseline.lookback_days, 20);
    EXPECT_DOUBLE_EQ(config.gates.min_pressure_ratio, 2.0);
    EXPECT_DOUBLE_EQ(config.gates.min_volume, 100.0);
    EXPECT_DOUBLE_EQ(config.scoring.extreme_cutoff, 0.85);
    EXPECT_DOUBLE_EQ(config.scoring.very_high_cutoff, 0.75);
    EXPECT_DOUBLE_EQ(config.scoring.high_cutoff, 0.65);
    EXPECT_DOUBLE_EQ(config.scoring.moderate_cutoff, 0.50);
    EXPECT_DOUBLE_EQ(config.market_making.max_market_making_probability, 0.3);
    EXPECT_EQ(config.engine.algorithm, "institutional");
    EXPECT_TRUE(config.baseline.storage_dir.empty());
}

TEST_F(ConfigTest, DefaultsValidate) {
    EXPECT_FALSE(Config::defaults().validate().has_value());
}

TEST_F(ConfigTest, LoadFromFileSuccess) {
    write_config(R"({
        "window": {
            "length_ms": 60000
        },
        "gates": {
            "min_volume": 250
        }
    })");

    auto result = Config::load_from_file(temp_config_path);

    ASSERT_TRUE(result.is_ok());
    auto config = result.value();

    // Changed values
    EXPECT_EQ(config.window.length.count(), 60000);
    EXPECT_DOUBLE_EQ(config.gates.min_volume, 250.0);

    // Defaults preserved
    EXPECT_DOUBLE_EQ(config.gates.min_pressure_ratio, 2.0);
    EXPECT_EQ(config.baseline.lookback_days, 20);
}

TEST_F(ConfigTest, LoadFromFileNotFound) {
    auto result = Config::load_from_file("nonexistent_file.json");

    EXPECT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().find("Failed to open") != std::string::npos);
}

TEST_F(ConfigTest, LoadFromFileInvalidJson) {
    write_config("{ invalid json }");

    auto result = Config::load_from_file(temp_config_path);

    EXPECT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().find("parse") != std::string::npos);
}

TEST_F(ConfigTest, LoadFromFileWrongFieldType) {
    write_config(R"({ "gates": { "min_volume": "lots" } })");

    auto result = Config::load_from_file(temp_config_path);

    EXPECT_TRUE(result.is_err());
}

TEST_F(ConfigTest, LoadFromFileEmptyJson) {
    write_config("{}");

    auto result = Config::load_from_file(temp_config_path);

    ASSERT_TRUE(result.is_ok());
    auto config = result.value();
    EXPECT_EQ(config.window.length.count(), 300000);
}

TEST_F(ConfigTest, LoadFromFileAllSections) {
    write_config(R"({
        "window": { "length_ms": 120000, "idle_timeout_ms": 600000, "idle_check_events": 50 },
        "baseline": {
            "lookback_days": 10,
            "reservoir_capacity": 256,
            "memory_only_quality_factor": 0.6,
            "recompute_interval_ms": 3600000,
            "storage_dir": "/tmp/flowscope-baselines"
        },
        "gates": { "min_pressure_ratio": 3.0, "min_data_quality": 0.7, "min_baseline_quality": 0.2 },
        "scoring": {
            "pressure_weight": 0.6, "baseline_weight": 0.4, "coordination_bonus_max": 0.05,
            "trend_weight": 0.0, "profile_lookback_windows": 5
        },
        "market_making": { "straddle_time_offset_ms": 120000, "crush_decline_pct": -8.0 },
        "coordination": { "strike_radius": 25.0, "time_offset_ms": 60000 },
        "engine": { "algorithm": "volume_ratio", "history_minutes": 90, "history_capacity": 100 },
        "comparison": { "reference_min_ratio": 1.5 },
        "logging": { "level": "debug", "stats_interval_ms": 500 }
    })");

    auto result = Config::load_from_file(temp_config_path);

    ASSERT_TRUE(result.is_ok());
    auto config = result.value();

    EXPECT_EQ(config.window.length.count(), 120000);
    EXPECT_EQ(config.window.idle_timeout.count(), 600000);
    EXPECT_EQ(config.window.idle_check_events, 50u);

    EXPECT_EQ(config.baseline.lookback_days, 10);
    EXPECT_EQ(config.baseline.reservoir_capacity, 256u);
    EXPECT_DOUBLE_EQ(config.baseline.memory_only_quality_factor, 0.6);
    EXPECT_EQ(config.baseline.recompute_interval.count(), 3600000);
    EXPECT_EQ(config.baseline.storage_dir, "/tmp/flowscope-baselines");

    EXPECT_DOUBLE_EQ(config.gates.min_pressure_ratio, 3.0);
    EXPECT_DOUBLE_EQ(config.gates.min_data_quality, 0.7);
    EXPECT_DOUBLE_EQ(config.gates.min_baseline_quality, 0.2);

    EXPECT_DOUBLE_EQ(config.scoring.pressure_weight, 0.6);
    EXPECT_DOUBLE_EQ(config.scoring.baseline_weight, 0.4);
    EXPECT_DOUBLE_EQ(config.scoring.coordination_bonus_max, 0.05);
    EXPECT_DOUBLE_EQ(config.scoring.trend_weight, 0.0);
    EXPECT_DOUBLE_EQ(config.scoring.significance_weight, 0.4);
    EXPECT_EQ(config.scoring.profile_lookback_windows, 5u);

    EXPECT_EQ(config.market_making.straddle_time_offset.count(), 120000);
    EXPECT_DOUBLE_EQ(config.market_making.crush_decline_pct, -8.0);

    EXPECT_DOUBLE_EQ(config.coordination.strike_radius, 25.0);
    EXPECT_EQ(config.coordination.time_offset.count(), 60000);

    EXPECT_EQ(config.engine.algorithm, "volume_ratio");
    EXPECT_EQ(config.engine.history.count(), 90);
    EXPECT_EQ(config.engine.history_capacity, 100u);

    EXPECT_DOUBLE_EQ(config.comparison.reference_min_ratio, 1.5);

    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.logging.stats_interval.count(), 500);

    EXPECT_FALSE(config.validate().has_value());
}

TEST_F(ConfigTest, LoadWithoutPathReturnsDefaults) {
    auto config = Config::load(std::nullopt);

    EXPECT_EQ(config.window.length.count(), 300000);
    EXPECT_EQ(config.engine.algorithm, "institutional");
}

TEST_F(ConfigTest, LoadWithMissingFileFallsBackToDefaults) {
    auto config = Config::load(std::string("definitely_missing.json"));

    EXPECT_EQ(config.window.length.count(), 300000);
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    write_config(R"({ "window": { "length_ms": 60000 }, "engine": { "algorithm": "institutional" } })");
    setenv("FLOWSCOPE_WINDOW_MS", "180000", 1);
    setenv("FLOWSCOPE_ALGORITHM", "volume_ratio", 1);

    auto config = Config::load(temp_config_path);

    EXPECT_EQ(config.window.length.count(), 180000);
    EXPECT_EQ(config.engine.algorithm, "volume_ratio");
}

TEST_F(ConfigTest, OutOfRangeEnvironmentValueIgnored) {
    setenv("FLOWSCOPE_LOOKBACK_DAYS", "0", 1);

    auto config = Config::load(std::nullopt);

    EXPECT_EQ(config.baseline.lookback_days, 20);
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, RejectsNonPositiveLookback) {
    auto config = Config::defaults();
    config.baseline.lookback_days = 0;

    auto problem = config.validate();
    ASSERT_TRUE(problem.has_value());
    EXPECT_NE(problem->find("lookback_days"), std::string::npos);
}

TEST_F(ConfigTest, RejectsNonDecreasingCutoffs) {
    auto config = Config::defaults();
    config.scoring.high_cutoff = 0.80;  // above very_high

    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigTest, RejectsUnusablePressureProfile) {
    auto config = Config::defaults();
    config.scoring.trend_weight = -0.1;
    EXPECT_TRUE(config.validate().has_value());

    config = Config::defaults();
    config.scoring.significance_weight = 0.0;
    config.scoring.trend_weight = 0.0;
    config.scoring.concentration_weight = 0.0;
    config.scoring.persistence_weight = 0.0;
    EXPECT_TRUE(config.validate().has_value());

    config = Config::defaults();
    config.scoring.profile_lookback_windows = 1;
    auto problem = config.validate();
    ASSERT_TRUE(problem.has_value());
    EXPECT_NE(problem->find("profile_lookback_windows"), std::string::npos);
}

TEST_F(ConfigTest, RejectsQualityGateOutsideUnitInterval) {
    auto config = Config::defaults();
    config.gates.min_data_quality = 1.5;

    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigTest, RejectsUnknownAlgorithm) {
    auto config = Config::defaults();
    config.engine.algorithm = "magic";

    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigTest, RejectsPositiveCrushThreshold) {
    auto config = Config::defaults();
    config.market_making.crush_decline_pct = 5.0;

    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigTest, RejectsIdleTimeoutShorterThanWindow) {
    auto config = Config::defaults();
    config.window.idle_timeout = std::chrono::milliseconds(1000);

    EXPECT_TRUE(config.validate().has_value());
}

TEST_F(ConfigTest, WindowMsMatchesLength) {
    auto config = Config::defaults();
    config.window.length = std::chrono::minutes(1);

    EXPECT_EQ(config.window_ms(), 60000);
}
