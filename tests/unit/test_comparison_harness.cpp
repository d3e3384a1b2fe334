#include <gtest/gtest.h>
#include "baseline/baseline_store.hpp"
#include "comparison/comparison_harness.hpp"
#include "core/errors.hpp"
#include <memory>
#include <vector>

using namespace flowscope;

namespace {

constexpr TimestampMs kT0 = 1'700'000'100'000;

PressureWindow make_window(double strike, OptionSide side, double ask, double bid) {
    PressureWindow window;
    window.key = InstrumentKey{strike, side};
    window.window_start = kT0;
    window.window_end = kT0 + 300'000;
    window.ask_volume = ask;
    window.bid_volume = bid;
    window.trade_count = 10;
    return window;
}

Signal make_signal(const PressureWindow& window, double confidence, Direction direction) {
    Signal signal;
    signal.key = window.key;
    signal.window_start = window.window_start;
    signal.timestamp = window.window_end;
    signal.confidence = confidence;
    signal.direction = direction;
    return signal;
}

/// Emits a canned signal list regardless of input
class ScriptedAlgorithm final : public SignalAlgorithm {
public:
    ScriptedAlgorithm(std::string_view name, std::vector<Signal> output)
        : name_(name), output_(std::move(output)) {}

    std::string_view name() const noexcept override { return name_; }

    std::vector<Signal> evaluate(const std::vector<PressureWindow>&) override {
        ++calls;
        return output_;
    }

    int calls{0};

private:
    std::string_view name_;
    std::vector<Signal> output_;
};

}  // namespace

// ============================================================================
// ComparisonHarness Tests
// ============================================================================

TEST(ComparisonHarnessTest, ClassifiesEveryWindow) {
    auto a = make_window(100.0, OptionSide::Call, 300, 100);
    auto b = make_window(105.0, OptionSide::Call, 300, 100);
    auto c = make_window(110.0, OptionSide::Put, 300, 100);
    auto d = make_window(115.0, OptionSide::Put, 100, 100);

    auto primary = std::make_unique<ScriptedAlgorithm>("primary", std::vector<Signal>{
        make_signal(a, 0.9, Direction::Long),
        make_signal(b, 0.7, Direction::Long),
    });
    auto reference = std::make_unique<ScriptedAlgorithm>("reference", std::vector<Signal>{
        make_signal(a, 0.6, Direction::Long),
        make_signal(c, 0.8, Direction::Short),
    });
    ComparisonHarness harness(std::move(primary), std::move(reference));

    auto result = harness.compare_once({a, b, c, d});

    EXPECT_EQ(result.primary_name, "primary");
    EXPECT_EQ(result.reference_name, "reference");
    EXPECT_EQ(result.counts.both, 1u);
    EXPECT_EQ(result.counts.primary_only, 1u);
    EXPECT_EQ(result.counts.reference_only, 1u);
    EXPECT_EQ(result.counts.neither, 1u);
    ASSERT_EQ(result.keys.size(), 4u);

    // Rows follow key order
    EXPECT_EQ(result.keys[0].outcome, ComparisonOutcome::Both);
    EXPECT_TRUE(result.keys[0].direction_agrees);
    EXPECT_NEAR(result.keys[0].confidence_delta, 0.3, 1e-12);
    EXPECT_EQ(result.keys[1].outcome, ComparisonOutcome::PrimaryOnly);
    EXPECT_DOUBLE_EQ(result.keys[1].primary_confidence, 0.7);
    EXPECT_EQ(result.keys[2].outcome, ComparisonOutcome::ReferenceOnly);
    EXPECT_DOUBLE_EQ(result.keys[2].reference_confidence, 0.8);
    EXPECT_EQ(result.keys[3].outcome, ComparisonOutcome::Neither);

    EXPECT_EQ(result.primary_signals.size(), 2u);
    EXPECT_EQ(result.reference_signals.size(), 2u);
}

TEST(ComparisonHarnessTest, SummaryAccumulatesAcrossBatches) {
    auto a = make_window(100.0, OptionSide::Call, 300, 100);
    auto b = make_window(105.0, OptionSide::Call, 300, 100);

    auto primary = std::make_unique<ScriptedAlgorithm>("primary", std::vector<Signal>{
        make_signal(a, 0.9, Direction::Long),
        make_signal(b, 0.8, Direction::Long),
    });
    auto reference = std::make_unique<ScriptedAlgorithm>("reference", std::vector<Signal>{
        make_signal(a, 0.7, Direction::Long),
        make_signal(b, 0.6, Direction::Short),
    });
    ComparisonHarness harness(std::move(primary), std::move(reference));

    (void)harness.compare_once({a, b});
    (void)harness.compare_once({a, b});

    const auto& summary = harness.summary();
    EXPECT_EQ(summary.batches, 2u);
    EXPECT_EQ(summary.counts.both, 4u);
    EXPECT_EQ(summary.direction_agreements, 2u);
    EXPECT_DOUBLE_EQ(summary.agreement_rate(), 0.5);
    EXPECT_NEAR(summary.mean_abs_confidence_delta(), 0.2, 1e-12);
    EXPECT_GE(summary.mean_primary_latency_us(), 0.0);
}

TEST(ComparisonHarnessTest, EmptySummaryIsZero) {
    ComparisonSummary summary;
    EXPECT_DOUBLE_EQ(summary.agreement_rate(), 0.0);
    EXPECT_DOUBLE_EQ(summary.mean_abs_confidence_delta(), 0.0);
    EXPECT_DOUBLE_EQ(summary.mean_primary_latency_us(), 0.0);
}

TEST(ComparisonHarnessTest, AlgorithmsSeeTheSameBatch) {
    auto primary = std::make_unique<ScriptedAlgorithm>("p", std::vector<Signal>{});
    auto reference = std::make_unique<ScriptedAlgorithm>("r", std::vector<Signal>{});
    auto* p = primary.get();
    auto* r = reference.get();
    ComparisonHarness harness(std::move(primary), std::move(reference));

    auto result = harness.compare_once({make_window(100.0, OptionSide::Call, 100, 100)});

    EXPECT_EQ(p->calls, 1);
    EXPECT_EQ(r->calls, 1);
    EXPECT_EQ(result.counts.neither, 1u);
    EXPECT_DOUBLE_EQ(harness.summary().agreement_rate(), 1.0);
}

TEST(ComparisonHarnessTest, MissingAlgorithmThrows) {
    EXPECT_THROW(ComparisonHarness harness(nullptr, std::make_unique<ScriptedAlgorithm>("r", std::vector<Signal>{})),
                 ConfigError);
}

TEST(ComparisonHarnessTest, InstitutionalVersusVolumeRatio) {
    Config config = Config::defaults();
    BaselineStore store(config.baseline);
    ComparisonHarness harness(config, store);

    EXPECT_EQ(harness.primary().name(), "institutional");
    EXPECT_EQ(harness.reference().name(), "volume_ratio");

    // No baseline history: the reference fires on raw ratio, the engine holds back
    auto result = harness.compare_once({make_window(21900.0, OptionSide::Call, 300, 100)});

    EXPECT_EQ(result.counts.reference_only, 1u);
    EXPECT_TRUE(result.primary_signals.empty());
    ASSERT_EQ(result.reference_signals.size(), 1u);
    EXPECT_EQ(result.reference_signals[0].algorithm, "volume_ratio");
}

TEST(ComparisonOutcomeTest, Names) {
    EXPECT_EQ(to_string(ComparisonOutcome::Both), "both");
    EXPECT_EQ(to_string(ComparisonOutcome::ReferenceOnly), "reference_only");
}
