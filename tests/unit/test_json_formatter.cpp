#include <gtest/gtest.h>
#include "output/json_formatter.hpp"

using namespace flowscope;
using flowscope::output::JsonFormatter;

namespace {

Signal make_signal() {
    Signal signal;
    signal.key = InstrumentKey{21900.0, OptionSide::Call};
    signal.window_start = 1700000100000;
    signal.timestamp = 1700000400000;
    signal.pressure_ratio = 3.0;
    signal.bid_volume = 100.0;
    signal.ask_volume = 300.0;
    signal.total_volume = 400.0;
    signal.dominant_side = DominantSide::Buy;
    signal.z_score = 6.7;
    signal.percentile_rank = 99.5;
    signal.baseline_quality = 1.0;
    signal.confidence = 0.9;
    signal.strength = StrengthClass::Extreme;
    signal.components.coordinated_peers = 2;
    signal.components.trend_strength = 0.75;
    signal.components.time_persistence = 1.0;
    signal.direction = Direction::Long;
    signal.action = Action::StrongBuy;
    signal.risk_score = 0.1;
    signal.position_size_multiplier = 3.0;
    signal.algorithm = "institutional";
    return signal;
}

}  // namespace

TEST(JsonFormatterTest, SignalFields) {
    auto j = JsonFormatter::format_signal(make_signal());

    EXPECT_EQ(j["type"], "signal");
    EXPECT_EQ(j["timestamp"], "2023-11-14T22:20:00.000Z");
    EXPECT_EQ(j["windowStart"], 1700000100000);
    EXPECT_DOUBLE_EQ(j["strike"].get<double>(), 21900.0);
    EXPECT_EQ(j["side"], "C");
    EXPECT_EQ(j["algorithm"], "institutional");
    EXPECT_DOUBLE_EQ(j["pressure"]["ratio"].get<double>(), 3.0);
    EXPECT_EQ(j["pressure"]["dominantSide"], "BUY");
    EXPECT_DOUBLE_EQ(j["baseline"]["zScore"].get<double>(), 6.7);
    EXPECT_EQ(j["components"]["coordinatedPeers"], 2);
    EXPECT_DOUBLE_EQ(j["components"]["trendStrength"].get<double>(), 0.75);
    EXPECT_DOUBLE_EQ(j["components"]["timePersistence"].get<double>(), 1.0);
    EXPECT_TRUE(j["components"].contains("volumeConcentration"));
    EXPECT_TRUE(j["components"].contains("pressureTerm"));
    EXPECT_EQ(j["strength"], "EXTREME");
    EXPECT_EQ(j["direction"], "LONG");
    EXPECT_EQ(j["action"], "STRONG_BUY");
    EXPECT_DOUBLE_EQ(j["positionSizeMultiplier"].get<double>(), 3.0);
}

TEST(JsonFormatterTest, DiagnosticFields) {
    SuppressionDiagnostic diagnostic{
        .key = InstrumentKey{21900.0, OptionSide::Put},
        .window_start = 1700000100000,
        .reason = SuppressionReason::VolumeBelowMinimum,
        .data_quality = 0.4,
        .window_completeness = 1.0,
        .confidence = 0.0,
        .detail = {}
    };

    auto j = JsonFormatter::format_diagnostic(diagnostic);

    EXPECT_EQ(j["type"], "suppression");
    EXPECT_EQ(j["side"], "P");
    EXPECT_EQ(j["reason"], "volume_below_minimum");
    EXPECT_DOUBLE_EQ(j["dataQuality"].get<double>(), 0.4);
}

TEST(JsonFormatterTest, ComparisonFields) {
    ComparisonResult result;
    result.primary_name = "institutional";
    result.reference_name = "volume_ratio";
    result.counts.reference_only = 1;
    result.keys.push_back(KeyComparison{
        .key = InstrumentKey{21900.0, OptionSide::Call},
        .window_start = 0,
        .outcome = ComparisonOutcome::ReferenceOnly,
        .direction_agrees = false,
        .primary_confidence = 0.0,
        .reference_confidence = 0.75,
        .confidence_delta = 0.0
    });

    auto j = JsonFormatter::format_comparison(result);

    EXPECT_EQ(j["type"], "comparison");
    EXPECT_EQ(j["counts"]["referenceOnly"], 1);
    ASSERT_EQ(j["keys"].size(), 1u);
    EXPECT_EQ(j["keys"][0]["outcome"], "reference_only");
}

TEST(JsonFormatterTest, SummaryFields) {
    ComparisonSummary summary;
    summary.batches = 3;
    summary.counts.both = 2;
    summary.counts.neither = 2;
    summary.direction_agreements = 1;

    auto j = JsonFormatter::format_summary(summary);

    EXPECT_EQ(j["type"], "comparisonSummary");
    EXPECT_EQ(j["windows"], 4);
    EXPECT_DOUBLE_EQ(j["agreementRate"].get<double>(), 0.75);
}

TEST(JsonFormatterTest, IsoTimestamp) {
    EXPECT_EQ(JsonFormatter::iso_timestamp(0), "1970-01-01T00:00:00.000Z");
    EXPECT_EQ(JsonFormatter::iso_timestamp(1700000000123), "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(JsonFormatter::iso_timestamp(-1), "1969-12-31T23:59:59.999Z");
}

TEST(JsonFormatterTest, CurrentTimestampIsIso) {
    auto ts = JsonFormatter::iso_timestamp();

    ASSERT_EQ(ts.size(), 24u);
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
}
