#include <gtest/gtest.h>
#include "baseline/baseline_context.hpp"
#include "baseline/running_stats.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

using namespace flowscope;

// ============================================================================
// RunningStats Tests
// ============================================================================

TEST(RunningStatsTest, EmptyIsZero) {
    RunningStats stats;
    EXPECT_EQ(stats.count(), 0u);
    EXPECT_DOUBLE_EQ(stats.mean(), 0.0);
    EXPECT_DOUBLE_EQ(stats.variance(), 0.0);
    EXPECT_DOUBLE_EQ(stats.min(), 0.0);
    EXPECT_DOUBLE_EQ(stats.max(), 0.0);
}

TEST(RunningStatsTest, SingleSampleHasNoVariance) {
    RunningStats stats;
    stats.add(4.0);
    EXPECT_DOUBLE_EQ(stats.mean(), 4.0);
    EXPECT_DOUBLE_EQ(stats.std_dev(), 0.0);
}

TEST(RunningStatsTest, MatchesPopulationMoments) {
    RunningStats stats;
    for (double v : {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0}) {
        stats.add(v);
    }
    EXPECT_DOUBLE_EQ(stats.mean(), 5.0);
    EXPECT_DOUBLE_EQ(stats.variance(), 4.0);
    EXPECT_DOUBLE_EQ(stats.std_dev(), 2.0);
    EXPECT_DOUBLE_EQ(stats.min(), 2.0);
    EXPECT_DOUBLE_EQ(stats.max(), 9.0);
}

TEST(RunningStatsTest, MergeEqualsSequential) {
    RunningStats a;
    RunningStats b;
    RunningStats all;
    for (int i = 0; i < 50; ++i) {
        double v = std::sin(i) * 10.0 + i;
        (i % 2 == 0 ? a : b).add(v);
        all.add(v);
    }

    a.merge(b);

    EXPECT_EQ(a.count(), all.count());
    EXPECT_NEAR(a.mean(), all.mean(), 1e-9);
    EXPECT_NEAR(a.variance(), all.variance(), 1e-9);
    EXPECT_DOUBLE_EQ(a.min(), all.min());
    EXPECT_DOUBLE_EQ(a.max(), all.max());
}

TEST(RunningStatsTest, MergeIntoEmpty) {
    RunningStats empty;
    RunningStats other;
    other.add(1.0);
    other.add(3.0);

    empty.merge(other);
    EXPECT_EQ(empty.count(), 2u);
    EXPECT_DOUBLE_EQ(empty.mean(), 2.0);
}

TEST(RunningStatsTest, FromMomentsRoundTripsAccessors) {
    RunningStats stats;
    for (double v : {1.0, 2.0, 3.0}) {
        stats.add(v);
    }

    auto restored = RunningStats::from_moments(stats.count(), stats.mean(), stats.m2(),
                                               stats.min(), stats.max());
    EXPECT_EQ(restored.count(), 3u);
    EXPECT_DOUBLE_EQ(restored.variance(), stats.variance());
}

// ============================================================================
// Reservoir Tests
// ============================================================================

TEST(ReservoirTest, KeepsEverythingUnderCapacity) {
    Reservoir reservoir(8);
    for (int i = 0; i < 5; ++i) {
        reservoir.add(i);
    }
    EXPECT_EQ(reservoir.values().size(), 5u);
    EXPECT_EQ(reservoir.seen(), 5u);
}

TEST(ReservoirTest, NeverExceedsCapacity) {
    Reservoir reservoir(16);
    for (int i = 0; i < 10000; ++i) {
        reservoir.add(i);
    }
    EXPECT_EQ(reservoir.values().size(), 16u);
    EXPECT_EQ(reservoir.seen(), 10000u);

    // Sample spans the stream rather than only its head
    double largest = *std::max_element(reservoir.values().begin(), reservoir.values().end());
    EXPECT_GT(largest, 100.0);
}

TEST(ReservoirTest, RestoreTruncatesToCapacity) {
    Reservoir reservoir(4);
    reservoir.restore({1.0, 2.0, 3.0, 4.0, 5.0, 6.0}, 2);
    EXPECT_EQ(reservoir.values().size(), 4u);
    EXPECT_EQ(reservoir.seen(), 4u);
}

// ============================================================================
// Percentiles
// ============================================================================

TEST(PercentileTest, InterpolatesBetweenSamples) {
    std::vector<double> sorted{0.0, 10.0, 20.0, 30.0, 40.0};
    EXPECT_DOUBLE_EQ(interpolate_percentile(sorted, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(interpolate_percentile(sorted, 50.0), 20.0);
    EXPECT_DOUBLE_EQ(interpolate_percentile(sorted, 100.0), 40.0);
    EXPECT_DOUBLE_EQ(interpolate_percentile(sorted, 12.5), 5.0);
}

TEST(PercentileTest, EmptyAndSingle) {
    EXPECT_DOUBLE_EQ(interpolate_percentile({}, 50.0), 0.0);
    EXPECT_DOUBLE_EQ(interpolate_percentile({7.0}, 90.0), 7.0);
}

TEST(BaselineContextTest, ZScoreUsesEpsilonFloor) {
    BaselineContext context;
    context.mean = 2.0;
    context.std_dev = 0.0;
    EXPECT_GT(context.z_score(3.0, 1e-3), 999.0);

    context.std_dev = 0.5;
    EXPECT_DOUBLE_EQ(context.z_score(3.0), 2.0);
}

TEST(BaselineContextTest, PercentileRankIsMonotonic) {
    BaselineContext context;
    context.min = 0.5;
    context.max = 6.0;
    context.percentiles = {1.0, 1.5, 2.0, 2.5, 3.0, 3.5, 4.0};

    double previous = -1.0;
    for (double v = 0.0; v <= 7.0; v += 0.1) {
        double rank = context.percentile_rank(v);
        EXPECT_GE(rank, previous);
        EXPECT_GE(rank, 0.0);
        EXPECT_LE(rank, 100.0);
        previous = rank;
    }
    EXPECT_DOUBLE_EQ(context.percentile_rank(2.0), 50.0);
    EXPECT_DOUBLE_EQ(context.percentile_rank(10.0), 100.0);
}
