#include <gtest/gtest.h>
#include "aggregator/pressure_aggregator.hpp"
#include <limits>

using namespace flowscope;

namespace {

constexpr TimestampMs kWindow = 300'000;
constexpr TimestampMs kBase = 1'700'000'100'000;  // Aligned to five minutes

Event make_event(double strike, OptionSide side, TimestampMs ts, double size,
                 Initiator initiator, double price = 10.0) {
    return Event{InstrumentKey{strike, side}, ts, price, size, initiator};
}

}  // namespace

// ============================================================================
// PressureAggregator Tests
// ============================================================================

class PressureAggregatorTest : public ::testing::Test {
protected:
    Config::Window config;
    std::unique_ptr<PressureAggregator> aggregator;

    void SetUp() override {
        config.length = std::chrono::milliseconds(kWindow);
        config.idle_timeout = std::chrono::minutes(30);
        aggregator = std::make_unique<PressureAggregator>(config);
    }
};

TEST_F(PressureAggregatorTest, BucketStartAlignsToWindow) {
    EXPECT_EQ(aggregator->bucket_start(kBase), kBase);
    EXPECT_EQ(aggregator->bucket_start(kBase + 1), kBase);
    EXPECT_EQ(aggregator->bucket_start(kBase + kWindow - 1), kBase);
    EXPECT_EQ(aggregator->bucket_start(kBase + kWindow), kBase + kWindow);
}

TEST_F(PressureAggregatorTest, BucketStartHandlesNegativeTimestamps) {
    EXPECT_EQ(aggregator->bucket_start(-1), -kWindow);
}

TEST_F(PressureAggregatorTest, AccumulatesVolumesBySide) {
    EXPECT_FALSE(aggregator->ingest(make_event(100, OptionSide::Call, kBase + 1, 50, Initiator::Ask)));
    EXPECT_FALSE(aggregator->ingest(make_event(100, OptionSide::Call, kBase + 2, 20, Initiator::Bid)));
    EXPECT_FALSE(aggregator->ingest(make_event(100, OptionSide::Call, kBase + 3, 5, Initiator::None)));

    auto window = aggregator->open_window(InstrumentKey{100, OptionSide::Call});
    ASSERT_TRUE(window.has_value());
    EXPECT_DOUBLE_EQ(window->ask_volume, 50.0);
    EXPECT_DOUBLE_EQ(window->bid_volume, 20.0);
    EXPECT_DOUBLE_EQ(window->unclassified_volume, 5.0);
    EXPECT_DOUBLE_EQ(window->total_volume(), 75.0);
    EXPECT_EQ(window->trade_count, 3u);
    EXPECT_EQ(window->window_start, kBase);
    EXPECT_EQ(window->window_end, kBase + kWindow);
}

TEST_F(PressureAggregatorTest, ClosesWindowWhenKeyAdvances) {
    (void)aggregator->ingest(make_event(100, OptionSide::Put, kBase + 10, 30, Initiator::Ask, 2.0));
    (void)aggregator->ingest(make_event(100, OptionSide::Put, kBase + 20, 10, Initiator::Ask, 2.5));

    auto closed = aggregator->ingest(make_event(100, OptionSide::Put, kBase + kWindow + 5, 1, Initiator::Bid));

    ASSERT_TRUE(closed.has_value());
    EXPECT_EQ(closed->window_start, kBase);
    EXPECT_DOUBLE_EQ(closed->ask_volume, 40.0);
    EXPECT_DOUBLE_EQ(closed->open_price, 2.0);
    EXPECT_DOUBLE_EQ(closed->close_price, 2.5);
    EXPECT_DOUBLE_EQ(closed->price_change_pct(), 25.0);
    EXPECT_EQ(aggregator->stats().windows_closed, 1u);

    auto reopened = aggregator->open_window(InstrumentKey{100, OptionSide::Put});
    ASSERT_TRUE(reopened.has_value());
    EXPECT_EQ(reopened->window_start, kBase + kWindow);
}

TEST_F(PressureAggregatorTest, KeysAreIndependent) {
    (void)aggregator->ingest(make_event(100, OptionSide::Call, kBase, 10, Initiator::Ask));
    (void)aggregator->ingest(make_event(100, OptionSide::Put, kBase, 10, Initiator::Ask));
    (void)aggregator->ingest(make_event(105, OptionSide::Call, kBase, 10, Initiator::Ask));

    EXPECT_EQ(aggregator->active_keys(), 3u);

    // Advancing one key does not close the others
    auto closed = aggregator->ingest(make_event(100, OptionSide::Call, kBase + kWindow, 1, Initiator::Ask));
    ASSERT_TRUE(closed.has_value());
    EXPECT_EQ(closed->key, (InstrumentKey{100, OptionSide::Call}));
    EXPECT_TRUE(aggregator->is_open(InstrumentKey{105, OptionSide::Call}));
}

TEST_F(PressureAggregatorTest, LateEventCountsAsDropped) {
    (void)aggregator->ingest(make_event(100, OptionSide::Call, kBase + kWindow + 1, 10, Initiator::Ask));

    auto result = aggregator->ingest(make_event(100, OptionSide::Call, kBase + 1, 10, Initiator::Ask));

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(aggregator->stats().events_out_of_order, 1u);

    auto window = aggregator->open_window(InstrumentKey{100, OptionSide::Call});
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->dropped_events, 1u);
    EXPECT_DOUBLE_EQ(window->data_completeness(), 0.5);
}

TEST_F(PressureAggregatorTest, InvalidEventRejected) {
    (void)aggregator->ingest(make_event(100, OptionSide::Call, kBase, 10, Initiator::Ask));
    (void)aggregator->ingest(make_event(100, OptionSide::Call, kBase + 1, 0, Initiator::Ask));
    (void)aggregator->ingest(make_event(100, OptionSide::Call, kBase + 2, 10, Initiator::Ask, -1.0));

    EXPECT_EQ(aggregator->stats().events_rejected, 2u);
    auto window = aggregator->open_window(InstrumentKey{100, OptionSide::Call});
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->trade_count, 1u);
    EXPECT_EQ(window->dropped_events, 2u);
}

TEST_F(PressureAggregatorTest, NonFiniteStrikeNeverOpensAWindow) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const double inf = std::numeric_limits<double>::infinity();
    for (int i = 0; i < 5; ++i) {
        (void)aggregator->ingest(make_event(nan, OptionSide::Call, kBase + i, 10, Initiator::Ask));
    }
    (void)aggregator->ingest(make_event(inf, OptionSide::Put, kBase + 5, 10, Initiator::Ask));

    EXPECT_EQ(aggregator->active_keys(), 0u);
    EXPECT_EQ(aggregator->stats().events_rejected, 6u);
    EXPECT_EQ(aggregator->stats().events_accepted, 0u);
}

TEST_F(PressureAggregatorTest, OutOfOrderWithinBucketKeepsEventTimeClose) {
    (void)aggregator->ingest(make_event(100, OptionSide::Call, kBase + 100, 1, Initiator::Ask, 3.0));
    (void)aggregator->ingest(make_event(100, OptionSide::Call, kBase + 50, 1, Initiator::Ask, 1.0));

    auto window = aggregator->open_window(InstrumentKey{100, OptionSide::Call});
    ASSERT_TRUE(window.has_value());
    EXPECT_DOUBLE_EQ(window->close_price, 3.0);
    EXPECT_DOUBLE_EQ(window->low_price, 1.0);
    EXPECT_DOUBLE_EQ(window->high_price, 3.0);
}

TEST_F(PressureAggregatorTest, EvictIdleClosesQuietKeys) {
    (void)aggregator->ingest(make_event(100, OptionSide::Call, kBase, 10, Initiator::Ask));
    (void)aggregator->ingest(make_event(110, OptionSide::Call, kBase + 25 * kMillisPerMinute, 10, Initiator::Ask));

    auto evicted = aggregator->evict_idle(kBase + 31 * kMillisPerMinute);

    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_DOUBLE_EQ(evicted[0].key.strike, 100.0);
    EXPECT_EQ(aggregator->active_keys(), 1u);
    EXPECT_EQ(aggregator->stats().keys_evicted, 1u);
}

TEST_F(PressureAggregatorTest, FlushReturnsSortedWindows) {
    (void)aggregator->ingest(make_event(110, OptionSide::Call, kBase + kWindow, 10, Initiator::Ask));
    (void)aggregator->ingest(make_event(105, OptionSide::Put, kBase, 10, Initiator::Ask));
    (void)aggregator->ingest(make_event(100, OptionSide::Call, kBase, 10, Initiator::Ask));

    auto windows = aggregator->flush();

    ASSERT_EQ(windows.size(), 3u);
    EXPECT_DOUBLE_EQ(windows[0].key.strike, 100.0);
    EXPECT_DOUBLE_EQ(windows[1].key.strike, 105.0);
    EXPECT_DOUBLE_EQ(windows[2].key.strike, 110.0);
    EXPECT_EQ(aggregator->active_keys(), 0u);
}

// ============================================================================
// PressureWindow derived values
// ============================================================================

TEST(PressureWindowTest, RatioUsesFloorOfOneForBid) {
    PressureWindow window;
    window.ask_volume = 300.0;
    window.bid_volume = 0.0;
    EXPECT_DOUBLE_EQ(window.pressure_ratio(), 300.0);

    window.bid_volume = 100.0;
    EXPECT_DOUBLE_EQ(window.pressure_ratio(), 3.0);
}

TEST(PressureWindowTest, DominantSideHasDeadBand) {
    PressureWindow window;
    window.ask_volume = 105.0;
    window.bid_volume = 100.0;
    EXPECT_EQ(window.dominant_side(), DominantSide::Neutral);

    window.ask_volume = 120.0;
    EXPECT_EQ(window.dominant_side(), DominantSide::Buy);

    window.ask_volume = 50.0;
    EXPECT_EQ(window.dominant_side(), DominantSide::Sell);
}

TEST(PressureWindowTest, EmptyWindowHasZeroCompleteness) {
    PressureWindow window;
    EXPECT_DOUBLE_EQ(window.data_completeness(), 0.0);
    EXPECT_DOUBLE_EQ(window.vwap(), 0.0);
    EXPECT_DOUBLE_EQ(window.price_change_pct(), 0.0);
}

TEST(PressureWindowTest, DayOfFloorsPreEpoch) {
    EXPECT_EQ(day_of(0), 0);
    EXPECT_EQ(day_of(kMillisPerDay - 1), 0);
    EXPECT_EQ(day_of(kMillisPerDay), 1);
    EXPECT_EQ(day_of(-1), -1);
}
