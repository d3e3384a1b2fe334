#include <benchmark/benchmark.h>
#include "baseline/baseline_store.hpp"
#include "coordination/coordination_index.hpp"
#include "detection/market_making_detector.hpp"
#include "detection/recent_history.hpp"
#include "engine/signal_engine.hpp"
#include "scoring/confidence_scorer.hpp"
#include <chrono>
#include <cstdint>
#include <vector>

using namespace flowscope;

namespace {

constexpr TimestampMs kT0 = 1'700'000'100'000;

std::vector<PressureWindow> make_batch(std::size_t strikes, TimestampMs start) {
    std::vector<PressureWindow> windows;
    windows.reserve(strikes * 2);
    for (std::size_t i = 0; i < strikes; ++i) {
        for (auto side : {OptionSide::Call, OptionSide::Put}) {
            PressureWindow window;
            window.key = InstrumentKey{20000.0 + 5.0 * static_cast<double>(i), side};
            window.window_start = start;
            window.window_end = start + 300'000;
            window.ask_volume = side == OptionSide::Call ? 300.0 + static_cast<double>(i % 50) : 120.0;
            window.bid_volume = 100.0;
            window.trade_count = 20;
            window.open_price = 10.0;
            window.close_price = 10.5;
            windows.push_back(window);
        }
    }
    return windows;
}

}  // namespace

// Whole-batch evaluation: gates, detection, coordination and scoring per key
static void BM_SignalEngineEvaluateBatch(benchmark::State& state) {
    const Config config = Config::defaults();
    BaselineStore store(config.baseline);
    SignalEngine engine(config, store);

    TimestampMs start = kT0;
    const auto strikes = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        state.PauseTiming();
        auto batch = make_batch(strikes, start);
        start += 300'000;
        state.ResumeTiming();

        benchmark::DoNotOptimize(engine.evaluate(batch));
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(strikes * 2));
}
BENCHMARK(BM_SignalEngineEvaluateBatch)->Range(8, 512);

static void BM_ConfidenceScore(benchmark::State& state) {
    const Config config = Config::defaults();
    ConfidenceScorer scorer(config);

    BaselineContext baseline;
    baseline.mean = 0.99;
    baseline.std_dev = 0.3;
    baseline.data_quality = 1.0;
    baseline.is_default = false;

    const auto batch = make_batch(64, kT0);
    const CoordinationIndex index(batch);
    const MarketMakingAssessment mm{};
    for (auto _ : state) {
        benchmark::DoNotOptimize(scorer.score(batch.front(), baseline, mm, &index));
    }
}
BENCHMARK(BM_ConfidenceScore);

static void BM_MarketMakingDetect(benchmark::State& state) {
    const Config config = Config::defaults();
    MarketMakingDetector detector(config.market_making);
    RecentHistory history(
        std::chrono::duration_cast<std::chrono::milliseconds>(config.engine.history).count(),
        config.engine.history_capacity);

    const auto batch = make_batch(static_cast<std::size_t>(state.range(0)), kT0);
    const CoordinationIndex index(batch);
    for (auto _ : state) {
        benchmark::DoNotOptimize(detector.assess(batch.front(), history, index));
    }
}
BENCHMARK(BM_MarketMakingDetect)->Range(8, 512);

BENCHMARK_MAIN();
