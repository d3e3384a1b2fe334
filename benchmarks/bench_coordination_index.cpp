#include <benchmark/benchmark.h>
#include "coordination/coordination_index.hpp"
#include <vector>

using namespace flowscope;

namespace {

constexpr TimestampMs kT0 = 1'700'000'100'000;

/// One call and one put per strike, 5 points apart
std::vector<PressureWindow> make_batch(std::size_t strikes) {
    std::vector<PressureWindow> windows;
    windows.reserve(strikes * 2);
    for (std::size_t i = 0; i < strikes; ++i) {
        for (auto side : {OptionSide::Call, OptionSide::Put}) {
            PressureWindow window;
            window.key = InstrumentKey{20000.0 + 5.0 * static_cast<double>(i), side};
            window.window_start = kT0;
            window.window_end = kT0 + 300'000;
            window.ask_volume = 300.0;
            window.bid_volume = 100.0;
            windows.push_back(window);
        }
    }
    return windows;
}

}  // namespace

// Build cost per batch
static void BM_CoordinationIndexBuild(benchmark::State& state) {
    const auto batch = make_batch(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        CoordinationIndex index(batch);
        benchmark::DoNotOptimize(index.size());
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_CoordinationIndexBuild)->RangeMultiplier(4)->Range(16, 16384)->Complexity(benchmark::oNLogN);

// Radius lookup should stay logarithmic in the batch size
static void BM_CoordinationIndexCountNearby(benchmark::State& state) {
    const CoordinationIndex index(make_batch(static_cast<std::size_t>(state.range(0))));
    const double middle = 20000.0 + 2.5 * static_cast<double>(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(index.count_nearby(middle, 50.0));
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_CoordinationIndexCountNearby)->RangeMultiplier(4)->Range(16, 16384)->Complexity(benchmark::oLogN);

static void BM_CoordinationIndexNearby(benchmark::State& state) {
    const CoordinationIndex index(make_batch(static_cast<std::size_t>(state.range(0))));
    const double middle = 20000.0 + 2.5 * static_cast<double>(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(index.nearby(middle, 50.0, kT0, 300'000));
    }
}
BENCHMARK(BM_CoordinationIndexNearby)->Range(16, 16384);

// Linear scan for comparison
static void BM_CoordinationBruteForce(benchmark::State& state) {
    const auto batch = make_batch(static_cast<std::size_t>(state.range(0)));
    const double middle = 20000.0 + 2.5 * static_cast<double>(state.range(0));
    for (auto _ : state) {
        std::size_t count = 0;
        for (const auto& window : batch) {
            if (window.key.strike >= middle - 50.0 && window.key.strike <= middle + 50.0) {
                ++count;
            }
        }
        benchmark::DoNotOptimize(count);
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_CoordinationBruteForce)->RangeMultiplier(4)->Range(16, 16384)->Complexity(benchmark::oN);

BENCHMARK_MAIN();
