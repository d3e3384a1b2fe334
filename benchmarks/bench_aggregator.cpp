#include <benchmark/benchmark.h>
#include "aggregator/pressure_aggregator.hpp"
#include "ingest/event_parser.hpp"
#include <string>
#include <vector>

using namespace flowscope;

namespace {

constexpr TimestampMs kT0 = 1'700'000'100'000;

Event make_event(std::size_t i, std::size_t keys) {
    return Event{
        InstrumentKey{20000.0 + 5.0 * static_cast<double>(i % keys),
                      (i / keys) % 2 == 0 ? OptionSide::Call : OptionSide::Put},
        kT0 + static_cast<TimestampMs>(i) * 10,
        12.5,
        1.0 + static_cast<double>(i % 7),
        i % 3 == 0 ? Initiator::Bid : Initiator::Ask
    };
}

}  // namespace

// Single event accumulated into an open window
static void BM_AggregatorIngest(benchmark::State& state) {
    PressureAggregator aggregator(Config::defaults().window);
    const auto event = make_event(0, 1);
    for (auto _ : state) {
        benchmark::DoNotOptimize(aggregator.ingest(event));
    }
}
BENCHMARK(BM_AggregatorIngest);

// Realistic stream spread over many keys, windows closing as time advances
static void BM_AggregatorStream(benchmark::State& state) {
    const auto keys = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t kEvents = 100000;

    std::vector<Event> events;
    events.reserve(kEvents);
    for (std::size_t i = 0; i < kEvents; ++i) {
        events.push_back(make_event(i, keys));
    }

    for (auto _ : state) {
        PressureAggregator aggregator(Config::defaults().window);
        std::size_t closed = 0;
        for (const auto& event : events) {
            if (aggregator.ingest(event)) {
                ++closed;
            }
        }
        closed += aggregator.flush().size();
        benchmark::DoNotOptimize(closed);
    }
    state.SetItemsProcessed(state.iterations() * kEvents);
}
BENCHMARK(BM_AggregatorStream)->Range(8, 1024);

static void BM_AggregatorEvictIdle(benchmark::State& state) {
    const auto keys = static_cast<std::size_t>(state.range(0));
    PressureAggregator aggregator(Config::defaults().window);
    for (std::size_t i = 0; i < keys; ++i) {
        (void)aggregator.ingest(make_event(i, keys));
    }
    for (auto _ : state) {
        // Nothing is idle yet: measures the sweep itself
        benchmark::DoNotOptimize(aggregator.evict_idle(kT0 + 1000));
    }
}
BENCHMARK(BM_AggregatorEvictIdle)->Range(8, 4096);

static void BM_EventParse(benchmark::State& state) {
    const std::string line =
        R"({"strike":21900,"side":"C","ts":1700000000123,"price":12.5,"size":10,"initiator":"ask"})";
    for (auto _ : state) {
        benchmark::DoNotOptimize(EventParser::parse_event(line));
    }
}
BENCHMARK(BM_EventParse);

BENCHMARK_MAIN();
