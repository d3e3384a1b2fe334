#include <benchmark/benchmark.h>
#include "core/messages.hpp"
#include "queue/spsc_queue.hpp"
#include <cstdint>

using namespace flowscope;

namespace {

Event make_event() {
    return Event{InstrumentKey{21900.0, OptionSide::Call}, 1'700'000'100'000, 12.5, 10.0, Initiator::Ask};
}

}  // namespace

// Benchmark single push/pop cycle
static void BM_SpscQueuePushPop(benchmark::State& state) {
    SpscQueue<int, 65536> queue;
    for (auto _ : state) {
        (void)queue.try_push(42);
        benchmark::DoNotOptimize(queue.try_pop());
    }
}
BENCHMARK(BM_SpscQueuePushPop);

// Reader-to-engine message, the payload the replay actually moves
static void BM_SpscQueuePipelineMessage(benchmark::State& state) {
    SpscQueue<PipelineMessage, 65536> queue;
    const auto event = make_event();
    std::size_t line = 0;

    for (auto _ : state) {
        (void)queue.try_push(PipelineMessage{EventMsg{event, ++line}});
        benchmark::DoNotOptimize(queue.try_pop());
    }
    state.SetBytesProcessed(state.iterations() * sizeof(PipelineMessage) * 2);
}
BENCHMARK(BM_SpscQueuePipelineMessage);

// Batch push then batch pop
static void BM_SpscQueueBatchPushPop(benchmark::State& state) {
    const auto batch = static_cast<std::size_t>(state.range(0));
    SpscQueue<PipelineMessage, 65536> queue;
    const auto event = make_event();

    for (auto _ : state) {
        for (std::size_t i = 0; i < batch; ++i) {
            (void)queue.try_push(PipelineMessage{EventMsg{event, i}});
        }
        for (std::size_t i = 0; i < batch; ++i) {
            benchmark::DoNotOptimize(queue.try_pop());
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(batch) * 2);
}
BENCHMARK(BM_SpscQueueBatchPushPop)->Range(64, 8192);

// Full queue push (fast rejection, the reader's backpressure path)
static void BM_SpscQueueFullPush(benchmark::State& state) {
    constexpr std::size_t kCapacity = 1024;
    SpscQueue<PipelineMessage, kCapacity> queue;

    while (queue.try_push(PipelineMessage{Shutdown{}})) {}

    for (auto _ : state) {
        benchmark::DoNotOptimize(queue.try_push(PipelineMessage{Shutdown{}}));
    }
}
BENCHMARK(BM_SpscQueueFullPush);

BENCHMARK_MAIN();
