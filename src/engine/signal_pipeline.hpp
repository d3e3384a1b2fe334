#pragma once

#include "aggregator/pressure_aggregator.hpp"
#include "aggregator/pressure_window.hpp"
#include "core/config.hpp"
#include "scoring/signal.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <vector>

namespace flowscope {

struct PipelineStats {
    std::size_t events_ingested{0};
    std::size_t parse_failures{0};
    std::size_t windows_closed{0};
    std::size_t batches_evaluated{0};
    std::size_t late_windows{0};  // Closed after their batch was evaluated
    std::size_t signals_emitted{0};
};

/// Event stream to signals: aggregation, batching and evaluation
///
/// Closed windows are grouped by window start. A batch is evaluated once
/// the event-time watermark passes its window end plus one window length,
/// giving lagging keys a grace period to close into the same batch.
/// Not thread-safe; driven from the engine thread.
class SignalPipeline {
public:
    using BatchEvaluator = std::function<std::vector<Signal>(const std::vector<PressureWindow>&)>;
    using SignalCallback = std::function<void(const Signal&)>;
    using KeyCallback = std::function<void(const InstrumentKey&)>;

    SignalPipeline(const Config::Window& config, BatchEvaluator evaluate, SignalCallback on_signal);

    /// Called whenever a key starts accumulating a new window
    void set_window_open_callback(KeyCallback callback);

    void on_event(const Event& event);

    void on_parse_failure();

    /// Close every open window and evaluate all pending batches
    void finish();

    [[nodiscard]] const PipelineStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const AggregatorStats& aggregator_stats() const noexcept { return aggregator_.stats(); }
    [[nodiscard]] std::size_t pending_windows() const noexcept;
    [[nodiscard]] TimestampMs watermark() const noexcept { return watermark_; }

private:
    void stage(PressureWindow window);
    void evaluate_ready();
    void evaluate_batch(std::vector<PressureWindow> batch);

    PressureAggregator aggregator_;
    TimestampMs window_ms_;
    std::size_t idle_check_events_;

    BatchEvaluator evaluate_;
    SignalCallback on_signal_;
    KeyCallback on_window_open_;

    std::map<TimestampMs, std::vector<PressureWindow>> pending_;
    TimestampMs watermark_{0};
    TimestampMs last_evaluated_start_{0};
    bool has_evaluated_{false};
    std::size_t events_since_sweep_{0};
    PipelineStats stats_;
};

}  // namespace flowscope
