#include "output/signal_logger.hpp"
#include <spdlog/spdlog.h>

namespace flowscope::output {

SignalLogger::SignalLogger(std::chrono::milliseconds interval)
    : interval_(interval)
    , last_output_(std::chrono::steady_clock::now())
{}

void SignalLogger::log_signal(const Signal& signal) {
    // Format: SIGNAL: 21900C EXTREME LONG conf 0.91 | ratio 3.20 z 6.7 | mm 0.05 | STRONG_BUY x3.0
    spdlog::warn(
        "SIGNAL: {} {} {} conf {:.2f} | ratio {:.2f} z {:.1f} pct {:.0f} | mm {:.2f}{} | {} x{:.1f}",
        to_string(signal.key),
        to_string(signal.strength),
        to_string(signal.direction),
        signal.confidence,
        signal.pressure_ratio,
        signal.z_score,
        signal.percentile_rank,
        signal.market_making_score,
        signal.straddle_detected ? " (straddle)" : "",
        to_string(signal.action),
        signal.position_size_multiplier
    );
}

void SignalLogger::log_suppression(const SuppressionDiagnostic& diagnostic) {
    spdlog::debug("SUPPRESSED: {} @{} {} | data quality {:.2f} | completeness {:.2f}{}",
                  to_string(diagnostic.key),
                  diagnostic.window_start,
                  to_string(diagnostic.reason),
                  diagnostic.data_quality,
                  diagnostic.window_completeness,
                  diagnostic.detail.empty() ? "" : " | " + diagnostic.detail);
}

bool SignalLogger::log_stats(const PipelineStats& pipeline, const BaselineStoreStats& baseline) {
    auto now = std::chrono::steady_clock::now();

    if (!force_next_ && (now - last_output_) < interval_) {
        return false;
    }

    force_next_ = false;
    last_output_ = now;

    spdlog::info(
        "EVENTS: {} | WINDOWS: {} | BATCHES: {} | SIGNALS: {} | BAD LINES: {} | "
        "BASELINE keys {} applied {} stale {} dropped {}{}",
        pipeline.events_ingested,
        pipeline.windows_closed,
        pipeline.batches_evaluated,
        pipeline.signals_emitted,
        pipeline.parse_failures,
        baseline.keys_tracked,
        baseline.records_applied,
        baseline.stale_windows,
        baseline.records_dropped,
        baseline.persistence_failures > 0 ? " (memory-only)" : ""
    );

    return true;
}

void SignalLogger::force_next() {
    force_next_ = true;
}

}  // namespace flowscope::output
