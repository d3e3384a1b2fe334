#pragma once

#include "baseline/baseline_store.hpp"
#include "engine/signal_engine.hpp"
#include "engine/signal_pipeline.hpp"
#include "scoring/signal.hpp"
#include <chrono>

namespace flowscope::output {

/// Operator-facing log lines for signals and pipeline progress
class SignalLogger {
public:
    /// @param interval Minimum time between statistics lines
    explicit SignalLogger(std::chrono::milliseconds interval);

    /// Log an emitted signal (always logs, not rate limited)
    void log_signal(const Signal& signal);

    /// Log a suppressed window at debug level
    void log_suppression(const SuppressionDiagnostic& diagnostic);

    /// Log pipeline and baseline counters (respects rate limiting)
    /// @return true if logged, false if rate limited
    bool log_stats(const PipelineStats& pipeline, const BaselineStoreStats& baseline);

    /// Force next log_stats to output regardless of rate limit
    void force_next();

private:
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_output_;
    bool force_next_{false};
};

}  // namespace flowscope::output
