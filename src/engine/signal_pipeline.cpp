#include "engine/signal_pipeline.hpp"
#include <spdlog/spdlog.h>

namespace flowscope {

SignalPipeline::SignalPipeline(const Config::Window& config, BatchEvaluator evaluate,
                               SignalCallback on_signal)
    : aggregator_(config)
    , window_ms_(static_cast<TimestampMs>(config.length.count()))
    , idle_check_events_(config.idle_check_events)
    , evaluate_(std::move(evaluate))
    , on_signal_(std::move(on_signal))
{}

void SignalPipeline::set_window_open_callback(KeyCallback callback) {
    on_window_open_ = std::move(callback);
}

void SignalPipeline::on_event(const Event& event) {
    ++stats_.events_ingested;
    if (event.timestamp > watermark_) {
        watermark_ = event.timestamp;
    }

    const auto before = aggregator_.open_window(event.key);
    auto closed = aggregator_.ingest(event);

    if (on_window_open_) {
        const auto after = aggregator_.open_window(event.key);
        if (after && (!before || before->window_start != after->window_start)) {
            on_window_open_(event.key);
        }
    }

    if (closed) {
        stage(std::move(*closed));
    }

    if (++events_since_sweep_ >= idle_check_events_) {
        events_since_sweep_ = 0;
        for (auto& window : aggregator_.evict_idle(watermark_)) {
            stage(std::move(window));
        }
    }

    evaluate_ready();
}

void SignalPipeline::on_parse_failure() {
    ++stats_.parse_failures;
}

void SignalPipeline::finish() {
    for (auto& window : aggregator_.flush()) {
        stage(std::move(window));
    }

    while (!pending_.empty()) {
        auto batch = std::move(pending_.begin()->second);
        pending_.erase(pending_.begin());
        evaluate_batch(std::move(batch));
    }

    spdlog::info("Pipeline finished: {} events, {} windows, {} batches, {} signals",
                 stats_.events_ingested, stats_.windows_closed,
                 stats_.batches_evaluated, stats_.signals_emitted);
}

std::size_t SignalPipeline::pending_windows() const noexcept {
    std::size_t total = 0;
    for (const auto& [start, batch] : pending_) {
        total += batch.size();
    }
    return total;
}

void SignalPipeline::stage(PressureWindow window) {
    ++stats_.windows_closed;
    if (has_evaluated_ && window.window_start <= last_evaluated_start_) {
        ++stats_.late_windows;
        spdlog::debug("Late window for {} at {}, evaluating on its own",
                      to_string(window.key), window.window_start);
    }
    pending_[window.window_start].push_back(std::move(window));
}

void SignalPipeline::evaluate_ready() {
    while (!pending_.empty()) {
        auto first = pending_.begin();
        // Grace of one window length past the bucket end
        if (first->first + 2 * window_ms_ > watermark_) {
            break;
        }
        auto batch = std::move(first->second);
        pending_.erase(first);
        evaluate_batch(std::move(batch));
    }
}

void SignalPipeline::evaluate_batch(std::vector<PressureWindow> batch) {
    if (batch.empty()) {
        return;
    }

    const TimestampMs start = batch.front().window_start;
    if (!has_evaluated_ || start > last_evaluated_start_) {
        last_evaluated_start_ = start;
        has_evaluated_ = true;
    }

    ++stats_.batches_evaluated;
    const auto signals = evaluate_(batch);
    for (const auto& signal : signals) {
        ++stats_.signals_emitted;
        if (on_signal_) {
            on_signal_(signal);
        }
    }
}

}  // namespace flowscope
