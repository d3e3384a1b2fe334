#pragma once

#include "baseline/baseline_store.hpp"
#include "comparison/comparison_harness.hpp"
#include "core/config.hpp"
#include "core/messages.hpp"
#include "engine/signal_algorithm.hpp"
#include "engine/signal_engine.hpp"
#include "engine/signal_pipeline.hpp"
#include "output/signal_logger.hpp"
#include "queue/spsc_queue.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace flowscope {

struct ReplayOptions {
    std::string input_path;  // "-" or empty reads stdin
    bool compare = false;    // Run the comparison harness
};

/// Replays a recorded event stream through the signal pipeline
/// Reader thread parses lines into the SPSC queue; engine thread aggregates,
/// evaluates and prints signals as JSON lines on stdout.
class ReplayEngine {
public:
    /// @throws ConfigError if config fails validation
    ReplayEngine(const Config& config, ReplayOptions options);

    ~ReplayEngine();

    // Non-copyable, non-movable
    ReplayEngine(const ReplayEngine&) = delete;
    ReplayEngine& operator=(const ReplayEngine&) = delete;

    /// Replay the whole input (blocks until done)
    /// @return Process exit code
    int run();

    /// Stop reading input; what was read is still evaluated (thread-safe)
    void request_shutdown();

    [[nodiscard]] bool shutdown_requested() const noexcept;

private:
    void setup_logging();
    void reader_thread_func();
    void engine_thread_func();

    void process_message(const PipelineMessage& message);
    [[nodiscard]] std::vector<Signal> evaluate_batch(const std::vector<PressureWindow>& batch);
    void emit_signal(const Signal& signal);
    void log_diagnostics();
    void output_stats();

    const Config config_;
    const ReplayOptions options_;

    std::unique_ptr<BaselineStore> store_;
    std::unique_ptr<SignalAlgorithm> algorithm_;
    std::unique_ptr<ComparisonHarness> harness_;
    SignalEngine* institutional_{nullptr};  // Diagnostics view into algorithm_ or harness_
    std::unique_ptr<SignalPipeline> pipeline_;
    std::unique_ptr<output::SignalLogger> logger_;

    // Queue between reader and engine threads
    SpscQueue<PipelineMessage, 65536> queue_;

    std::thread engine_thread_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> abort_{false};
    std::atomic<bool> input_failed_{false};
};

}  // namespace flowscope
