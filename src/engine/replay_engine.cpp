#include "engine/replay_engine.hpp"
#include "baseline/baseline_persistence.hpp"
#include "core/errors.hpp"
#include "ingest/event_parser.hpp"
#include "output/json_formatter.hpp"
#include <fstream>
#include <iostream>
#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace flowscope {

ReplayEngine::ReplayEngine(const Config& config, ReplayOptions options)
    : config_(config)
    , options_(std::move(options))
{
    setup_logging();

    if (auto problem = config_.validate()) {
        throw ConfigError(*problem);
    }

    store_ = std::make_unique<BaselineStore>(config_.baseline, make_persistence(config_.baseline));

    if (options_.compare) {
        harness_ = std::make_unique<ComparisonHarness>(config_, *store_);
        institutional_ = dynamic_cast<SignalEngine*>(&harness_->primary());
    } else {
        algorithm_ = make_algorithm(config_, *store_);
        institutional_ = dynamic_cast<SignalEngine*>(algorithm_.get());
    }

    pipeline_ = std::make_unique<SignalPipeline>(
        config_.window,
        [this](const std::vector<PressureWindow>& batch) { return evaluate_batch(batch); },
        [this](const Signal& signal) { emit_signal(signal); }
    );
    if (institutional_ != nullptr) {
        pipeline_->set_window_open_callback([this](const InstrumentKey& key) {
            institutional_->mark_window_open(key);
        });
    }

    logger_ = std::make_unique<output::SignalLogger>(config_.logging.stats_interval);
}

ReplayEngine::~ReplayEngine() {
    if (engine_thread_.joinable()) {
        abort_.store(true);
        (void)queue_.try_push(Shutdown{});
        engine_thread_.join();
    }
}

void ReplayEngine::setup_logging() {
    // Async logging on stderr; stdout carries the JSON signal stream
    spdlog::init_thread_pool(8192, 1);

    auto log_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::async_logger>(
        "flowscope",
        log_sink,
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::overrun_oldest
    );

    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config_.logging.level));
}

int ReplayEngine::run() {
    spdlog::info("Starting flowscope replay");
    spdlog::info("Input: {}", options_.input_path.empty() ? "-" : options_.input_path);

    store_->start();

    engine_thread_ = std::thread([this]() {
        engine_thread_func();
    });

    // Reader runs on the calling thread
    reader_thread_func();

    if (engine_thread_.joinable()) {
        engine_thread_.join();
    }

    store_->stop();

    logger_->force_next();
    output_stats();

    if (harness_) {
        std::cout << output::JsonFormatter::format_summary(harness_->summary()).dump() << std::endl;
    }

    spdlog::info("Replay complete");
    return input_failed_.load() ? 1 : 0;
}

void ReplayEngine::request_shutdown() {
    shutdown_requested_.store(true);
}

bool ReplayEngine::shutdown_requested() const noexcept {
    return shutdown_requested_.load();
}

void ReplayEngine::reader_thread_func() {
    spdlog::debug("Reader thread started");

    std::ifstream file;
    std::istream* input = &std::cin;
    if (!options_.input_path.empty() && options_.input_path != "-") {
        file.open(options_.input_path);
        if (!file.is_open()) {
            spdlog::error("Cannot open input file: {}", options_.input_path);
            input_failed_.store(true);
        }
        input = &file;
    }

    std::size_t line_no = 0;
    std::string line;
    while (!input_failed_.load() && !shutdown_requested_.load() && std::getline(*input, line)) {
        ++line_no;
        if (EventParser::is_skippable(line)) {
            continue;
        }

        auto parsed = EventParser::parse_event(line);
        PipelineMessage message = parsed.is_ok()
            ? PipelineMessage{EventMsg{parsed.value(), line_no}}
            : PipelineMessage{ParseFailure{line_no, parsed.error()}};

        if (!queue_.push_wait(std::move(message), abort_)) {
            break;
        }
    }

    // Engine thread finishes on this message
    (void)queue_.push_wait(PipelineMessage{EndOfStream{line_no}}, abort_);

    spdlog::debug("Reader thread stopped after {} lines", line_no);
}

void ReplayEngine::engine_thread_func() {
    spdlog::debug("Engine thread started");

    while (!abort_.load()) {
        // Poll for messages
        if (auto msg = queue_.try_pop()) {
            process_message(*msg);

            if (std::holds_alternative<EndOfStream>(*msg) || std::holds_alternative<Shutdown>(*msg)) {
                break;
            }
        } else {
            // No message, do periodic tasks
            output_stats();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    spdlog::debug("Engine thread stopped");
}

void ReplayEngine::process_message(const PipelineMessage& message) {
    std::visit([this](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;

        if constexpr (std::is_same_v<T, EventMsg>) {
            pipeline_->on_event(msg.event);
        } else if constexpr (std::is_same_v<T, ParseFailure>) {
            spdlog::debug("Skipping line {}: {}", msg.line, msg.reason);
            pipeline_->on_parse_failure();
        } else if constexpr (std::is_same_v<T, EndOfStream>) {
            spdlog::info("End of input after {} lines", msg.lines_read);
            pipeline_->finish();
        } else if constexpr (std::is_same_v<T, Shutdown>) {
            spdlog::info("Shutdown message received");
        }
    }, message);

    output_stats();
}

std::vector<Signal> ReplayEngine::evaluate_batch(const std::vector<PressureWindow>& batch) {
    std::vector<Signal> signals;
    if (harness_) {
        auto result = harness_->compare_once(batch);
        spdlog::debug("Comparison: {}", output::JsonFormatter::format_comparison(result).dump());
        // The reference algorithm only feeds the summary
        signals = std::move(result.primary_signals);
    } else {
        signals = algorithm_->evaluate(batch);
    }

    log_diagnostics();
    return signals;
}

void ReplayEngine::emit_signal(const Signal& signal) {
    logger_->log_signal(signal);
    std::cout << output::JsonFormatter::format_signal(signal).dump() << '\n';
}

void ReplayEngine::log_diagnostics() {
    if (institutional_ == nullptr) {
        return;
    }
    for (const auto& diagnostic : institutional_->last_diagnostics()) {
        logger_->log_suppression(diagnostic);
    }
}

void ReplayEngine::output_stats() {
    logger_->log_stats(pipeline_->stats(), store_->stats());
}

}  // namespace flowscope
