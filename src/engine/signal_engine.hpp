#pragma once

#include "baseline/baseline_store.hpp"
#include "coordination/coordination_index.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "detection/market_making_detector.hpp"
#include "detection/recent_history.hpp"
#include "engine/signal_algorithm.hpp"
#include "scoring/confidence_scorer.hpp"
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace flowscope {

/// Lifecycle of one key inside the engine
enum class KeyState : std::uint8_t {
    Idle,
    WindowOpen,
    WindowClosed,
    Scored,
    Emitted,
    Suppressed
};

/// Why an evaluated window produced no signal
enum class SuppressionReason : std::uint8_t {
    PressureBelowMinimum,
    VolumeBelowMinimum,
    DataQualityBelowMinimum,
    BaselineQualityBelowMinimum,
    ConfidenceBelowFloor,
    ComputationFailure
};

inline constexpr std::size_t kSuppressionReasonCount = 6;

[[nodiscard]] std::string_view to_string(KeyState state) noexcept;
[[nodiscard]] std::string_view to_string(SuppressionReason reason) noexcept;

/// Operator-facing record of a suppressed window
struct SuppressionDiagnostic {
    InstrumentKey key;
    TimestampMs window_start{0};
    SuppressionReason reason{SuppressionReason::ConfidenceBelowFloor};
    Percentage data_quality{0.0};         // Baseline data quality
    Percentage window_completeness{0.0};  // Usable events in the window
    double confidence{0.0};
    std::string detail;
};

struct EngineStats {
    std::size_t batches{0};
    std::size_t windows_evaluated{0};
    std::size_t signals_emitted{0};
    std::array<std::size_t, kSuppressionReasonCount> suppressed{};
    std::size_t failures{0};

    [[nodiscard]] std::size_t suppressed_total() const noexcept;
    [[nodiscard]] std::size_t suppressed_for(SuppressionReason reason) const noexcept {
        return suppressed[static_cast<std::size_t>(reason)];
    }
};

/// Full institutional-flow pipeline for one batch of closed windows
///
/// Per window: baseline lookup, market-making assessment, hard gates,
/// confidence scoring, signal construction. Every evaluated window is
/// recorded into the baseline store and the recent history. Failures are
/// contained per key; evaluate() only throws on allocation failure.
/// Not thread-safe: call evaluate() from one thread.
class SignalEngine final : public SignalAlgorithm {
public:
    /// @throws ConfigError if config fails validation
    SignalEngine(const Config& config, BaselineStore& store);

    [[nodiscard]] std::string_view name() const noexcept override { return kInstitutionalAlgorithm; }

    [[nodiscard]] std::vector<Signal> evaluate(const std::vector<PressureWindow>& batch) override;

    /// Note that the ingestion side opened a window for key
    void mark_window_open(const InstrumentKey& key);

    [[nodiscard]] KeyState key_state(const InstrumentKey& key) const;

    /// Suppressions from the most recent evaluate() call
    [[nodiscard]] const std::vector<SuppressionDiagnostic>& last_diagnostics() const noexcept {
        return diagnostics_;
    }

    [[nodiscard]] const EngineStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const RecentHistory& history() const noexcept { return history_; }

private:
    /// Outcome of one window; exactly one of signal/suppression is set
    struct Outcome {
        std::optional<Signal> signal;
        std::optional<SuppressionDiagnostic> suppression;
    };

    [[nodiscard]] Outcome evaluate_window(const PressureWindow& window, const CoordinationIndex& index);
    [[nodiscard]] std::optional<SuppressionReason> check_gates(const PressureWindow& window,
                                                               const BaselineContext& baseline) const;
    [[nodiscard]] Signal make_signal(const PressureWindow& window,
                                     const BaselineContext& baseline,
                                     const MarketMakingAssessment& mm,
                                     const ConfidenceBreakdown& score) const;
    void record_suppression(SuppressionDiagnostic diagnostic);

    Config config_;
    BaselineStore& store_;
    MarketMakingDetector detector_;
    ConfidenceScorer scorer_;
    RecentHistory history_;

    std::unordered_map<InstrumentKey, KeyState> states_;
    std::vector<SuppressionDiagnostic> diagnostics_;
    EngineStats stats_;
};

}  // namespace flowscope
