#pragma once

#include "aggregator/pressure_window.hpp"
#include "core/config.hpp"
#include "engine/signal_algorithm.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace flowscope {

class BaselineStore;

/// Which algorithms produced a signal for a window
enum class ComparisonOutcome : std::uint8_t {
    Both,
    PrimaryOnly,
    ReferenceOnly,
    Neither
};

[[nodiscard]] std::string_view to_string(ComparisonOutcome outcome) noexcept;

struct KeyComparison {
    InstrumentKey key;
    TimestampMs window_start{0};
    ComparisonOutcome outcome{ComparisonOutcome::Neither};
    bool direction_agrees{false};  // Only meaningful for Both
    double primary_confidence{0.0};
    double reference_confidence{0.0};
    double confidence_delta{0.0};  // primary - reference, 0 unless Both
};

struct OutcomeCounts {
    std::size_t both{0};
    std::size_t primary_only{0};
    std::size_t reference_only{0};
    std::size_t neither{0};

    [[nodiscard]] std::size_t total() const noexcept {
        return both + primary_only + reference_only + neither;
    }
};

struct ComparisonResult {
    std::string primary_name;
    std::string reference_name;
    std::vector<KeyComparison> keys;
    std::chrono::microseconds primary_latency{0};
    std::chrono::microseconds reference_latency{0};
    OutcomeCounts counts;
    std::vector<Signal> primary_signals;
    std::vector<Signal> reference_signals;
};

/// Running totals across every compared batch
struct ComparisonSummary {
    std::size_t batches{0};
    OutcomeCounts counts;
    std::size_t direction_agreements{0};
    double total_primary_latency_us{0.0};
    double total_reference_latency_us{0.0};
    double total_abs_confidence_delta{0.0};

    /// Share of windows where both agreed (same direction, or both silent)
    [[nodiscard]] double agreement_rate() const noexcept;
    [[nodiscard]] double mean_primary_latency_us() const noexcept;
    [[nodiscard]] double mean_reference_latency_us() const noexcept;

    /// Mean |primary - reference| over windows where both emitted
    [[nodiscard]] double mean_abs_confidence_delta() const noexcept;
};

/// Runs two algorithms on the same batch and records how they differ
/// Results stay inside the harness; neither algorithm sees the other.
class ComparisonHarness {
public:
    /// @throws ConfigError if either algorithm is missing
    ComparisonHarness(std::unique_ptr<SignalAlgorithm> primary,
                      std::unique_ptr<SignalAlgorithm> reference);

    /// Institutional engine over store versus the volume-ratio reference
    /// @throws ConfigError if config fails validation
    ComparisonHarness(const Config& config, BaselineStore& store);

    [[nodiscard]] ComparisonResult compare_once(const std::vector<PressureWindow>& batch);

    [[nodiscard]] const ComparisonSummary& summary() const noexcept { return summary_; }

    [[nodiscard]] SignalAlgorithm& primary() noexcept { return *primary_; }
    [[nodiscard]] SignalAlgorithm& reference() noexcept { return *reference_; }

private:
    std::unique_ptr<SignalAlgorithm> primary_;
    std::unique_ptr<SignalAlgorithm> reference_;
    ComparisonSummary summary_;
};

}  // namespace flowscope
