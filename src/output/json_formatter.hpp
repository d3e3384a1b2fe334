#pragma once

#include "comparison/comparison_harness.hpp"
#include "engine/signal_engine.hpp"
#include "scoring/signal.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace flowscope::output {

/// Formats engine output as JSON for offline tooling
class JsonFormatter {
public:
    [[nodiscard]] static nlohmann::json format_signal(const Signal& signal);

    [[nodiscard]] static nlohmann::json format_diagnostic(const SuppressionDiagnostic& diagnostic);

    [[nodiscard]] static nlohmann::json format_comparison(const ComparisonResult& result);

    [[nodiscard]] static nlohmann::json format_summary(const ComparisonSummary& summary);

    /// ISO8601 UTC string for an event timestamp
    [[nodiscard]] static std::string iso_timestamp(TimestampMs ts);

    /// Get current ISO8601 timestamp string
    [[nodiscard]] static std::string iso_timestamp();
};

}  // namespace flowscope::output
