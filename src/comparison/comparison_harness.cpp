#include "comparison/comparison_harness.hpp"
#include "core/errors.hpp"
#include "engine/signal_engine.hpp"
#include "engine/volume_ratio_algorithm.hpp"
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace flowscope {

namespace {

using WindowId = std::pair<InstrumentKey, TimestampMs>;

std::map<WindowId, const Signal*> index_signals(const std::vector<Signal>& signals) {
    std::map<WindowId, const Signal*> by_window;
    for (const auto& signal : signals) {
        by_window.emplace(WindowId{signal.key, signal.window_start}, &signal);
    }
    return by_window;
}

double safe_mean(double total, std::size_t count) noexcept {
    return count == 0 ? 0.0 : total / static_cast<double>(count);
}

}  // namespace

std::string_view to_string(ComparisonOutcome outcome) noexcept {
    switch (outcome) {
        case ComparisonOutcome::Both: return "both";
        case ComparisonOutcome::PrimaryOnly: return "primary_only";
        case ComparisonOutcome::ReferenceOnly: return "reference_only";
        case ComparisonOutcome::Neither: return "neither";
    }
    return "neither";
}

double ComparisonSummary::agreement_rate() const noexcept {
    return safe_mean(static_cast<double>(direction_agreements + counts.neither), counts.total());
}

double ComparisonSummary::mean_primary_latency_us() const noexcept {
    return safe_mean(total_primary_latency_us, batches);
}

double ComparisonSummary::mean_reference_latency_us() const noexcept {
    return safe_mean(total_reference_latency_us, batches);
}

double ComparisonSummary::mean_abs_confidence_delta() const noexcept {
    return safe_mean(total_abs_confidence_delta, counts.both);
}

ComparisonHarness::ComparisonHarness(std::unique_ptr<SignalAlgorithm> primary,
                                     std::unique_ptr<SignalAlgorithm> reference)
    : primary_(std::move(primary))
    , reference_(std::move(reference))
{
    if (!primary_ || !reference_) {
        throw ConfigError("comparison requires a primary and a reference algorithm");
    }
}

ComparisonHarness::ComparisonHarness(const Config& config, BaselineStore& store)
    : ComparisonHarness(std::make_unique<SignalEngine>(config, store),
                        std::make_unique<VolumeRatioAlgorithm>(config))
{}

ComparisonResult ComparisonHarness::compare_once(const std::vector<PressureWindow>& batch) {
    using Clock = std::chrono::steady_clock;

    ComparisonResult result;
    result.primary_name = std::string(primary_->name());
    result.reference_name = std::string(reference_->name());

    auto start = Clock::now();
    result.primary_signals = primary_->evaluate(batch);
    result.primary_latency = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);

    start = Clock::now();
    result.reference_signals = reference_->evaluate(batch);
    result.reference_latency = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);

    const auto primary_by_window = index_signals(result.primary_signals);
    const auto reference_by_window = index_signals(result.reference_signals);

    std::set<WindowId> windows;
    for (const auto& window : batch) {
        windows.emplace(window.key, window.window_start);
    }

    for (const auto& id : windows) {
        KeyComparison row;
        row.key = id.first;
        row.window_start = id.second;

        auto p = primary_by_window.find(id);
        auto r = reference_by_window.find(id);
        const bool has_primary = p != primary_by_window.end();
        const bool has_reference = r != reference_by_window.end();

        if (has_primary) {
            row.primary_confidence = p->second->confidence;
        }
        if (has_reference) {
            row.reference_confidence = r->second->confidence;
        }

        if (has_primary && has_reference) {
            row.outcome = ComparisonOutcome::Both;
            row.direction_agrees = p->second->direction == r->second->direction;
            row.confidence_delta = row.primary_confidence - row.reference_confidence;
            ++result.counts.both;
        } else if (has_primary) {
            row.outcome = ComparisonOutcome::PrimaryOnly;
            ++result.counts.primary_only;
        } else if (has_reference) {
            row.outcome = ComparisonOutcome::ReferenceOnly;
            ++result.counts.reference_only;
        } else {
            row.outcome = ComparisonOutcome::Neither;
            ++result.counts.neither;
        }

        result.keys.push_back(row);
    }

    ++summary_.batches;
    summary_.counts.both += result.counts.both;
    summary_.counts.primary_only += result.counts.primary_only;
    summary_.counts.reference_only += result.counts.reference_only;
    summary_.counts.neither += result.counts.neither;
    summary_.total_primary_latency_us += static_cast<double>(result.primary_latency.count());
    summary_.total_reference_latency_us += static_cast<double>(result.reference_latency.count());
    for (const auto& row : result.keys) {
        if (row.outcome == ComparisonOutcome::Both) {
            summary_.total_abs_confidence_delta += std::abs(row.confidence_delta);
            if (row.direction_agrees) {
                ++summary_.direction_agreements;
            }
        }
    }

    return result;
}

}  // namespace flowscope
