#include "output/json_formatter.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace flowscope::output {

nlohmann::json JsonFormatter::format_signal(const Signal& signal) {
    return nlohmann::json{
        {"type", "signal"},
        {"timestamp", iso_timestamp(signal.timestamp)},
        {"windowStart", signal.window_start},
        {"windowEnd", signal.timestamp},
        {"strike", signal.key.strike},
        {"side", to_string(signal.key.side)},
        {"algorithm", signal.algorithm},
        {"pressure", {
            {"ratio", signal.pressure_ratio},
            {"bidVolume", signal.bid_volume},
            {"askVolume", signal.ask_volume},
            {"totalVolume", signal.total_volume},
            {"dominantSide", to_string(signal.dominant_side)}
        }},
        {"baseline", {
            {"zScore", signal.z_score},
            {"percentileRank", signal.percentile_rank},
            {"dataQuality", signal.baseline_quality}
        }},
        {"marketMaking", {
            {"score", signal.market_making_score},
            {"straddle", signal.straddle_detected},
            {"volatilityCrush", signal.volatility_crush}
        }},
        {"components", {
            {"pressureSignificance", signal.components.pressure_significance},
            {"trendStrength", signal.components.trend_strength},
            {"volumeConcentration", signal.components.volume_concentration},
            {"timePersistence", signal.components.time_persistence},
            {"pressureTerm", signal.components.pressure_term},
            {"baselineDeviation", signal.components.baseline_deviation},
            {"marketMakingPenalty", signal.components.market_making_penalty},
            {"coordinationBonus", signal.components.coordination_bonus},
            {"coordinatedPeers", signal.components.coordinated_peers}
        }},
        {"confidence", signal.confidence},
        {"strength", to_string(signal.strength)},
        {"direction", to_string(signal.direction)},
        {"action", to_string(signal.action)},
        {"riskScore", signal.risk_score},
        {"positionSizeMultiplier", signal.position_size_multiplier}
    };
}

nlohmann::json JsonFormatter::format_diagnostic(const SuppressionDiagnostic& diagnostic) {
    return nlohmann::json{
        {"type", "suppression"},
        {"windowStart", diagnostic.window_start},
        {"strike", diagnostic.key.strike},
        {"side", to_string(diagnostic.key.side)},
        {"reason", to_string(diagnostic.reason)},
        {"dataQuality", diagnostic.data_quality},
        {"windowCompleteness", diagnostic.window_completeness},
        {"confidence", diagnostic.confidence},
        {"detail", diagnostic.detail}
    };
}

nlohmann::json JsonFormatter::format_comparison(const ComparisonResult& result) {
    auto keys = nlohmann::json::array();
    for (const auto& row : result.keys) {
        keys.push_back({
            {"strike", row.key.strike},
            {"side", to_string(row.key.side)},
            {"windowStart", row.window_start},
            {"outcome", to_string(row.outcome)},
            {"directionAgrees", row.direction_agrees},
            {"primaryConfidence", row.primary_confidence},
            {"referenceConfidence", row.reference_confidence},
            {"confidenceDelta", row.confidence_delta}
        });
    }

    return nlohmann::json{
        {"type", "comparison"},
        {"primary", result.primary_name},
        {"reference", result.reference_name},
        {"primaryLatencyUs", result.primary_latency.count()},
        {"referenceLatencyUs", result.reference_latency.count()},
        {"counts", {
            {"both", result.counts.both},
            {"primaryOnly", result.counts.primary_only},
            {"referenceOnly", result.counts.reference_only},
            {"neither", result.counts.neither}
        }},
        {"keys", std::move(keys)}
    };
}

nlohmann::json JsonFormatter::format_summary(const ComparisonSummary& summary) {
    return nlohmann::json{
        {"type", "comparisonSummary"},
        {"timestamp", iso_timestamp()},
        {"batches", summary.batches},
        {"windows", summary.counts.total()},
        {"counts", {
            {"both", summary.counts.both},
            {"primaryOnly", summary.counts.primary_only},
            {"referenceOnly", summary.counts.reference_only},
            {"neither", summary.counts.neither}
        }},
        {"agreementRate", summary.agreement_rate()},
        {"meanPrimaryLatencyUs", summary.mean_primary_latency_us()},
        {"meanReferenceLatencyUs", summary.mean_reference_latency_us()},
        {"meanAbsConfidenceDelta", summary.mean_abs_confidence_delta()}
    };
}

std::string JsonFormatter::iso_timestamp(TimestampMs ts) {
    TimestampMs seconds = ts / 1000;
    TimestampMs millis = ts % 1000;
    if (millis < 0) {
        millis += 1000;
        --seconds;
    }

    const auto time_t_value = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&time_t_value, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string JsonFormatter::iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    return iso_timestamp(std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count());
}

}  // namespace flowscope::output
