#include "ingest/event_parser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace flowscope {

using json = nlohmann::json;

namespace {

std::string upper(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

/// Number or numeric string
double read_number(const json& j, const char* field) {
    const auto& value = j.at(field);
    if (value.is_string()) {
        return std::stod(value.get<std::string>());
    }
    return value.get<double>();
}

/// Epoch milliseconds; throws std::out_of_range if it does not fit
TimestampMs read_timestamp(const json& j) {
    const auto& value = j.at("ts");
    if (value.is_string()) {
        return std::stoll(value.get<std::string>());
    }
    if (value.is_number_float()) {
        // 2^63; every double below it and at or above -2^63 converts exactly
        constexpr double kLimit = 9223372036854775808.0;
        const double ms = value.get<double>();
        if (!(ms >= -kLimit && ms < kLimit)) {
            throw std::out_of_range("timestamp out of range: " + value.dump());
        }
        return static_cast<TimestampMs>(ms);
    }
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<TimestampMs>::max())) {
        throw std::out_of_range("timestamp out of range: " + value.dump());
    }
    return value.get<TimestampMs>();
}

}  // namespace

Result<Event, std::string> EventParser::parse_event(std::string_view json_str) {
    try {
        auto j = json::parse(json_str);

        if (!j.is_object() || !j.contains("strike") || !j.contains("side") || !j.contains("ts") ||
            !j.contains("price") || !j.contains("size")) {
            return Result<Event, std::string>::Err("Missing required fields in event");
        }

        const auto side = parse_side(j["side"].get<std::string>());
        if (!side) {
            return Result<Event, std::string>::Err("Unknown option side: " + j["side"].get<std::string>());
        }

        Initiator initiator = Initiator::None;
        if (j.contains("initiator") && !j["initiator"].is_null()) {
            const auto parsed = parse_initiator(j["initiator"].get<std::string>());
            if (!parsed) {
                return Result<Event, std::string>::Err(
                    "Unknown initiator: " + j["initiator"].get<std::string>());
            }
            initiator = *parsed;
        }

        const double strike = read_number(j, "strike");
        if (!std::isfinite(strike)) {
            return Result<Event, std::string>::Err("Non-finite strike: " + j["strike"].dump());
        }

        Event event;
        event.key = InstrumentKey{strike, *side};
        event.timestamp = read_timestamp(j);
        event.price = read_number(j, "price");
        event.size = read_number(j, "size");
        event.initiator = initiator;

        return Result<Event, std::string>::Ok(event);

    } catch (const json::exception& e) {
        return Result<Event, std::string>::Err(std::string("JSON parse error: ") + e.what());
    } catch (const std::exception& e) {
        return Result<Event, std::string>::Err(std::string("Parse error: ") + e.what());
    }
}

std::optional<OptionSide> EventParser::parse_side(std::string_view text) {
    const std::string side = upper(text);
    if (side == "C" || side == "CALL") {
        return OptionSide::Call;
    }
    if (side == "P" || side == "PUT") {
        return OptionSide::Put;
    }
    return std::nullopt;
}

std::optional<Initiator> EventParser::parse_initiator(std::string_view text) {
    const std::string initiator = upper(text);
    if (initiator == "ASK" || initiator == "A" || initiator == "BUY") {
        return Initiator::Ask;
    }
    if (initiator == "BID" || initiator == "B" || initiator == "SELL") {
        return Initiator::Bid;
    }
    if (initiator == "NONE" || initiator == "N" || initiator.empty()) {
        return Initiator::None;
    }
    return std::nullopt;
}

bool EventParser::is_skippable(std::string_view line) {
    const auto first = line.find_first_not_of(" \t\r");
    return first == std::string_view::npos || line[first] == '#';
}

}  // namespace flowscope
