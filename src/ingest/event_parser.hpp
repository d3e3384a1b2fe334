#pragma once

#include "core/status.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace flowscope {

/// Parser for normalized event records, one JSON object per line
///
/// {"strike":21900,"side":"C","ts":1700000000000,"price":12.5,"size":10,"initiator":"ask"}
///
/// Numeric fields may also be given as strings. "initiator" is optional
/// and accepts ask/bid/none, A/B/N or BUY/SELL.
class EventParser {
public:
    [[nodiscard]] static Result<Event, std::string> parse_event(std::string_view json);

    [[nodiscard]] static std::optional<OptionSide> parse_side(std::string_view text);

    [[nodiscard]] static std::optional<Initiator> parse_initiator(std::string_view text);

    /// True for blank lines and lines starting with '#'
    [[nodiscard]] static bool is_skippable(std::string_view line);
};

}  // namespace flowscope
