#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace flowscope {

/// Parsed event with its source line
struct EventMsg {
    Event event;
    std::size_t line{0};
};

/// Input line that could not be parsed
struct ParseFailure {
    std::size_t line{0};
    std::string reason;
};

/// Reader reached the end of its input
struct EndOfStream {
    std::size_t lines_read{0};
};

/// Shutdown request
struct Shutdown {};

/// Unified message type between the reader and engine threads
using PipelineMessage = std::variant<
    EventMsg,
    ParseFailure,
    EndOfStream,
    Shutdown
>;

/// Helper to get message type name for logging
[[nodiscard]] inline std::string_view message_type_name(const PipelineMessage& msg) {
    return std::visit([](const auto& m) -> std::string_view {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, EventMsg>) return "Event";
        else if constexpr (std::is_same_v<T, ParseFailure>) return "ParseFailure";
        else if constexpr (std::is_same_v<T, EndOfStream>) return "EndOfStream";
        else if constexpr (std::is_same_v<T, Shutdown>) return "Shutdown";
        else return "Unknown";
    }, msg);
}

}  // namespace flowscope
