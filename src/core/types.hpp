#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace flowscope {

// Exchange event time, milliseconds since the Unix epoch
using TimestampMs = std::int64_t;

// Option premium
using Price = double;

// Contracts
using Quantity = double;

// Strike price of an option series
using Strike = double;

// UTC day index (days since the Unix epoch)
using DayIndex = std::int64_t;

// Fraction in [0.0, 1.0]
using Percentage = double;

constexpr TimestampMs kMillisPerMinute = 60'000;
constexpr TimestampMs kMillisPerDay = 86'400'000;

/// Option side of an instrument
enum class OptionSide : std::uint8_t {
    Call,
    Put
};

/// Which side of the book an execution hit
enum class Initiator : std::uint8_t {
    Bid,   // Executed at the bid (seller initiated)
    Ask,   // Executed at the ask (buyer initiated)
    None   // Between the quotes or unknown
};

/// Side carrying the majority of classified volume in a window
enum class DominantSide : std::uint8_t {
    Buy,
    Sell,
    Neutral
};

/// Implied direction for the underlying
enum class Direction : std::uint8_t {
    Long,
    Short
};

/// (strike, option side) pair identifying one option series
struct InstrumentKey {
    Strike strike{0.0};
    OptionSide side{OptionSide::Call};

    [[nodiscard]] InstrumentKey opposite() const noexcept {
        return InstrumentKey{strike, side == OptionSide::Call ? OptionSide::Put : OptionSide::Call};
    }

    friend bool operator==(const InstrumentKey& a, const InstrumentKey& b) noexcept {
        return a.strike == b.strike && a.side == b.side;
    }

    friend bool operator<(const InstrumentKey& a, const InstrumentKey& b) noexcept {
        if (a.strike != b.strike) {
            return a.strike < b.strike;
        }
        return a.side < b.side;
    }
};

/// Single normalized order-book execution
struct Event {
    InstrumentKey key;
    TimestampMs timestamp{0};
    Price price{0.0};
    Quantity size{0.0};
    Initiator initiator{Initiator::None};

    /// Check that the strike, price and size are usable
    [[nodiscard]] bool is_valid() const noexcept {
        return std::isfinite(key.strike) && std::isfinite(price) && std::isfinite(size) &&
               price > 0.0 && size > 0.0;
    }
};

[[nodiscard]] inline DayIndex day_of(TimestampMs ts) noexcept {
    // Floor division so pre-epoch times land on the previous day
    DayIndex day = ts / kMillisPerDay;
    if (ts % kMillisPerDay < 0) {
        --day;
    }
    return day;
}

[[nodiscard]] inline std::string_view to_string(OptionSide side) noexcept {
    return side == OptionSide::Call ? "C" : "P";
}

[[nodiscard]] inline std::string_view to_string(Initiator initiator) noexcept {
    switch (initiator) {
        case Initiator::Bid: return "bid";
        case Initiator::Ask: return "ask";
        case Initiator::None: return "none";
    }
    return "none";
}

[[nodiscard]] inline std::string_view to_string(DominantSide side) noexcept {
    switch (side) {
        case DominantSide::Buy: return "BUY";
        case DominantSide::Sell: return "SELL";
        case DominantSide::Neutral: return "NEUTRAL";
    }
    return "NEUTRAL";
}

[[nodiscard]] inline std::string_view to_string(Direction direction) noexcept {
    return direction == Direction::Long ? "LONG" : "SHORT";
}

/// Human readable key, e.g. "21900C"
[[nodiscard]] std::string to_string(const InstrumentKey& key);

}  // namespace flowscope

template <>
struct std::hash<flowscope::InstrumentKey> {
    std::size_t operator()(const flowscope::InstrumentKey& key) const noexcept {
        std::size_t h = std::hash<double>{}(key.strike);
        return h ^ (static_cast<std::size_t>(key.side) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
