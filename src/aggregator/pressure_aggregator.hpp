#pragma once

#include "aggregator/pressure_window.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <vector>

namespace flowscope {

/// Counters exposed for diagnostics
struct AggregatorStats {
    std::size_t events_accepted{0};
    std::size_t events_out_of_order{0};
    std::size_t events_rejected{0};
    std::size_t windows_closed{0};
    std::size_t keys_evicted{0};
};

/// Folds events into fixed-length windows per (strike, side) key
///
/// Windows close lazily per key: the open window for a key is returned
/// once an event for that key lands in a later bucket. Keys that stay
/// quiet longer than the idle timeout are evicted by evict_idle().
/// Not thread-safe; run one instance per worker and shard keys across them.
class PressureAggregator {
public:
    explicit PressureAggregator(const Config::Window& config);

    /// Accumulate an event into the open window for its key
    /// @return The previous window for the key once the event advances past its bucket
    [[nodiscard]] std::optional<PressureWindow> ingest(const Event& event);

    /// Close and drop keys not seen for longer than the idle timeout
    /// @param now Current event-time watermark
    /// @return The evicted keys' windows, ordered by window start then key
    [[nodiscard]] std::vector<PressureWindow> evict_idle(TimestampMs now);

    /// Close every open window (end of stream)
    [[nodiscard]] std::vector<PressureWindow> flush();

    [[nodiscard]] bool is_open(const InstrumentKey& key) const;

    /// Copy of the window currently accumulating for a key
    [[nodiscard]] std::optional<PressureWindow> open_window(const InstrumentKey& key) const;

    [[nodiscard]] std::size_t active_keys() const noexcept;

    [[nodiscard]] const AggregatorStats& stats() const noexcept;

    /// Start of the bucket containing ts
    [[nodiscard]] TimestampMs bucket_start(TimestampMs ts) const noexcept;

private:
    struct Slot {
        PressureWindow window;
        TimestampMs last_seen{0};
    };

    [[nodiscard]] PressureWindow make_window(const InstrumentKey& key, TimestampMs start) const;
    static void accumulate(PressureWindow& window, const Event& event);
    static void sort_windows(std::vector<PressureWindow>& windows);

    TimestampMs window_ms_;
    TimestampMs idle_timeout_ms_;
    std::unordered_map<InstrumentKey, Slot> open_;
    AggregatorStats stats_;
};

}  // namespace flowscope
