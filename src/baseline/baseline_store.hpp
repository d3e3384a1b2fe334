#pragma once

#include "aggregator/pressure_window.hpp"
#include "baseline/baseline_context.hpp"
#include "baseline/baseline_persistence.hpp"
#include "baseline/baseline_updater.hpp"
#include "baseline/running_stats.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <unordered_map>

namespace flowscope {

struct BaselineStoreStats {
    std::size_t records_applied{0};
    std::size_t duplicates_ignored{0};
    std::size_t stale_windows{0};  // Older than the lookback of the latest day
    std::size_t records_dropped{0};
    std::size_t persistence_failures{0};
    std::size_t keys_tracked{0};
};

/// Rolling per-key pressure-ratio statistics over the trailing lookback
///
/// A reader holds the shared lock only long enough to copy a shared_ptr to
/// an immutable snapshot; writers build a new snapshot and swap it in.
/// Updates arrive through record() and are applied by the background
/// updater in the order they were recorded.
class BaselineStore {
public:
    /// @throws ConfigError if the baseline section is invalid
    explicit BaselineStore(const Config::Baseline& config,
                           std::unique_ptr<BaselinePersistence> persistence =
                               std::make_unique<NullPersistence>());

    ~BaselineStore();

    BaselineStore(const BaselineStore&) = delete;
    BaselineStore& operator=(const BaselineStore&) = delete;

    /// Current context for a key, or the default context if none exists
    /// Never throws.
    [[nodiscard]] BaselineContext get(const InstrumentKey& key) const noexcept;

    /// Published snapshot, nullptr if the key has no history
    [[nodiscard]] std::shared_ptr<const BaselineContext> snapshot(const InstrumentKey& key) const;

    /// Enqueue a closed window for the background updater (never blocks)
    void record(const PressureWindow& window);

    /// Apply a closed window on the caller's thread
    /// @return false if the window was already applied or falls before the
    ///         lookback of the latest day seen by any key
    bool apply(const PressureWindow& window);

    /// Drop days outside the lookback ending at now_day and rebuild every key
    /// Keys left without any day in the lookback are forgotten.
    void recompute_all(DayIndex now_day);

    /// Full recompute anchored at the latest day seen
    void recompute_all();

    /// Start the background updater and its recompute timer
    void start();
    void stop();

    /// Block until every recorded window has been applied
    void flush();

    /// True once a persistence failure has switched the store to memory-only
    [[nodiscard]] bool memory_only() const noexcept;

    [[nodiscard]] BaselineStoreStats stats() const;
    [[nodiscard]] std::size_t key_count() const;

    [[nodiscard]] BaselineContext default_context(const InstrumentKey& key) const noexcept;

    [[nodiscard]] const Config::Baseline& config() const noexcept { return config_; }

private:
    struct KeyHistory {
        std::deque<DayAggregate> days;  // Ascending by day
        RunningStats overall;
        Reservoir reservoir;
        TimestampMs last_window_start{0};
        bool has_applied{false};

        explicit KeyHistory(std::size_t reservoir_capacity)
            : reservoir(reservoir_capacity) {}
    };

    void load_persisted();
    KeyHistory& history_for(const InstrumentKey& key);
    void add_day_sample(DayAggregate& day, double value);
    [[nodiscard]] DayIndex lookback_start(DayIndex now_day) const noexcept;
    void trim_days(KeyHistory& history, DayIndex now_day) const;
    void rebuild(KeyHistory& history) const;
    void publish(const InstrumentKey& key, const KeyHistory& history);
    [[nodiscard]] std::shared_ptr<const BaselineContext> build_context(
        const InstrumentKey& key, const KeyHistory& history) const;
    void persist(const InstrumentKey& key, const DayAggregate& day, TimestampMs last_window_start);
    void enter_memory_only(const Error& error);
    [[nodiscard]] Percentage quality_for(std::size_t count) const noexcept;

    Config::Baseline config_;
    std::unique_ptr<BaselinePersistence> persistence_;

    // Writer state, touched by apply/recompute only
    mutable std::mutex state_mutex_;
    std::unordered_map<InstrumentKey, KeyHistory> histories_;
    DayIndex latest_day_{0};
    bool has_latest_day_{false};
    std::mt19937 day_rng_{0xba5e};

    // Published snapshots
    mutable std::shared_mutex published_mutex_;
    std::unordered_map<InstrumentKey, std::shared_ptr<const BaselineContext>> published_;

    std::atomic<bool> memory_only_{false};
    std::atomic<std::size_t> records_applied_{0};
    std::atomic<std::size_t> duplicates_ignored_{0};
    std::atomic<std::size_t> stale_windows_{0};
    std::atomic<std::size_t> records_dropped_{0};
    std::atomic<std::size_t> persistence_failures_{0};

    // Declared last so its thread stops before the state above is destroyed
    BaselineUpdater updater_;
};

}  // namespace flowscope
