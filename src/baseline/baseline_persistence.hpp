#pragma once

#include "baseline/running_stats.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/status.hpp"
#include "core/types.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <string_view>
#include <vector>

namespace flowscope {

/// Day aggregates recovered for one key
struct PersistedKey {
    InstrumentKey key;
    TimestampMs last_window_start{0};
    std::vector<DayAggregate> days;
};

/// Durable storage for per-(strike, side, day) baseline statistics
///
/// The layout is private to the implementation; the store only relies on
/// being able to reconstruct its rolling window after a restart.
class BaselinePersistence {
public:
    virtual ~BaselinePersistence() = default;

    /// Read everything persisted so far
    [[nodiscard]] virtual Result<std::vector<PersistedKey>, Error> load_all() = 0;

    /// Insert or replace the aggregate for (key, day.day)
    [[nodiscard]] virtual Result<Unit, Error> save_day(const InstrumentKey& key,
                                                       const DayAggregate& day,
                                                       TimestampMs last_window_start) = 0;

    /// Remove every day older than before_day
    [[nodiscard]] virtual Result<Unit, Error> prune(DayIndex before_day) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Keeps nothing; the store runs memory-only without degrading quality
class NullPersistence final : public BaselinePersistence {
public:
    [[nodiscard]] Result<std::vector<PersistedKey>, Error> load_all() override;
    [[nodiscard]] Result<Unit, Error> save_day(const InstrumentKey& key, const DayAggregate& day,
                                               TimestampMs last_window_start) override;
    [[nodiscard]] Result<Unit, Error> prune(DayIndex before_day) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "none"; }
};

/// One JSON document per key under a directory
/// Writes go to a temporary file that is renamed over the previous version.
class JsonFileBaselinePersistence final : public BaselinePersistence {
public:
    explicit JsonFileBaselinePersistence(std::filesystem::path directory);

    [[nodiscard]] Result<std::vector<PersistedKey>, Error> load_all() override;
    [[nodiscard]] Result<Unit, Error> save_day(const InstrumentKey& key, const DayAggregate& day,
                                               TimestampMs last_window_start) override;
    [[nodiscard]] Result<Unit, Error> prune(DayIndex before_day) override;
    [[nodiscard]] std::string_view name() const noexcept override { return "json-file"; }

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    [[nodiscard]] std::filesystem::path path_for(const InstrumentKey& key) const;
    [[nodiscard]] Result<Unit, Error> write_document(const InstrumentKey& key,
                                                     const nlohmann::json& doc) const;

    std::filesystem::path directory_;
    std::map<InstrumentKey, nlohmann::json> documents_;
};

/// JSON files under baseline.storage_dir, or NullPersistence when it is empty
[[nodiscard]] std::unique_ptr<BaselinePersistence> make_persistence(const Config::Baseline& config);

/// JSON encoding shared by the file persistence and its tests
[[nodiscard]] nlohmann::json day_to_json(const DayAggregate& day);
[[nodiscard]] DayAggregate day_from_json(const nlohmann::json& j);

}  // namespace flowscope
