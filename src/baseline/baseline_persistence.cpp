#include "baseline/baseline_persistence.hpp"
#include <algorithm>
#include <fstream>
#include <spdlog/spdlog.h>
#include <sstream>
#include <system_error>

namespace flowscope {

using json = nlohmann::json;

namespace {

Error persistence_error(const std::string& message) {
    return Error{ErrorKind::PersistenceFailure, message};
}

}  // namespace

json day_to_json(const DayAggregate& day) {
    return json{
        {"day", day.day},
        {"count", day.stats.count()},
        {"mean", day.stats.mean()},
        {"m2", day.stats.m2()},
        {"min", day.stats.min()},
        {"max", day.stats.max()},
        {"samples_seen", day.samples_seen},
        {"samples", day.samples}
    };
}

DayAggregate day_from_json(const json& j) {
    DayAggregate day;
    day.day = j.at("day").get<DayIndex>();
    day.stats = RunningStats::from_moments(
        j.at("count").get<std::size_t>(),
        j.at("mean").get<double>(),
        j.at("m2").get<double>(),
        j.at("min").get<double>(),
        j.at("max").get<double>()
    );
    day.samples = j.value("samples", std::vector<double>{});
    day.samples_seen = j.value("samples_seen", static_cast<std::uint64_t>(day.samples.size()));
    return day;
}

std::unique_ptr<BaselinePersistence> make_persistence(const Config::Baseline& config) {
    if (config.storage_dir.empty()) {
        return std::make_unique<NullPersistence>();
    }
    return std::make_unique<JsonFileBaselinePersistence>(config.storage_dir);
}

Result<std::vector<PersistedKey>, Error> NullPersistence::load_all() {
    return Result<std::vector<PersistedKey>, Error>::Ok({});
}

Result<Unit, Error> NullPersistence::save_day(const InstrumentKey& /*key*/,
                                              const DayAggregate& /*day*/,
                                              TimestampMs /*last_window_start*/) {
    return Result<Unit, Error>::Ok(Unit{});
}

Result<Unit, Error> NullPersistence::prune(DayIndex /*before_day*/) {
    return Result<Unit, Error>::Ok(Unit{});
}

JsonFileBaselinePersistence::JsonFileBaselinePersistence(std::filesystem::path directory)
    : directory_(std::move(directory))
{}

Result<std::vector<PersistedKey>, Error> JsonFileBaselinePersistence::load_all() {
    using ResultT = Result<std::vector<PersistedKey>, Error>;

    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return ResultT::Err(persistence_error(
            "cannot create " + directory_.string() + ": " + ec.message()));
    }

    std::vector<PersistedKey> loaded;
    documents_.clear();

    try {
        for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json") {
                continue;
            }

            std::ifstream file(entry.path());
            if (!file.is_open()) {
                return ResultT::Err(persistence_error("cannot read " + entry.path().string()));
            }

            json doc = json::parse(file);
            PersistedKey persisted;
            persisted.key.strike = doc.at("strike").get<double>();
            persisted.key.side = doc.at("side").get<std::string>() == "P" ? OptionSide::Put
                                                                          : OptionSide::Call;
            persisted.last_window_start = doc.value("last_window_start", TimestampMs{0});
            for (const auto& day : doc.at("days")) {
                persisted.days.push_back(day_from_json(day));
            }

            documents_[persisted.key] = std::move(doc);
            loaded.push_back(std::move(persisted));
        }
    } catch (const std::filesystem::filesystem_error& e) {
        return ResultT::Err(persistence_error(e.what()));
    } catch (const json::exception& e) {
        return ResultT::Err(persistence_error(std::string("corrupt baseline file: ") + e.what()));
    }

    spdlog::info("Loaded baselines for {} keys from {}", loaded.size(), directory_.string());
    return ResultT::Ok(std::move(loaded));
}

Result<Unit, Error> JsonFileBaselinePersistence::save_day(const InstrumentKey& key,
                                                          const DayAggregate& day,
                                                          TimestampMs last_window_start) {
    json& doc = documents_[key];
    if (doc.is_null()) {
        doc = json{
            {"strike", key.strike},
            {"side", std::string(to_string(key.side))},
            {"days", json::array()}
        };
    }
    doc["last_window_start"] = last_window_start;

    auto& days = doc["days"];
    auto existing = std::find_if(days.begin(), days.end(), [&](const json& d) {
        return d.at("day").get<DayIndex>() == day.day;
    });
    if (existing != days.end()) {
        *existing = day_to_json(day);
    } else {
        days.push_back(day_to_json(day));
    }

    return write_document(key, doc);
}

Result<Unit, Error> JsonFileBaselinePersistence::prune(DayIndex before_day) {
    for (auto& [key, doc] : documents_) {
        auto& days = doc["days"];
        const auto original = days.size();

        json kept = json::array();
        for (const auto& d : days) {
            if (d.at("day").get<DayIndex>() >= before_day) {
                kept.push_back(d);
            }
        }
        if (kept.size() == original) {
            continue;
        }

        days = std::move(kept);
        auto written = write_document(key, doc);
        if (written.is_err()) {
            return written;
        }
    }
    return Result<Unit, Error>::Ok(Unit{});
}

std::filesystem::path JsonFileBaselinePersistence::path_for(const InstrumentKey& key) const {
    return directory_ / ("baseline_" + to_string(key) + ".json");
}

Result<Unit, Error> JsonFileBaselinePersistence::write_document(const InstrumentKey& key,
                                                                const json& doc) const {
    const auto target = path_for(key);
    auto temp = target;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            return Result<Unit, Error>::Err(persistence_error("cannot write " + temp.string()));
        }
        out << doc.dump();
        if (!out.good()) {
            return Result<Unit, Error>::Err(persistence_error("short write to " + temp.string()));
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        return Result<Unit, Error>::Err(persistence_error(
            "cannot replace " + target.string() + ": " + ec.message()));
    }
    return Result<Unit, Error>::Ok(Unit{});
}

}  // namespace flowscope
