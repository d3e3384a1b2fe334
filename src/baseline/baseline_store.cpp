#include "baseline/baseline_store.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <vector>

namespace flowscope {

namespace {

// Standard normal quantiles for kPercentileLevels
constexpr std::array<double, kPercentileLevels.size()> kNormalQuantiles{
    -1.2816, -0.6745, 0.0, 0.6745, 1.2816, 1.6449, 2.3263
};

void check_config(const Config::Baseline& config) {
    if (config.lookback_days < 1) {
        throw ConfigError("baseline.lookback_days must be >= 1");
    }
    if (config.expected_windows_per_day <= 0.0) {
        throw ConfigError("baseline.expected_windows_per_day must be positive");
    }
    if (config.reservoir_capacity < 8) {
        throw ConfigError("baseline.reservoir_capacity must be >= 8");
    }
    if (config.samples_per_day == 0) {
        throw ConfigError("baseline.samples_per_day must be positive");
    }
    if (config.queue_capacity == 0) {
        throw ConfigError("baseline.queue_capacity must be positive");
    }
    if (config.default_std < 0.0) {
        throw ConfigError("baseline.default_std must be non-negative");
    }
    if (config.memory_only_quality_factor < 0.0 || config.memory_only_quality_factor > 1.0) {
        throw ConfigError("baseline.memory_only_quality_factor must be in [0, 1]");
    }
    if (config.recompute_interval.count() <= 0) {
        throw ConfigError("baseline.recompute_interval_ms must be positive");
    }
}

}  // namespace

BaselineStore::BaselineStore(const Config::Baseline& config,
                             std::unique_ptr<BaselinePersistence> persistence)
    : config_(config)
    , persistence_(std::move(persistence))
    , updater_(config.queue_capacity,
               config.recompute_interval,
               [this](const PressureWindow& window) { apply(window); },
               [this]() { recompute_all(); })
{
    check_config(config_);
    if (!persistence_) {
        persistence_ = std::make_unique<NullPersistence>();
    }
    load_persisted();
}

BaselineStore::~BaselineStore() {
    updater_.stop();
}

BaselineContext BaselineStore::get(const InstrumentKey& key) const noexcept {
    {
        std::shared_lock<std::shared_mutex> lock(published_mutex_);
        auto it = published_.find(key);
        if (it != published_.end() && it->second) {
            return *it->second;
        }
    }
    return default_context(key);
}

std::shared_ptr<const BaselineContext> BaselineStore::snapshot(const InstrumentKey& key) const {
    std::shared_lock<std::shared_mutex> lock(published_mutex_);
    auto it = published_.find(key);
    return it != published_.end() ? it->second : nullptr;
}

void BaselineStore::record(const PressureWindow& window) {
    if (!updater_.submit(window)) {
        records_dropped_.fetch_add(1);
    }
}

bool BaselineStore::apply(const PressureWindow& window) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    const DayIndex day = window.day();
    if (has_latest_day_ && day < lookback_start(latest_day_)) {
        // Would be trimmed on arrival; counted as a data gap instead
        stale_windows_.fetch_add(1);
        spdlog::debug("Ignoring baseline record for {} on day {}, lookback starts at day {}",
                      to_string(window.key), day, lookback_start(latest_day_));
        return false;
    }

    KeyHistory& history = history_for(window.key);
    if (history.has_applied && window.window_start <= history.last_window_start) {
        duplicates_ignored_.fetch_add(1);
        spdlog::debug("Ignoring replayed baseline record for {} at {}",
                      to_string(window.key), window.window_start);
        return false;
    }

    const double ratio = window.pressure_ratio();

    bool day_rolled = false;
    if (!has_latest_day_ || day > latest_day_) {
        day_rolled = has_latest_day_;
        latest_day_ = day;
        has_latest_day_ = true;
    }

    if (history.days.empty() || history.days.back().day < day) {
        history.days.push_back(DayAggregate{.day = day});
        day_rolled = true;
    }
    DayAggregate& today = history.days.back();
    today.stats.add(ratio);
    add_day_sample(today, ratio);

    history.last_window_start = window.window_start;
    history.has_applied = true;

    if (day_rolled) {
        // Forget days outside the lookback and rebuild from the survivors
        trim_days(history, latest_day_);
        rebuild(history);
    } else {
        history.overall.add(ratio);
        history.reservoir.add(ratio);
    }

    publish(window.key, history);
    records_applied_.fetch_add(1);

    persist(window.key, history.days.back(), history.last_window_start);
    return true;
}

void BaselineStore::recompute_all(DayIndex now_day) {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (!has_latest_day_ || now_day > latest_day_) {
        latest_day_ = now_day;
        has_latest_day_ = true;
    }

    std::size_t emptied = 0;
    for (auto it = histories_.begin(); it != histories_.end();) {
        KeyHistory& history = it->second;
        trim_days(history, now_day);
        if (history.days.empty()) {
            ++emptied;
            {
                std::unique_lock<std::shared_mutex> writer(published_mutex_);
                published_.erase(it->first);
            }
            it = histories_.erase(it);
            continue;
        }
        rebuild(history);
        publish(it->first, history);
        ++it;
    }

    spdlog::info("Baseline recompute for day {}: {} keys kept, {} dropped without history in lookback",
                 now_day, histories_.size(), emptied);

    if (!memory_only_.load()) {
        auto pruned = persistence_->prune(lookback_start(now_day));
        if (pruned.is_err()) {
            enter_memory_only(pruned.error());
        }
    }
}

void BaselineStore::recompute_all() {
    DayIndex day = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!has_latest_day_) {
            return;
        }
        day = latest_day_;
    }
    recompute_all(day);
}

void BaselineStore::start() {
    updater_.start();
}

void BaselineStore::stop() {
    updater_.stop();
}

void BaselineStore::flush() {
    updater_.flush();
}

bool BaselineStore::memory_only() const noexcept {
    return memory_only_.load();
}

BaselineStoreStats BaselineStore::stats() const {
    return BaselineStoreStats{
        .records_applied = records_applied_.load(),
        .duplicates_ignored = duplicates_ignored_.load(),
        .stale_windows = stale_windows_.load(),
        .records_dropped = records_dropped_.load(),
        .persistence_failures = persistence_failures_.load(),
        .keys_tracked = key_count()
    };
}

std::size_t BaselineStore::key_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return histories_.size();
}

BaselineContext BaselineStore::default_context(const InstrumentKey& key) const noexcept {
    BaselineContext context;
    context.key = key;
    context.mean = config_.default_mean;
    context.std_dev = config_.default_std;
    context.min = std::max(0.0, config_.default_mean + kNormalQuantiles.front() * config_.default_std);
    context.max = std::max(0.0, config_.default_mean + kNormalQuantiles.back() * config_.default_std);
    for (std::size_t i = 0; i < kPercentileLevels.size(); ++i) {
        context.percentiles[i] =
            std::max(0.0, config_.default_mean + kNormalQuantiles[i] * config_.default_std);
    }
    context.data_quality = 0.0;
    context.sample_count = 0;
    context.lookback_days = config_.lookback_days;
    context.is_default = true;
    context.memory_only = memory_only_.load();
    return context;
}

void BaselineStore::load_persisted() {
    auto loaded = persistence_->load_all();
    if (loaded.is_err()) {
        enter_memory_only(loaded.error());
        return;
    }

    auto keys = std::move(loaded).take_value();
    if (keys.empty()) {
        return;
    }

    DayIndex newest = 0;
    bool any_day = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto& persisted : keys) {
            KeyHistory& history = history_for(persisted.key);
            std::sort(persisted.days.begin(), persisted.days.end(),
                      [](const DayAggregate& a, const DayAggregate& b) { return a.day < b.day; });
            history.days.assign(persisted.days.begin(), persisted.days.end());
            history.last_window_start = persisted.last_window_start;
            history.has_applied = !history.days.empty();

            if (!history.days.empty()) {
                const DayIndex last = history.days.back().day;
                if (!any_day || last > newest) {
                    newest = last;
                    any_day = true;
                }
            }
        }
    }

    if (any_day) {
        recompute_all(newest);
    }
    spdlog::info("Baseline store restored {} keys via {} persistence",
                 keys.size(), persistence_->name());
}

BaselineStore::KeyHistory& BaselineStore::history_for(const InstrumentKey& key) {
    auto it = histories_.find(key);
    if (it == histories_.end()) {
        it = histories_.emplace(key, KeyHistory(config_.reservoir_capacity)).first;
    }
    return it->second;
}

void BaselineStore::add_day_sample(DayAggregate& day, double value) {
    ++day.samples_seen;
    if (day.samples.size() < config_.samples_per_day) {
        day.samples.push_back(value);
        return;
    }
    std::uniform_int_distribution<std::uint64_t> pick(0, day.samples_seen - 1);
    const std::uint64_t slot = pick(day_rng_);
    if (slot < day.samples.size()) {
        day.samples[static_cast<std::size_t>(slot)] = value;
    }
}

DayIndex BaselineStore::lookback_start(DayIndex now_day) const noexcept {
    return now_day - config_.lookback_days + 1;
}

void BaselineStore::trim_days(KeyHistory& history, DayIndex now_day) const {
    const DayIndex cutoff = lookback_start(now_day);
    while (!history.days.empty() && history.days.front().day < cutoff) {
        history.days.pop_front();
    }
}

void BaselineStore::rebuild(KeyHistory& history) const {
    history.overall.clear();
    history.reservoir.clear();
    for (const auto& day : history.days) {
        history.overall.merge(day.stats);
        for (double sample : day.samples) {
            history.reservoir.add(sample);
        }
    }
}

void BaselineStore::publish(const InstrumentKey& key, const KeyHistory& history) {
    auto context = build_context(key, history);
    std::unique_lock<std::shared_mutex> lock(published_mutex_);
    published_[key] = std::move(context);
}

std::shared_ptr<const BaselineContext> BaselineStore::build_context(
    const InstrumentKey& key, const KeyHistory& history) const {
    auto context = std::make_shared<BaselineContext>();
    context->key = key;
    context->mean = history.overall.mean();
    context->std_dev = history.overall.std_dev();
    context->min = history.overall.min();
    context->max = history.overall.max();
    context->sample_count = history.overall.count();
    context->lookback_days = config_.lookback_days;
    context->is_default = history.overall.count() == 0;
    context->memory_only = memory_only_.load();
    context->last_window_start = history.last_window_start;
    context->data_quality = quality_for(history.overall.count());

    std::vector<double> sorted = history.reservoir.values();
    std::sort(sorted.begin(), sorted.end());
    for (std::size_t i = 0; i < kPercentileLevels.size(); ++i) {
        context->percentiles[i] = interpolate_percentile(sorted, kPercentileLevels[i]);
    }
    return context;
}

void BaselineStore::persist(const InstrumentKey& key, const DayAggregate& day,
                            TimestampMs last_window_start) {
    if (memory_only_.load()) {
        return;
    }
    auto saved = persistence_->save_day(key, day, last_window_start);
    if (saved.is_err()) {
        enter_memory_only(saved.error());
    }
}

void BaselineStore::enter_memory_only(const Error& error) {
    persistence_failures_.fetch_add(1);
    if (memory_only_.exchange(true)) {
        return;
    }

    spdlog::error("Baseline persistence unavailable, continuing memory-only: {}", error.describe());

    // Caller may or may not hold state_mutex_; only snapshots are touched here
    std::unique_lock<std::shared_mutex> lock(published_mutex_);
    for (auto& [key, context] : published_) {
        if (!context) {
            continue;
        }
        auto degraded = std::make_shared<BaselineContext>(*context);
        degraded->memory_only = true;
        degraded->data_quality = quality_for(degraded->sample_count);
        context = std::move(degraded);
    }
}

Percentage BaselineStore::quality_for(std::size_t count) const noexcept {
    const double expected = config_.expected_windows_per_day * config_.lookback_days;
    double quality = std::min(1.0, static_cast<double>(count) / expected);
    if (memory_only_.load()) {
        quality *= config_.memory_only_quality_factor;
    }
    return quality;
}

}  // namespace flowscope
