#include "price_history_store.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace data {

namespace {

    std::optional<double> validPrice(double value) {
        if (!std::isfinite(value) || value <= 0.0) {
            return std::nullopt;
        }
        return value;
    }

} // namespace

PriceHistoryStore::PriceHistoryStore(std::string asset,
                                     std::string interval,
                                     IPriceProvider& provider,
                                     CacheStore& cache)
    : asset_(std::move(asset)),
      interval_(std::move(interval)),
      provider_(provider),
      cache_(cache)
{
    if (asset_.empty()) {
        throw std::invalid_argument("PriceHistoryStore asset cannot be empty.");
    }
}

CacheKey PriceHistoryStore::cacheKey() const {
    return CacheKey{asset_, provider_.sourceName(), interval_};
}

bool PriceHistoryStore::isRangeComplete(const std::map<core::Timestamp, core::PriceBar>& bars,
                                        core::Timestamp start, core::Timestamp end) {
    if (bars.empty()) {
        return false;
    }
    core::Timestamp min_date = bars.begin()->first;
    core::Timestamp max_date = bars.rbegin()->first;
    return min_date <= core::utils::toDate(start) &&
           max_date >= core::utils::addDays(core::utils::toDate(end), -kCompletenessSlackDays);
}

void PriceHistoryStore::merge(const core::TimeSeries<core::PriceBar>& incoming) {
    for (const auto& bar : incoming) {
        core::PriceBar normalized = bar;
        normalized.date = core::utils::toDate(bar.date);
        bars_[normalized.date] = normalized; // New rows override old on date collisions
    }
}

core::TimeSeries<core::PriceBar> PriceHistoryStore::allBars() const {
    core::TimeSeries<core::PriceBar> result;
    result.reserve(bars_.size());
    for (const auto& entry : bars_) {
        result.push_back(entry.second);
    }
    return result;
}

void PriceHistoryStore::initialize(core::Timestamp start, core::Timestamp end) {
    auto logger = core::logging::getLogger();
    const CacheKey key = cacheKey();
    bars_.clear();

    // --- 1. Cache lookup ---
    try {
        auto cached = cache_.loadBars(key);
        if (cached) {
            merge(*cached);
        }
    } catch (const core::CacheCorruptionException& e) {
        logger->warn("Unreadable cache for {}: {}. Re-fetching full history.", asset_, e.what());
        bars_.clear();
        if (!cache_.clear(key)) {
            logger->warn("Could not clear corrupt cache unit for {}.", asset_);
        }
    }

    if (isRangeComplete(bars_, start, end)) {
        logger->info("Cache hit for {} ({}/{}): {} bars cover {} -> {}.", asset_, key.source, key.interval,
                     bars_.size(), core::utils::dateToString(start), core::utils::dateToString(end));
        return;
    }

    // --- 2. Fetch, merge, persist ---
    logger->info("Cache miss or partial for {} ({} cached bars). Fetching from {}...", asset_, bars_.size(), key.source);
    std::string raw_payload;
    core::TimeSeries<core::PriceBar> fetched;
    try {
        ++fetch_count_;
        raw_payload = provider_.fetchRaw(asset_, interval_, start, end);
        fetched = provider_.normalize(raw_payload);
    } catch (const std::exception& e) {
        // A cache that starts after `start` cannot back the lookback window
        if (bars_.empty() || bars_.begin()->first > core::utils::toDate(start)) {
            throw core::DataLoadException(fmt::format("Failed to load price data for {}: {}", asset_, e.what()));
        }
        core::Timestamp cached_until = bars_.rbegin()->first;
        logger->warn("Fetch failed for {} ({}). Using {} cached bars; {} -> {} is not covered.", asset_, e.what(),
                     bars_.size(), core::utils::dateToString(core::utils::addDays(cached_until, 1)),
                     core::utils::dateToString(end));
        return;
    }

    if (fetched.empty() && bars_.empty()) {
        throw core::DataLoadException(fmt::format("Source '{}' returned no bars for {}.", key.source, asset_));
    }

    merge(fetched);
    if (!cache_.saveBars(key, fetched, raw_payload)) {
        logger->warn("Could not persist fetched bars for {}; the next run will fetch again.", asset_);
    }
    logger->info("Loaded {} bars for {} (fetched {}).", bars_.size(), asset_, fetched.size());
}

bool PriceHistoryStore::renormalizeFromCache() {
    auto logger = core::logging::getLogger();
    const CacheKey key = cacheKey();

    std::vector<std::string> payloads;
    try {
        payloads = cache_.loadRawPayloads(key);
    } catch (const core::CacheCorruptionException& e) {
        logger->warn("Cannot replay cached payloads for {}: {}", asset_, e.what());
        return false;
    }
    if (payloads.empty()) {
        logger->debug("No cached raw payload for {}.", asset_);
        return false;
    }

    // Oldest first, so later fetches win on shared dates as they did when merged
    size_t replayed = 0;
    for (const auto& payload : payloads) {
        auto bars = provider_.normalize(payload);
        replayed += bars.size();
        merge(bars);
    }
    if (!cache_.saveBars(key, allBars(), std::nullopt)) {
        logger->warn("Could not persist re-normalized bars for {}.", asset_);
    }
    logger->info("Re-normalized {} bars for {} from {} cached payloads.", replayed, asset_, payloads.size());
    return true;
}

std::optional<core::PriceBar> PriceHistoryStore::priceOn(core::Timestamp date) const {
    auto it = bars_.find(core::utils::toDate(date));
    if (it == bars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> PriceHistoryStore::closeOn(core::Timestamp date) const {
    auto bar = priceOn(date);
    return bar ? validPrice(bar->close) : std::nullopt;
}

std::optional<double> PriceHistoryStore::openOn(core::Timestamp date) const {
    auto bar = priceOn(date);
    return bar ? validPrice(bar->open) : std::nullopt;
}

long long PriceHistoryStore::volumeOn(core::Timestamp date) const {
    auto bar = priceOn(date);
    return bar ? bar->volume : 0;
}

core::TimeSeries<core::PriceBar> PriceHistoryStore::historyUpTo(core::Timestamp date) const {
    core::TimeSeries<core::PriceBar> result;
    auto last = bars_.upper_bound(core::utils::toDate(date));
    for (auto it = bars_.begin(); it != last; ++it) {
        result.push_back(it->second);
    }
    return result;
}

} // namespace data
