#pragma once

#include <string>
#include <map>
#include <optional>

#include "datatypes.hpp"
#include "cache_store.hpp"
#include "price_provider.hpp"

namespace data {

    // Ordered daily bars of one asset. Populated once by initialize(), read-only afterwards.
    class PriceHistoryStore {
    public:
        // Cached data counts as complete when it ends no more than this many days
        // before the requested end (weekends and holidays)
        static constexpr int kCompletenessSlackDays = 4;

        PriceHistoryStore(std::string asset,
                          std::string interval,
                          IPriceProvider& provider,
                          CacheStore& cache);

        // Load from cache, fetching and merging when the cache does not cover
        // [start, end - slack]. Throws core::DataLoadException when the fetch fails
        // and the cache is empty or begins after `start`. A cache reaching back to
        // `start` is used as is, with the uncovered tail logged.
        void initialize(core::Timestamp start, core::Timestamp end);

        // Re-run the provider's normalizer over every cached fetch payload, oldest
        // first, without fetching. Returns false when no payload is cached.
        bool renormalizeFromCache();

        std::optional<core::PriceBar> priceOn(core::Timestamp date) const;
        std::optional<double> closeOn(core::Timestamp date) const;
        std::optional<double> openOn(core::Timestamp date) const;
        long long volumeOn(core::Timestamp date) const;

        // Bars dated on or before `date`, ascending
        core::TimeSeries<core::PriceBar> historyUpTo(core::Timestamp date) const;

        const std::string& asset() const { return asset_; }
        size_t size() const { return bars_.size(); }
        int fetchCount() const { return fetch_count_; }

        static bool isRangeComplete(const std::map<core::Timestamp, core::PriceBar>& bars,
                                    core::Timestamp start, core::Timestamp end);

    private:
        std::string asset_;
        std::string interval_;
        IPriceProvider& provider_;
        CacheStore& cache_;
        std::map<core::Timestamp, core::PriceBar> bars_;
        int fetch_count_ = 0;

        CacheKey cacheKey() const;
        void merge(const core::TimeSeries<core::PriceBar>& incoming);
        core::TimeSeries<core::PriceBar> allBars() const;
    };

} // namespace data
