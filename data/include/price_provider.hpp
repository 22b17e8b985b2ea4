#pragma once

#include <string>
#include "datatypes.hpp"

namespace data {

    // A market data source. Fetching and normalization are separate steps so
    // the raw payload can be cached and re-normalized without another fetch.
    class IPriceProvider {
    public:
        virtual ~IPriceProvider() = default;

        // Name used in the cache key, e.g. "local" or "yahoo"
        virtual std::string sourceName() const = 0;

        // Retrieve the provider's raw payload covering at least [from, to].
        // Throws core::DataLoadException or core::ApiRequestException on failure.
        virtual std::string fetchRaw(const std::string& asset,
                                     const std::string& interval,
                                     core::Timestamp from,
                                     core::Timestamp to) = 0;

        // Convert a raw payload into bars sorted by date, unique per date
        virtual core::TimeSeries<core::PriceBar> normalize(const std::string& raw_payload) const = 0;
    };

    // Sampling interval label for a clock step: "1d", "1wk"
    std::string intervalLabel(int interval_days);

} // namespace data
