#pragma once

#include <string>
#include "price_provider.hpp"

namespace data {

    // Reads <directory>/<asset>.csv (or the asset itself when it is a path to a file).
    // The date column is detected by name (date, time, trade_date, datetime),
    // other columns are matched case-insensitively.
    class CsvFileProvider : public IPriceProvider {
    public:
        explicit CsvFileProvider(std::string directory);

        std::string sourceName() const override { return "local"; }

        std::string fetchRaw(const std::string& asset,
                             const std::string& interval,
                             core::Timestamp from,
                             core::Timestamp to) override;

        core::TimeSeries<core::PriceBar> normalize(const std::string& raw_payload) const override;

    private:
        std::string directory_;

        std::string resolvePath(const std::string& asset) const;
    };

} // namespace data
