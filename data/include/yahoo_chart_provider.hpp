#pragma once

#include <string>
#include "price_provider.hpp"

namespace data {

class YahooChartProvider : public IPriceProvider {
public:
    explicit YahooChartProvider(std::string base_url = "https://query1.finance.yahoo.com",
                                int timeout_ms = 15000);

    std::string sourceName() const override { return "yahoo"; }

    // GET /v8/finance/chart/<symbol> with dividend events. Throws core::ApiRequestException.
    std::string fetchRaw(const std::string& asset,
                         const std::string& interval,
                         core::Timestamp from,
                         core::Timestamp to) override;

    // Parses chart.result[0] into bars; rows without a close are dropped
    core::TimeSeries<core::PriceBar> normalize(const std::string& raw_payload) const override;

private:
    std::string base_url_;
    int timeout_ms_;
};

} // namespace data
