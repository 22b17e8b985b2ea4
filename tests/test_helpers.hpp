#pragma once

#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "datatypes.hpp"
#include "exceptions.hpp"
#include "utils.hpp"
#include "market_prices.hpp"
#include "price_provider.hpp"

namespace test_support {

    inline core::Timestamp day(const std::string& date) {
        return core::utils::stringToDate(date);
    }

    inline core::PriceBar makeBar(const std::string& date, double close, long long volume = 1000000,
                                  std::optional<double> open = std::nullopt) {
        core::PriceBar bar;
        bar.date = day(date);
        bar.close = close;
        bar.open = open.value_or(close);
        bar.high = std::max(bar.open, close);
        bar.low = std::min(bar.open, close);
        bar.volume = volume;
        return bar;
    }

    // Consecutive calendar-day bars starting at `first_date`
    inline core::TimeSeries<core::PriceBar> dailyBars(const std::string& first_date, const std::vector<double>& closes) {
        core::TimeSeries<core::PriceBar> bars;
        core::Timestamp date = day(first_date);
        for (double close : closes) {
            core::PriceBar bar;
            bar.date = date;
            bar.open = bar.high = bar.low = bar.close = close;
            bar.volume = 1000000;
            bars.push_back(bar);
            date = core::utils::addDays(date, 1);
        }
        return bars;
    }

    // In-memory bars keyed by asset and date
    class FakeMarketPrices : public backtester::IMarketPrices {
    public:
        void setBar(const std::string& asset, const core::PriceBar& bar) {
            bars_[asset][bar.date] = bar;
        }

        std::optional<double> closeOn(const std::string& asset, core::Timestamp date) const override {
            const auto* bar = find(asset, date);
            if (!bar || bar->close <= 0.0) return std::nullopt;
            return bar->close;
        }

        std::optional<double> openOn(const std::string& asset, core::Timestamp date) const override {
            const auto* bar = find(asset, date);
            if (!bar || bar->open <= 0.0) return std::nullopt;
            return bar->open;
        }

        long long volumeOn(const std::string& asset, core::Timestamp date) const override {
            const auto* bar = find(asset, date);
            return bar ? bar->volume : 0;
        }

        bool hasBar(const std::string& asset, core::Timestamp date) const override {
            return find(asset, date) != nullptr;
        }

    private:
        std::map<std::string, std::map<core::Timestamp, core::PriceBar>> bars_;

        const core::PriceBar* find(const std::string& asset, core::Timestamp date) const {
            auto asset_it = bars_.find(asset);
            if (asset_it == bars_.end()) return nullptr;
            auto bar_it = asset_it->second.find(date);
            return bar_it != asset_it->second.end() ? &bar_it->second : nullptr;
        }
    };

    // Serves preset bars as "date,open,close,volume" lines and counts fetches
    class FakePriceProvider : public data::IPriceProvider {
    public:
        explicit FakePriceProvider(std::string name = "fake") : name_(std::move(name)) {}

        std::string sourceName() const override { return name_; }

        std::string fetchRaw(const std::string& asset, const std::string& /*interval*/,
                             core::Timestamp /*from*/, core::Timestamp /*to*/) override {
            ++fetch_calls;
            if (fail) {
                throw core::ApiRequestException("simulated outage for " + asset);
            }
            std::ostringstream out;
            auto it = bars.find(asset);
            if (it != bars.end()) {
                for (const auto& bar : it->second) {
                    out << core::utils::dateToString(bar.date) << ',' << bar.open << ','
                        << bar.close << ',' << bar.volume << '\n';
                }
            }
            return out.str();
        }

        core::TimeSeries<core::PriceBar> normalize(const std::string& raw_payload) const override {
            core::TimeSeries<core::PriceBar> result;
            std::istringstream in(raw_payload);
            std::string line;
            while (std::getline(in, line)) {
                if (line.empty()) continue;
                std::istringstream fields(line);
                std::string date, open, close, volume;
                std::getline(fields, date, ',');
                std::getline(fields, open, ',');
                std::getline(fields, close, ',');
                std::getline(fields, volume, ',');
                core::PriceBar bar;
                bar.date = core::utils::stringToDate(date);
                bar.open = std::stod(open);
                bar.close = std::stod(close);
                bar.high = std::max(bar.open, bar.close);
                bar.low = std::min(bar.open, bar.close);
                bar.volume = std::stoll(volume);
                result.push_back(bar);
            }
            return result;
        }

        std::map<std::string, core::TimeSeries<core::PriceBar>> bars;
        bool fail = false;
        int fetch_calls = 0;

    private:
        std::string name_;
    };

} // namespace test_support
