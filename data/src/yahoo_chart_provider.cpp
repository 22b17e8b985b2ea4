#include "yahoo_chart_provider.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <map>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace data {

namespace {

    std::optional<double> numberAt(const nlohmann::json& array, size_t index) {
        if (!array.is_array() || index >= array.size() || !array[index].is_number()) {
            return std::nullopt;
        }
        return array[index].get<double>();
    }

} // namespace

YahooChartProvider::YahooChartProvider(std::string base_url, int timeout_ms)
    : base_url_(std::move(base_url)), timeout_ms_(timeout_ms)
{
    core::logging::getLogger()->debug("YahooChartProvider created for {}.", base_url_);
}

std::string YahooChartProvider::fetchRaw(const std::string& asset,
                                         const std::string& interval,
                                         core::Timestamp from,
                                         core::Timestamp to)
{
    auto logger = core::logging::getLogger();

    // A week of margin so a weekend start date is still covered by the first bar
    long long period1 = core::utils::toUnixSeconds(core::utils::addDays(from, -7));
    long long period2 = core::utils::toUnixSeconds(core::utils::addDays(to, 1));

    std::string full_url = fmt::format("{}/v8/finance/chart/{}", base_url_, cpr::util::urlEncode(asset));
    logger->debug("Requesting Yahoo chart URL: {} ({} -> {})", full_url,
                  core::utils::dateToString(from), core::utils::dateToString(to));

    cpr::Header headers = {
        {"Accept", "application/json"},
        {"User-Agent", "Mozilla/5.0 (settlement-backtester)"}
    };
    cpr::Parameters params = {
        {"period1", std::to_string(period1)},
        {"period2", std::to_string(period2)},
        {"interval", interval},
        {"events", "div"}
    };

    cpr::Response response = cpr::Get(cpr::Url{full_url}, headers, params, cpr::Timeout{timeout_ms_});

    logger->debug("Yahoo API Response Status: {}, Body size: {}", response.status_code, response.text.length());

    if (response.error) {
        throw core::ApiRequestException(fmt::format("Yahoo request for {} failed (CPR error {}): {}",
                                                    asset, static_cast<int>(response.error.code), response.error.message));
    }
    if (response.status_code != 200) {
        throw core::ApiRequestException(fmt::format("Yahoo request for {} failed: Status Code={}, Body='{}'",
                                                    asset, response.status_code, response.text.substr(0, 300)));
    }
    return response.text;
}

core::TimeSeries<core::PriceBar> YahooChartProvider::normalize(const std::string& raw_payload) const {
    auto logger = core::logging::getLogger();
    core::TimeSeries<core::PriceBar> bars;

    nlohmann::json json_response;
    try {
        json_response = nlohmann::json::parse(raw_payload);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::DataLoadException(fmt::format("Failed to parse Yahoo chart payload: {}", e.what()));
    }

    try {
        const auto& chart = json_response.at("chart");
        if (chart.contains("error") && !chart["error"].is_null()) {
            throw core::DataLoadException(fmt::format("Yahoo chart returned error: {}", chart["error"].dump()));
        }
        const auto& results = chart.at("result");
        if (!results.is_array() || results.empty()) {
            throw core::DataLoadException("Yahoo chart payload has no result.");
        }
        const auto& result = results[0];
        if (!result.contains("timestamp")) {
            logger->warn("Yahoo chart payload has no timestamps, no bars produced.");
            return bars;
        }
        const auto& timestamps = result.at("timestamp");
        const auto& quote = result.at("indicators").at("quote").at(0);

        // Dividends arrive as events keyed by epoch seconds
        std::map<core::Timestamp, double> dividends;
        if (result.contains("events") && result["events"].contains("dividends")) {
            for (const auto& item : result["events"]["dividends"].items()) {
                const auto& event = item.value();
                if (event.contains("date") && event.contains("amount")) {
                    auto date = core::utils::toDate(core::utils::fromUnixSeconds(event["date"].get<long long>()));
                    dividends[date] = event["amount"].get<double>();
                }
            }
        }

        std::map<core::Timestamp, core::PriceBar> by_date;
        for (size_t i = 0; i < timestamps.size(); ++i) {
            auto close = numberAt(quote.value("close", nlohmann::json()), i);
            if (!close) continue; // Holidays show up as null rows

            core::PriceBar bar;
            bar.date = core::utils::toDate(core::utils::fromUnixSeconds(timestamps[i].get<long long>()));
            bar.close = *close;
            bar.open = numberAt(quote.value("open", nlohmann::json()), i).value_or(bar.close);
            bar.high = numberAt(quote.value("high", nlohmann::json()), i).value_or(bar.close);
            bar.low = numberAt(quote.value("low", nlohmann::json()), i).value_or(bar.close);
            bar.volume = static_cast<long long>(numberAt(quote.value("volume", nlohmann::json()), i).value_or(0.0));
            auto dividend_it = dividends.find(bar.date);
            if (dividend_it != dividends.end()) {
                bar.dividend = dividend_it->second;
            }
            by_date[bar.date] = bar;
        }

        bars.reserve(by_date.size());
        for (const auto& entry : by_date) {
            bars.push_back(entry.second);
        }
    } catch (const nlohmann::json::exception& e) {
        throw core::DataLoadException(fmt::format("Unexpected Yahoo chart structure: {}", e.what()));
    }

    logger->debug("Parsed {} bars from Yahoo chart payload.", bars.size());
    return bars;
}

} // namespace data
