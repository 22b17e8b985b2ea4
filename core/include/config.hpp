#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace core {
namespace config {

    using json = nlohmann::json;

    // One entry of the "strategies" array. The full object is kept so the
    // strategy factory can read its own parameters.
    struct StrategyConfig {
        std::string type;
        std::string name;
        std::vector<std::string> instruments;
        double initial_capital = 1000000.0;
        std::string data_source;            // Falls back to RunConfig::data_source
        MarketConfig market;
        json raw;
    };

    struct RunConfig {
        Timestamp start_date;
        Timestamp end_date;
        int interval_days = 1;
        int lookback_days = 365;
        std::string cache_path = "price_cache.db";
        std::string log_level = "info";
        std::string data_source = "local";  // "local" (CSV files) or "yahoo"
        std::string csv_directory = "data";
        double risk_free_rate = 0.0;
        std::string trade_log_path;         // Empty disables export
        std::string equity_log_path;
        std::string notify_recipient;       // Empty disables notification
        std::vector<StrategyConfig> strategies;
    };

    // Throws ConfigException on unreadable files or invalid content
    RunConfig loadRunConfig(const std::string& path);
    RunConfig parseRunConfig(const json& config);

    // Accepts a preset name ("US", "CN") or an object {"preset": ..., overrides...}
    MarketConfig parseMarketConfig(const json& market);

} // namespace config
} // namespace core
