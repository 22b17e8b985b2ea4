#include "config.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <fstream>
#include <cstdlib>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace core {
namespace config {

    namespace {

        MarketConfig presetByName(const std::string& name) {
            std::string lower = utils::toLower(name);
            if (lower == "us") return MarketConfig::usMarket();
            if (lower == "cn") return MarketConfig::cnMarket();
            throw ConfigException(fmt::format("Unknown market preset '{}' (expected US or CN).", name));
        }

        SettlementMode settlementFromString(const std::string& value) {
            std::string lower = utils::toLower(value);
            if (lower == "immediate" || lower == "t+0") return SettlementMode::Immediate;
            if (lower == "next_day" || lower == "nextdaysettle" || lower == "t+1") return SettlementMode::NextDaySettle;
            throw ConfigException("Unknown settlement_mode: " + value);
        }

        ExecutionTiming timingFromString(const std::string& value) {
            std::string lower = utils::toLower(value);
            if (lower == "close" || lower == "same_bar_close") return ExecutionTiming::SameBarClose;
            if (lower == "next_open" || lower == "next_bar_open") return ExecutionTiming::NextBarOpen;
            throw ConfigException("Unknown execution_timing: " + value);
        }

        Timestamp requireDate(const json& config, const char* key) {
            if (!config.contains(key) || !config[key].is_string()) {
                throw ConfigException(fmt::format("Config missing '{}' (YYYY-MM-DD string).", key));
            }
            try {
                return utils::stringToDate(config[key].get<std::string>());
            } catch (const std::runtime_error& e) {
                throw ConfigException(fmt::format("Invalid '{}': {}", key, e.what()));
            }
        }

        StrategyConfig parseStrategyConfig(const json& config) {
            if (!config.is_object()) throw ConfigException("Strategy entry must be a JSON object.");
            if (!config.contains("type") || !config["type"].is_string()) throw ConfigException("Strategy entry missing 'type'.");
            if (!config.contains("instruments") || !config["instruments"].is_array() || config["instruments"].empty()) {
                throw ConfigException("Strategy entry missing 'instruments' array.");
            }

            StrategyConfig strategy;
            strategy.type = config["type"].get<std::string>();
            strategy.name = config.value("name", strategy.type);
            strategy.instruments = config["instruments"].get<std::vector<std::string>>();
            strategy.initial_capital = config.value("initial_capital", strategy.initial_capital);
            if (strategy.initial_capital <= 0.0) {
                throw ConfigException(fmt::format("Strategy '{}' initial_capital must be positive.", strategy.name));
            }
            strategy.data_source = config.value("data_source", std::string());
            strategy.market = config.contains("market") ? parseMarketConfig(config["market"]) : MarketConfig::usMarket();
            strategy.raw = config;
            return strategy;
        }

    } // namespace

    MarketConfig parseMarketConfig(const json& market) {
        if (market.is_string()) {
            return presetByName(market.get<std::string>());
        }
        if (!market.is_object()) {
            throw ConfigException("'market' must be a preset name or an object.");
        }

        try {
            MarketConfig result = presetByName(market.value("preset", std::string("US")));
            result.commission_rate = market.value("commission_rate", result.commission_rate);
            result.min_commission = market.value("min_commission", result.min_commission);
            result.tax_rate = market.value("tax_rate", result.tax_rate);
            result.slippage_rate = market.value("slippage_rate", result.slippage_rate);
            result.volume_limit_fraction = market.value("volume_limit_fraction", result.volume_limit_fraction);
            result.round_costs_to_cents = market.value("round_costs_to_cents", result.round_costs_to_cents);
            if (market.contains("settlement_mode")) {
                result.settlement_mode = settlementFromString(market["settlement_mode"].get<std::string>());
            }
            if (market.contains("execution_timing")) {
                result.execution_timing = timingFromString(market["execution_timing"].get<std::string>());
            }

            if (result.commission_rate < 0.0 || result.min_commission < 0.0 || result.tax_rate < 0.0 ||
                result.slippage_rate < 0.0 || result.slippage_rate >= 1.0) {
                throw ConfigException("Market cost rates must be non-negative and slippage_rate below 1.");
            }
            if (result.volume_limit_fraction <= 0.0) {
                throw ConfigException("volume_limit_fraction must be positive.");
            }
            return result;
        } catch (const json::exception& e) {
            throw ConfigException(fmt::format("Invalid market config: {}", e.what()));
        }
    }

    RunConfig parseRunConfig(const json& config) {
        if (!config.is_object()) throw ConfigException("Run config must be a JSON object.");

        try {
            RunConfig run;
            run.start_date = requireDate(config, "start_date");
            run.end_date = requireDate(config, "end_date");
            if (run.end_date < run.start_date) {
                throw ConfigException("end_date precedes start_date.");
            }
            run.interval_days = config.value("interval_days", run.interval_days);
            run.lookback_days = config.value("lookback_days", run.lookback_days);
            if (run.interval_days <= 0) throw ConfigException("interval_days must be positive.");
            if (run.lookback_days < 0) throw ConfigException("lookback_days cannot be negative.");

            run.cache_path = config.value("cache_path", run.cache_path);
            run.log_level = config.value("log_level", run.log_level);
            run.data_source = config.value("data_source", run.data_source);
            run.csv_directory = config.value("csv_directory", run.csv_directory);
            run.risk_free_rate = config.value("risk_free_rate", run.risk_free_rate);
            run.trade_log_path = config.value("trade_log_path", run.trade_log_path);
            run.equity_log_path = config.value("equity_log_path", run.equity_log_path);

            if (config.contains("notify") && config["notify"].is_object()) {
                run.notify_recipient = config["notify"].value("recipient", std::string());
            }
            const char* recipient_env = std::getenv("RECIPIENT_EMAIL");
            if (recipient_env && *recipient_env) {
                run.notify_recipient = recipient_env;
            }

            if (!config.contains("strategies") || !config["strategies"].is_array() || config["strategies"].empty()) {
                throw ConfigException("Config missing 'strategies' array.");
            }
            for (const auto& entry : config["strategies"]) {
                run.strategies.push_back(parseStrategyConfig(entry));
                if (run.strategies.back().data_source.empty()) {
                    run.strategies.back().data_source = run.data_source;
                }
            }
            return run;
        } catch (const json::exception& e) {
            throw ConfigException(fmt::format("JSON error in run config: {}", e.what()));
        }
    }

    RunConfig loadRunConfig(const std::string& path) {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            throw ConfigException(fmt::format("Failed to open run config file: {}", path));
        }
        json parsed;
        try {
            parsed = json::parse(ifs);
        } catch (const json::parse_error& e) {
            throw ConfigException(fmt::format("Failed to parse run config '{}': {}", path, e.what()));
        }
        if (logging::isInitialized()) {
            logging::getLogger()->debug("Run config loaded from {}", path);
        }
        return parseRunConfig(parsed);
    }

} // namespace config
} // namespace core
