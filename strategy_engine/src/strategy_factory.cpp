#include "strategy_factory.hpp"
#include "trend_regime_strategy.hpp"
#include "mean_reversion_strategy.hpp"
#include "logging.hpp"
#include "exceptions.hpp"
#include "utils.hpp"

#include <stdexcept>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace strategy_engine {

    using json = nlohmann::json;

    namespace { // File-local helpers

        // Parameters live in a "params" object when present, else beside the common keys
        const json& paramsOf(const core::config::StrategyConfig& config) {
            if (config.raw.contains("params") && config.raw["params"].is_object()) {
                return config.raw["params"];
            }
            return config.raw;
        }

        template<typename T>
        void readParam(const json& params, const char* key, T& target) {
            if (params.contains(key)) {
                target = params[key].get<T>();
            }
        }

        TrendRegimeParams parseTrendRegimeParams(const json& params) {
            TrendRegimeParams result;
            readParam(params, "hurst_threshold", result.hurst_threshold);
            readParam(params, "strong_trend_hurst", result.strong_trend_hurst);
            readParam(params, "hurst_window", result.hurst_window);
            readParam(params, "regime_period", result.regime_period);
            if (params.contains("regime_ma")) {
                result.regime_ma_type = indicators::movingAverageTypeFromString(params["regime_ma"].get<std::string>());
            }
            readParam(params, "volatility_window", result.volatility_window);
            readParam(params, "target_volatility", result.target_volatility);
            readParam(params, "stop_loss_pct", result.stop_loss_pct);
            readParam(params, "cooldown_ticks", result.cooldown_ticks);
            readParam(params, "lot_size", result.lot_size);
            readParam(params, "rebalance_threshold", result.rebalance_threshold);
            return result;
        }

        MeanReversionParams parseMeanReversionParams(const json& params) {
            MeanReversionParams result;
            readParam(params, "window_days", result.window_days);
            readParam(params, "min_chunk", result.min_chunk);
            readParam(params, "reversion_hurst", result.reversion_hurst);
            readParam(params, "trend_hurst", result.trend_hurst);
            readParam(params, "breakout_return", result.breakout_return);
            readParam(params, "dip_pct", result.dip_pct);
            readParam(params, "take_profit_pct", result.take_profit_pct);
            readParam(params, "lot_quantity", result.lot_quantity);
            readParam(params, "max_position", result.max_position);
            readParam(params, "reversion_expiry_days", result.reversion_expiry_days);
            readParam(params, "breakout_expiry_days", result.breakout_expiry_days);
            return result;
        }

    } // end anonymous namespace

    std::vector<std::string> StrategyFactory::availableTypes() {
        return {"TrendRegime", "MeanReversion"};
    }

    std::unique_ptr<IStrategy> StrategyFactory::createStrategy(const core::config::StrategyConfig& config) {
        auto logger = core::logging::getLogger();
        logger->debug("Creating strategy '{}' of type '{}'", config.name, config.type);

        const std::string type = core::utils::toLower(config.type);
        try {
            const json& params = paramsOf(config);
            if (type == "trendregime" || type == "trend_regime") {
                return std::make_unique<TrendRegimeStrategy>(config, parseTrendRegimeParams(params));
            }
            if (type == "meanreversion" || type == "mean_reversion") {
                return std::make_unique<MeanReversionStrategy>(config, parseMeanReversionParams(params));
            }
        } catch (const json::exception& e) {
            throw core::ConfigException(fmt::format("Invalid parameters for strategy '{}': {}", config.name, e.what()));
        } catch (const std::invalid_argument& e) {
            throw core::ConfigException(fmt::format("Strategy '{}' rejected its parameters: {}", config.name, e.what()));
        }

        throw core::ConfigException(fmt::format("Unknown strategy type '{}' (available: {}).",
                                                config.type, fmt::join(availableTypes(), ", ")));
    }

} // namespace strategy_engine
