#pragma once

#include <string>
#include <vector>

#include "interfaces.hpp"
#include "config.hpp"
#include "moving_average_indicator.hpp"

namespace strategy_engine {

    struct TrendRegimeParams {
        double hurst_threshold = 0.55;     // Above: trending, full allocation in a bull regime
        double strong_trend_hurst = 0.65;  // Bear-regime allocation needs this much persistence
        int hurst_window = 100;            // Closes fed to the Hurst estimate
        int regime_period = 60;            // Moving average separating bull and bear regimes
        indicators::MovingAverageType regime_ma_type = indicators::MovingAverageType::Exponential;
        int volatility_window = 20;
        double target_volatility = 0.25;   // Annualized
        double stop_loss_pct = 0.08;       // Trailing stop from the highest close since entry
        int cooldown_ticks = 5;            // Ticks spent flat after a stop
        double lot_size = 100.0;           // Order quantities are floored to whole lots
        double rebalance_threshold = 0.05; // Minimum drift (fraction of equity) before trading
    };

    // Volatility-targeted single-asset trend follower: regime from a moving average,
    // persistence from the Hurst exponent, protected by a trailing stop.
    // Never asks to sell more than the settled quantity.
    class TrendRegimeStrategy : public IStrategy {
    public:
        TrendRegimeStrategy(core::config::StrategyConfig config, TrendRegimeParams params);

        std::string getName() const override { return config_.name; }
        const std::vector<std::string>& getRequiredInstruments() const override { return config_.instruments; }
        std::string getDataSource() const override { return config_.data_source; }
        const core::MarketConfig& getMarketConfig() const override { return config_.market; }
        double getInitialCapital() const override { return config_.initial_capital; }

        void onInit() override;
        Decision decide(core::Timestamp today,
                        const PriceHistoryMap& history,
                        const core::AccountState& account) override;
        void onFinalize() override;

        const TrendRegimeParams& params() const { return params_; }

        // Target fraction of equity for the given signals
        double targetAllocation(bool bull_regime, double hurst, double volatility_scalar) const;

    private:
        core::config::StrategyConfig config_;
        TrendRegimeParams params_;
        std::string asset_;
        indicators::MovingAverageIndicator regime_ma_;
        double max_price_ = 0.0;
        int cooldown_remaining_ = 0;
        int decisions_ = 0;

        double floorToLot(double quantity) const;
    };

} // namespace strategy_engine
