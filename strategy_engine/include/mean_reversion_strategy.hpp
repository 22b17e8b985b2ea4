#pragma once

#include <string>
#include <vector>

#include "interfaces.hpp"
#include "config.hpp"

namespace strategy_engine {

    struct MeanReversionParams {
        int window_days = 90;              // Calendar days of closes analysed each tick
        int min_chunk = 8;                 // Smallest R/S chunk
        double reversion_hurst = 0.4;      // Below: anti-persistent, trade dips
        double trend_hurst = 0.65;         // Above: persistent, ride breakouts
        double breakout_return = 0.10;     // Window return needed for a breakout entry
        double dip_pct = 0.10;             // Dip below the window mean that triggers a buy
        double take_profit_pct = 0.10;     // Breakout exits at mean * (1 + take_profit_pct)
        double lot_quantity = 1000.0;
        double max_position = 10000.0;
        int reversion_expiry_days = 30;
        int breakout_expiry_days = 16;
    };

    // Hurst-gated mean reversion with deferred exits. Dips are bought outright
    // with a sell promise at the window mean; otherwise a buy promise waits at
    // the dip level. Persistent breakouts are bought with a take-profit promise.
    class MeanReversionStrategy : public IStrategy {
    public:
        MeanReversionStrategy(core::config::StrategyConfig config, MeanReversionParams params);

        std::string getName() const override { return config_.name; }
        const std::vector<std::string>& getRequiredInstruments() const override { return config_.instruments; }
        std::string getDataSource() const override { return config_.data_source; }
        const core::MarketConfig& getMarketConfig() const override { return config_.market; }
        double getInitialCapital() const override { return config_.initial_capital; }

        void onInit() override;
        Decision decide(core::Timestamp today,
                        const PriceHistoryMap& history,
                        const core::AccountState& account) override;

    private:
        core::config::StrategyConfig config_;
        MeanReversionParams params_;
        std::string asset_;
        core::Timestamp next_buy_promise_;  // One resting buy promise at a time
    };

} // namespace strategy_engine
