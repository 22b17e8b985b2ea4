#include "datatypes.hpp"

namespace core {

    MarketConfig MarketConfig::usMarket() {
        MarketConfig config;
        config.commission_rate = 0.0;
        config.min_commission = 0.0;
        config.tax_rate = 0.0;
        config.slippage_rate = 0.0005;
        config.volume_limit_fraction = 0.1;
        config.settlement_mode = SettlementMode::Immediate;
        config.execution_timing = ExecutionTiming::SameBarClose;
        return config;
    }

    MarketConfig MarketConfig::cnMarket() {
        MarketConfig config;
        config.commission_rate = 0.00025;
        config.min_commission = 5.0;
        config.tax_rate = 0.0005;
        config.slippage_rate = 0.001;
        config.volume_limit_fraction = 0.1;
        config.settlement_mode = SettlementMode::NextDaySettle;
        config.execution_timing = ExecutionTiming::SameBarClose;
        return config;
    }

    std::string actionToString(TradeAction action) {
        switch (action) {
            case TradeAction::Buy:  return "Buy";
            case TradeAction::Sell: return "Sell";
            default:                return "UnknownAction";
        }
    }

} // namespace core
