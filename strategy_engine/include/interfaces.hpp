#pragma once

#include <vector>
#include <string>
#include <map>

#include "datatypes.hpp"

namespace strategy_engine {

    // Visible history per asset: bars dated on or before the decision date, ascending
    using PriceHistoryMap = std::map<std::string, core::TimeSeries<core::PriceBar>>;

    // What a strategy wants done this tick. Orders are submitted in order,
    // conditional orders join the pending promises before they are evaluated.
    struct Decision {
        std::vector<core::OrderIntent> orders;
        std::vector<core::ConditionalOrder> conditional_orders;

        bool empty() const { return orders.empty() && conditional_orders.empty(); }
    };

    // --- Strategy Interface ---
    // A black-box decision callback driven by the simulation kernel
    class IStrategy {
    public:
        virtual ~IStrategy() = default;

        // Get the unique name/ID of the strategy
        virtual std::string getName() const = 0;

        // Assets whose price history must be loaded before the run
        virtual const std::vector<std::string>& getRequiredInstruments() const = 0;

        // Price provider name ("local", "yahoo")
        virtual std::string getDataSource() const = 0;

        virtual const core::MarketConfig& getMarketConfig() const = 0;
        virtual double getInitialCapital() const = 0;

        virtual void onInit() {}

        // Called once per tick. Non-const because strategies keep state
        // (trailing stops, cooldowns) between ticks.
        virtual Decision decide(core::Timestamp today,
                                const PriceHistoryMap& history,
                                const core::AccountState& account) = 0;

        virtual void onFinalize() {}
    };

} // namespace strategy_engine
