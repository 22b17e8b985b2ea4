#pragma once

#include <vector>

#include "datatypes.hpp"
#include "market_prices.hpp"

namespace backtester {

    // Pending "promises" of one strategy. A buy fires when the close drops to
    // its trigger, a sell when the close rises to it, and either is forced once
    // the tick date passes its expiry. Orders on assets without a valid close
    // that day stay pending.
    class ConditionalOrderManager {
    public:
        explicit ConditionalOrderManager(const IMarketPrices& prices);

        // Returns false (and logs) for orders with no asset or a non-positive quantity
        bool add(core::ConditionalOrder order);

        // Fired orders are removed and yield one intent each, in insertion order
        std::vector<core::OrderIntent> evaluate(core::Timestamp as_of);

        const std::vector<core::ConditionalOrder>& pending() const { return pending_; }
        void clear() { pending_.clear(); }

    private:
        const IMarketPrices& prices_; // Not owned
        std::vector<core::ConditionalOrder> pending_;
    };

} // namespace backtester
