#pragma once

#include <string>
#include <vector>
#include <optional>

#include "datatypes.hpp"
#include "market_prices.hpp"

namespace backtester {

    // Turns order intents into fills against one account. Owns the ledger
    // (cash, holdings, settlement-frozen quantity) and the append-only trade log.
    class ExecutionEngine {
    public:
        ExecutionEngine(core::MarketConfig config, double initial_cash, const IMarketPrices& prices);

        // Fill at the bar close of `as_of`. Intents are processed in the given order.
        std::vector<core::TradeRecord> submit(const std::vector<core::OrderIntent>& intents, core::Timestamp as_of);

        // Fill queued next-open orders at the bar open of `as_of`
        std::vector<core::TradeRecord> submitAtOpen(const std::vector<core::OrderIntent>& intents, core::Timestamp as_of);

        // Start-of-tick step: everything bought on earlier ticks becomes sellable
        void clearSettlement();

        // commission + tax for a fill of `gross_value`
        double costFor(core::TradeAction action, double gross_value) const;

        const core::AccountState& account() const { return account_; }
        const std::vector<core::TradeRecord>& tradeLog() const { return trade_log_; }
        const core::MarketConfig& config() const { return config_; }
        double initialCash() const { return initial_cash_; }

    private:
        enum class PriceField { Close, Open };

        core::MarketConfig config_;
        double initial_cash_;
        const IMarketPrices& prices_; // Not owned
        core::AccountState account_;
        std::vector<core::TradeRecord> trade_log_;

        std::vector<core::TradeRecord> process(const std::vector<core::OrderIntent>& intents,
                                               core::Timestamp as_of, PriceField field);
        std::optional<core::TradeRecord> execute(const core::OrderIntent& intent,
                                                 core::Timestamp as_of, PriceField field);

        // Largest buy quantity whose gross value plus cost fits in the available cash
        double affordableQuantity(double price) const;
        double roundMoney(double value) const;
        void applyFill(const core::TradeRecord& trade);
    };

} // namespace backtester
