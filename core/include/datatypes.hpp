#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <map>
#include <optional> // For fields a provider may not supply (dividend, valuation)

namespace core {

    // All dates are UTC midnight time points (daily resolution)
    using Timestamp = std::chrono::system_clock::time_point;

    struct PriceBar {
        Timestamp date;
        double open = 0.0;
        double high = 0.0;
        double low = 0.0;
        double close = 0.0;
        long long volume = 0; // 0 when the provider has no volume column
        std::optional<double> dividend;
        std::optional<double> pe_ttm; // Valuation metric, only some sources carry it

        bool operator<(const PriceBar& other) const {
            return date < other.date;
        }
    };

    enum class TradeAction {
        Buy,
        Sell
    };

    enum class SettlementMode {
        Immediate,    // T+0, shares sellable the day they are bought
        NextDaySettle // T+1, shares frozen until the next tick clears them
    };

    enum class ExecutionTiming {
        SameBarClose, // Fill at the close of the decision bar
        NextBarOpen   // Queue and fill at the next tick's open
    };

    struct MarketConfig {
        double commission_rate = 0.0;
        double min_commission = 0.0;
        double tax_rate = 0.0;              // Sell side only
        double slippage_rate = 0.0;
        double volume_limit_fraction = 1.0; // 1.0 disables the liquidity cap
        SettlementMode settlement_mode = SettlementMode::Immediate;
        ExecutionTiming execution_timing = ExecutionTiming::SameBarClose;
        bool round_costs_to_cents = true;

        // US equities: T+0 for backtest purposes, commission free, no stamp tax
        static MarketConfig usMarket();
        // A-shares: T+1, 0.025% commission with 5 minimum, 0.05% sell-side stamp tax
        static MarketConfig cnMarket();
    };

    struct OrderIntent {
        std::string asset;
        TradeAction action = TradeAction::Buy;
        double quantity = 0.0; // Requested, the engine may clip it
    };

    // Deferred order ("promise"): fires on price or when it expires
    struct ConditionalOrder {
        std::string asset;
        TradeAction action = TradeAction::Buy;
        double trigger_price = 0.0;
        Timestamp expiry_date;
        double quantity = 0.0;
    };

    struct TradeRecord {
        Timestamp date;
        std::string asset;
        TradeAction action = TradeAction::Buy;
        double raw_price = 0.0;      // Bar price before slippage
        double executed_price = 0.0; // After slippage
        double quantity = 0.0;       // Always positive
        double gross_value = 0.0;    // quantity * executed_price
        double commission = 0.0;
        double tax = 0.0;
        double cost = 0.0;           // commission + tax
        double slippage_cost = 0.0;  // |executed - raw| * quantity
        double net_cash_delta = 0.0;

        // +quantity for buys, -quantity for sells
        double signedQuantity() const {
            return action == TradeAction::Buy ? quantity : -quantity;
        }
    };

    struct AccountState {
        double cash_available = 0.0;
        std::map<std::string, double> holdings;
        std::map<std::string, double> frozen; // Bought but not yet settled

        double holdingOf(const std::string& asset) const {
            auto it = holdings.find(asset);
            return it != holdings.end() ? it->second : 0.0;
        }

        double frozenOf(const std::string& asset) const {
            auto it = frozen.find(asset);
            return it != frozen.end() ? it->second : 0.0;
        }

        double sellableOf(const std::string& asset) const {
            double sellable = holdingOf(asset) - frozenOf(asset);
            return sellable > 0.0 ? sellable : 0.0;
        }
    };

    struct EquitySnapshot {
        Timestamp date;
        double cash = 0.0;
        double holdings_value = 0.0;
        double total_equity = 0.0; // cash + holdings_value
    };

    template<typename T>
    using TimeSeries = std::vector<T>;

    std::string actionToString(TradeAction action);

} // namespace core
