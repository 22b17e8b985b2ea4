#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp"

namespace backtester {

    // CSV export of a run. Both writers return false (and log) when the file
    // cannot be written; a failed export never aborts a run.
    class TradeLogWriter {
    public:
        // date,asset,action,raw_price,executed_price,quantity,gross_value,
        // commission,tax,cost,slippage_cost,net_cash_delta,quantity_delta
        static bool writeTrades(const std::string& path, const std::vector<core::TradeRecord>& trades);

        // date,cash,holdings_value,total_equity
        static bool writeEquityCurve(const std::string& path, const std::vector<core::EquitySnapshot>& snapshots);

        static std::string formatTradeRow(const core::TradeRecord& trade);
    };

} // namespace backtester
