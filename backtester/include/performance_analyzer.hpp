#pragma once

#include <string>
#include <vector>

#include "datatypes.hpp"

namespace backtester {

    struct PerformanceReport {
        double initial_capital = 0.0;
        double final_equity = 0.0;
        double total_return = 0.0;   // final / initial - 1
        double cagr = 0.0;
        double max_drawdown = 0.0;   // <= 0, e.g. -0.25 for a 25% peak-to-trough fall
        double sharpe_ratio = 0.0;   // Annualized over 252 sessions
        long long duration_days = 0; // First to last snapshot
        int snapshot_count = 0;
        int trade_count = 0;
        double total_cost = 0.0;     // Commission + tax
        double total_slippage = 0.0;

        void logMetrics(const std::string& strategy_name) const;
    };

    // Pure functions over the equity snapshots and trade log of one run
    class PerformanceAnalyzer {
    public:
        static PerformanceReport analyze(const std::vector<core::EquitySnapshot>& snapshots,
                                         const std::vector<core::TradeRecord>& trades,
                                         double initial_capital,
                                         double risk_free_rate = 0.0);

        // min over t of (equity[t] - running_max[t]) / running_max[t]; 0 for fewer than 2 points
        static double maxDrawdown(const std::vector<double>& equity);

        // mean(r - rf/252) / stddev(r) * sqrt(252) with the sample stddev; 0 on zero variance
        static double sharpeRatio(const std::vector<double>& equity, double risk_free_rate);

        // (final/initial)^(365/duration_days) - 1; 0 when duration_days is 0
        static double cagr(double initial, double final_value, long long duration_days);
    };

} // namespace backtester
