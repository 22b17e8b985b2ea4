#include "performance_analyzer.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cmath>
#include <numeric>

namespace backtester {

namespace {
    constexpr double kTradingDaysPerYear = 252.0;
    constexpr double kCalendarDaysPerYear = 365.0;
}

void PerformanceReport::logMetrics(const std::string& strategy_name) const {
    auto logger = core::logging::getLogger();
    logger->info("--- Backtest Metrics: {} ---", strategy_name);
    logger->info("Initial Capital: {:.2f}", initial_capital);
    logger->info("Final Equity: {:.2f}", final_equity);
    logger->info("Total Return: {:.2f}%", total_return * 100.0);
    logger->info("CAGR: {:.2f}%", cagr * 100.0);
    logger->info("Max Drawdown: {:.2f}%", max_drawdown * 100.0);
    logger->info("Sharpe Ratio: {:.3f}", sharpe_ratio);
    logger->info("Duration: {} days ({} snapshots)", duration_days, snapshot_count);
    logger->info("Trades: {}", trade_count);
    logger->info("Commission + Tax: {:.2f}", total_cost);
    logger->info("Slippage Cost: {:.2f}", total_slippage);
    logger->info("------------------------");
}

double PerformanceAnalyzer::maxDrawdown(const std::vector<double>& equity) {
    if (equity.size() < 2) {
        return 0.0;
    }
    double running_max = equity.front();
    double max_dd = 0.0;
    for (double value : equity) {
        if (value > running_max) running_max = value;
        if (running_max <= 0.0) continue;
        double dd = (value - running_max) / running_max;
        if (dd < max_dd) max_dd = dd;
    }
    return max_dd;
}

double PerformanceAnalyzer::sharpeRatio(const std::vector<double>& equity, double risk_free_rate) {
    std::vector<double> returns;
    if (equity.size() > 1) {
        returns.reserve(equity.size() - 1);
    }
    for (size_t i = 1; i < equity.size(); ++i) {
        double prev = equity[i - 1];
        returns.push_back(prev > 0.0 ? equity[i] / prev - 1.0 : 0.0);
    }
    if (returns.size() < 2) {
        return 0.0;
    }

    double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / static_cast<double>(returns.size());
    double var = 0.0;
    for (double r : returns) {
        double d = r - mean;
        var += d * d;
    }
    var /= static_cast<double>(returns.size() - 1);
    double stddev = std::sqrt(var);
    if (!(stddev > 1e-12)) {
        return 0.0;
    }
    double excess_mean = mean - risk_free_rate / kTradingDaysPerYear;
    return excess_mean / stddev * std::sqrt(kTradingDaysPerYear);
}

double PerformanceAnalyzer::cagr(double initial, double final_value, long long duration_days) {
    if (duration_days <= 0 || initial <= 0.0) {
        return 0.0;
    }
    double ratio = final_value / initial;
    if (ratio <= 0.0) {
        return -1.0; // Account wiped out
    }
    return std::pow(ratio, kCalendarDaysPerYear / static_cast<double>(duration_days)) - 1.0;
}

PerformanceReport PerformanceAnalyzer::analyze(const std::vector<core::EquitySnapshot>& snapshots,
                                               const std::vector<core::TradeRecord>& trades,
                                               double initial_capital,
                                               double risk_free_rate) {
    PerformanceReport report;
    report.initial_capital = initial_capital;
    report.final_equity = initial_capital;
    report.snapshot_count = static_cast<int>(snapshots.size());
    report.trade_count = static_cast<int>(trades.size());
    for (const auto& trade : trades) {
        report.total_cost += trade.cost;
        report.total_slippage += trade.slippage_cost;
    }

    if (snapshots.empty()) {
        core::logging::getLogger()->warn("No equity snapshots recorded, performance metrics are zero.");
        return report;
    }

    std::vector<double> equity;
    equity.reserve(snapshots.size());
    for (const auto& snapshot : snapshots) {
        equity.push_back(snapshot.total_equity);
    }

    report.final_equity = equity.back();
    report.total_return = initial_capital > 0.0 ? report.final_equity / initial_capital - 1.0 : 0.0;
    report.duration_days = core::utils::daysBetween(snapshots.front().date, snapshots.back().date);
    report.cagr = cagr(initial_capital, report.final_equity, report.duration_days);
    report.max_drawdown = maxDrawdown(equity);
    report.sharpe_ratio = sharpeRatio(equity, risk_free_rate);
    return report;
}

} // namespace backtester
