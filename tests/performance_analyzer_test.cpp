#include <gtest/gtest.h>

#include <cmath>

#include "performance_analyzer.hpp"
#include "test_helpers.hpp"

using namespace backtester;
using test_support::day;

namespace {

    core::EquitySnapshot snapshot(const std::string& date, double equity) {
        core::EquitySnapshot s;
        s.date = day(date);
        s.cash = equity;
        s.total_equity = equity;
        return s;
    }

} // namespace

TEST(PerformanceAnalyzerTest, MaxDrawdownPeakToTrough) {
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::maxDrawdown({100, 120, 90, 130}), -0.25);
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::maxDrawdown({100, 110, 120}), 0.0);
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::maxDrawdown({100}), 0.0);
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::maxDrawdown({}), 0.0);
}

TEST(PerformanceAnalyzerTest, SharpeIsZeroWithoutVariance) {
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::sharpeRatio({100, 100, 100, 100}, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::sharpeRatio({100, 110}, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::sharpeRatio({}, 0.02), 0.0);
}

TEST(PerformanceAnalyzerTest, SharpeMatchesSampleStatistics) {
    std::vector<double> equity = {100.0, 110.0, 99.0, 108.9};
    // Returns 0.1, -0.1, 0.1
    double mean = 0.1 / 3.0;
    double var = ((0.1 - mean) * (0.1 - mean) * 2 + (-0.1 - mean) * (-0.1 - mean)) / 2.0;
    double expected = mean / std::sqrt(var) * std::sqrt(252.0);
    EXPECT_NEAR(PerformanceAnalyzer::sharpeRatio(equity, 0.0), expected, 1e-9);

    double with_rf = (mean - 0.05 / 252.0) / std::sqrt(var) * std::sqrt(252.0);
    EXPECT_NEAR(PerformanceAnalyzer::sharpeRatio(equity, 0.05), with_rf, 1e-9);
}

TEST(PerformanceAnalyzerTest, CagrAnnualizesOverCalendarDays) {
    EXPECT_NEAR(PerformanceAnalyzer::cagr(100.0, 121.0, 730), 0.1, 1e-9);
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::cagr(100.0, 150.0, 0), 0.0);
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::cagr(100.0, 0.0, 365), -1.0);
}

TEST(PerformanceAnalyzerTest, EmptySeriesKeepsInitialCapital) {
    auto report = PerformanceAnalyzer::analyze({}, {}, 5000.0);
    EXPECT_DOUBLE_EQ(report.final_equity, 5000.0);
    EXPECT_DOUBLE_EQ(report.total_return, 0.0);
    EXPECT_DOUBLE_EQ(report.max_drawdown, 0.0);
    EXPECT_DOUBLE_EQ(report.sharpe_ratio, 0.0);
    EXPECT_EQ(report.snapshot_count, 0);
}

TEST(PerformanceAnalyzerTest, SingleSnapshotHasZeroDuration) {
    auto report = PerformanceAnalyzer::analyze({snapshot("2024-01-02", 1100.0)}, {}, 1000.0);
    EXPECT_DOUBLE_EQ(report.final_equity, 1100.0);
    EXPECT_NEAR(report.total_return, 0.1, 1e-12);
    EXPECT_EQ(report.duration_days, 0);
    EXPECT_DOUBLE_EQ(report.cagr, 0.0);
    EXPECT_DOUBLE_EQ(report.max_drawdown, 0.0);
}

TEST(PerformanceAnalyzerTest, AnalyzeAggregatesTradeCosts) {
    core::TradeRecord first;
    first.cost = 5.0;
    first.slippage_cost = 1.5;
    core::TradeRecord second;
    second.cost = 7.25;
    second.slippage_cost = 0.5;

    std::vector<core::EquitySnapshot> snapshots = {
        snapshot("2024-01-01", 1000.0), snapshot("2024-07-01", 1200.0), snapshot("2025-01-01", 900.0)};
    auto report = PerformanceAnalyzer::analyze(snapshots, {first, second}, 1000.0);

    EXPECT_EQ(report.trade_count, 2);
    EXPECT_DOUBLE_EQ(report.total_cost, 12.25);
    EXPECT_DOUBLE_EQ(report.total_slippage, 2.0);
    EXPECT_EQ(report.duration_days, 366);
    EXPECT_DOUBLE_EQ(report.max_drawdown, -0.25);
    EXPECT_NEAR(report.total_return, -0.1, 1e-12);
}
