#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "trade_log_writer.hpp"
#include "test_helpers.hpp"

using namespace backtester;

namespace {

    std::vector<std::string> readLines(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    core::TradeRecord sellRecord() {
        core::TradeRecord trade;
        trade.date = test_support::day("2024-01-03");
        trade.asset = "600519";
        trade.action = core::TradeAction::Sell;
        trade.raw_price = 110.0;
        trade.executed_price = 109.89;
        trade.quantity = 500.0;
        trade.gross_value = 54945.0;
        trade.commission = 13.74;
        trade.tax = 27.47;
        trade.cost = 41.21;
        trade.slippage_cost = 55.0;
        trade.net_cash_delta = 54903.79;
        return trade;
    }

} // namespace

TEST(TradeLogWriterTest, FormatsTradeRow) {
    EXPECT_EQ(TradeLogWriter::formatTradeRow(sellRecord()),
              "2024-01-03,600519,Sell,110.0000,109.8900,500,54945.00,13.74,27.47,41.21,55.0000,54903.79,-500");
}

TEST(TradeLogWriterTest, WritesTradesAndEquityWithHeaders) {
    auto dir = std::filesystem::temp_directory_path() / "settlement_backtester_export_test" / "nested";
    std::filesystem::remove_all(dir.parent_path());

    ASSERT_TRUE(TradeLogWriter::writeTrades((dir / "trades.csv").string(), {sellRecord(), sellRecord()}));
    auto trade_lines = readLines(dir / "trades.csv");
    ASSERT_EQ(trade_lines.size(), 3u);
    EXPECT_EQ(trade_lines[0], "date,asset,action,raw_price,executed_price,quantity,gross_value,"
                              "commission,tax,cost,slippage_cost,net_cash_delta,quantity_delta");

    core::EquitySnapshot snapshot;
    snapshot.date = test_support::day("2024-01-03");
    snapshot.cash = 954778.76;
    snapshot.holdings_value = 55000.0;
    snapshot.total_equity = 1009778.76;
    ASSERT_TRUE(TradeLogWriter::writeEquityCurve((dir / "equity.csv").string(), {snapshot}));
    auto equity_lines = readLines(dir / "equity.csv");
    ASSERT_EQ(equity_lines.size(), 2u);
    EXPECT_EQ(equity_lines[0], "date,cash,holdings_value,total_equity");
    EXPECT_EQ(equity_lines[1], "2024-01-03,954778.76,55000.00,1009778.76");

    std::filesystem::remove_all(dir.parent_path());
}

TEST(TradeLogWriterTest, UnwritablePathReportsFailure) {
    auto dir = std::filesystem::temp_directory_path() / "settlement_backtester_blocked";
    std::filesystem::remove_all(dir);
    {
        std::ofstream blocker(dir); // A file where a directory is expected
    }
    EXPECT_FALSE(TradeLogWriter::writeTrades((dir / "trades.csv").string(), {}));
    std::filesystem::remove_all(dir);
}
