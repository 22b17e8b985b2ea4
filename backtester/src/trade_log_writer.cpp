#include "trade_log_writer.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <spdlog/fmt/fmt.h>

namespace backtester {

namespace {

    bool openForWrite(const std::string& path, std::ofstream& out) {
        auto logger = core::logging::getLogger();
        try {
            std::filesystem::path file_path(path);
            if (file_path.has_parent_path()) {
                std::filesystem::create_directories(file_path.parent_path());
            }
        } catch (const std::filesystem::filesystem_error& e) {
            logger->error("Cannot create directory for '{}': {}", path, e.what());
            return false;
        }
        out.open(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            logger->error("Cannot open '{}' for writing.", path);
            return false;
        }
        return true;
    }

} // namespace

std::string TradeLogWriter::formatTradeRow(const core::TradeRecord& trade) {
    return fmt::format("{},{},{},{:.4f},{:.4f},{},{:.2f},{:.2f},{:.2f},{:.2f},{:.4f},{:.2f},{}",
                       core::utils::dateToString(trade.date),
                       trade.asset,
                       core::actionToString(trade.action),
                       trade.raw_price,
                       trade.executed_price,
                       trade.quantity,
                       trade.gross_value,
                       trade.commission,
                       trade.tax,
                       trade.cost,
                       trade.slippage_cost,
                       trade.net_cash_delta,
                       trade.signedQuantity());
}

bool TradeLogWriter::writeTrades(const std::string& path, const std::vector<core::TradeRecord>& trades) {
    std::ofstream out;
    if (!openForWrite(path, out)) {
        return false;
    }
    out << "date,asset,action,raw_price,executed_price,quantity,gross_value,"
           "commission,tax,cost,slippage_cost,net_cash_delta,quantity_delta\n";
    for (const auto& trade : trades) {
        out << formatTradeRow(trade) << '\n';
    }
    out.flush();
    if (!out) {
        core::logging::getLogger()->error("Write to '{}' failed.", path);
        return false;
    }
    core::logging::getLogger()->info("Wrote {} trades to {}", trades.size(), path);
    return true;
}

bool TradeLogWriter::writeEquityCurve(const std::string& path, const std::vector<core::EquitySnapshot>& snapshots) {
    std::ofstream out;
    if (!openForWrite(path, out)) {
        return false;
    }
    out << "date,cash,holdings_value,total_equity\n";
    for (const auto& snapshot : snapshots) {
        out << fmt::format("{},{:.2f},{:.2f},{:.2f}\n",
                           core::utils::dateToString(snapshot.date),
                           snapshot.cash,
                           snapshot.holdings_value,
                           snapshot.total_equity);
    }
    out.flush();
    if (!out) {
        core::logging::getLogger()->error("Write to '{}' failed.", path);
        return false;
    }
    core::logging::getLogger()->info("Wrote {} equity snapshots to {}", snapshots.size(), path);
    return true;
}

} // namespace backtester
