// cli/src/main.cpp

#include <iostream>
#include <string>
#include <vector>
#include <exception>
#include <memory>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>

#include "logging.hpp"
#include "exceptions.hpp"
#include "config.hpp"
#include "utils.hpp"
#include "cache_store.hpp"
#include "csv_file_provider.hpp"
#include "yahoo_chart_provider.hpp"
#include "strategy_factory.hpp"
#include "simulation_kernel.hpp"
#include "trade_log_writer.hpp"
#include "notifier.hpp"

namespace {

    // With several strategies each export gets the strategy name appended: trades_<name>.csv
    std::string exportPath(const std::string& base, const std::string& strategy_name, size_t strategy_count) {
        if (strategy_count <= 1) {
            return base;
        }
        std::filesystem::path path(base);
        std::string stem = path.stem().string() + "_" + strategy_name;
        return (path.parent_path() / (stem + path.extension().string())).string();
    }

    void printUsage(const char* program) {
        std::cout << "Usage: " << program << " [run_config.json]\n"
                  << "  Defaults to config/example_run.json\n";
    }

} // namespace

int main(int argc, char* argv[]) {
    std::shared_ptr<spdlog::logger> logger = nullptr;

    try {
        if (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help")) {
            printUsage(argv[0]);
            return 0;
        }
        const std::string config_path = argc > 1 ? argv[1] : "config/example_run.json";

        // --- Configuration first, it carries the log level ---
        core::config::RunConfig run = core::config::loadRunConfig(config_path);

        core::logging::initialize("settlement_backtester",
                                  core::logging::level_from_string(run.log_level),
                                  spdlog::level::debug);
        logger = core::logging::getLogger();
        logger->info("Settlement Backtester CLI starting with config {}", config_path);
        logger->info("Period: {} to {}, step {}d, lookback {}d, {} strategies",
                     core::utils::dateToString(run.start_date), core::utils::dateToString(run.end_date),
                     run.interval_days, run.lookback_days, run.strategies.size());

        // --- Price cache ---
        logger->info("Using SQLite price cache: {}", run.cache_path);
        data::CacheStore cache(run.cache_path);
        if (!cache.connect() || !cache.initializeSchema()) {
            throw core::DataLoadException("Price cache unavailable: " + run.cache_path);
        }

        // --- Price sources ---
        data::CsvFileProvider csv_provider(run.csv_directory);
        data::YahooChartProvider yahoo_provider;

        backtester::SimulationKernel kernel(run.start_date, run.end_date, run.interval_days,
                                            run.lookback_days, cache, run.risk_free_rate);
        kernel.registerProvider(csv_provider);
        kernel.registerProvider(yahoo_provider);

        for (const auto& strategy_config : run.strategies) {
            kernel.addStrategy(strategy_engine::StrategyFactory::createStrategy(strategy_config));
        }

        // --- Run ---
        kernel.initialize();
        kernel.run();
        kernel.finalize();

        const auto& results = kernel.results();

        // --- Export ---
        bool exports_ok = true;
        for (const auto& result : results) {
            if (!run.trade_log_path.empty()) {
                exports_ok &= backtester::TradeLogWriter::writeTrades(
                    exportPath(run.trade_log_path, result.name, results.size()), result.trades);
            }
            if (!run.equity_log_path.empty()) {
                exports_ok &= backtester::TradeLogWriter::writeEquityCurve(
                    exportPath(run.equity_log_path, result.name, results.size()), result.snapshots);
            }
        }
        if (!exports_ok) {
            logger->warn("Some exports failed, see errors above.");
        }

        // --- Notify decisions executed on the last tick ---
        if (!run.notify_recipient.empty()) {
            std::vector<std::string> decisions;
            for (const auto& result : results) {
                for (const auto& trade : result.trades) {
                    if (trade.date == kernel.lastTick()) {
                        decisions.push_back(notify::describeTrade(result.name, trade));
                    }
                }
            }
            if (decisions.empty()) {
                logger->info("No trades on {}, nothing to notify.", core::utils::dateToString(kernel.lastTick()));
            } else {
                notify::MailjetNotifier notifier;
                if (!notifier.notifyDecisions(run.notify_recipient, decisions)) {
                    logger->warn("{} decisions were not delivered to {}.", decisions.size(), run.notify_recipient);
                }
            }
        }

        cache.disconnect();
        logger->info("Settlement Backtester CLI finished.");

    // --- Exception Handling ---
    } catch (const core::SimulatorException& ex) {
        std::cerr << "Simulator Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Simulator Error: {}", ex.what());
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Standard Error: " << ex.what() << std::endl;
        if (logger) logger->critical("Standard Error: {}", ex.what());
        return 1;
    }

    return 0;
}
