#pragma once

#include <string>
#include <vector>
#include <map>
#include <deque>
#include <memory>
#include <utility>

#include "datatypes.hpp"
#include "cache_store.hpp"
#include "price_provider.hpp"
#include "price_history_store.hpp"
#include "interfaces.hpp"
#include "market_prices.hpp"
#include "execution_engine.hpp"
#include "conditional_order_manager.hpp"
#include "performance_analyzer.hpp"

namespace backtester {

    enum class KernelState {
        Uninitialized,
        Initializing, // Data loaded, ready to run
        Running,
        Finalized
    };

    std::string kernelStateToString(KernelState state);

    struct StrategyResult {
        std::string name;
        std::vector<core::TradeRecord> trades;
        std::vector<core::EquitySnapshot> snapshots;
        core::AccountState final_account;
        PerformanceReport report;
    };

    // Daily clock driving any number of strategies over shared price stores.
    // Each strategy gets its own ledger, promises and next-open queue.
    class SimulationKernel {
    public:
        SimulationKernel(core::Timestamp start,
                         core::Timestamp end,
                         int interval_days,
                         int lookback_days,
                         data::CacheStore& cache,
                         double risk_free_rate = 0.0);

        // Providers are referenced, not owned, and keyed by their sourceName()
        void registerProvider(data::IPriceProvider& provider);

        void addStrategy(std::unique_ptr<strategy_engine::IStrategy> strategy);

        // Loads [start - lookback, end] for every referenced asset, then calls onInit.
        // Throws core::DataLoadException when an asset cannot be loaded. On failure the
        // kernel returns to Uninitialized and may be initialized again; onInit is called
        // at most once per strategy.
        void initialize();

        // Steps the clock from start to end
        void run();

        // Calls onFinalize and computes the performance reports
        void finalize();

        KernelState state() const { return state_; }
        core::Timestamp lastTick() const { return last_tick_; }
        const std::vector<StrategyResult>& results() const;

        // Trades of one strategy so far, valid from initialize() on
        const std::vector<core::TradeRecord>& tradesOf(size_t strategy_index) const;
        const core::AccountState& accountOf(size_t strategy_index) const;

        const data::PriceHistoryStore* store(const std::string& source, const std::string& asset) const;

    private:
        struct StrategyContext {
            std::unique_ptr<strategy_engine::IStrategy> strategy;
            StoreBackedPrices prices;
            std::unique_ptr<ExecutionEngine> engine;
            std::unique_ptr<ConditionalOrderManager> promises;
            std::deque<core::OrderIntent> next_open_queue;
            std::vector<core::EquitySnapshot> snapshots;
            bool initialized = false; // onInit() returned
        };

        core::Timestamp start_;
        core::Timestamp end_;
        int interval_days_;
        int lookback_days_;
        double risk_free_rate_;
        data::CacheStore& cache_;
        KernelState state_ = KernelState::Uninitialized;
        core::Timestamp last_tick_;

        std::map<std::string, data::IPriceProvider*> providers_;
        std::map<std::pair<std::string, std::string>, std::unique_ptr<data::PriceHistoryStore>> stores_;
        std::vector<std::unique_ptr<StrategyContext>> contexts_;
        std::vector<StrategyResult> results_;

        void requireState(KernelState expected, const char* operation) const;
        data::PriceHistoryStore& loadStore(const std::string& source, const std::string& asset);
        void step(StrategyContext& context, core::Timestamp today);
        void drainNextOpenQueue(StrategyContext& context, core::Timestamp today);
        void recordSnapshot(StrategyContext& context, core::Timestamp today);
        strategy_engine::PriceHistoryMap visibleHistory(const StrategyContext& context, core::Timestamp today) const;
    };

} // namespace backtester
