#include "simulation_kernel.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "exceptions.hpp"

#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace backtester {

std::string kernelStateToString(KernelState state) {
    switch (state) {
        case KernelState::Uninitialized: return "Uninitialized";
        case KernelState::Initializing:  return "Initializing";
        case KernelState::Running:       return "Running";
        case KernelState::Finalized:     return "Finalized";
        default:                         return "Unknown";
    }
}

SimulationKernel::SimulationKernel(core::Timestamp start,
                                   core::Timestamp end,
                                   int interval_days,
                                   int lookback_days,
                                   data::CacheStore& cache,
                                   double risk_free_rate)
    : start_(core::utils::toDate(start)),
      end_(core::utils::toDate(end)),
      interval_days_(interval_days),
      lookback_days_(lookback_days),
      risk_free_rate_(risk_free_rate),
      cache_(cache),
      last_tick_(core::utils::toDate(start))
{
    if (end_ < start_) {
        throw std::invalid_argument("Simulation end date precedes start date.");
    }
    if (interval_days_ <= 0) {
        throw std::invalid_argument("Simulation interval must be at least one day.");
    }
    if (lookback_days_ < 0) {
        throw std::invalid_argument("Lookback margin cannot be negative.");
    }
    core::logging::getLogger()->debug("SimulationKernel created: {} -> {}, step {}d, lookback {}d",
                                      core::utils::dateToString(start_), core::utils::dateToString(end_),
                                      interval_days_, lookback_days_);
}

void SimulationKernel::requireState(KernelState expected, const char* operation) const {
    if (state_ != expected) {
        throw core::BacktestException(fmt::format("{}() called in state {} (expected {}).", operation,
                                                  kernelStateToString(state_), kernelStateToString(expected)));
    }
}

void SimulationKernel::registerProvider(data::IPriceProvider& provider) {
    requireState(KernelState::Uninitialized, "registerProvider");
    providers_[provider.sourceName()] = &provider;
}

void SimulationKernel::addStrategy(std::unique_ptr<strategy_engine::IStrategy> strategy) {
    requireState(KernelState::Uninitialized, "addStrategy");
    if (!strategy) {
        throw std::invalid_argument("Cannot add a null strategy.");
    }
    auto context = std::make_unique<StrategyContext>();
    context->strategy = std::move(strategy);
    contexts_.push_back(std::move(context));
}

data::PriceHistoryStore& SimulationKernel::loadStore(const std::string& source, const std::string& asset) {
    auto key = std::make_pair(source, asset);
    auto it = stores_.find(key);
    if (it != stores_.end()) {
        return *it->second; // Shared with an earlier strategy
    }

    auto provider_it = providers_.find(source);
    if (provider_it == providers_.end()) {
        throw core::BacktestException(fmt::format("No price provider registered for source '{}'.", source));
    }

    auto store = std::make_unique<data::PriceHistoryStore>(asset, data::intervalLabel(interval_days_),
                                                           *provider_it->second, cache_);
    store->initialize(core::utils::addDays(start_, -lookback_days_), end_);
    auto& ref = *store;
    stores_.emplace(key, std::move(store));
    return ref;
}

const data::PriceHistoryStore* SimulationKernel::store(const std::string& source, const std::string& asset) const {
    auto it = stores_.find(std::make_pair(source, asset));
    return it != stores_.end() ? it->second.get() : nullptr;
}

void SimulationKernel::initialize() {
    requireState(KernelState::Uninitialized, "initialize");
    auto logger = core::logging::getLogger();
    if (contexts_.empty()) {
        throw core::BacktestException("No strategies attached to the simulation.");
    }

    state_ = KernelState::Initializing;
    logger->info("Initializing simulation for {} strategies...", contexts_.size());

    try {
        for (auto& context : contexts_) {
            auto& strategy = *context->strategy;
            const std::string source = strategy.getDataSource();
            for (const auto& asset : strategy.getRequiredInstruments()) {
                context->prices.addStore(loadStore(source, asset));
            }
            context->engine = std::make_unique<ExecutionEngine>(strategy.getMarketConfig(),
                                                                strategy.getInitialCapital(),
                                                                context->prices);
            context->promises = std::make_unique<ConditionalOrderManager>(context->prices);
        }
        for (auto& context : contexts_) {
            if (!context->initialized) {
                context->strategy->onInit();
                context->initialized = true;
            }
            logger->info("Strategy '{}' initialized ({} instruments, source '{}').",
                         context->strategy->getName(),
                         context->strategy->getRequiredInstruments().size(),
                         context->strategy->getDataSource());
        }
    } catch (const std::exception& e) {
        logger->critical("Simulation initialization failed: {}", e.what());
        for (auto& context : contexts_) {
            context->promises.reset();
            context->engine.reset();
            context->prices = StoreBackedPrices{};
        }
        state_ = KernelState::Uninitialized;
        throw;
    }
}

void SimulationKernel::run() {
    requireState(KernelState::Initializing, "run");
    auto logger = core::logging::getLogger();
    state_ = KernelState::Running;

    logger->info("========================================================");
    logger->info("Starting Backtest Run: {} to {}", core::utils::dateToString(start_), core::utils::dateToString(end_));
    logger->info("========================================================");

    size_t ticks = 0;
    for (core::Timestamp today = start_; today <= end_; today = core::utils::addDays(today, interval_days_)) {
        logger->trace("Tick {}", core::utils::dateToString(today));
        for (auto& context : contexts_) {
            step(*context, today);
        }
        last_tick_ = today;
        ++ticks;
    }
    logger->info("Event loop finished after {} ticks.", ticks);
}

void SimulationKernel::step(StrategyContext& context, core::Timestamp today) {
    auto& engine = *context.engine;
    auto& strategy = *context.strategy;

    // 1. Shares bought on earlier ticks become sellable
    engine.clearSettlement();

    // 2. Yesterday's next-open orders fill at today's open
    drainNextOpenQueue(context, today);

    // 3. Point-in-time decision
    strategy_engine::Decision decision;
    try {
        decision = strategy.decide(today, visibleHistory(context, today), engine.account());
    } catch (const core::SimulatorException&) {
        throw;
    } catch (const std::exception& e) {
        throw core::StrategyException(fmt::format("Strategy '{}' failed on {}: {}", strategy.getName(),
                                                  core::utils::dateToString(today), e.what()));
    }

    // 4. Promises, including ones created this tick
    for (auto& order : decision.conditional_orders) {
        context.promises->add(std::move(order));
    }
    std::vector<core::OrderIntent> intents = std::move(decision.orders);
    auto fired = context.promises->evaluate(today);
    intents.insert(intents.end(), fired.begin(), fired.end());

    // 5. Execute now or at the next open
    if (!intents.empty()) {
        if (engine.config().execution_timing == core::ExecutionTiming::NextBarOpen) {
            for (auto& intent : intents) {
                context.next_open_queue.push_back(std::move(intent));
            }
            core::logging::getLogger()->debug("'{}' queued {} orders for the next open.", strategy.getName(),
                                              context.next_open_queue.size());
        } else {
            engine.submit(intents, today);
        }
    }

    // 6. Mark to market
    recordSnapshot(context, today);
}

void SimulationKernel::drainNextOpenQueue(StrategyContext& context, core::Timestamp today) {
    if (context.next_open_queue.empty()) {
        return;
    }

    // Orders for assets with no session today wait for the next tick that has one
    std::vector<core::OrderIntent> executable;
    std::deque<core::OrderIntent> carried;
    while (!context.next_open_queue.empty()) {
        core::OrderIntent intent = std::move(context.next_open_queue.front());
        context.next_open_queue.pop_front();
        if (context.prices.hasBar(intent.asset, today)) {
            executable.push_back(std::move(intent));
        } else {
            carried.push_back(std::move(intent));
        }
    }
    if (!carried.empty()) {
        core::logging::getLogger()->debug("{} queued orders carried past {} (no session).", carried.size(),
                                          core::utils::dateToString(today));
    }
    context.next_open_queue = std::move(carried);

    if (!executable.empty()) {
        context.engine->submitAtOpen(executable, today);
    }
}

strategy_engine::PriceHistoryMap SimulationKernel::visibleHistory(const StrategyContext& context,
                                                                  core::Timestamp today) const {
    strategy_engine::PriceHistoryMap history;
    for (const auto& asset : context.strategy->getRequiredInstruments()) {
        const auto* store = context.prices.storeFor(asset);
        history[asset] = store ? store->historyUpTo(today) : core::TimeSeries<core::PriceBar>{};
    }
    return history;
}

void SimulationKernel::recordSnapshot(StrategyContext& context, core::Timestamp today) {
    const auto& account = context.engine->account();
    double holdings_value = 0.0;
    for (const auto& position : account.holdings) {
        if (position.second <= 0.0) continue;
        auto close = context.prices.closeOn(position.first, today);
        if (!close) {
            core::logging::getLogger()->trace("No close for held {} on {}, snapshot skipped.", position.first,
                                              core::utils::dateToString(today));
            return;
        }
        holdings_value += position.second * *close;
    }

    core::EquitySnapshot snapshot;
    snapshot.date = today;
    snapshot.cash = account.cash_available;
    snapshot.holdings_value = holdings_value;
    snapshot.total_equity = snapshot.cash + holdings_value;
    context.snapshots.push_back(snapshot);
}

void SimulationKernel::finalize() {
    requireState(KernelState::Running, "finalize");
    auto logger = core::logging::getLogger();
    state_ = KernelState::Finalized;

    results_.clear();
    for (auto& context : contexts_) {
        context->strategy->onFinalize();

        StrategyResult result;
        result.name = context->strategy->getName();
        result.trades = context->engine->tradeLog();
        result.snapshots = context->snapshots;
        result.final_account = context->engine->account();
        result.report = PerformanceAnalyzer::analyze(result.snapshots, result.trades,
                                                     context->engine->initialCash(), risk_free_rate_);
        if (!context->next_open_queue.empty()) {
            logger->warn("'{}' ends with {} unfilled next-open orders.", result.name, context->next_open_queue.size());
        }
        if (!context->promises->pending().empty()) {
            logger->info("'{}' ends with {} pending conditional orders.", result.name, context->promises->pending().size());
        }
        result.report.logMetrics(result.name);
        results_.push_back(std::move(result));
    }

    logger->info("========================================================");
    logger->info("Backtest Run Completed ({} strategies)", results_.size());
    logger->info("========================================================");
}

const std::vector<StrategyResult>& SimulationKernel::results() const {
    if (state_ != KernelState::Finalized) {
        throw core::BacktestException("Results requested before finalize().");
    }
    return results_;
}

const std::vector<core::TradeRecord>& SimulationKernel::tradesOf(size_t strategy_index) const {
    if (strategy_index >= contexts_.size() || !contexts_[strategy_index]->engine) {
        throw std::out_of_range("No initialized strategy at index " + std::to_string(strategy_index));
    }
    return contexts_[strategy_index]->engine->tradeLog();
}

const core::AccountState& SimulationKernel::accountOf(size_t strategy_index) const {
    if (strategy_index >= contexts_.size() || !contexts_[strategy_index]->engine) {
        throw std::out_of_range("No initialized strategy at index " + std::to_string(strategy_index));
    }
    return contexts_[strategy_index]->engine->account();
}

} // namespace backtester
