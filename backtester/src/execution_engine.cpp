#include "execution_engine.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace backtester {

namespace {

    // Float noise tolerated when comparing money amounts against available cash
    constexpr double kCashEpsilon = 1e-9;
    constexpr double kQuantityEpsilon = 1e-9;
    constexpr int kMaxAffordabilityPasses = 4;

    const char* fieldName(bool at_open) {
        return at_open ? "open" : "close";
    }

} // namespace

ExecutionEngine::ExecutionEngine(core::MarketConfig config, double initial_cash, const IMarketPrices& prices)
    : config_(config), initial_cash_(initial_cash), prices_(prices)
{
    if (!std::isfinite(initial_cash) || initial_cash <= 0.0) {
        throw std::invalid_argument("Initial cash must be positive.");
    }
    if (config_.commission_rate < 0.0 || config_.min_commission < 0.0 || config_.tax_rate < 0.0 ||
        config_.slippage_rate < 0.0 || config_.slippage_rate >= 1.0) {
        throw std::invalid_argument("Market cost rates must be non-negative and slippage below 1.");
    }
    if (config_.volume_limit_fraction <= 0.0) {
        throw std::invalid_argument("Volume limit fraction must be positive.");
    }
    account_.cash_available = initial_cash;
    core::logging::getLogger()->debug("ExecutionEngine initialized with cash: {:.2f}", initial_cash);
}

std::vector<core::TradeRecord> ExecutionEngine::submit(const std::vector<core::OrderIntent>& intents,
                                                       core::Timestamp as_of) {
    return process(intents, as_of, PriceField::Close);
}

std::vector<core::TradeRecord> ExecutionEngine::submitAtOpen(const std::vector<core::OrderIntent>& intents,
                                                             core::Timestamp as_of) {
    return process(intents, as_of, PriceField::Open);
}

void ExecutionEngine::clearSettlement() {
    if (config_.settlement_mode != core::SettlementMode::NextDaySettle || account_.frozen.empty()) {
        return;
    }
    core::logging::getLogger()->trace("Clearing settlement holds on {} assets.", account_.frozen.size());
    account_.frozen.clear();
}

double ExecutionEngine::roundMoney(double value) const {
    return config_.round_costs_to_cents ? core::utils::roundToCents(value) : value;
}

double ExecutionEngine::costFor(core::TradeAction action, double gross_value) const {
    double commission = roundMoney(std::max(gross_value * config_.commission_rate, config_.min_commission));
    double tax = action == core::TradeAction::Sell ? roundMoney(gross_value * config_.tax_rate) : 0.0;
    return commission + tax;
}

double ExecutionEngine::affordableQuantity(double price) const {
    const double cash = account_.cash_available;
    const double rate = config_.commission_rate;

    // Solve g + max(g * rate, min_commission) = cash for the gross value g
    double gross = cash / (1.0 + rate);
    if (gross * rate < config_.min_commission) {
        gross = cash - config_.min_commission;
    }
    if (gross <= 0.0) {
        return 0.0;
    }

    // Rounding the commission up can push the total a fraction of a cent over
    double quantity = gross / price;
    for (int pass = 0; pass < kMaxAffordabilityPasses; ++pass) {
        double value = quantity * price;
        double excess = value + costFor(core::TradeAction::Buy, value) - cash;
        if (excess <= kCashEpsilon) {
            break;
        }
        quantity = (value - excess) / price;
        if (quantity <= 0.0) {
            return 0.0;
        }
    }
    return quantity;
}

std::vector<core::TradeRecord> ExecutionEngine::process(const std::vector<core::OrderIntent>& intents,
                                                        core::Timestamp as_of, PriceField field) {
    std::vector<core::TradeRecord> fills;
    for (const auto& intent : intents) {
        auto trade = execute(intent, as_of, field);
        if (trade) {
            applyFill(*trade);
            fills.push_back(*trade);
        }
    }
    return fills;
}

std::optional<core::TradeRecord> ExecutionEngine::execute(const core::OrderIntent& intent,
                                                          core::Timestamp as_of, PriceField field) {
    auto logger = core::logging::getLogger();
    const std::string date_str = core::utils::dateToString(as_of);
    const bool is_buy = intent.action == core::TradeAction::Buy;
    const std::string& asset = intent.asset;
    double quantity = intent.quantity;

    if (asset.empty() || !std::isfinite(quantity) || quantity <= 0.0) {
        logger->warn("Ignoring invalid order intent on {}: asset='{}', quantity={}", date_str, asset, quantity);
        return std::nullopt;
    }

    // --- 1. Settlement / availability check ---
    if (!is_buy) {
        double sellable = account_.sellableOf(asset);
        if (quantity > sellable) {
            double frozen = account_.frozenOf(asset);
            if (frozen > 0.0) {
                logger->warn("Settlement hold on {} ({}): sell of {} clipped to {} settled units ({} frozen until next session).",
                             asset, date_str, quantity, sellable, frozen);
            } else if (quantity > sellable + kQuantityEpsilon) {
                logger->info("Sell of {} {} clipped to held quantity {} on {}.", quantity, asset, sellable, date_str);
            }
            quantity = sellable;
        }
        if (quantity <= kQuantityEpsilon) {
            logger->debug("Sell of {} on {} refused, nothing sellable.", asset, date_str);
            return std::nullopt;
        }
    }

    // --- 2. Liquidity cap ---
    if (config_.volume_limit_fraction < 1.0) {
        long long volume = prices_.volumeOn(asset, as_of);
        if (volume <= 0) {
            logger->debug("No traded volume for {} on {}, liquidity cap not applied.", asset, date_str);
        } else {
            double cap = static_cast<double>(volume) * config_.volume_limit_fraction;
            if (quantity > cap) {
                logger->warn("Liquidity limit on {} ({}): requested {} exceeds {:.0f}% of volume {}, clipped to {}.",
                             asset, date_str, quantity, config_.volume_limit_fraction * 100.0, volume, cap);
                quantity = cap;
            }
        }
        if (quantity <= kQuantityEpsilon) {
            return std::nullopt;
        }
    }

    // --- 3. Price resolution ---
    const bool at_open = field == PriceField::Open;
    std::optional<double> raw_price = at_open ? prices_.openOn(asset, as_of) : prices_.closeOn(asset, as_of);
    if (!raw_price) {
        logger->debug("No valid {} price for {} on {}, {} order skipped.",
                      fieldName(at_open), asset, date_str, core::actionToString(intent.action));
        return std::nullopt;
    }
    double price = is_buy ? *raw_price * (1.0 + config_.slippage_rate)
                          : *raw_price * (1.0 - config_.slippage_rate);
    if (!std::isfinite(price) || price <= 0.0) {
        logger->warn("Execution price for {} on {} is not usable ({}), order skipped.", asset, date_str, price);
        return std::nullopt;
    }

    // --- 4. Cash cap ---
    if (is_buy) {
        double value = quantity * price;
        if (value + costFor(core::TradeAction::Buy, value) > account_.cash_available + kCashEpsilon) {
            double affordable = affordableQuantity(price);
            logger->info("Insufficient cash for {} x {} @ {:.4f} on {} (cash {:.2f}), quantity clipped to {:.4f}.",
                         quantity, asset, price, date_str, account_.cash_available, affordable);
            quantity = std::min(quantity, affordable);
        }
        if (quantity <= kQuantityEpsilon) {
            logger->debug("Buy of {} on {} refused, no affordable quantity.", asset, date_str);
            return std::nullopt;
        }
    }

    // --- 5. Cost model ---
    core::TradeRecord trade;
    trade.date = as_of;
    trade.asset = asset;
    trade.action = intent.action;
    trade.raw_price = *raw_price;
    trade.executed_price = price;
    trade.quantity = quantity;
    trade.gross_value = quantity * price;
    trade.commission = roundMoney(std::max(trade.gross_value * config_.commission_rate, config_.min_commission));
    trade.tax = is_buy ? 0.0 : roundMoney(trade.gross_value * config_.tax_rate);
    trade.cost = trade.commission + trade.tax;
    trade.slippage_cost = std::abs(price - *raw_price) * quantity;
    trade.net_cash_delta = is_buy ? -trade.gross_value - trade.cost : trade.gross_value - trade.cost;

    // A sell too small to cover its minimum commission can also overdraw
    if (account_.cash_available + trade.net_cash_delta < -kCashEpsilon) {
        logger->warn("{} of {} x {} on {} would overdraw cash ({:.2f} + {:.2f}), order aborted.",
                     core::actionToString(intent.action), quantity, asset, date_str,
                     account_.cash_available, trade.net_cash_delta);
        return std::nullopt;
    }
    return trade;
}

void ExecutionEngine::applyFill(const core::TradeRecord& trade) {
    auto logger = core::logging::getLogger();

    // --- 6. Ledger mutation ---
    account_.cash_available += trade.net_cash_delta;
    if (account_.cash_available < 0.0) {
        account_.cash_available = 0.0; // Only float noise reaches here, see the overdraw check
    }

    double& holding = account_.holdings[trade.asset];
    holding += trade.signedQuantity();
    if (holding <= kQuantityEpsilon) {
        account_.holdings.erase(trade.asset);
        account_.frozen.erase(trade.asset);
    } else if (trade.action == core::TradeAction::Buy &&
               config_.settlement_mode == core::SettlementMode::NextDaySettle) {
        account_.frozen[trade.asset] += trade.quantity;
    }

    trade_log_.push_back(trade);

    logger->info("Trade Executed: Date={}, Asset={}, Action={}, Qty={}, Raw={:.4f}, Price={:.4f}, Gross={:.2f}, Comm={:.2f}, Tax={:.2f}, NetCash={:.2f}, Cash={:.2f}, Holding={}",
                 core::utils::dateToString(trade.date),
                 trade.asset,
                 core::actionToString(trade.action),
                 trade.quantity,
                 trade.raw_price,
                 trade.executed_price,
                 trade.gross_value,
                 trade.commission,
                 trade.tax,
                 trade.net_cash_delta,
                 account_.cash_available,
                 account_.holdingOf(trade.asset));
}

} // namespace backtester
