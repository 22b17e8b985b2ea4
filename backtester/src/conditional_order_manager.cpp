#include "conditional_order_manager.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <cmath>

namespace backtester {

ConditionalOrderManager::ConditionalOrderManager(const IMarketPrices& prices)
    : prices_(prices) {}

bool ConditionalOrderManager::add(core::ConditionalOrder order) {
    auto logger = core::logging::getLogger();
    if (order.asset.empty() || !std::isfinite(order.quantity) || order.quantity <= 0.0) {
        logger->warn("Rejected conditional {} order: asset='{}', quantity={}",
                     core::actionToString(order.action), order.asset, order.quantity);
        return false;
    }
    logger->debug("Conditional {} {} x {} @ {:.4f} pending until {}",
                  core::actionToString(order.action), order.quantity, order.asset,
                  order.trigger_price, core::utils::dateToString(order.expiry_date));
    pending_.push_back(std::move(order));
    return true;
}

std::vector<core::OrderIntent> ConditionalOrderManager::evaluate(core::Timestamp as_of) {
    auto logger = core::logging::getLogger();
    std::vector<core::OrderIntent> fired;
    std::vector<core::ConditionalOrder> still_pending;
    still_pending.reserve(pending_.size());

    for (auto& order : pending_) {
        auto close = prices_.closeOn(order.asset, as_of);
        if (!close) {
            still_pending.push_back(std::move(order));
            continue;
        }

        bool triggered = order.action == core::TradeAction::Buy ? *close <= order.trigger_price
                                                                 : *close >= order.trigger_price;
        bool expired = as_of > order.expiry_date;
        if (!triggered && !expired) {
            still_pending.push_back(std::move(order));
            continue;
        }

        logger->info("Conditional {} on {} fired on {} ({}): close {:.4f}, trigger {:.4f}",
                     core::actionToString(order.action), order.asset, core::utils::dateToString(as_of),
                     triggered ? "price" : "expired", *close, order.trigger_price);
        fired.push_back(core::OrderIntent{order.asset, order.action, order.quantity});
    }

    pending_ = std::move(still_pending);
    return fired;
}

} // namespace backtester
