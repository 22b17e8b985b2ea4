#include "mean_reversion_strategy.hpp"
#include "market_statistics.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace strategy_engine {

MeanReversionStrategy::MeanReversionStrategy(core::config::StrategyConfig config, MeanReversionParams params)
    : config_(std::move(config)), params_(params)
{
    if (config_.instruments.size() != 1) {
        throw std::invalid_argument("MeanReversionStrategy trades exactly one instrument.");
    }
    if (params_.window_days <= 0 || params_.lot_quantity <= 0.0 || params_.max_position <= 0.0 ||
        params_.dip_pct <= 0.0 || params_.dip_pct >= 1.0) {
        throw std::invalid_argument("MeanReversionStrategy parameters out of range.");
    }
    asset_ = config_.instruments.front();
}

void MeanReversionStrategy::onInit() {
    next_buy_promise_ = core::Timestamp{};
    core::logging::getLogger()->info("{}: trading {} over a {}-day window (H<{:.2f} reverts, H>{:.2f} trends)",
                                     config_.name, asset_, params_.window_days,
                                     params_.reversion_hurst, params_.trend_hurst);
}

Decision MeanReversionStrategy::decide(core::Timestamp today,
                                       const PriceHistoryMap& history,
                                       const core::AccountState& account) {
    Decision decision;
    auto it = history.find(asset_);
    if (it == history.end() || it->second.empty() || it->second.back().date != today) {
        return decision;
    }
    const double price = it->second.back().close;

    core::Timestamp window_start = core::utils::addDays(today, -params_.window_days);
    std::vector<double> window;
    for (const auto& bar : it->second) {
        if (bar.date > window_start) window.push_back(bar.close);
    }
    if (window.size() < 2) {
        return decision;
    }

    double hurst = indicators::hurstExponent(window, params_.min_chunk);
    double mean = std::accumulate(window.begin(), window.end(), 0.0) / static_cast<double>(window.size());
    core::logging::getLogger()->trace("{} {}: H {:.3f}, mean {:.2f}, close {:.2f}", config_.name,
                                      core::utils::dateToString(today), hurst, mean, price);

    if (hurst < params_.reversion_hurst) {
        if (price < mean * (1.0 - params_.dip_pct)) {
            decision.orders.push_back({asset_, core::TradeAction::Buy, params_.lot_quantity});
            decision.conditional_orders.push_back({asset_, core::TradeAction::Sell, mean,
                                                   core::utils::addDays(today, params_.reversion_expiry_days),
                                                   params_.lot_quantity});
        } else if (today >= next_buy_promise_) {
            decision.conditional_orders.push_back({asset_, core::TradeAction::Buy, mean * (1.0 - params_.dip_pct),
                                                   core::utils::addDays(today, params_.reversion_expiry_days),
                                                   params_.lot_quantity});
            next_buy_promise_ = core::utils::addDays(today, params_.reversion_expiry_days);
        }
    } else if (hurst > params_.trend_hurst) {
        double window_return = (window.back() - window.front()) / window.front();
        if (window_return > params_.breakout_return) {
            double quantity = std::clamp(params_.max_position - account.holdingOf(asset_) * 0.5,
                                         0.0, params_.max_position);
            if (quantity > 0.0) {
                decision.orders.push_back({asset_, core::TradeAction::Buy, quantity});
                decision.conditional_orders.push_back({asset_, core::TradeAction::Sell,
                                                       mean * (1.0 + params_.take_profit_pct),
                                                       core::utils::addDays(today, params_.breakout_expiry_days),
                                                       quantity});
            }
        }
    }
    return decision;
}

} // namespace strategy_engine
