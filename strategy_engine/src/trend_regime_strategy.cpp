#include "trend_regime_strategy.hpp"
#include "market_statistics.hpp"
#include "logging.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace strategy_engine {

TrendRegimeStrategy::TrendRegimeStrategy(core::config::StrategyConfig config, TrendRegimeParams params)
    : config_(std::move(config)),
      params_(params),
      regime_ma_(params.regime_period, params.regime_ma_type)
{
    if (config_.instruments.size() != 1) {
        throw std::invalid_argument("TrendRegimeStrategy trades exactly one instrument.");
    }
    if (params_.hurst_window < 16 || params_.volatility_window < 2) {
        throw std::invalid_argument("TrendRegimeStrategy needs hurst_window >= 16 and volatility_window >= 2.");
    }
    if (params_.target_volatility <= 0.0 || params_.lot_size <= 0.0 ||
        params_.stop_loss_pct <= 0.0 || params_.stop_loss_pct >= 1.0) {
        throw std::invalid_argument("TrendRegimeStrategy parameters out of range.");
    }
    asset_ = config_.instruments.front();
}

void TrendRegimeStrategy::onInit() {
    max_price_ = 0.0;
    cooldown_remaining_ = 0;
    decisions_ = 0;
    core::logging::getLogger()->info("{}: trading {} (H>{:.2f}, {} regime, target vol {:.0f}%, stop {:.0f}%)",
                                     config_.name, asset_, params_.hurst_threshold, regime_ma_.getName(),
                                     params_.target_volatility * 100.0, params_.stop_loss_pct * 100.0);
}

void TrendRegimeStrategy::onFinalize() {
    core::logging::getLogger()->debug("{}: {} trading decisions issued.", config_.name, decisions_);
}

double TrendRegimeStrategy::floorToLot(double quantity) const {
    return std::floor(quantity / params_.lot_size) * params_.lot_size;
}

double TrendRegimeStrategy::targetAllocation(bool bull_regime, double hurst, double volatility_scalar) const {
    if (bull_regime) {
        return (hurst > params_.hurst_threshold ? 1.0 : 0.6) * volatility_scalar;
    }
    return hurst > params_.strong_trend_hurst ? 0.3 * volatility_scalar : 0.0;
}

Decision TrendRegimeStrategy::decide(core::Timestamp today,
                                     const PriceHistoryMap& history,
                                     const core::AccountState& account) {
    Decision decision;
    auto it = history.find(asset_);
    if (it == history.end() || it->second.empty() || it->second.back().date != today) {
        return decision; // No session today
    }
    const auto& bars = it->second;
    const double price = bars.back().close;
    if (!std::isfinite(price) || price <= 0.0) {
        return decision;
    }

    auto logger = core::logging::getLogger();
    const double shares = account.holdingOf(asset_);
    const double sellable = account.sellableOf(asset_);
    const double total_equity = account.cash_available + shares * price;
    if (total_equity <= 0.0) {
        return decision;
    }

    // --- Risk management ---
    if (cooldown_remaining_ > 0) {
        --cooldown_remaining_;
        if (sellable > 0.0) {
            decision.orders.push_back({asset_, core::TradeAction::Sell, sellable});
            ++decisions_;
        }
        return decision;
    }

    if (sellable > 0.0) {
        max_price_ = std::max(max_price_, price);
        if (price < max_price_ * (1.0 - params_.stop_loss_pct)) {
            logger->info("{}: trailing stop hit on {} at {:.2f} (peak {:.2f})", config_.name,
                         core::utils::dateToString(today), price, max_price_);
            decision.orders.push_back({asset_, core::TradeAction::Sell, sellable});
            max_price_ = 0.0;
            cooldown_remaining_ = params_.cooldown_ticks;
            ++decisions_;
            return decision;
        }
    }

    // --- Signals ---
    std::vector<double> closes = indicators::closePrices(bars);
    size_t required = static_cast<size_t>(std::max(params_.hurst_window, params_.regime_period)) + 10;
    if (closes.size() < required) {
        return decision;
    }

    auto volatility = indicators::realizedVolatility(closes, params_.volatility_window);
    if (!volatility) {
        return decision;
    }
    double realized = *volatility > 0.0 ? *volatility : 0.01;
    double volatility_scalar = std::min(params_.target_volatility / realized, 1.0);

    regime_ma_.calculate(bars);
    auto regime_level = regime_ma_.latest();
    if (!regime_level) {
        return decision;
    }
    bool bull_regime = price > *regime_level;

    std::vector<double> window(closes.end() - params_.hurst_window, closes.end());
    double hurst = indicators::hurstExponent(window);

    double target_pct = targetAllocation(bull_regime, hurst, volatility_scalar);
    if (target_pct == 0.0) {
        max_price_ = 0.0;
    }
    logger->debug("{} {}: price {:.2f}, MA {:.2f}, H {:.3f}, vol {:.3f}, target {:.2f}",
                  config_.name, core::utils::dateToString(today), price, *regime_level, hurst, realized, target_pct);

    // --- Rebalance ---
    double target_value = total_equity * target_pct;
    double diff_value = target_value - shares * price;
    bool drifted = std::abs(diff_value) > total_equity * params_.rebalance_threshold;
    bool entering = shares == 0.0 && target_pct > 0.0;
    bool exiting = target_pct == 0.0 && shares > 0.0;
    if (!drifted && !entering && !exiting) {
        return decision;
    }

    if (diff_value > 0.0) {
        double quantity = floorToLot(diff_value / price);
        if (quantity > 0.0) {
            decision.orders.push_back({asset_, core::TradeAction::Buy, quantity});
            if (shares == 0.0) max_price_ = price;
            ++decisions_;
        }
    } else if (diff_value < 0.0) {
        double quantity = std::min(floorToLot(-diff_value / price), sellable);
        if (exiting) {
            quantity = sellable; // Flat target, odd lots included
        }
        if (quantity > 0.0) {
            decision.orders.push_back({asset_, core::TradeAction::Sell, quantity});
            ++decisions_;
        }
    }
    return decision;
}

} // namespace strategy_engine
