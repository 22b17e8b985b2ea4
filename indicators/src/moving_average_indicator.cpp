#include "moving_average_indicator.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include "ta_libc.h"            // TA-Lib C API
#include <vector>
#include <stdexcept>
#include <spdlog/fmt/fmt.h>

namespace indicators {

namespace {

    TA_MAType toTaLib(MovingAverageType type) {
        return type == MovingAverageType::Exponential ? TA_MAType_EMA : TA_MAType_SMA;
    }

} // namespace

MovingAverageType movingAverageTypeFromString(const std::string& value) {
    std::string lower = core::utils::toLower(value);
    if (lower == "sma" || lower == "simple") return MovingAverageType::Simple;
    if (lower == "ema" || lower == "exponential") return MovingAverageType::Exponential;
    throw std::invalid_argument("Unknown moving average type: " + value);
}

MovingAverageIndicator::MovingAverageIndicator(int period, MovingAverageType type)
    : period_(period), type_(type), lookback_(0)
{
    if (period_ <= 0) {
        throw std::invalid_argument("Moving average period must be positive.");
    }

    lookback_ = TA_MA_Lookback(period_, toTaLib(type_));
    if (lookback_ < 0) {
        throw core::IndicatorCalculationException(fmt::format("TA_MA_Lookback returned an unexpected value: {}", lookback_));
    }

    name_ = fmt::format("{}({})", type_ == MovingAverageType::Exponential ? "EMA" : "SMA", period_);
    core::logging::getLogger()->debug("MovingAverageIndicator created: {}, lookback {}", name_, lookback_);
}

std::string MovingAverageIndicator::getName() const {
    return name_;
}

int MovingAverageIndicator::getLookback() const {
    return lookback_;
}

const core::TimeSeries<double>& MovingAverageIndicator::getResult() const {
    return results_;
}

std::optional<double> MovingAverageIndicator::latest() const {
    if (results_.empty()) {
        return std::nullopt;
    }
    return results_.back();
}

void MovingAverageIndicator::calculate(const core::TimeSeries<core::PriceBar>& input) {
    results_.clear();
    if (input.size() <= static_cast<size_t>(lookback_)) {
        core::logging::getLogger()->trace("{}: {} bars do not cover lookback {}.", name_, input.size(), lookback_);
        return;
    }

    std::vector<double> closes;
    closes.reserve(input.size());
    for (const auto& bar : input) {
        closes.push_back(bar.close);
    }

    results_.resize(closes.size() - static_cast<size_t>(lookback_));
    int out_begin = 0;
    int out_count = 0;
    TA_RetCode rc = TA_MA(0, static_cast<int>(closes.size()) - 1, closes.data(),
                          period_, toTaLib(type_), &out_begin, &out_count, results_.data());
    if (rc != TA_SUCCESS) {
        results_.clear();
        throw core::IndicatorCalculationException(
            fmt::format("TA_MA failed for {} with code {}", name_, static_cast<int>(rc)));
    }
    if (out_begin != lookback_) {
        core::logging::getLogger()->warn("{}: TA_MA began at {} instead of lookback {}.", name_, out_begin, lookback_);
    }
    results_.resize(static_cast<size_t>(out_count));
}

} // namespace indicators
