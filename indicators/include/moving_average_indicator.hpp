#pragma once

#include "indicators.hpp" // Base interface
#include <optional>
#include <string>

namespace indicators {

enum class MovingAverageType {
    Simple,
    Exponential
};

// "sma" / "ema", case-insensitive. Throws std::invalid_argument otherwise.
MovingAverageType movingAverageTypeFromString(const std::string& value);

// TA-Lib TA_MA over the bars' closes
class MovingAverageIndicator : public IIndicator {
public:
    MovingAverageIndicator(int period, MovingAverageType type);

    std::string getName() const override;
    int getLookback() const override;
    void calculate(const core::TimeSeries<core::PriceBar>& input) override;
    const core::TimeSeries<double>& getResult() const override;

    // Most recent value, nullopt until calculate() produced one
    std::optional<double> latest() const;

    MovingAverageType type() const { return type_; }

private:
    const int period_;
    const MovingAverageType type_;
    int lookback_;              // Leading bars TA-Lib consumes
    std::string name_;          // "SMA(60)", "EMA(60)"
    core::TimeSeries<double> results_;
};

} // namespace indicators
