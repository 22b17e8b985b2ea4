#pragma once

#include "datatypes.hpp" // Needs PriceBar, TimeSeries
#include <string>
#include <vector>

namespace indicators {

class IIndicator {
public:
    virtual ~IIndicator() = default;

    // Get the name of the indicator (e.g., "SMA(50)")
    virtual std::string getName() const = 0;

    // Number of leading input bars consumed before the first valid output
    virtual int getLookback() const = 0;

    // Calculate over the bars' close prices and store the result internally
    virtual void calculate(const core::TimeSeries<core::PriceBar>& input) = 0;

    // Results are aligned to the input shifted by getLookback()
    virtual const core::TimeSeries<double>& getResult() const = 0;
};

} // namespace indicators
