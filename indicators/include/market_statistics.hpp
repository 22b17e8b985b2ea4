#pragma once

#include "datatypes.hpp"
#include <optional>
#include <vector>

namespace indicators {

    std::vector<double> closePrices(const core::TimeSeries<core::PriceBar>& bars);

    // Close-to-close simple returns, one shorter than the input
    std::vector<double> simpleReturns(const std::vector<double>& prices);

    // Hurst exponent by rescaled-range analysis of the log returns of `prices`.
    // Chunk sizes are ~20 log-spaced values in [min_chunk, N]; H is the slope of
    // log(mean R/S) against log(chunk size). Returns 0.5 (random walk) when there
    // are fewer than 2 * min_chunk prices or fewer than 3 usable chunk sizes.
    double hurstExponent(const std::vector<double>& prices, int min_chunk = 8);

    // Sample stddev of the last `window` simple returns, annualized by sqrt(252).
    // nullopt when fewer than `window` returns exist.
    std::optional<double> realizedVolatility(const std::vector<double>& prices, int window = 20);

} // namespace indicators
