#include "market_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>
#include <set>

namespace indicators {

namespace {

    constexpr int kChunkSizeSamples = 20;
    constexpr double kNeutralHurst = 0.5;

    double sampleStdDev(std::vector<double>::const_iterator begin, std::vector<double>::const_iterator end) {
        auto n = std::distance(begin, end);
        if (n < 2) return 0.0;
        double mean = std::accumulate(begin, end, 0.0) / static_cast<double>(n);
        double sq = 0.0;
        for (auto it = begin; it != end; ++it) {
            sq += (*it - mean) * (*it - mean);
        }
        return std::sqrt(sq / static_cast<double>(n - 1));
    }

    // Mean rescaled range over the non-overlapping chunks of size n. nullopt when
    // every chunk is flat.
    std::optional<double> meanRescaledRange(const std::vector<double>& x, size_t n) {
        size_t chunks = x.size() / n;
        double sum = 0.0;
        size_t used = 0;
        for (size_t c = 0; c < chunks; ++c) {
            auto begin = x.begin() + static_cast<std::ptrdiff_t>(c * n);
            auto end = begin + static_cast<std::ptrdiff_t>(n);
            double mean = std::accumulate(begin, end, 0.0) / static_cast<double>(n);

            double cumulative = 0.0;
            double z_max = 0.0, z_min = 0.0;
            bool first = true;
            for (auto it = begin; it != end; ++it) {
                cumulative += *it - mean;
                if (first || cumulative > z_max) z_max = cumulative;
                if (first || cumulative < z_min) z_min = cumulative;
                first = false;
            }
            double s = sampleStdDev(begin, end);
            if (s == 0.0) continue;
            sum += (z_max - z_min) / s;
            ++used;
        }
        if (used == 0) return std::nullopt;
        return sum / static_cast<double>(used);
    }

} // namespace

std::vector<double> closePrices(const core::TimeSeries<core::PriceBar>& bars) {
    std::vector<double> closes;
    closes.reserve(bars.size());
    for (const auto& bar : bars) {
        closes.push_back(bar.close);
    }
    return closes;
}

std::vector<double> simpleReturns(const std::vector<double>& prices) {
    std::vector<double> returns;
    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i - 1] == 0.0) continue;
        returns.push_back(prices[i] / prices[i - 1] - 1.0);
    }
    return returns;
}

double hurstExponent(const std::vector<double>& prices, int min_chunk) {
    if (min_chunk < 2) min_chunk = 2;
    if (prices.size() < static_cast<size_t>(min_chunk) * 2) {
        return kNeutralHurst;
    }

    std::vector<double> log_returns;
    log_returns.reserve(prices.size() - 1);
    for (size_t i = 1; i < prices.size(); ++i) {
        if (prices[i - 1] <= 0.0 || prices[i] <= 0.0) {
            return kNeutralHurst;
        }
        log_returns.push_back(std::log(prices[i] / prices[i - 1]));
    }
    const size_t n_total = log_returns.size();

    // Log-spaced chunk sizes between min_chunk and the full length
    std::set<size_t> chunk_sizes;
    double min_log = std::log10(static_cast<double>(min_chunk));
    double max_log = std::log10(static_cast<double>(n_total));
    for (int i = 0; i < kChunkSizeSamples; ++i) {
        double exponent = min_log + (max_log - min_log) * i / (kChunkSizeSamples - 1);
        auto size = static_cast<size_t>(std::pow(10.0, exponent) + 1e-9);
        if (size >= static_cast<size_t>(min_chunk) && size <= n_total) {
            chunk_sizes.insert(size);
        }
    }

    std::vector<double> log_n;
    std::vector<double> log_rs;
    for (size_t n : chunk_sizes) {
        auto rs = meanRescaledRange(log_returns, n);
        if (!rs || *rs <= 0.0) continue;
        log_n.push_back(std::log(static_cast<double>(n)));
        log_rs.push_back(std::log(*rs));
    }
    if (log_n.size() < 3) {
        return kNeutralHurst;
    }

    // Least squares slope of log(R/S) on log(n)
    double count = static_cast<double>(log_n.size());
    double mean_x = std::accumulate(log_n.begin(), log_n.end(), 0.0) / count;
    double mean_y = std::accumulate(log_rs.begin(), log_rs.end(), 0.0) / count;
    double sxy = 0.0, sxx = 0.0;
    for (size_t i = 0; i < log_n.size(); ++i) {
        sxy += (log_n[i] - mean_x) * (log_rs[i] - mean_y);
        sxx += (log_n[i] - mean_x) * (log_n[i] - mean_x);
    }
    return sxx > 0.0 ? sxy / sxx : kNeutralHurst;
}

std::optional<double> realizedVolatility(const std::vector<double>& prices, int window) {
    if (window < 2) return std::nullopt;
    std::vector<double> returns = simpleReturns(prices);
    if (returns.size() < static_cast<size_t>(window)) {
        return std::nullopt;
    }
    auto begin = returns.end() - window;
    return sampleStdDev(begin, returns.end()) * std::sqrt(252.0);
}

} // namespace indicators
