// ols_statistics.hpp
// Window statistics used by the replay strategies
// Means, dispersion, hedge ratio regression and residual z-score over fixed windows

#pragma once

#include <algorithm>
#include <cmath>
#include <numeric>
#include <optional>
#include <vector>

namespace replay {

inline double windowMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

// Mean of the last `period` values (all of them if fewer are available)
inline double trailingMean(const std::vector<double>& values, size_t period) {
    if (values.empty() || period == 0) return 0.0;
    size_t count = std::min(period, values.size());
    double sum = 0.0;
    for (size_t i = values.size() - count; i < values.size(); ++i) {
        sum += values[i];
    }
    return sum / count;
}

// Population standard deviation (divides by n)
inline double windowStdDev(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double mean = windowMean(values);
    double ss = 0.0;
    for (double v : values) {
        double diff = v - mean;
        ss += diff * diff;
    }
    return std::sqrt(ss / values.size());
}

// Least-squares slope of y on x without an intercept: sum(xy) / sum(xx)
inline std::optional<double> hedgeRatio(const std::vector<double>& y,
                                        const std::vector<double>& x) {
    if (y.size() != x.size() || y.empty()) {
        return std::nullopt;
    }
    double sxy = 0.0;
    double sxx = 0.0;
    for (size_t i = 0; i < x.size(); ++i) {
        sxy += x[i] * y[i];
        sxx += x[i] * x[i];
    }
    if (sxx <= 0.0) {
        return std::nullopt;
    }
    return sxy / sxx;
}

inline std::vector<double> residualSpread(const std::vector<double>& y,
                                          const std::vector<double>& x,
                                          double hedge_ratio) {
    std::vector<double> spread;
    spread.reserve(y.size());
    for (size_t i = 0; i < y.size() && i < x.size(); ++i) {
        spread.push_back(y[i] - hedge_ratio * x[i]);
    }
    return spread;
}

// Z-score of the last value against the window; empty when the window has no dispersion
inline std::optional<double> lastZScore(const std::vector<double>& values) {
    if (values.size() < 2) return std::nullopt;
    double std_dev = windowStdDev(values);
    if (!(std_dev > 1e-12)) return std::nullopt;
    return (values.back() - windowMean(values)) / std_dev;
}

} // namespace replay
