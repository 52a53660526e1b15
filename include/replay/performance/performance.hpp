// performance.hpp
// Post-run performance statistics for the Market Replay Engine
// Period returns, normalized equity curve, drawdowns, Sharpe ratio and CSV export

#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <numeric>
#include <string>
#include <vector>
#include "../interfaces/portfolio.hpp"
#include "../core/exceptions.hpp"
#include "../core/time_utils.hpp"

namespace replay {

// One row of the finalized equity curve
struct EquityRecord {
    std::chrono::nanoseconds timestamp{0};
    double total = 0.0;         // Portfolio value
    double returns = 0.0;       // Percentage change from the previous row
    double equity_curve = 1.0;  // Cumulative return multiple, 1.0 at the first row
    double drawdown = 0.0;      // (peak - curve) / peak
};

struct SummaryStats {
    double total_return = 0.0;  // equity_curve[last] - 1
    double sharpe_ratio = 0.0;
    double max_drawdown = 0.0;
    size_t max_drawdown_duration = 0;  // Periods spent below the running peak
    double final_equity = 0.0;
    size_t periods = 0;
};

struct DrawdownSeries {
    std::vector<double> drawdown;
    double max_drawdown = 0.0;
    size_t max_duration = 0;
};

// ============================================================================
// Performance calculations
// ============================================================================

class PerformanceAnalyzer {
public:
    static constexpr double DEFAULT_PERIODS_PER_YEAR = 252.0;

    // First element is 0; a zero previous value yields a 0 return
    static std::vector<double> periodReturns(const std::vector<double>& totals) {
        std::vector<double> returns(totals.size(), 0.0);
        for (size_t i = 1; i < totals.size(); ++i) {
            if (totals[i - 1] != 0.0) {
                returns[i] = totals[i] / totals[i - 1] - 1.0;
            }
        }
        return returns;
    }

    static std::vector<double> cumulativeCurve(const std::vector<double>& returns) {
        std::vector<double> curve;
        curve.reserve(returns.size());
        double level = 1.0;
        for (double r : returns) {
            level *= (1.0 + r);
            curve.push_back(level);
        }
        return curve;
    }

    static DrawdownSeries drawdowns(const std::vector<double>& curve) {
        DrawdownSeries result;
        result.drawdown.reserve(curve.size());

        double high_water_mark = 0.0;
        size_t duration = 0;
        for (double value : curve) {
            high_water_mark = std::max(high_water_mark, value);
            double dd = high_water_mark > 0.0 ? (high_water_mark - value) / high_water_mark : 0.0;
            result.drawdown.push_back(dd);

            duration = (dd > 0.0) ? duration + 1 : 0;
            result.max_drawdown = std::max(result.max_drawdown, dd);
            result.max_duration = std::max(result.max_duration, duration);
        }
        return result;
    }

    // sqrt(periods) * mean / std over the returns after the first row (sample std).
    // Zero when there is no dispersion.
    static double sharpeRatio(const std::vector<double>& returns,
                              double periods = DEFAULT_PERIODS_PER_YEAR) {
        if (returns.size() < 3) return 0.0;

        auto first = returns.begin() + 1;
        double n = static_cast<double>(returns.size() - 1);
        double mean = std::accumulate(first, returns.end(), 0.0) / n;

        double sq_sum = 0.0;
        for (auto it = first; it != returns.end(); ++it) {
            sq_sum += (*it - mean) * (*it - mean);
        }
        double std_dev = std::sqrt(sq_sum / (n - 1.0));
        if (std_dev < 1e-12) return 0.0;

        return std::sqrt(periods) * mean / std_dev;
    }

    static std::vector<EquityRecord> buildRecords(const std::vector<HoldingsSnapshot>& snapshots) {
        std::vector<double> totals;
        totals.reserve(snapshots.size());
        for (const auto& s : snapshots) {
            totals.push_back(s.total);
        }

        auto returns = periodReturns(totals);
        auto curve = cumulativeCurve(returns);
        auto dd = drawdowns(curve);

        std::vector<EquityRecord> records(snapshots.size());
        for (size_t i = 0; i < snapshots.size(); ++i) {
            records[i].timestamp = snapshots[i].timestamp;
            records[i].total = totals[i];
            records[i].returns = returns[i];
            records[i].equity_curve = curve[i];
            records[i].drawdown = dd.drawdown[i];
        }
        return records;
    }

    static SummaryStats summarize(const std::vector<EquityRecord>& records,
                                  double periods = DEFAULT_PERIODS_PER_YEAR) {
        SummaryStats stats;
        stats.periods = records.size();
        if (records.empty()) return stats;

        std::vector<double> returns;
        std::vector<double> curve;
        returns.reserve(records.size());
        curve.reserve(records.size());
        for (const auto& r : records) {
            returns.push_back(r.returns);
            curve.push_back(r.equity_curve);
        }

        auto dd = drawdowns(curve);
        stats.total_return = curve.back() - 1.0;
        stats.sharpe_ratio = sharpeRatio(returns, periods);
        stats.max_drawdown = dd.max_drawdown;
        stats.max_drawdown_duration = dd.max_duration;
        stats.final_equity = records.back().total;
        return stats;
    }
};

// Writes datetime,equity_curve,returns,drawdown; one line per record
inline void writeEquityCurveCsv(const std::string& path,
                                const std::vector<EquityRecord>& records,
                                const std::string& date_format = "%Y-%m-%d") {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw ConfigurationException("Cannot open equity curve output: " + path);
    }

    out << "datetime,equity_curve,returns,drawdown\n";
    out << std::setprecision(10);
    for (const auto& r : records) {
        out << formatTimestamp(r.timestamp, date_format) << ','
            << r.equity_curve << ',' << r.returns << ',' << r.drawdown << '\n';
    }
    if (!out) {
        throw BacktestException("Failed writing equity curve to " + path);
    }
}

} // namespace replay
