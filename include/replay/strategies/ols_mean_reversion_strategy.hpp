// ols_mean_reversion_strategy.hpp
// Pairs Mean-Reversion Strategy for the Market Replay Engine
// Rolling OLS hedge ratio between two legs; trades the z-score of the residual spread

#pragma once

#include <cmath>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../interfaces/data_handler.hpp"
#include "../interfaces/strategy.hpp"
#include "../core/bar.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "ols_statistics.hpp"

namespace replay {

// ============================================================================
// OLS Pairs Mean-Reversion Strategy
// ============================================================================

class OLSMeanReversionStrategy : public IStrategy {
public:
    struct OLSMeanReversionConfig {
        size_t ols_window;
        double zscore_low;   // Exit band
        double zscore_high;  // Entry threshold
        std::string price_field;
        bool verbose;

        OLSMeanReversionConfig()
            : ols_window(100)
            , zscore_low(0.5)
            , zscore_high(3.0)
            , price_field("close")
            , verbose(false) {}

        static OLSMeanReversionConfig getDefault() {
            return OLSMeanReversionConfig();
        }
    };

    struct StrategyStats {
        uint64_t total_signals;
        uint64_t long_spread_entries;
        uint64_t short_spread_entries;
        uint64_t exits;
        uint64_t skipped_windows;  // Enough bars but no dispersion or regression
    };

private:
    const IDataHandler& bars_;
    OLSMeanReversionConfig config_;
    BarField price_field_;
    std::string strategy_name_;

    std::string y_symbol_;
    std::string x_symbol_;

    bool long_market_ = false;   // long y, short x
    bool short_market_ = false;  // short y, long x
    double hedge_ratio_ = 0.0;
    std::optional<double> last_zscore_;

    uint64_t signals_generated_ = 0;
    uint64_t long_spread_entries_ = 0;
    uint64_t short_spread_entries_ = 0;
    uint64_t exits_ = 0;
    uint64_t skipped_windows_ = 0;

    void emitPair(std::chrono::nanoseconds timestamp,
                  SignalEvent::Direction y_direction, double y_strength,
                  SignalEvent::Direction x_direction, double x_strength) {
        emitSignal(SignalEvent(strategy_name_, y_symbol_, timestamp, y_direction, y_strength));
        emitSignal(SignalEvent(strategy_name_, x_symbol_, timestamp, x_direction, x_strength));
        signals_generated_ += 2;

        if (config_.verbose) {
            std::cout << "[OLSMR] " << y_symbol_ << "=" << directionName(y_direction)
                      << " " << x_symbol_ << "=" << directionName(x_direction)
                      << " z=" << last_zscore_.value_or(0.0)
                      << " hedge_ratio=" << hedge_ratio_ << std::endl;
        }
    }

    // The four transitions are mutually exclusive; at most one fires per bar
    void calculateXYSignals(double zscore, std::chrono::nanoseconds timestamp) {
        double hr = std::abs(hedge_ratio_);

        if (zscore <= -config_.zscore_high && !long_market_) {
            long_market_ = true;
            long_spread_entries_++;
            emitPair(timestamp, SignalEvent::Direction::LONG, 1.0,
                     SignalEvent::Direction::SHORT, hr);
        } else if (std::abs(zscore) <= config_.zscore_low && long_market_) {
            long_market_ = false;
            exits_++;
            emitPair(timestamp, SignalEvent::Direction::EXIT, 1.0,
                     SignalEvent::Direction::EXIT, 1.0);
        } else if (zscore >= config_.zscore_high && !short_market_) {
            short_market_ = true;
            short_spread_entries_++;
            emitPair(timestamp, SignalEvent::Direction::SHORT, 1.0,
                     SignalEvent::Direction::LONG, hr);
        } else if (std::abs(zscore) <= config_.zscore_low && short_market_) {
            short_market_ = false;
            exits_++;
            emitPair(timestamp, SignalEvent::Direction::EXIT, 1.0,
                     SignalEvent::Direction::EXIT, 1.0);
        }
    }

public:
    // y is regressed on x; y carries unit strength, x is scaled by |hedge ratio|
    OLSMeanReversionStrategy(const IDataHandler& bars,
                             std::string y_symbol, std::string x_symbol,
                             const OLSMeanReversionConfig& config = OLSMeanReversionConfig::getDefault(),
                             const std::string& name = "OLSMeanReversion")
        : bars_(bars), config_(config), price_field_(parseBarField(config.price_field)),
          strategy_name_(name), y_symbol_(std::move(y_symbol)), x_symbol_(std::move(x_symbol)) {
        if (config_.ols_window < 2) {
            throw ConfigurationException("OLS window must hold at least two observations");
        }
        if (config_.zscore_low < 0 || config_.zscore_high <= config_.zscore_low) {
            throw ConfigurationException("Z-score thresholds require 0 <= low < high");
        }
        if (y_symbol_ == x_symbol_) {
            throw ConfigurationException("Pair legs must be different symbols");
        }
        // Fail at construction if either leg is not tracked
        bars_.getLatestBarsValues(y_symbol_, price_field_, 0);
        bars_.getLatestBarsValues(x_symbol_, price_field_, 0);
    }

    // IStrategy interface implementation
    void calculateSignals(const MarketEvent& event) override {
        auto y = bars_.getLatestBarsValues(y_symbol_, price_field_, config_.ols_window);
        auto x = bars_.getLatestBarsValues(x_symbol_, price_field_, config_.ols_window);

        if (y.size() < config_.ols_window || x.size() < config_.ols_window) {
            return;  // Insufficient history
        }

        auto ratio = hedgeRatio(y, x);
        if (!ratio) {
            skipped_windows_++;
            return;
        }
        hedge_ratio_ = *ratio;

        last_zscore_ = lastZScore(residualSpread(y, x, hedge_ratio_));
        if (!last_zscore_) {
            skipped_windows_++;
            return;
        }

        auto bar_date = bars_.getLatestBarDatetime(y_symbol_);
        calculateXYSignals(*last_zscore_, bar_date ? *bar_date : event.timestamp);
    }

    void reset() override {
        long_market_ = false;
        short_market_ = false;
        hedge_ratio_ = 0.0;
        last_zscore_.reset();
        signals_generated_ = 0;
        long_spread_entries_ = 0;
        short_spread_entries_ = 0;
        exits_ = 0;
        skipped_windows_ = 0;
    }

    void initialize() override {
        reset();
    }

    std::string getName() const override {
        return strategy_name_;
    }

    bool isLongMarket() const { return long_market_; }
    bool isShortMarket() const { return short_market_; }
    double getHedgeRatio() const { return hedge_ratio_; }
    std::optional<double> getLastZScore() const { return last_zscore_; }
    const std::string& getYSymbol() const { return y_symbol_; }
    const std::string& getXSymbol() const { return x_symbol_; }

    StrategyStats getStats() const {
        return {signals_generated_, long_spread_entries_, short_spread_entries_,
                exits_, skipped_windows_};
    }
};

} // namespace replay
