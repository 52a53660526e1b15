// moving_average_cross_strategy.hpp
// Moving Average Crossover Strategy for the Market Replay Engine
// Long when the short SMA is above the long SMA, flat when it falls back below

#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>
#include "../interfaces/data_handler.hpp"
#include "../interfaces/strategy.hpp"
#include "../core/bar.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "ols_statistics.hpp"

namespace replay {

// ============================================================================
// Simple Moving Average Crossover Strategy
// ============================================================================

class MovingAverageCrossStrategy : public IStrategy {
public:
    struct MACrossConfig {
        size_t short_window;
        size_t long_window;
        std::string price_field;
        bool verbose;

        MACrossConfig()
            : short_window(100)
            , long_window(400)
            , price_field("adj_close")
            , verbose(false) {}

        static MACrossConfig getDefault() {
            return MACrossConfig();
        }
    };

    struct StrategyStats {
        uint64_t total_signals;
        uint64_t long_signals;
        uint64_t exit_signals;
        size_t symbols_tracked;
    };

private:
    const IDataHandler& bars_;
    MACrossConfig config_;
    BarField price_field_;
    std::string strategy_name_;

    // true while the strategy holds the symbol
    std::unordered_map<std::string, bool> bought_;

    uint64_t signals_generated_ = 0;
    uint64_t long_signals_ = 0;
    uint64_t exit_signals_ = 0;

    void resetBought() {
        bought_.clear();
        for (const auto& symbol : bars_.getSymbols()) {
            bought_[symbol] = false;
        }
    }

public:
    MovingAverageCrossStrategy(const IDataHandler& bars,
                               const MACrossConfig& config = MACrossConfig::getDefault(),
                               const std::string& name = "MACross")
        : bars_(bars), config_(config), price_field_(parseBarField(config.price_field)),
          strategy_name_(name) {
        if (config_.short_window == 0 || config_.long_window == 0) {
            throw ConfigurationException("Moving average windows must be positive");
        }
        if (config_.short_window > config_.long_window) {
            throw ConfigurationException("Short window must not exceed long window");
        }
        resetBought();
    }

    // IStrategy interface implementation
    void calculateSignals(const MarketEvent& event) override {
        for (const auto& symbol : bars_.getSymbols()) {
            auto values = bars_.getLatestBarsValues(symbol, price_field_, config_.long_window);
            if (values.size() < config_.long_window) {
                continue;  // Still warming up
            }

            double short_sma = trailingMean(values, config_.short_window);
            double long_sma = trailingMean(values, config_.long_window);
            auto bar_date = bars_.getLatestBarDatetime(symbol);
            auto timestamp = bar_date ? *bar_date : event.timestamp;

            bool& bought = bought_[symbol];
            if (short_sma > long_sma && !bought) {
                if (config_.verbose) {
                    std::cout << "[MACross] LONG " << symbol << " short=" << short_sma
                              << " long=" << long_sma << std::endl;
                }
                emitSignal(SignalEvent(strategy_name_, symbol, timestamp,
                                       SignalEvent::Direction::LONG, 1.0));
                bought = true;
                signals_generated_++;
                long_signals_++;
            } else if (short_sma < long_sma && bought) {
                if (config_.verbose) {
                    std::cout << "[MACross] EXIT " << symbol << " short=" << short_sma
                              << " long=" << long_sma << std::endl;
                }
                emitSignal(SignalEvent(strategy_name_, symbol, timestamp,
                                       SignalEvent::Direction::EXIT, 1.0));
                bought = false;
                signals_generated_++;
                exit_signals_++;
            }
        }
    }

    void reset() override {
        resetBought();
        signals_generated_ = 0;
        long_signals_ = 0;
        exit_signals_ = 0;
    }

    void initialize() override {
        reset();
    }

    std::string getName() const override {
        return strategy_name_;
    }

    bool isInvested(const std::string& symbol) const {
        auto it = bought_.find(symbol);
        if (it == bought_.end()) {
            throw SymbolLookupException(symbol);
        }
        return it->second;
    }

    StrategyStats getStats() const {
        return {signals_generated_, long_signals_, exit_signals_, bought_.size()};
    }

    const MACrossConfig& getConfig() const { return config_; }
};

} // namespace replay
