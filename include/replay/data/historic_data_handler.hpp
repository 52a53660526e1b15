// historic_data_handler.hpp
// Historic Bar Source for the Market Replay Engine
// Aligns every symbol onto the union of all native timestamps and replays one step at a time

#pragma once

#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../interfaces/data_handler.hpp"
#include "../core/bar.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"

namespace replay {

// ============================================================================
// Historic Data Handler (in-memory native series)
// ============================================================================

class HistoricDataHandler : public IDataHandler {
public:
    using SeriesMap = std::unordered_map<std::string, std::vector<Bar>>;

private:
    std::vector<std::string> symbols_;

    // Union of every symbol's native timestamps, ascending
    std::vector<std::chrono::nanoseconds> time_index_;

    // Per-symbol stream aligned on time_index_. An empty slot is a timestamp
    // before the symbol's first native observation.
    std::unordered_map<std::string, std::vector<std::optional<Bar>>> reindexed_;

    // Bars already replayed; append-only
    std::unordered_map<std::string, std::vector<Bar>> latest_symbol_data_;

    size_t current_step_ = 0;
    bool exhausted_ = false;

    const std::vector<Bar>& observedBars(const std::string& symbol) const {
        auto it = latest_symbol_data_.find(symbol);
        if (it == latest_symbol_data_.end()) {
            throw SymbolLookupException(symbol);
        }
        return it->second;
    }

    static void sortAndCheck(const std::string& symbol, std::vector<Bar>& bars) {
        std::sort(bars.begin(), bars.end(),
                  [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });
        for (size_t i = 1; i < bars.size(); ++i) {
            if (bars[i].timestamp == bars[i - 1].timestamp) {
                throw DataException("Duplicate timestamp in series for " + symbol);
            }
        }
    }

    void buildTimeIndex(const SeriesMap& series) {
        for (const auto& symbol : symbols_) {
            for (const auto& bar : series.at(symbol)) {
                time_index_.push_back(bar.timestamp);
            }
        }
        std::sort(time_index_.begin(), time_index_.end());
        time_index_.erase(std::unique(time_index_.begin(), time_index_.end()),
                          time_index_.end());
    }

    // Forward-fill: each union timestamp takes the last native bar at or before it
    void reindex(const std::string& symbol, const std::vector<Bar>& native) {
        auto& stream = reindexed_[symbol];
        stream.reserve(time_index_.size());

        size_t next = 0;
        std::optional<Bar> last;
        for (auto ts : time_index_) {
            while (next < native.size() && native[next].timestamp <= ts) {
                last = native[next];
                ++next;
            }
            if (last) {
                Bar filled = *last;
                filled.timestamp = ts;
                stream.push_back(filled);
            } else {
                stream.push_back(std::nullopt);
            }
        }
    }

public:
    // Symbols are replayed in the given order; every symbol needs a series
    HistoricDataHandler(std::vector<std::string> symbols, SeriesMap series)
        : symbols_(std::move(symbols)) {
        if (symbols_.empty()) {
            throw ConfigurationException("No symbols requested");
        }
        for (const auto& symbol : symbols_) {
            auto it = series.find(symbol);
            if (it == series.end()) {
                throw ConfigurationException("No bar series supplied for " + symbol);
            }
            if (latest_symbol_data_.count(symbol)) {
                throw ConfigurationException("Symbol requested twice: " + symbol);
            }
            sortAndCheck(symbol, it->second);
            latest_symbol_data_[symbol] = {};
        }

        buildTimeIndex(series);
        for (const auto& symbol : symbols_) {
            reindex(symbol, series.at(symbol));
        }
        exhausted_ = time_index_.empty();
    }

    // IDataHandler interface implementation
    std::optional<Bar> getLatestBar(const std::string& symbol) const override {
        const auto& bars = observedBars(symbol);
        if (bars.empty()) {
            return std::nullopt;
        }
        return bars.back();
    }

    std::vector<Bar> getLatestBars(const std::string& symbol, size_t n) const override {
        const auto& bars = observedBars(symbol);
        size_t count = std::min(n, bars.size());
        return std::vector<Bar>(bars.end() - static_cast<std::ptrdiff_t>(count), bars.end());
    }

    std::optional<std::chrono::nanoseconds>
    getLatestBarDatetime(const std::string& symbol) const override {
        const auto& bars = observedBars(symbol);
        if (bars.empty()) {
            return std::nullopt;
        }
        return bars.back().timestamp;
    }

    std::optional<double> getLatestBarValue(const std::string& symbol,
                                            BarField field) const override {
        const auto& bars = observedBars(symbol);
        if (bars.empty()) {
            return std::nullopt;
        }
        return barFieldValue(bars.back(), field);
    }

    std::vector<double> getLatestBarsValues(const std::string& symbol,
                                            BarField field, size_t n) const override {
        const auto& bars = observedBars(symbol);
        size_t count = std::min(n, bars.size());
        std::vector<double> values;
        values.reserve(count);
        for (size_t i = bars.size() - count; i < bars.size(); ++i) {
            values.push_back(barFieldValue(bars[i], field));
        }
        return values;
    }

    bool updateBars() override {
        if (exhausted_) {
            return false;
        }

        // No partial steps: check every stream before appending anything
        for (const auto& symbol : symbols_) {
            if (current_step_ >= reindexed_.at(symbol).size()) {
                exhausted_ = true;
                return false;
            }
        }

        for (const auto& symbol : symbols_) {
            const auto& slot = reindexed_.at(symbol)[current_step_];
            if (slot) {
                latest_symbol_data_[symbol].push_back(*slot);
            }
        }

        emitMarket(MarketEvent(time_index_[current_step_]));
        ++current_step_;
        return true;
    }

    bool isExhausted() const override { return exhausted_; }

    const std::vector<std::string>& getSymbols() const override { return symbols_; }

    // Additional utility methods
    const std::vector<std::chrono::nanoseconds>& getTimeIndex() const { return time_index_; }

    const std::vector<std::optional<Bar>>& getReindexedSeries(const std::string& symbol) const {
        auto it = reindexed_.find(symbol);
        if (it == reindexed_.end()) {
            throw SymbolLookupException(symbol);
        }
        return it->second;
    }

    size_t getBarsProcessed() const { return current_step_; }

    size_t getRemainingSteps() const { return time_index_.size() - current_step_; }
};

} // namespace replay
