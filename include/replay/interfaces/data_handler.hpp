// data_handler.hpp
// Bar Source Interface for the Market Replay Engine
// Historic and live sources expose the same lookups so strategies run unmodified on either

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "../core/bar.hpp"
#include "../core/event_queue.hpp"

namespace replay {

// ============================================================================
// Data Handler Interface
// ============================================================================

// Lookups on an untracked symbol throw SymbolLookupException. A tracked symbol
// with no bars yet yields an empty optional or an empty vector.
class IDataHandler {
public:
    virtual ~IDataHandler() = default;

    virtual std::optional<Bar> getLatestBar(const std::string& symbol) const = 0;

    // Most recent min(n, available) bars, oldest first
    virtual std::vector<Bar> getLatestBars(const std::string& symbol, size_t n) const = 0;

    virtual std::optional<std::chrono::nanoseconds>
    getLatestBarDatetime(const std::string& symbol) const = 0;

    virtual std::optional<double> getLatestBarValue(const std::string& symbol,
                                                    BarField field) const = 0;

    // Most recent min(n, available) values of one field, oldest first
    virtual std::vector<double> getLatestBarsValues(const std::string& symbol,
                                                    BarField field, size_t n) const = 0;

    // Advances every symbol by one synchronized step and publishes one
    // MarketEvent. Returns false, publishing nothing, once any series is
    // exhausted; exhaustion is permanent.
    virtual bool updateBars() = 0;

    virtual bool isExhausted() const = 0;
    virtual const std::vector<std::string>& getSymbols() const = 0;

    virtual void initialize() {}
    virtual void shutdown() {}

    void setEventQueue(EventQueue& queue) { event_queue_ = &queue; }

protected:
    EventQueue* event_queue_ = nullptr;

    void emitMarket(const MarketEvent& event) {
        if (event_queue_) {
            event_queue_->publish(event);
        }
    }
};

} // namespace replay
