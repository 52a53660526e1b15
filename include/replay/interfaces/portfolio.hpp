// portfolio.hpp
// Portfolio Interface for the Market Replay Engine

#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>
#include "../core/event_queue.hpp"
#include "../core/event_types.hpp"

namespace replay {

// One mark-to-market row of the equity curve
struct HoldingsSnapshot {
    std::chrono::nanoseconds timestamp{0};
    double cash = 0.0;
    double commission = 0.0;  // Cumulative
    std::unordered_map<std::string, double> market_values;
    double total = 0.0;  // cash + sum of market_values
};

// ============================================================================
// Portfolio Interface
// ============================================================================

class IPortfolio {
public:
    virtual ~IPortfolio() = default;

    // Exactly once per MarketEvent
    virtual void updateTimeindex(const MarketEvent& event) = 0;
    virtual void updateSignal(const SignalEvent& event) = 0;
    virtual void updateFill(const FillEvent& event) = 0;

    // Execution refused the order; no fill will follow for it
    virtual void onOrderRejected(const OrderEvent& event) { (void)event; }

    virtual double getEquity() const = 0;
    virtual double getCash() const = 0;
    virtual std::unordered_map<std::string, long> getPositions() const = 0;
    virtual const std::vector<HoldingsSnapshot>& getEquityCurve() const = 0;

    virtual void initialize(double initial_capital) { (void)initial_capital; }
    virtual void shutdown() {}
    virtual void reset() {}

    void setEventQueue(EventQueue& queue) { event_queue_ = &queue; }

protected:
    EventQueue* event_queue_ = nullptr;

    void emitOrder(const OrderEvent& order) {
        if (event_queue_) {
            event_queue_->publish(order);
        }
    }
};

} // namespace replay
