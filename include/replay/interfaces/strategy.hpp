// strategy.hpp
// Strategy Interface for the Market Replay Engine

#pragma once

#include <string>
#include "../core/event_queue.hpp"
#include "../core/event_types.hpp"

namespace replay {

// ============================================================================
// Strategy Interface
// ============================================================================

class IStrategy {
public:
    virtual ~IStrategy() = default;

    // Invoked once per MarketEvent; emits zero or more SignalEvents
    virtual void calculateSignals(const MarketEvent& event) = 0;

    virtual void reset() = 0;
    virtual void initialize() {}
    virtual void shutdown() {}
    virtual std::string getName() const { return "UnnamedStrategy"; }

    void setEventQueue(EventQueue& queue) { event_queue_ = &queue; }

protected:
    EventQueue* event_queue_ = nullptr;

    // Invalid events are rejected and counted by the dispatcher
    void emitSignal(const SignalEvent& signal) {
        if (event_queue_) {
            event_queue_->publish(signal);
        }
    }
};

} // namespace replay
