// execution_handler.hpp
// Execution Handler Interface for the Market Replay Engine

#pragma once

#include "../core/event_queue.hpp"
#include "../core/event_types.hpp"

namespace replay {

// ============================================================================
// Execution Handler Interface
// ============================================================================

class IExecutionHandler {
public:
    virtual ~IExecutionHandler() = default;

    // One FillEvent per accepted order, now or after the venue confirms it
    virtual void executeOrder(const OrderEvent& event) = 0;

    // Called by the orchestrator on its own thread before every dequeue.
    // Handlers fed by asynchronous callbacks publish buffered fills here.
    virtual void processPendingEvents() {}

    virtual void initialize() {}
    virtual void shutdown() {}

    void setEventQueue(EventQueue& queue) { event_queue_ = &queue; }

protected:
    EventQueue* event_queue_ = nullptr;

    void emitFill(const FillEvent& fill) {
        if (event_queue_) {
            event_queue_->publish(fill);
        }
    }
};

} // namespace replay
