// event_dispatcher.hpp
// Event Dispatcher for the Market Replay Engine
// Routes each event to its role by tag; a failing handler is logged and counted, never fatal

#pragma once

#include <cstdint>
#include <exception>
#include <iostream>
#include "../core/event_types.hpp"
#include "../interfaces/strategy.hpp"
#include "../interfaces/portfolio.hpp"
#include "../interfaces/execution_handler.hpp"

namespace replay {

// ============================================================================
// Event Visitor with Error Handling
// ============================================================================

class EventDispatcher {
public:
    struct DispatchCounts {
        uint64_t market_events = 0;
        uint64_t signals = 0;
        uint64_t orders = 0;
        uint64_t fills = 0;
        uint64_t errors = 0;
    };

private:
    IStrategy& strategy_;
    IPortfolio& portfolio_;
    IExecutionHandler& execution_;
    DispatchCounts counts_;

    void reportFailure(const char* event_type, const std::exception& ex) {
        counts_.errors++;
        std::cerr << "[Dispatcher] " << event_type << " handler failed: " << ex.what() << std::endl;
    }

    bool rejectInvalid(const Event& e, const char* event_type) {
        if (e.validate()) {
            return false;
        }
        counts_.errors++;
        std::cerr << "[Dispatcher] Dropped invalid " << event_type << " #" << e.sequence_id
                  << std::endl;
        return true;
    }

    // No fill will come for a refused order; the portfolio releases its exposure
    void notifyRejected(const OrderEvent& e) {
        try {
            portfolio_.onOrderRejected(e);
        } catch (const std::exception& ex) {
            reportFailure("OrderEvent(rejection)", ex);
        }
    }

public:
    EventDispatcher(IStrategy& strategy, IPortfolio& portfolio, IExecutionHandler& execution)
        : strategy_(strategy), portfolio_(portfolio), execution_(execution) {}

    void operator()(const MarketEvent& e) {
        counts_.market_events++;
        try {
            strategy_.calculateSignals(e);
        } catch (const std::exception& ex) {
            reportFailure("MarketEvent(strategy)", ex);
        }
        // Runs even if the strategy failed so every timestep still gets its row
        try {
            portfolio_.updateTimeindex(e);
        } catch (const std::exception& ex) {
            reportFailure("MarketEvent(portfolio)", ex);
        }
    }

    void operator()(const SignalEvent& e) {
        if (rejectInvalid(e, "SignalEvent")) return;
        counts_.signals++;
        try {
            portfolio_.updateSignal(e);
        } catch (const std::exception& ex) {
            reportFailure("SignalEvent", ex);
        }
    }

    void operator()(const OrderEvent& e) {
        if (rejectInvalid(e, "OrderEvent")) {
            notifyRejected(e);
            return;
        }
        counts_.orders++;
        try {
            execution_.executeOrder(e);
        } catch (const std::exception& ex) {
            reportFailure("OrderEvent", ex);
            notifyRejected(e);
        }
    }

    void operator()(const FillEvent& e) {
        if (rejectInvalid(e, "FillEvent")) return;
        counts_.fills++;
        try {
            portfolio_.updateFill(e);
        } catch (const std::exception& ex) {
            reportFailure("FillEvent", ex);
        }
    }

    const DispatchCounts& getCounts() const { return counts_; }
    uint64_t getErrorCount() const { return counts_.errors; }
};

} // namespace replay
