// simulated_execution_handler.hpp
// Simulated Execution Handler for the Market Replay Engine
// Fills every order immediately at its nominal price; no slippage, no latency

#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include "../interfaces/execution_handler.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "commission.hpp"

namespace replay {

// ============================================================================
// Simulated Execution Handler
// ============================================================================

class SimulatedExecutionHandler : public IExecutionHandler {
public:
    struct ExecutionConfig {
        CommissionModel commission;
        std::string exchange;
        bool verbose;

        ExecutionConfig()
            : commission(CommissionModel::fixed(0.0))
            , exchange("ARCA")
            , verbose(false) {}

        static ExecutionConfig getDefault() {
            return ExecutionConfig();
        }
    };

    struct ExecutionStats {
        uint64_t total_orders = 0;
        uint64_t filled_orders = 0;
        double total_commission = 0.0;
    };

private:
    ExecutionConfig config_;
    ExecutionStats stats_;

public:
    explicit SimulatedExecutionHandler(const ExecutionConfig& config = ExecutionConfig::getDefault())
        : config_(config) {}

    void executeOrder(const OrderEvent& event) override {
        stats_.total_orders++;

        if (event.quantity <= 0) {
            throw ExecutionException("Order " + event.order_id + " has non-positive quantity");
        }
        if (event.price <= 0) {
            throw ExecutionException("Order " + event.order_id + " for " + event.symbol +
                                     " has no nominal price");
        }

        FillEvent fill;
        fill.timestamp = event.timestamp;
        fill.symbol = event.symbol;
        fill.exchange = config_.exchange;
        fill.quantity = event.quantity;
        fill.direction = event.direction;
        fill.fill_cost = event.price;
        fill.commission = config_.commission.calculate(event.quantity, event.price);
        fill.order_id = event.order_id;

        stats_.filled_orders++;
        stats_.total_commission += fill.commission;

        if (config_.verbose) {
            std::cout << "[SimExec] Filled " << fill.order_id << " " << directionName(fill.direction)
                      << " " << fill.quantity << " " << fill.symbol << " @ " << fill.fill_cost
                      << " commission=" << fill.commission << std::endl;
        }
        emitFill(fill);
    }

    void initialize() override {
        stats_ = ExecutionStats();
    }

    const ExecutionStats& getStats() const { return stats_; }
};

} // namespace replay
