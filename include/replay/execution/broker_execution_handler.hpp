// broker_execution_handler.hpp
// Broker-Backed Execution Handler for the Market Replay Engine
// Two-phase execution: submit with a session order id, then correlate asynchronous status messages

#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "../interfaces/execution_handler.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "broker_session.hpp"
#include "commission.hpp"

namespace replay {

// ============================================================================
// Broker Execution Handler
// ============================================================================

class BrokerExecutionHandler : public IExecutionHandler {
public:
    struct BrokerExecutionConfig {
        std::string order_routing;
        std::string currency;
        std::string sec_type;
        long initial_order_id;
        CommissionModel fallback_commission;  // When the status carries none
        bool verbose;

        BrokerExecutionConfig()
            : order_routing("SMART")
            , currency("USD")
            , sec_type("STK")
            , initial_order_id(1)
            , fallback_commission(CommissionModel::interactiveBrokers())
            , verbose(false) {}

        static BrokerExecutionConfig getDefault() {
            return BrokerExecutionConfig();
        }
    };

    // Per-order metadata, recorded before the order leaves for the broker
    struct OrderRecord {
        std::string symbol;
        std::string exchange;
        OrderEvent::Direction direction = OrderEvent::Direction::BUY;
        std::chrono::nanoseconds timestamp{0};
        std::string client_order_id;
        bool filled = false;
    };

    struct BrokerStats {
        uint64_t orders_submitted = 0;
        uint64_t fills_received = 0;
        uint64_t duplicate_fills = 0;
        uint64_t unknown_fills = 0;
        uint64_t invalid_fills = 0;  // "Filled" without a usable quantity or price
        uint64_t errors = 0;
    };

private:
    std::unique_ptr<IBrokerSession> session_;
    BrokerExecutionConfig config_;

    // Guards everything below; written by the submit path and the message callback
    mutable std::mutex mutex_;
    long next_order_id_;
    std::unordered_map<long, OrderRecord> fill_table_;
    std::vector<FillEvent> pending_fills_;
    BrokerStats stats_;

    static bool parseAction(const std::string& action, OrderEvent::Direction& direction) {
        if (action == "BUY") { direction = OrderEvent::Direction::BUY; return true; }
        if (action == "SELL") { direction = OrderEvent::Direction::SELL; return true; }
        return false;
    }

    void handleOpenOrder(const BrokerMessage& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fill_table_.count(msg.order_id)) {
            return;
        }
        OrderRecord record;
        record.symbol = msg.contract.symbol;
        record.exchange = msg.contract.exchange;
        if (!parseAction(msg.action, record.direction)) {
            std::cerr << "[Broker] Open order " << msg.order_id
                      << " has unknown action '" << msg.action << "'" << std::endl;
            stats_.errors++;
            return;
        }
        fill_table_.emplace(msg.order_id, std::move(record));
    }

    void handleOrderStatus(const BrokerMessage& msg) {
        if (msg.status != "Filled") {
            if (config_.verbose) {
                std::cout << "[Broker] Order " << msg.order_id << " status " << msg.status
                          << std::endl;
            }
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = fill_table_.find(msg.order_id);
        if (it == fill_table_.end()) {
            std::cerr << "[Broker] Fill for unknown order id " << msg.order_id << std::endl;
            stats_.unknown_fills++;
            return;
        }
        OrderRecord& record = it->second;
        if (record.filled) {
            stats_.duplicate_fills++;
            return;
        }

        FillEvent fill;
        fill.timestamp = record.timestamp;
        fill.symbol = record.symbol;
        fill.exchange = record.exchange;
        fill.quantity = msg.filled;
        fill.direction = record.direction;
        fill.fill_cost = msg.avg_fill_price;
        fill.commission = msg.commission
                              ? *msg.commission
                              : config_.fallback_commission.calculate(msg.filled, msg.avg_fill_price);
        fill.order_id = record.client_order_id.empty() ? std::to_string(msg.order_id)
                                                       : record.client_order_id;

        // The order stays open for a later status with real numbers
        if (!fill.validate()) {
            std::cerr << "[Broker] Ignoring unusable fill for order " << msg.order_id
                      << ": quantity " << msg.filled << " @ " << msg.avg_fill_price << std::endl;
            stats_.invalid_fills++;
            return;
        }

        record.filled = true;
        pending_fills_.push_back(std::move(fill));
        stats_.fills_received++;
    }

    void handleError(const BrokerMessage& msg) {
        std::cerr << "[Broker] Error " << msg.error_code << " (order " << msg.order_id
                  << "): " << msg.error_text << std::endl;
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.errors++;
    }

public:
    explicit BrokerExecutionHandler(std::unique_ptr<IBrokerSession> session,
                                    const BrokerExecutionConfig& config = BrokerExecutionConfig::getDefault())
        : session_(std::move(session)), config_(config), next_order_id_(config.initial_order_id) {
        if (!session_) {
            throw ConfigurationException("Broker execution requires a session");
        }
        session_->setMessageHandler([this](const BrokerMessage& msg) { onMessage(msg); });
    }

    ~BrokerExecutionHandler() override {
        session_->setMessageHandler(nullptr);
    }

    BrokerExecutionHandler(const BrokerExecutionHandler&) = delete;
    BrokerExecutionHandler& operator=(const BrokerExecutionHandler&) = delete;

    // Callback entry point; safe from any thread
    void onMessage(const BrokerMessage& msg) {
        switch (msg.kind) {
            case BrokerMessage::Kind::OPEN_ORDER:
                handleOpenOrder(msg);
                break;
            case BrokerMessage::Kind::ORDER_STATUS:
                handleOrderStatus(msg);
                break;
            case BrokerMessage::Kind::ERROR:
                handleError(msg);
                break;
        }
    }

    void executeOrder(const OrderEvent& event) override {
        if (event.quantity <= 0) {
            throw ExecutionException("Order " + event.order_id + " has non-positive quantity");
        }

        ContractSpec contract;
        contract.symbol = event.symbol;
        contract.sec_type = config_.sec_type;
        contract.exchange = config_.order_routing;
        contract.primary_exchange = config_.order_routing;
        contract.currency = config_.currency;

        OrderSpec order;
        order.order_type = event.order_type == OrderEvent::Type::MARKET ? "MKT" : "LMT";
        order.action = directionName(event.direction);
        order.total_quantity = event.quantity;
        order.limit_price = event.order_type == OrderEvent::Type::LIMIT ? event.price : 0.0;

        long order_id;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            order_id = next_order_id_++;

            OrderRecord record;
            record.symbol = event.symbol;
            record.exchange = config_.order_routing;
            record.direction = event.direction;
            record.timestamp = event.timestamp;
            record.client_order_id = event.order_id;
            fill_table_[order_id] = std::move(record);
            stats_.orders_submitted++;
        }

        if (config_.verbose) {
            std::cout << "[Broker] Submitting " << order_id << " " << order.action << " "
                      << order.total_quantity << " " << contract.symbol << std::endl;
        }
        try {
            session_->submit(order_id, contract, order);
        } catch (const std::exception& e) {
            // The id stays consumed; only the metadata for the rejected order is dropped
            {
                std::lock_guard<std::mutex> lock(mutex_);
                fill_table_.erase(order_id);
                stats_.errors++;
            }
            throw BrokerException("Submit of order " + std::to_string(order_id) + " for " +
                                  event.symbol + " failed: " + e.what());
        }
    }

    // Publishes fills buffered by the callback path; orchestrator thread only
    void processPendingEvents() override {
        std::vector<FillEvent> ready;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ready.swap(pending_fills_);
        }
        for (const auto& fill : ready) {
            emitFill(fill);
        }
    }

    void initialize() override {
        session_->connect();
    }

    void shutdown() override {
        session_->disconnect();
    }

    long peekNextOrderId() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return next_order_id_;
    }

    bool hasOrder(long order_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fill_table_.count(order_id) > 0;
    }

    bool isFilled(long order_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = fill_table_.find(order_id);
        return it != fill_table_.end() && it->second.filled;
    }

    size_t pendingFillCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_fills_.size();
    }

    BrokerStats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }
};

} // namespace replay
