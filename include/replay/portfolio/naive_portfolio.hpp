// naive_portfolio.hpp
// Naive Portfolio Implementation for the Market Replay Engine
// Fixed-size orders from signals, fill accounting, one holdings snapshot per timestep

#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>
#include "../interfaces/data_handler.hpp"
#include "../interfaces/portfolio.hpp"
#include "../core/bar.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"

namespace replay {

// ============================================================================
// Naive Portfolio: no risk management, fixed or strength-scaled sizing
// ============================================================================

class NaivePortfolio : public IPortfolio {
public:
    struct PortfolioConfig {
        double initial_capital;
        long order_quantity;
        bool scale_by_strength;  // floor(order_quantity * strength)
        std::string mark_field;  // Field used to value positions and price orders
        bool verbose;

        PortfolioConfig()
            : initial_capital(100000.0)
            , order_quantity(100)
            , scale_by_strength(false)
            , mark_field("adj_close")
            , verbose(false) {}

        static PortfolioConfig getDefault() {
            return PortfolioConfig();
        }
    };

    struct PortfolioStats {
        uint64_t signals_received;
        uint64_t signals_ignored;
        uint64_t orders_placed;
        uint64_t fills_applied;
        uint64_t orders_rejected;
        double total_commission;
    };

private:
    const IDataHandler& bars_;
    PortfolioConfig config_;
    BarField mark_field_;

    double cash_;
    double total_commission_ = 0.0;
    std::unordered_map<std::string, long> positions_;

    // Signed quantity the portfolio has committed to through orders. Ahead of
    // positions_ while an order awaits its fill.
    std::unordered_map<std::string, long> target_;

    struct PendingOrder {
        std::string symbol;
        long signed_quantity;
    };
    // Orders sent but not yet filled or rejected, by order id
    std::unordered_map<std::string, PendingOrder> pending_;

    std::vector<HoldingsSnapshot> equity_curve_;

    uint64_t order_id_counter_ = 1;
    uint64_t signals_received_ = 0;
    uint64_t signals_ignored_ = 0;
    uint64_t orders_placed_ = 0;
    uint64_t fills_applied_ = 0;
    uint64_t orders_rejected_ = 0;

    void resetHoldings() {
        cash_ = config_.initial_capital;
        total_commission_ = 0.0;
        positions_.clear();
        target_.clear();
        pending_.clear();
        for (const auto& symbol : bars_.getSymbols()) {
            positions_[symbol] = 0;
            target_[symbol] = 0;
        }
    }

    std::string generateOrderId() {
        return "ORD_" + std::to_string(order_id_counter_++);
    }

    long orderSize(double strength) const {
        if (!config_.scale_by_strength) {
            return config_.order_quantity;
        }
        return static_cast<long>(std::floor(config_.order_quantity * strength));
    }

    double markPrice(const std::string& symbol) const {
        return bars_.getLatestBarValue(symbol, mark_field_).value_or(0.0);
    }

    long& targetFor(const std::string& symbol) {
        auto it = target_.find(symbol);
        if (it == target_.end()) {
            throw SymbolLookupException(symbol);
        }
        return it->second;
    }

    void placeOrder(const SignalEvent& signal, OrderEvent::Direction direction, long quantity) {
        auto price = bars_.getLatestBarValue(signal.symbol, mark_field_);
        if (!price) {
            if (config_.verbose) {
                std::cout << "[Portfolio] No mark price for " << signal.symbol
                          << ", signal ignored" << std::endl;
            }
            signals_ignored_++;
            return;
        }

        OrderEvent order;
        order.timestamp = signal.timestamp;
        order.symbol = signal.symbol;
        order.order_type = OrderEvent::Type::MARKET;
        order.direction = direction;
        order.quantity = quantity;
        order.price = *price;
        order.order_id = generateOrderId();

        long signed_quantity = (direction == OrderEvent::Direction::BUY) ? quantity : -quantity;
        targetFor(signal.symbol) += signed_quantity;
        pending_[order.order_id] = PendingOrder{order.symbol, signed_quantity};
        orders_placed_++;

        if (config_.verbose) {
            std::cout << "[Portfolio] " << order.order_id << " " << directionName(direction)
                      << " " << quantity << " " << order.symbol << " @ " << order.price
                      << std::endl;
        }
        emitOrder(order);
    }

public:
    NaivePortfolio(const IDataHandler& bars,
                   const PortfolioConfig& config = PortfolioConfig::getDefault())
        : bars_(bars), config_(config), mark_field_(parseBarField(config.mark_field)),
          cash_(config.initial_capital) {
        if (config_.initial_capital <= 0) {
            throw ConfigurationException("Initial capital must be positive");
        }
        if (config_.order_quantity <= 0) {
            throw ConfigurationException("Order quantity must be positive");
        }
        resetHoldings();
    }

    // IPortfolio interface implementation
    void initialize(double initial_capital) override {
        if (initial_capital > 0) {
            config_.initial_capital = initial_capital;
        }
        reset();
    }

    void reset() override {
        resetHoldings();
        equity_curve_.clear();
        order_id_counter_ = 1;
        signals_received_ = 0;
        signals_ignored_ = 0;
        orders_placed_ = 0;
        fills_applied_ = 0;
        orders_rejected_ = 0;
    }

    // Appends one row per timestep. A second call at the same timestamp
    // replaces the row instead of adding one.
    void updateTimeindex(const MarketEvent& event) override {
        const auto& symbols = bars_.getSymbols();
        auto first_date = bars_.getLatestBarDatetime(symbols.front());

        HoldingsSnapshot snapshot;
        snapshot.timestamp = first_date ? *first_date : event.timestamp;
        snapshot.cash = cash_;
        snapshot.commission = total_commission_;
        snapshot.total = cash_;
        for (const auto& symbol : symbols) {
            double value = positions_.at(symbol) * markPrice(symbol);
            snapshot.market_values[symbol] = value;
            snapshot.total += value;
        }

        if (!equity_curve_.empty() && equity_curve_.back().timestamp == snapshot.timestamp) {
            equity_curve_.back() = snapshot;
        } else {
            equity_curve_.push_back(snapshot);
        }
    }

    // LONG/SHORT open from flat, EXIT closes; anything else is ignored
    void updateSignal(const SignalEvent& event) override {
        signals_received_++;
        long target = targetFor(event.symbol);

        switch (event.direction) {
            case SignalEvent::Direction::LONG:
            case SignalEvent::Direction::SHORT: {
                if (target != 0) {
                    signals_ignored_++;
                    return;
                }
                long quantity = orderSize(event.strength);
                if (quantity <= 0) {
                    signals_ignored_++;
                    return;
                }
                placeOrder(event,
                           event.direction == SignalEvent::Direction::LONG
                               ? OrderEvent::Direction::BUY : OrderEvent::Direction::SELL,
                           quantity);
                break;
            }
            case SignalEvent::Direction::EXIT:
                if (target > 0) {
                    placeOrder(event, OrderEvent::Direction::SELL, target);
                } else if (target < 0) {
                    placeOrder(event, OrderEvent::Direction::BUY, -target);
                } else {
                    signals_ignored_++;
                }
                break;
        }
    }

    void updateFill(const FillEvent& event) override {
        auto it = positions_.find(event.symbol);
        if (it == positions_.end()) {
            throw SymbolLookupException(event.symbol);
        }

        double cost = event.quantity * event.fill_cost;
        if (event.isBuy()) {
            it->second += event.quantity;
            cash_ -= cost + event.commission;
        } else {
            it->second -= event.quantity;
            cash_ += cost - event.commission;
        }
        total_commission_ += event.commission;
        fills_applied_++;
        pending_.erase(event.order_id);

        if (config_.verbose) {
            std::cout << "[Portfolio] Fill " << event.order_id << " "
                      << directionName(event.direction) << " " << event.quantity << " "
                      << event.symbol << " @ " << event.fill_cost
                      << " cash=" << cash_ << std::endl;
        }
    }

    // Undo the exposure the order committed so the next signal sees the real book
    void onOrderRejected(const OrderEvent& event) override {
        auto it = pending_.find(event.order_id);
        if (it == pending_.end()) {
            return;
        }
        targetFor(it->second.symbol) -= it->second.signed_quantity;
        pending_.erase(it);
        orders_rejected_++;

        if (config_.verbose) {
            std::cout << "[Portfolio] " << event.order_id << " rejected, target for "
                      << event.symbol << " back to " << target_.at(event.symbol) << std::endl;
        }
    }

    double getEquity() const override {
        double equity = cash_;
        for (const auto& [symbol, quantity] : positions_) {
            if (quantity != 0) {
                equity += quantity * markPrice(symbol);
            }
        }
        return equity;
    }

    double getCash() const override { return cash_; }

    std::unordered_map<std::string, long> getPositions() const override { return positions_; }

    const std::vector<HoldingsSnapshot>& getEquityCurve() const override { return equity_curve_; }

    double getTotalCommission() const { return total_commission_; }
    size_t pendingOrderCount() const { return pending_.size(); }
    double getInitialCapital() const { return config_.initial_capital; }

    PortfolioStats getStats() const {
        return {signals_received_, signals_ignored_, orders_placed_, fills_applied_,
                orders_rejected_, total_commission_};
    }
};

} // namespace replay
