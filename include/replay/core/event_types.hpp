// event_types.hpp
// Event Type Definitions for the Event-Driven Market Replay Engine
// Closed set of events carried on the queue: market, signal, order and fill

#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace replay {

// ============================================================================
// Event base
// ============================================================================

struct Event {
    std::chrono::nanoseconds timestamp;
    uint64_t sequence_id;  // Stamped by the queue on publish

    Event() : timestamp(0), sequence_id(0) {}
    explicit Event(std::chrono::nanoseconds ts) : timestamp(ts), sequence_id(0) {}

    virtual ~Event() = default;

    virtual bool validate() const { return true; }
};

// ============================================================================
// Market Event - a new synchronized timestep is available
// ============================================================================

// Carries no bar data; consumers read the bar source directly
struct MarketEvent : Event {
    MarketEvent() : Event() {}
    explicit MarketEvent(std::chrono::nanoseconds ts) : Event(ts) {}
};

// ============================================================================
// Signal Event - strategy opinion on one symbol
// ============================================================================

struct SignalEvent : Event {
    enum class Direction { LONG, SHORT, EXIT };

    std::string strategy_id;
    std::string symbol;
    Direction direction;
    double strength;  // Relative sizing weight, not bounded above

    SignalEvent() : Event(), direction(Direction::EXIT), strength(1.0) {}

    SignalEvent(std::string strategy, std::string sym, std::chrono::nanoseconds ts,
                Direction dir, double str)
        : Event(ts), strategy_id(std::move(strategy)), symbol(std::move(sym)),
          direction(dir), strength(str) {}

    bool validate() const override {
        return !symbol.empty() && std::isfinite(strength) && strength >= 0.0;
    }
};

// ============================================================================
// Order Event - request sent to the execution role
// ============================================================================

struct OrderEvent : Event {
    enum class Type { MARKET, LIMIT };
    enum class Direction { BUY, SELL };

    std::string symbol;
    Type order_type;
    Direction direction;
    long quantity;
    double price;  // Nominal price: reference mark for market orders, limit for limit orders
    std::string order_id;

    OrderEvent() : Event(), order_type(Type::MARKET), direction(Direction::BUY),
                   quantity(0), price(0.0) {}

    bool validate() const override {
        if (symbol.empty() || quantity <= 0 || order_id.empty()) {
            return false;
        }
        if (order_type == Type::LIMIT && price <= 0) {
            return false;
        }
        return true;
    }
};

// ============================================================================
// Fill Event - realized outcome of an order
// ============================================================================

struct FillEvent : Event {
    std::string symbol;
    std::string exchange;
    long quantity;
    OrderEvent::Direction direction;
    double fill_cost;  // Per-unit execution price
    double commission;
    std::string order_id;

    FillEvent() : Event(), quantity(0), direction(OrderEvent::Direction::BUY),
                  fill_cost(0.0), commission(0.0) {}

    bool isBuy() const { return direction == OrderEvent::Direction::BUY; }

    bool validate() const override {
        return !symbol.empty() && quantity > 0 && fill_cost > 0 && commission >= 0;
    }
};

// ============================================================================
// Event Variant - Type-safe event container
// ============================================================================

using EventVariant = std::variant<MarketEvent, SignalEvent, OrderEvent, FillEvent>;

// ============================================================================
// Event Utility Functions
// ============================================================================

inline const char* getEventTypeName(const EventVariant& event) {
    return std::visit([](auto&& arg) -> const char* {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, MarketEvent>) return "MarketEvent";
        else if constexpr (std::is_same_v<T, SignalEvent>) return "SignalEvent";
        else if constexpr (std::is_same_v<T, OrderEvent>) return "OrderEvent";
        else return "FillEvent";
    }, event);
}

inline bool validateEvent(const EventVariant& event) {
    return std::visit([](auto&& arg) { return arg.validate(); }, event);
}

inline std::chrono::nanoseconds getEventTimestamp(const EventVariant& event) {
    return std::visit([](auto&& arg) { return arg.timestamp; }, event);
}

inline uint64_t getEventSequenceId(const EventVariant& event) {
    return std::visit([](auto&& arg) { return arg.sequence_id; }, event);
}

inline const char* directionName(SignalEvent::Direction direction) {
    switch (direction) {
        case SignalEvent::Direction::LONG: return "LONG";
        case SignalEvent::Direction::SHORT: return "SHORT";
        case SignalEvent::Direction::EXIT: return "EXIT";
    }
    return "UNKNOWN";
}

inline const char* directionName(OrderEvent::Direction direction) {
    return direction == OrderEvent::Direction::BUY ? "BUY" : "SELL";
}

} // namespace replay
