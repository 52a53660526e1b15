// broker_session.hpp
// Broker session boundary for the Market Replay Engine
// Outbound order submission and inbound asynchronous status messages

#pragma once

#include <functional>
#include <optional>
#include <string>

namespace replay {

struct ContractSpec {
    std::string symbol;
    std::string sec_type;   // "STK"
    std::string exchange;   // Routing destination, "SMART"
    std::string primary_exchange;
    std::string currency;   // "USD"
};

struct OrderSpec {
    std::string order_type;  // "MKT" or "LMT"
    std::string action;      // "BUY" or "SELL"
    long total_quantity = 0;
    double limit_price = 0.0;
};

// One asynchronous message from the broker. Which fields are meaningful
// depends on kind.
struct BrokerMessage {
    enum class Kind { OPEN_ORDER, ORDER_STATUS, ERROR };

    Kind kind = Kind::ORDER_STATUS;
    long order_id = -1;

    // ORDER_STATUS
    std::string status;  // "Filled", "Submitted", "Cancelled", ...
    long filled = 0;
    double avg_fill_price = 0.0;
    std::optional<double> commission;

    // OPEN_ORDER
    ContractSpec contract;
    std::string action;

    // ERROR
    int error_code = 0;
    std::string error_text;
};

// ============================================================================
// Broker Session Interface
// ============================================================================

// Implementations may deliver messages on any thread, including from inside submit().
class IBrokerSession {
public:
    using MessageHandler = std::function<void(const BrokerMessage&)>;

    virtual ~IBrokerSession() = default;

    virtual void connect() {}
    virtual void disconnect() {}

    // Fire-and-forget
    virtual void submit(long order_id, const ContractSpec& contract, const OrderSpec& order) = 0;

    virtual void setMessageHandler(MessageHandler handler) = 0;
};

} // namespace replay
