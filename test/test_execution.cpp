// test_execution.cpp
// Execution tests: commission models, simulated fills and the broker-backed handler

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "replay/core/event_queue.hpp"
#include "replay/core/exceptions.hpp"
#include "replay/execution/broker_execution_handler.hpp"
#include "replay/execution/broker_session.hpp"
#include "replay/execution/commission.hpp"
#include "replay/execution/simulated_execution_handler.hpp"
#include "test_support.hpp"

using namespace replay;
using namespace replay_test;

namespace {

OrderEvent makeOrder(const std::string& symbol, OrderEvent::Direction direction, long quantity,
                     double price, const std::string& id) {
    OrderEvent order;
    order.timestamp = day(3);
    order.symbol = symbol;
    order.order_type = OrderEvent::Type::MARKET;
    order.direction = direction;
    order.quantity = quantity;
    order.price = price;
    order.order_id = id;
    return order;
}

std::vector<FillEvent> drainFills(EventQueue& queue) {
    std::vector<FillEvent> fills;
    while (auto event = queue.try_consume()) {
        fills.push_back(std::get<FillEvent>(*event));
    }
    return fills;
}

// Records submissions; tests push messages through deliver() from any thread
class FakeBrokerSession : public IBrokerSession {
public:
    struct Submission {
        long order_id;
        ContractSpec contract;
        OrderSpec order;
    };

    void submit(long order_id, const ContractSpec& contract, const OrderSpec& order) override {
        if (reject_submissions_) {
            throw std::runtime_error("socket closed");
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            submissions_.push_back({order_id, contract, order});
        }
        if (fill_immediately_) {
            deliver(statusFilled(order_id, order.total_quantity, 10.0));
        }
    }

    void setMessageHandler(MessageHandler handler) override {
        handler_ = std::move(handler);
    }

    void connect() override { connected_ = true; }
    void disconnect() override { connected_ = false; }

    void deliver(const BrokerMessage& msg) {
        if (handler_) handler_(msg);
    }

    static BrokerMessage statusFilled(long id, long filled, double price) {
        BrokerMessage msg;
        msg.kind = BrokerMessage::Kind::ORDER_STATUS;
        msg.order_id = id;
        msg.status = "Filled";
        msg.filled = filled;
        msg.avg_fill_price = price;
        return msg;
    }

    std::vector<Submission> submissions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return submissions_;
    }

    bool fill_immediately_ = false;
    bool reject_submissions_ = false;
    bool connected_ = false;

private:
    mutable std::mutex mutex_;
    std::vector<Submission> submissions_;
    MessageHandler handler_;
};

struct BrokerRig {
    FakeBrokerSession* session;
    std::unique_ptr<BrokerExecutionHandler> handler;
    EventQueue queue;

    explicit BrokerRig(const BrokerExecutionHandler::BrokerExecutionConfig& config =
                           BrokerExecutionHandler::BrokerExecutionConfig::getDefault()) {
        auto owned = std::make_unique<FakeBrokerSession>();
        session = owned.get();
        handler = std::make_unique<BrokerExecutionHandler>(std::move(owned), config);
        handler->setEventQueue(queue);
    }
};

} // namespace

// ============================================================================
// Commission
// ============================================================================

void test_commission_models() {
    auto fixed = CommissionModel::fixed(2.5);
    expectNear(fixed.calculate(1000, 10.0), 2.5, 1e-12, "fixed per order");

    auto ib = CommissionModel::interactiveBrokers();
    expectNear(ib.calculate(50, 10.0), 1.3, 1e-12, "minimum applies");
    expectNear(ib.calculate(400, 10.0), 5.2, 1e-9, "0.013 per share up to 500");
    expectNear(ib.calculate(1000, 10.0), 8.0, 1e-9, "0.008 per share above 500");

    expect(parseCommissionModel("ib").kind == CommissionModel::Kind::INTERACTIVE_BROKERS, "ib");
    expectThrows<ConfigurationException>([] { parseCommissionModel("percent"); }, "unknown model");
    expectThrows<ConfigurationException>([] { CommissionModel::fixed(-1.0); }, "negative fixed");
}

// ============================================================================
// Simulated execution
// ============================================================================

void test_simulated_fill_at_nominal_price() {
    SimulatedExecutionHandler::ExecutionConfig config;
    config.commission = CommissionModel::fixed(1.0);
    SimulatedExecutionHandler handler(config);
    EventQueue queue;
    handler.setEventQueue(queue);

    handler.executeOrder(makeOrder("A", OrderEvent::Direction::SELL, 25, 42.5, "ORD_7"));
    auto fills = drainFills(queue);
    expect(fills.size() == 1, "exactly one fill per order");
    expect(fills[0].symbol == "A" && fills[0].quantity == 25, "symbol and quantity copied");
    expect(fills[0].direction == OrderEvent::Direction::SELL, "direction copied");
    expectNear(fills[0].fill_cost, 42.5, 1e-12, "no slippage");
    expectNear(fills[0].commission, 1.0, 1e-12, "fixed commission");
    expect(fills[0].exchange == "ARCA", "simulated exchange");
    expect(fills[0].order_id == "ORD_7", "order id carried");
    expect(fills[0].timestamp == day(3), "fill at the order's timestamp");
    expect(handler.getStats().filled_orders == 1, "stats");
}

void test_simulated_rejects_unpriced_order() {
    SimulatedExecutionHandler handler;
    EventQueue queue;
    handler.setEventQueue(queue);

    expectThrows<ExecutionException>(
        [&] { handler.executeOrder(makeOrder("A", OrderEvent::Direction::BUY, 10, 0.0, "O1")); },
        "zero price");
    expectThrows<ExecutionException>(
        [&] { handler.executeOrder(makeOrder("A", OrderEvent::Direction::BUY, 0, 5.0, "O2")); },
        "zero quantity");
    expect(queue.empty(), "no fill for rejected orders");
}

// ============================================================================
// Broker-backed execution
// ============================================================================

void test_broker_submission_and_ids() {
    BrokerExecutionHandler::BrokerExecutionConfig config;
    config.initial_order_id = 500;
    BrokerRig rig(config);
    rig.handler->initialize();
    expect(rig.session->connected_, "initialize connects the session");

    rig.handler->executeOrder(makeOrder("AAPL", OrderEvent::Direction::BUY, 100, 0.0, "ORD_1"));
    rig.handler->executeOrder(makeOrder("MSFT", OrderEvent::Direction::SELL, 50, 0.0, "ORD_2"));

    auto subs = rig.session->submissions();
    expect(subs.size() == 2, "two submissions");
    expect(subs[0].order_id == 500 && subs[1].order_id == 501, "ids increase from the initial id");
    expect(rig.handler->peekNextOrderId() == 502, "next id already advanced");
    expect(subs[0].contract.symbol == "AAPL" && subs[0].contract.exchange == "SMART" &&
           subs[0].contract.currency == "USD" && subs[0].contract.sec_type == "STK",
           "contract spec from config");
    expect(subs[0].order.order_type == "MKT" && subs[0].order.action == "BUY" &&
           subs[0].order.total_quantity == 100, "order spec");
    expect(subs[1].order.action == "SELL", "sell action");
    expect(rig.handler->hasOrder(500) && rig.handler->hasOrder(501), "metadata tracked on submit");
    expect(rig.queue.empty(), "no fill before the broker confirms");

    rig.handler->shutdown();
    expect(!rig.session->connected_, "shutdown disconnects");
}

void test_broker_fill_deduplication() {
    BrokerRig rig;
    rig.handler->executeOrder(makeOrder("AAPL", OrderEvent::Direction::BUY, 100, 0.0, "ORD_1"));

    BrokerMessage submitted;
    submitted.kind = BrokerMessage::Kind::ORDER_STATUS;
    submitted.order_id = 1;
    submitted.status = "Submitted";
    rig.session->deliver(submitted);
    rig.handler->processPendingEvents();
    expect(rig.queue.empty(), "non-filled status emits nothing");

    auto filled = FakeBrokerSession::statusFilled(1, 100, 187.25);
    filled.commission = 1.0;
    rig.session->deliver(filled);
    rig.session->deliver(filled);
    rig.session->deliver(filled);
    expect(rig.queue.empty(), "fills wait for the orchestrator pump");

    rig.handler->processPendingEvents();
    auto fills = drainFills(rig.queue);
    expect(fills.size() == 1, "only the first Filled notification produces a fill");
    expect(fills[0].symbol == "AAPL" && fills[0].exchange == "SMART", "metadata from submit");
    expect(fills[0].direction == OrderEvent::Direction::BUY, "direction from submit");
    expectNear(fills[0].fill_cost, 187.25, 1e-12, "average fill price");
    expectNear(fills[0].commission, 1.0, 1e-12, "reported commission");
    expect(fills[0].order_id == "ORD_1", "portfolio order id restored");
    expect(rig.handler->isFilled(1), "marked filled");

    auto stats = rig.handler->getStats();
    expect(stats.fills_received == 1 && stats.duplicate_fills == 2, "duplicates counted");

    rig.handler->processPendingEvents();
    expect(rig.queue.empty(), "nothing left to publish");
}

void test_broker_unusable_fill_keeps_order_open() {
    BrokerRig rig;
    rig.handler->executeOrder(makeOrder("AAPL", OrderEvent::Direction::BUY, 5, 0.0, "ORD_1"));

    rig.session->deliver(FakeBrokerSession::statusFilled(1, 0, 0.0));
    rig.handler->processPendingEvents();
    expect(rig.queue.empty(), "empty Filled status publishes nothing");
    expect(!rig.handler->isFilled(1), "order still open");

    rig.session->deliver(FakeBrokerSession::statusFilled(1, 5, 10.0));
    rig.handler->processPendingEvents();
    auto fills = drainFills(rig.queue);
    expect(fills.size() == 1, "the real fill still arrives");
    expect(fills[0].quantity == 5, "quantity from the usable status");
    expectNear(fills[0].fill_cost, 10.0, 1e-12, "price from the usable status");
    expect(rig.handler->isFilled(1), "now filled");

    auto stats = rig.handler->getStats();
    expect(stats.invalid_fills == 1, "unusable status counted");
    expect(stats.fills_received == 1 && stats.duplicate_fills == 0, "not taken for a duplicate");
}

void test_broker_open_order_and_errors() {
    BrokerRig rig;

    BrokerMessage open;
    open.kind = BrokerMessage::Kind::OPEN_ORDER;
    open.order_id = 77;
    open.contract.symbol = "IBM";
    open.contract.exchange = "NYSE";
    open.action = "SELL";
    rig.session->deliver(open);
    expect(rig.handler->hasOrder(77), "open order creates metadata");

    rig.session->deliver(FakeBrokerSession::statusFilled(77, 10, 120.0));
    rig.session->deliver(FakeBrokerSession::statusFilled(99, 10, 120.0));

    BrokerMessage error;
    error.kind = BrokerMessage::Kind::ERROR;
    error.order_id = 77;
    error.error_code = 202;
    error.error_text = "Order cancelled";
    rig.session->deliver(error);

    rig.handler->processPendingEvents();
    auto fills = drainFills(rig.queue);
    expect(fills.size() == 1, "only the known order fills");
    expect(fills[0].symbol == "IBM" && fills[0].direction == OrderEvent::Direction::SELL,
           "metadata from the open order message");
    expectNear(fills[0].commission, 1.3, 1e-12, "fallback IB commission");

    auto stats = rig.handler->getStats();
    expect(stats.unknown_fills == 1, "unknown id counted");
    expect(stats.errors == 1, "error counted, not thrown");
}

void test_broker_synchronous_callback() {
    BrokerRig rig;
    rig.session->fill_immediately_ = true;

    rig.handler->executeOrder(makeOrder("AAPL", OrderEvent::Direction::BUY, 5, 0.0, "ORD_1"));
    rig.handler->processPendingEvents();
    auto fills = drainFills(rig.queue);
    expect(fills.size() == 1, "callback inside submit finds the recorded metadata");
    expect(fills[0].symbol == "AAPL", "fill matched to its order");
}

void test_broker_submit_failure() {
    BrokerRig rig;
    rig.session->reject_submissions_ = true;

    expectThrows<BrokerException>(
        [&] { rig.handler->executeOrder(makeOrder("AAPL", OrderEvent::Direction::BUY, 5, 0.0, "O1")); },
        "session failure surfaces as a broker error");
    expect(!rig.handler->hasOrder(1), "rejected order leaves no metadata");
    expect(rig.handler->peekNextOrderId() == 2, "id is not reused");
    expect(rig.handler->getStats().errors == 1, "failure counted");

    rig.session->reject_submissions_ = false;
    rig.handler->executeOrder(makeOrder("AAPL", OrderEvent::Direction::BUY, 5, 0.0, "O2"));
    expect(rig.session->submissions().at(0).order_id == 2, "next submission gets the next id");
}

void test_broker_concurrent_callbacks() {
    BrokerRig rig;
    const int orders = 200;
    const int threads = 4;

    for (int i = 0; i < orders; ++i) {
        rig.handler->executeOrder(makeOrder("S" + std::to_string(i % 7), OrderEvent::Direction::BUY,
                                            10, 0.0, "ORD_" + std::to_string(i + 1)));
    }

    // Every worker reports every order as filled; each order must fill once
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&rig, orders] {
            for (long id = 1; id <= orders; ++id) {
                rig.session->deliver(FakeBrokerSession::statusFilled(id, 10, 50.0));
            }
        });
    }

    // Submissions keep flowing while callbacks arrive
    for (int i = 0; i < 50; ++i) {
        rig.handler->executeOrder(makeOrder("LATE", OrderEvent::Direction::SELL, 1, 0.0,
                                            "LATE_" + std::to_string(i)));
        rig.handler->processPendingEvents();
    }
    for (auto& w : workers) w.join();
    rig.handler->processPendingEvents();

    std::set<std::string> ids;
    for (const auto& fill : drainFills(rig.queue)) {
        ids.insert(fill.order_id);
    }
    expect(ids.size() == static_cast<size_t>(orders), "one fill per filled order");

    std::set<long> submitted;
    for (const auto& sub : rig.session->submissions()) {
        submitted.insert(sub.order_id);
    }
    expect(submitted.size() == static_cast<size_t>(orders + 50), "broker ids never reused");

    auto stats = rig.handler->getStats();
    expect(stats.fills_received == static_cast<uint64_t>(orders), "fills counted once");
    expect(stats.duplicate_fills == static_cast<uint64_t>(orders * (threads - 1)),
           "duplicates counted");
}

int main() {
    std::cout << "=== Execution Tests ===" << std::endl;
    TestReporter reporter;

    std::cout << "\nCommission Tests:" << std::endl;
    reporter.test("Commission Models", test_commission_models);

    std::cout << "\nSimulated Execution Tests:" << std::endl;
    reporter.test("Fill At Nominal Price", test_simulated_fill_at_nominal_price);
    reporter.test("Rejects Unpriced Order", test_simulated_rejects_unpriced_order);

    std::cout << "\nBroker Execution Tests:" << std::endl;
    reporter.test("Submission And Ids", test_broker_submission_and_ids);
    reporter.test("Fill Deduplication", test_broker_fill_deduplication);
    reporter.test("Open Order And Errors", test_broker_open_order_and_errors);
    reporter.test("Synchronous Callback", test_broker_synchronous_callback);
    reporter.test("Unusable Fill Keeps Order Open", test_broker_unusable_fill_keeps_order_open);
    reporter.test("Submit Failure", test_broker_submit_failure);
    reporter.test("Concurrent Callbacks", test_broker_concurrent_callbacks);

    return reporter.report();
}
