// cerebro.hpp
// Main Engine (Cerebro) for the Market Replay Engine
// Owns the event queue and the four roles; drives the replay loop to a deterministic finish

#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>
#include <variant>
#include <vector>
#include "../core/event_queue.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../interfaces/data_handler.hpp"
#include "../interfaces/strategy.hpp"
#include "../interfaces/portfolio.hpp"
#include "../interfaces/execution_handler.hpp"
#include "../performance/performance.hpp"
#include "event_dispatcher.hpp"

namespace replay {

struct BacktestResult {
    std::vector<EquityRecord> equity;
    SummaryStats stats;
    uint64_t bars_processed = 0;
    uint64_t signals = 0;
    uint64_t orders = 0;
    uint64_t fills = 0;
    uint64_t errors = 0;
};

// ============================================================================
// Main Engine (Cerebro)
// ============================================================================

class Cerebro {
public:
    enum class State { IDLE, RUNNING, EXHAUSTED, DONE, FAILED };

    struct Config {
        double initial_capital;
        std::chrono::milliseconds heartbeat;  // Pacing between timesteps only
        size_t max_events_per_tick;           // Runaway feedback guard
        double periods_per_year;
        bool verbose;

        Config()
            : initial_capital(100000.0)
            , heartbeat(0)
            , max_events_per_tick(10000)
            , periods_per_year(PerformanceAnalyzer::DEFAULT_PERIODS_PER_YEAR)
            , verbose(false) {}

        static Config getDefault() {
            return Config();
        }
    };

private:
    EventQueue event_queue_;
    std::unique_ptr<IDataHandler> data_handler_;
    std::unique_ptr<IStrategy> strategy_;
    std::unique_ptr<IPortfolio> portfolio_;
    std::unique_ptr<IExecutionHandler> execution_handler_;

    Config config_;
    State state_ = State::IDLE;
    bool initialized_ = false;
    uint64_t bars_processed_ = 0;
    BacktestResult result_;

    void requireIdle() const {
        if (state_ == State::RUNNING) {
            throw BacktestException("Cannot change components while running");
        }
    }

    // Fixed point: events published while handling another are consumed in the same pass
    void drain(EventDispatcher& dispatcher) {
        size_t events_this_tick = 0;
        while (true) {
            execution_handler_->processPendingEvents();
            auto event = event_queue_.try_consume();
            if (!event) {
                break;
            }
            if (++events_this_tick > config_.max_events_per_tick) {
                throw BacktestException("More than " + std::to_string(config_.max_events_per_tick) +
                                        " events in one timestep; aborting run");
            }
            std::visit(dispatcher, *event);
        }
    }

    void finalize(const EventDispatcher& dispatcher) {
        const auto& counts = dispatcher.getCounts();
        result_ = BacktestResult();
        result_.equity = PerformanceAnalyzer::buildRecords(portfolio_->getEquityCurve());
        result_.stats = PerformanceAnalyzer::summarize(result_.equity, config_.periods_per_year);
        result_.bars_processed = bars_processed_;
        result_.signals = counts.signals;
        result_.orders = counts.orders;
        result_.fills = counts.fills;
        result_.errors = counts.errors;
        state_ = State::DONE;

        if (config_.verbose) {
            std::cout << "[Cerebro] Done: " << bars_processed_ << " bars, " << result_.signals
                      << " signals, " << result_.orders << " orders, " << result_.fills
                      << " fills, " << result_.errors << " errors" << std::endl;
        }
    }

public:
    explicit Cerebro(const Config& config = Config::getDefault()) : config_(config) {
        if (config_.initial_capital <= 0) {
            throw ConfigurationException("Initial capital must be positive");
        }
        if (config_.max_events_per_tick == 0) {
            throw ConfigurationException("max_events_per_tick must be positive");
        }
    }

    ~Cerebro() {
        if (initialized_) {
            shutdown();
        }
    }

    Cerebro(const Cerebro&) = delete;
    Cerebro& operator=(const Cerebro&) = delete;

    // Component injection
    void setDataHandler(std::unique_ptr<IDataHandler> handler) {
        requireIdle();
        data_handler_ = std::move(handler);
        if (data_handler_) {
            data_handler_->setEventQueue(event_queue_);
        }
    }

    void setStrategy(std::unique_ptr<IStrategy> strategy) {
        requireIdle();
        strategy_ = std::move(strategy);
        if (strategy_) {
            strategy_->setEventQueue(event_queue_);
        }
    }

    void setPortfolio(std::unique_ptr<IPortfolio> portfolio) {
        requireIdle();
        portfolio_ = std::move(portfolio);
        if (portfolio_) {
            portfolio_->setEventQueue(event_queue_);
        }
    }

    void setExecutionHandler(std::unique_ptr<IExecutionHandler> handler) {
        requireIdle();
        execution_handler_ = std::move(handler);
        if (execution_handler_) {
            execution_handler_->setEventQueue(event_queue_);
        }
    }

    void initialize() {
        if (initialized_) return;

        if (!data_handler_ || !strategy_ || !portfolio_ || !execution_handler_) {
            throw ConfigurationException("All components must be set before initialization");
        }

        data_handler_->initialize();
        portfolio_->initialize(config_.initial_capital);
        strategy_->initialize();
        execution_handler_->initialize();

        event_queue_.clear();
        event_queue_.resetStats();
        bars_processed_ = 0;
        initialized_ = true;
    }

    void shutdown() {
        if (!initialized_) return;

        execution_handler_->shutdown();
        strategy_->shutdown();
        portfolio_->shutdown();
        data_handler_->shutdown();

        initialized_ = false;
    }

    // RUNNING -> EXHAUSTED -> DONE; an exception out of the loop ends in FAILED
    const BacktestResult& run() {
        if (state_ == State::DONE) {
            return result_;
        }
        if (state_ == State::FAILED) {
            throw BacktestException("Previous run failed; build a new engine to run again");
        }
        initialize();

        state_ = State::RUNNING;
        EventDispatcher dispatcher(*strategy_, *portfolio_, *execution_handler_);

        try {
            while (state_ == State::RUNNING) {
                if (data_handler_->isExhausted() || !data_handler_->updateBars()) {
                    state_ = State::EXHAUSTED;
                    break;
                }
                bars_processed_++;
                drain(dispatcher);

                if (config_.heartbeat.count() > 0) {
                    std::this_thread::sleep_for(config_.heartbeat);
                }
            }

            // Late asynchronous fills still reach the portfolio
            drain(dispatcher);
            finalize(dispatcher);
        } catch (const std::exception& e) {
            state_ = State::FAILED;
            event_queue_.clear();
            std::cerr << "[Cerebro] Run failed after " << bars_processed_ << " bars: " << e.what()
                      << std::endl;
            throw;
        }
        return result_;
    }

    State getState() const { return state_; }
    const BacktestResult& getResult() const { return result_; }
    const EventQueue& getEventQueue() const { return event_queue_; }

    IDataHandler* getDataHandler() { return data_handler_.get(); }
    IStrategy* getStrategy() { return strategy_.get(); }
    IPortfolio* getPortfolio() { return portfolio_.get(); }
    IExecutionHandler* getExecutionHandler() { return execution_handler_.get(); }
};

inline const char* stateName(Cerebro::State state) {
    switch (state) {
        case Cerebro::State::IDLE: return "IDLE";
        case Cerebro::State::RUNNING: return "RUNNING";
        case Cerebro::State::EXHAUSTED: return "EXHAUSTED";
        case Cerebro::State::DONE: return "DONE";
        case Cerebro::State::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

} // namespace replay
