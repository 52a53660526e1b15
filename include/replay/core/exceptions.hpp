// exceptions.hpp
// Exception Types for the Event-Driven Market Replay Engine
// Startup failures, runtime lookup failures and execution rejections

#pragma once

#include <stdexcept>
#include <string>

namespace replay {

// ============================================================================
// Exception Types for Better Error Handling
// ============================================================================

class BacktestException : public std::runtime_error {
public:
    explicit BacktestException(const std::string& msg) : std::runtime_error(msg) {}
};

// Fatal before the run loop starts: missing bar file, bad parameters, missing components
class ConfigurationException : public BacktestException {
public:
    explicit ConfigurationException(const std::string& msg)
        : BacktestException("Configuration Error: " + msg) {}
};

// Malformed bar data
class DataException : public BacktestException {
public:
    explicit DataException(const std::string& msg) : BacktestException("Data Error: " + msg) {}
};

// Request for bars or fields of a symbol the source does not track
class SymbolLookupException : public BacktestException {
public:
    explicit SymbolLookupException(const std::string& symbol)
        : BacktestException("Lookup Error: symbol '" + symbol +
                            "' is not available in the data set"),
          symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

class InvalidFieldException : public BacktestException {
public:
    explicit InvalidFieldException(const std::string& field)
        : BacktestException("Invalid Field: '" + field + "'") {}
};

class ExecutionException : public BacktestException {
public:
    explicit ExecutionException(const std::string& msg) : BacktestException("Execution Error: " + msg) {}
};

class BrokerException : public BacktestException {
public:
    explicit BrokerException(const std::string& msg) : BacktestException("Broker Error: " + msg) {}
};

} // namespace replay
