// postgres_symbol_store.hpp
// PostgreSQL-backed symbol master store (libpq)

#pragma once

#include <string>
#include <vector>
#include "symbol_store.hpp"

// Forward-declared so callers need not see libpq-fe.h
struct pg_conn;

namespace replay {

class PostgresSymbolStore : public ISymbolStore {
public:
    // conninfo is a libpq connection string, e.g. "host=localhost dbname=securities_master"
    explicit PostgresSymbolStore(std::string conninfo);
    ~PostgresSymbolStore() override;

    PostgresSymbolStore(const PostgresSymbolStore&) = delete;
    PostgresSymbolStore& operator=(const PostgresSymbolStore&) = delete;

    // Throws BacktestException if the server cannot be reached
    void connect();
    void disconnect();
    bool isConnected() const;

    // One transaction per batch; any failed row rolls back the whole batch.
    // An empty batch writes nothing and does not connect.
    size_t insertSymbols(const std::vector<SymbolRecord>& batch) override;

    static const char* insertStatement();

private:
    std::string conninfo_;
    pg_conn* conn_ = nullptr;

    void execCommand(const char* sql);
};

} // namespace replay
