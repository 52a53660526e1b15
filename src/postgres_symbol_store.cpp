// postgres_symbol_store.cpp
// libpq implementation of the symbol master store

#include "replay/reference/postgres_symbol_store.hpp"

#include <libpq-fe.h>
#include <iostream>
#include <memory>
#include <utility>
#include "replay/core/exceptions.hpp"

namespace replay {

namespace {

struct ResultDeleter {
    void operator()(PGresult* res) const { PQclear(res); }
};
using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

}  // namespace

PostgresSymbolStore::PostgresSymbolStore(std::string conninfo)
    : conninfo_(std::move(conninfo)) {}

PostgresSymbolStore::~PostgresSymbolStore() {
    disconnect();
}

void PostgresSymbolStore::connect() {
    if (isConnected()) return;
    disconnect();

    conn_ = PQconnectdb(conninfo_.c_str());
    if (PQstatus(conn_) != CONNECTION_OK) {
        std::string message = conn_ ? PQerrorMessage(conn_) : "out of memory";
        disconnect();
        throw BacktestException("Symbol store connection failed: " + message);
    }
}

void PostgresSymbolStore::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresSymbolStore::isConnected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

const char* PostgresSymbolStore::insertStatement() {
    return "INSERT INTO symbol (ticker, instrument, name, sector, currency, "
           "created_date, last_updated_date) VALUES ($1, $2, $3, $4, $5, $6, $7)";
}

void PostgresSymbolStore::execCommand(const char* sql) {
    ResultPtr res(PQexec(conn_, sql));
    if (PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
        throw BacktestException(std::string("Symbol store command '") + sql +
                                "' failed: " + PQerrorMessage(conn_));
    }
}

size_t PostgresSymbolStore::insertSymbols(const std::vector<SymbolRecord>& batch) {
    if (batch.empty()) return 0;
    connect();

    execCommand("BEGIN");
    size_t written = 0;
    try {
        for (const auto& record : batch) {
            std::string created = formatUtc(record.created_at);
            std::string updated = formatUtc(record.updated_at);
            const char* values[7] = {
                record.ticker.c_str(), record.instrument.c_str(), record.name.c_str(),
                record.sector.c_str(), record.currency.c_str(),
                created.c_str(), updated.c_str()
            };

            ResultPtr res(PQexecParams(conn_, insertStatement(), 7, nullptr, values,
                                       nullptr, nullptr, 0));
            if (PQresultStatus(res.get()) != PGRES_COMMAND_OK) {
                throw BacktestException("Insert of '" + record.ticker + "' failed: " +
                                        PQerrorMessage(conn_));
            }
            written++;
        }
        execCommand("COMMIT");
    } catch (const BacktestException&) {
        ResultPtr rollback(PQexec(conn_, "ROLLBACK"));
        if (PQresultStatus(rollback.get()) != PGRES_COMMAND_OK) {
            std::cerr << "[SymbolStore] Rollback failed: " << PQerrorMessage(conn_) << std::endl;
        }
        throw;
    }
    return written;
}

} // namespace replay
