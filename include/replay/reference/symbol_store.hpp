// symbol_store.hpp
// Symbol master records and the store interface that persists them
// Also reads constituent lists from CSV into records ready for insertion

#pragma once

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include "../core/exceptions.hpp"

namespace replay {

struct SymbolRecord {
    std::string ticker;
    std::string instrument;  // "stock", "etf", ...
    std::string name;
    std::string sector;
    std::string currency;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
};

// ============================================================================
// Symbol Store Interface
// ============================================================================

// Repeated inserts of the same ticker are not deduplicated here
class ISymbolStore {
public:
    virtual ~ISymbolStore() = default;

    // Returns the number of rows written
    virtual size_t insertSymbols(const std::vector<SymbolRecord>& batch) = 0;
};

// "YYYY-MM-DD HH:MM:SS" in UTC
inline std::string formatUtc(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = {};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

// Columns: ticker,name,sector[,instrument[,currency]] with a header row.
// Missing instrument defaults to "stock", missing currency to "USD".
inline std::vector<SymbolRecord> loadSymbolCsv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationException("Failed to open symbol file: " + path);
    }

    auto now = std::chrono::system_clock::now();
    std::vector<SymbolRecord> records;
    std::string line;
    std::getline(file, line);  // header

    size_t line_num = 1;
    while (std::getline(file, line)) {
        line_num++;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;

        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, ',')) {
            token.erase(0, token.find_first_not_of(" \t\r\n"));
            token.erase(token.find_last_not_of(" \t\r\n") + 1);
            tokens.push_back(token);
        }
        if (tokens.size() < 3 || tokens[0].empty()) {
            throw DataException("Invalid symbol row in " + path + " at line " +
                                std::to_string(line_num));
        }

        SymbolRecord record;
        record.ticker = tokens[0];
        record.name = tokens[1];
        record.sector = tokens[2];
        record.instrument = (tokens.size() > 3 && !tokens[3].empty()) ? tokens[3] : "stock";
        record.currency = (tokens.size() > 4 && !tokens[4].empty()) ? tokens[4] : "USD";
        record.created_at = now;
        record.updated_at = now;
        records.push_back(record);
    }
    return records;
}

} // namespace replay
