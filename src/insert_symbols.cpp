// insert_symbols.cpp
// Loads a constituents CSV into the symbol master table

#include <iostream>
#include <string>

#include "replay/reference/postgres_symbol_store.hpp"
#include "replay/reference/symbol_store.hpp"
#include "replay/core/exceptions.hpp"

using namespace replay;

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " CONSTITUENTS.csv [CONNINFO]\n\n";
    std::cout << "  CONSTITUENTS.csv  ticker,name,sector[,instrument,currency] with a header row\n";
    std::cout << "  CONNINFO          libpq connection string\n";
    std::cout << "                    (default: \"host=localhost dbname=securities_master\")\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2 || std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help") {
        printUsage(argv[0]);
        return argc < 2 ? 1 : 0;
    }

    std::string csv_path = argv[1];
    std::string conninfo = argc > 2 ? argv[2] : "host=localhost dbname=securities_master";

    try {
        auto records = loadSymbolCsv(csv_path);
        std::cout << "Read " << records.size() << " symbols from " << csv_path << "\n";

        PostgresSymbolStore store(conninfo);
        size_t written = store.insertSymbols(records);
        std::cout << written << " symbols were successfully added.\n";
        return 0;
    } catch (const BacktestException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
