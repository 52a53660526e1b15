// historic_csv_data_handler.hpp
// CSV Bar Source for the Market Replay Engine
// Loads <csv_dir>/<symbol>.csv for each symbol and replays them through HistoricDataHandler

#pragma once

#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "historic_data_handler.hpp"
#include "../core/bar.hpp"
#include "../core/exceptions.hpp"
#include "../core/time_utils.hpp"

namespace replay {

// ============================================================================
// CSV Data Handler for Historical Market Data
// ============================================================================

class HistoricCsvDataHandler : public HistoricDataHandler {
public:
    struct CsvConfig {
        bool has_header;
        char delimiter;
        std::string date_format;  // strptime format
        bool check_data_integrity;

        CsvConfig()
            : has_header(true)
            , delimiter(',')
            , date_format("%Y-%m-%d")
            , check_data_integrity(true) {}

        static CsvConfig getDefault() {
            return CsvConfig();
        }
    };

private:
    static std::vector<std::string> splitLine(const std::string& line, char delimiter) {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, delimiter)) {
            // Trim whitespace
            token.erase(0, token.find_first_not_of(" \t\r\n"));
            token.erase(token.find_last_not_of(" \t\r\n") + 1);
            tokens.push_back(token);
        }
        return tokens;
    }

    static std::string symbolPath(const std::string& csv_dir, const std::string& symbol) {
        if (csv_dir.empty()) {
            return symbol + ".csv";
        }
        char last = csv_dir.back();
        return (last == '/') ? csv_dir + symbol + ".csv" : csv_dir + "/" + symbol + ".csv";
    }

    static SeriesMap loadDirectory(const std::string& csv_dir,
                                   const std::vector<std::string>& symbols,
                                   const CsvConfig& config) {
        SeriesMap series;
        for (const auto& symbol : symbols) {
            series[symbol] = loadCsv(symbolPath(csv_dir, symbol), config);
        }
        return series;
    }

public:
    HistoricCsvDataHandler(const std::string& csv_dir,
                           const std::vector<std::string>& symbols,
                           const CsvConfig& config = CsvConfig::getDefault())
        : HistoricDataHandler(symbols, loadDirectory(csv_dir, symbols, config)) {}

    // Reads one bar file: date,open,high,low,close,volume[,adj_close].
    // Rows come back in file order; the handler sorts them.
    static std::vector<Bar> loadCsv(const std::string& filepath,
                                    const CsvConfig& config = CsvConfig::getDefault()) {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw ConfigurationException("Failed to open bar file: " + filepath);
        }

        std::vector<Bar> bars;
        std::string line;

        if (config.has_header && !std::getline(file, line)) {
            throw DataException("Empty CSV file: " + filepath);
        }

        size_t line_num = config.has_header ? 2 : 1;
        while (std::getline(file, line)) {
            if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
                line_num++;
                continue;
            }

            auto tokens = splitLine(line, config.delimiter);
            if (tokens.size() < 6) {  // Minimum: Date,O,H,L,C,V
                throw DataException("Invalid CSV format in " + filepath + " at line " +
                                    std::to_string(line_num));
            }

            Bar bar;
            try {
                bar.timestamp = parseTimestamp(tokens[0], config.date_format);
                bar.open = std::stod(tokens[1]);
                bar.high = std::stod(tokens[2]);
                bar.low = std::stod(tokens[3]);
                bar.close = std::stod(tokens[4]);
                bar.volume = std::stod(tokens[5]);
                bar.adj_close = (tokens.size() > 6 && !tokens[6].empty())
                                    ? std::stod(tokens[6]) : bar.close;
            } catch (const std::exception& e) {
                throw DataException("Error parsing " + filepath + " line " +
                                    std::to_string(line_num) + ": " + e.what());
            }

            if (config.check_data_integrity && !bar.validate()) {
                throw DataException("Invalid bar data in " + filepath + " at line " +
                                    std::to_string(line_num));
            }

            bars.push_back(bar);
            line_num++;
        }

        if (bars.empty()) {
            throw DataException("No valid bars loaded from: " + filepath);
        }
        return bars;
    }
};

} // namespace replay
