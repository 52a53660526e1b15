// main.cpp
// Market Replay Engine command line driver
// Loads per-symbol bar files, runs one strategy through Cerebro and reports the results

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "replay/engine/cerebro.hpp"
#include "replay/data/historic_csv_data_handler.hpp"
#include "replay/strategies/moving_average_cross_strategy.hpp"
#include "replay/strategies/ols_mean_reversion_strategy.hpp"
#include "replay/portfolio/naive_portfolio.hpp"
#include "replay/execution/simulated_execution_handler.hpp"
#include "replay/performance/performance.hpp"
#include "replay/core/exceptions.hpp"

using namespace replay;

// ============================================================================
// Configuration Structure
// ============================================================================

struct BacktestOptions {
    std::string data_dir = "data";
    std::vector<std::string> symbols;

    std::string strategy_type = "ma_cross";  // "ma_cross" or "ols_mr"
    size_t short_window = 100;
    size_t long_window = 400;
    size_t ols_window = 100;
    double zscore_high = 3.0;
    double zscore_low = 0.5;

    double initial_capital = 100000.0;
    long order_quantity = 100;
    bool scale_by_strength = false;

    std::string commission_model = "fixed";  // "fixed" or "ib"
    double commission = 0.0;

    long heartbeat_ms = 0;
    std::string output_file;  // Equity curve CSV, skipped when empty
    bool verbose = false;
};

// ============================================================================
// Command Line Argument Parser
// ============================================================================

void printUsage(const char* program_name) {
    std::cout << "Market Replay Engine\n";
    std::cout << "====================\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -d, --data DIR           Directory holding <SYMBOL>.csv files (default: data)\n";
    std::cout << "  -s, --symbols SYM1,SYM2  Symbols to replay (default: AAPL for ma_cross, AREX,WLL for ols_mr)\n";
    std::cout << "  -t, --strategy TYPE      ma_cross or ols_mr (default: ma_cross)\n";
    std::cout << "      --short N            Short SMA window (default: 100)\n";
    std::cout << "      --long N             Long SMA window (default: 400)\n";
    std::cout << "  -w, --ols-window N       OLS lookback window (default: 100)\n";
    std::cout << "  -e, --entry Z            Entry z-score threshold (default: 3.0)\n";
    std::cout << "  -x, --exit Z             Exit z-score band (default: 0.5)\n";
    std::cout << "  -c, --capital AMOUNT     Initial capital (default: 100000)\n";
    std::cout << "  -q, --quantity N         Shares per order (default: 100)\n";
    std::cout << "      --scale              Scale order size by signal strength\n";
    std::cout << "  -m, --commission-model M fixed or ib (default: fixed)\n";
    std::cout << "      --commission AMOUNT  Fixed commission per order (default: 0)\n";
    std::cout << "      --heartbeat MS       Pause between timesteps (default: 0)\n";
    std::cout << "  -o, --output FILE        Write the equity curve CSV\n";
    std::cout << "      --verbose            Enable verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -d data -s AAPL --short 100 --long 400\n";
    std::cout << "  " << program_name << " -t ols_mr -s AREX,WLL -w 100 -e 3.0 -x 0.5 -o equity.csv\n";
}

std::vector<std::string> splitSymbols(const std::string& symbols_str) {
    std::vector<std::string> symbols;
    size_t start = 0, end;
    while ((end = symbols_str.find(',', start)) != std::string::npos) {
        symbols.push_back(symbols_str.substr(start, end - start));
        start = end + 1;
    }
    symbols.push_back(symbols_str.substr(start));
    return symbols;
}

bool parseArguments(int argc, char* argv[], BacktestOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            return false;
        }
        else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            options.data_dir = argv[++i];
        }
        else if ((arg == "-s" || arg == "--symbols") && i + 1 < argc) {
            options.symbols = splitSymbols(argv[++i]);
        }
        else if ((arg == "-t" || arg == "--strategy") && i + 1 < argc) {
            options.strategy_type = argv[++i];
        }
        else if (arg == "--short" && i + 1 < argc) {
            options.short_window = std::stoul(argv[++i]);
        }
        else if (arg == "--long" && i + 1 < argc) {
            options.long_window = std::stoul(argv[++i]);
        }
        else if ((arg == "-w" || arg == "--ols-window") && i + 1 < argc) {
            options.ols_window = std::stoul(argv[++i]);
        }
        else if ((arg == "-e" || arg == "--entry") && i + 1 < argc) {
            options.zscore_high = std::stod(argv[++i]);
        }
        else if ((arg == "-x" || arg == "--exit") && i + 1 < argc) {
            options.zscore_low = std::stod(argv[++i]);
        }
        else if ((arg == "-c" || arg == "--capital") && i + 1 < argc) {
            options.initial_capital = std::stod(argv[++i]);
        }
        else if ((arg == "-q" || arg == "--quantity") && i + 1 < argc) {
            options.order_quantity = std::stol(argv[++i]);
        }
        else if (arg == "--scale") {
            options.scale_by_strength = true;
        }
        else if ((arg == "-m" || arg == "--commission-model") && i + 1 < argc) {
            options.commission_model = argv[++i];
        }
        else if (arg == "--commission" && i + 1 < argc) {
            options.commission = std::stod(argv[++i]);
        }
        else if (arg == "--heartbeat" && i + 1 < argc) {
            options.heartbeat_ms = std::stol(argv[++i]);
        }
        else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            options.output_file = argv[++i];
        }
        else if (arg == "--verbose") {
            options.verbose = true;
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }

    if (options.symbols.empty()) {
        if (options.strategy_type == "ols_mr") {
            options.symbols = {"AREX", "WLL"};
        } else {
            options.symbols = {"AAPL"};
        }
    }

    return true;
}

// ============================================================================
// Result Reporting
// ============================================================================

void printBacktestSummary(const BacktestOptions& options, const BacktestResult& result,
                          double elapsed_seconds) {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              BACKTEST RESULTS SUMMARY                        ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
    std::cout << "\n";

    std::cout << "Configuration:\n";
    std::cout << "  Strategy:        " << options.strategy_type << "\n";
    std::cout << "  Symbols:         ";
    for (size_t i = 0; i < options.symbols.size(); ++i) {
        std::cout << options.symbols[i] << (i + 1 < options.symbols.size() ? ", " : "\n");
    }
    std::cout << "  Initial Capital: $" << std::fixed << std::setprecision(2)
              << options.initial_capital << "\n\n";

    const auto& stats = result.stats;
    std::cout << "Performance:\n";
    std::cout << "  Final Equity:    $" << std::fixed << std::setprecision(2)
              << stats.final_equity << "\n";
    std::cout << "  Total Return:    " << std::fixed << std::setprecision(2)
              << stats.total_return * 100.0 << "%\n";
    std::cout << "  Sharpe Ratio:    " << std::fixed << std::setprecision(3)
              << stats.sharpe_ratio << "\n";
    std::cout << "  Max Drawdown:    " << std::fixed << std::setprecision(2)
              << stats.max_drawdown * 100.0 << "%\n";
    std::cout << "  DD Duration:     " << stats.max_drawdown_duration << " bars\n\n";

    std::cout << "Activity:\n";
    std::cout << "  Bars:            " << result.bars_processed << "\n";
    std::cout << "  Signals:         " << result.signals << "\n";
    std::cout << "  Orders:          " << result.orders << "\n";
    std::cout << "  Fills:           " << result.fills << "\n";
    std::cout << "  Errors:          " << result.errors << "\n";
    std::cout << "  Time Elapsed:    " << std::fixed << std::setprecision(3)
              << elapsed_seconds << " seconds\n\n";
}

// ============================================================================
// Main Function
// ============================================================================

int main(int argc, char* argv[]) {
    BacktestOptions options;
    try {
        if (!parseArguments(argc, argv, options)) {
            printUsage(argv[0]);
            return (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))
                   ? 0 : 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        return 1;
    }

    if (options.verbose) {
        std::cout << "Loaded configuration:\n";
        std::cout << "  Data dir:  " << options.data_dir << "\n";
        std::cout << "  Strategy:  " << options.strategy_type << "\n";
        std::cout << "  Capital:   $" << options.initial_capital << "\n";
        std::cout << "\n";
    }

    try {
        auto start_time = std::chrono::high_resolution_clock::now();

        Cerebro::Config engine_config;
        engine_config.initial_capital = options.initial_capital;
        engine_config.heartbeat = std::chrono::milliseconds(options.heartbeat_ms);
        engine_config.verbose = options.verbose;
        Cerebro cerebro(engine_config);

        std::cout << "Loading market data from: " << options.data_dir << "\n";
        auto data_handler = std::make_unique<HistoricCsvDataHandler>(options.data_dir,
                                                                     options.symbols);

        // Strategy and portfolio read the handler, which Cerebro keeps alive
        std::unique_ptr<IStrategy> strategy;
        if (options.strategy_type == "ma_cross") {
            MovingAverageCrossStrategy::MACrossConfig config;
            config.short_window = options.short_window;
            config.long_window = options.long_window;
            config.verbose = options.verbose;
            strategy = std::make_unique<MovingAverageCrossStrategy>(*data_handler, config);
        } else if (options.strategy_type == "ols_mr") {
            if (options.symbols.size() != 2) {
                throw ConfigurationException("ols_mr requires exactly two symbols (y,x)");
            }
            OLSMeanReversionStrategy::OLSMeanReversionConfig config;
            config.ols_window = options.ols_window;
            config.zscore_high = options.zscore_high;
            config.zscore_low = options.zscore_low;
            config.verbose = options.verbose;
            strategy = std::make_unique<OLSMeanReversionStrategy>(
                *data_handler, options.symbols[0], options.symbols[1], config);
        } else {
            throw ConfigurationException("Unknown strategy type: " + options.strategy_type);
        }

        NaivePortfolio::PortfolioConfig portfolio_config;
        portfolio_config.initial_capital = options.initial_capital;
        portfolio_config.order_quantity = options.order_quantity;
        portfolio_config.scale_by_strength = options.scale_by_strength;
        portfolio_config.verbose = options.verbose;
        auto portfolio = std::make_unique<NaivePortfolio>(*data_handler, portfolio_config);

        SimulatedExecutionHandler::ExecutionConfig execution_config;
        execution_config.commission = parseCommissionModel(options.commission_model,
                                                           options.commission);
        execution_config.verbose = options.verbose;
        auto execution_handler = std::make_unique<SimulatedExecutionHandler>(execution_config);

        cerebro.setDataHandler(std::move(data_handler));
        cerebro.setStrategy(std::move(strategy));
        cerebro.setPortfolio(std::move(portfolio));
        cerebro.setExecutionHandler(std::move(execution_handler));

        std::cout << "Running backtest...\n";
        const auto& result = cerebro.run();

        auto end_time = std::chrono::high_resolution_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time).count() / 1000.0;

        printBacktestSummary(options, result, elapsed);

        if (!options.output_file.empty()) {
            writeEquityCurveCsv(options.output_file, result.equity);
            std::cout << "Equity curve saved to: " << options.output_file << "\n";
        }
        return 0;

    } catch (const BacktestException& e) {
        std::cerr << "\nBacktest Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}
