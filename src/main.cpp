// main.cpp
// Distance-Method Pairs Trading Backtester
// Runs the distance strategy on a synthetic co-moving pair and reports trade statistics

#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <iomanip>
#include <random>
#include <cmath>
#include <algorithm>

// Core engine components
#include "engine/cerebro.hpp"
#include "data/pair_data_handler.hpp"

// Strategy
#include "strategies/distance_strategy.hpp"

// Portfolio and execution
#include "portfolio/basic_portfolio.hpp"
#include "portfolio/commission.hpp"
#include "execution/simulated_execution_handler.hpp"

// Analyzers
#include "analyzers/metrics_analyzer.hpp"

// Utilities
#include "core/exceptions.hpp"

using namespace distbt;

// ============================================================================
// Configuration Structure
// ============================================================================

struct BacktestConfig {
    // Synthetic data configuration
    std::string symbol0 = "ASSET_A";
    std::string symbol1 = "ASSET_B";
    size_t num_bars = 1000;
    unsigned int seed = 42;
    double base_price = 50.0;
    double spread_mean = 2.0;
    double spread_reversion = 0.1;    // OU pull toward the mean per bar
    double spread_volatility = 0.5;

    // Strategy configuration
    DistanceConfig strategy;

    // Portfolio configuration
    double initial_capital = 100000.0;

    // Execution configuration
    bool check_margin = true;

    // Analyzer configuration
    size_t metrics_lookback = 84;

    // Output configuration
    bool verbose = false;
};

// ============================================================================
// Command Line Argument Parser
// ============================================================================

void printUsage(const char* program_name) {
    std::cout << "Distance-Method Pairs Trading Backtester\n";
    std::cout << "========================================\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -l, --lookback BARS      Spread mean/std window (default: 84)\n";
    std::cout << "  -m, --max-lookback BARS  History required before trading (default: 84)\n";
    std::cout << "  -e, --entry SIZE         Entry band in standard deviations (default: 2.0)\n";
    std::cout << "  -x, --exit SIZE          Exit band in standard deviations (default: 0.5)\n";
    std::cout << "  -s, --loss-limit FRAC    Stop-loss trade return, negative (default: -0.015)\n";
    std::cout << "  -c, --capital AMOUNT     Initial capital (default: 100000)\n";
    std::cout << "  -n, --bars NUM           Synthetic bars to generate (default: 1000)\n";
    std::cout << "  -r, --seed NUM           Random seed for the synthetic pair (default: 42)\n";
    std::cout << "  -a, --metrics-lookback N Bars before metrics recording starts (default: 84)\n";
    std::cout << "  --no-margin              Fill buys regardless of available cash\n";
    std::cout << "  --print-msg              Print decisions and start/end values\n";
    std::cout << "  --print-transactions     Print fills and rejections\n";
    std::cout << "  --no-progress            Suppress the progress tick\n";
    std::cout << "  --verbose                Enable verbose output\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " --lookback 60 --max-lookback 60 --print-transactions\n";
    std::cout << "  " << program_name << " -e 2.5 -x 0.3 -n 2000 -r 7\n";
}

bool parseArguments(int argc, char* argv[], BacktestConfig& config) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            return false;
        }
        else if ((arg == "-l" || arg == "--lookback") && i + 1 < argc) {
            config.strategy.lookback = std::stoul(argv[++i]);
        }
        else if ((arg == "-m" || arg == "--max-lookback") && i + 1 < argc) {
            config.strategy.max_lookback = std::stoul(argv[++i]);
        }
        else if ((arg == "-e" || arg == "--entry") && i + 1 < argc) {
            config.strategy.enter_threshold_size = std::stod(argv[++i]);
        }
        else if ((arg == "-x" || arg == "--exit") && i + 1 < argc) {
            config.strategy.exit_threshold_size = std::stod(argv[++i]);
        }
        else if ((arg == "-s" || arg == "--loss-limit") && i + 1 < argc) {
            config.strategy.loss_limit = std::stod(argv[++i]);
        }
        else if ((arg == "-c" || arg == "--capital") && i + 1 < argc) {
            config.initial_capital = std::stod(argv[++i]);
        }
        else if ((arg == "-n" || arg == "--bars") && i + 1 < argc) {
            config.num_bars = std::stoul(argv[++i]);
        }
        else if ((arg == "-r" || arg == "--seed") && i + 1 < argc) {
            config.seed = static_cast<unsigned int>(std::stoul(argv[++i]));
        }
        else if ((arg == "-a" || arg == "--metrics-lookback") && i + 1 < argc) {
            config.metrics_lookback = std::stoul(argv[++i]);
        }
        else if (arg == "--no-margin") {
            config.check_margin = false;
        }
        else if (arg == "--print-msg") {
            config.strategy.print_msg = true;
        }
        else if (arg == "--print-transactions") {
            config.strategy.print_transaction = true;
        }
        else if (arg == "--no-progress") {
            config.strategy.print_bar = false;
        }
        else if (arg == "--verbose") {
            config.verbose = true;
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }

    return true;
}

// ============================================================================
// Synthetic Pair Generation
// ============================================================================

// instrument1 follows a geometric random walk; instrument0 tracks it plus an
// Ornstein-Uhlenbeck spread, so the pair co-moves and the spread mean-reverts
void generateSyntheticPair(const BacktestConfig& config,
                           std::vector<double>& closes0,
                           std::vector<double>& closes1) {
    std::mt19937 rng(config.seed);
    std::normal_distribution<> price_noise(0.0, 0.01);
    std::normal_distribution<> spread_noise(0.0, config.spread_volatility);

    closes0.clear();
    closes1.clear();
    closes0.reserve(config.num_bars);
    closes1.reserve(config.num_bars);

    double price1 = config.base_price;
    double spread = config.spread_mean;

    for (size_t i = 0; i < config.num_bars; ++i) {
        price1 *= std::exp(price_noise(rng));
        spread += config.spread_reversion * (config.spread_mean - spread) + spread_noise(rng);

        // Keep both legs strictly positive
        double price0 = std::max(price1 + spread, 0.01);

        closes0.push_back(price0);
        closes1.push_back(price1);
    }
}

// ============================================================================
// Result Reporting
// ============================================================================

void printBacktestSummary(const BacktestConfig& config,
                          const Cerebro::RunStats& run_stats,
                          const DistanceStrategy::StrategyStats& strategy_stats,
                          const BasicPortfolio& portfolio,
                          double elapsed_seconds) {
    std::cout << "\n";
    std::cout << "==============================================================\n";
    std::cout << "                  BACKTEST RESULTS SUMMARY\n";
    std::cout << "==============================================================\n";
    std::cout << "\n";

    // Configuration summary
    std::cout << "Configuration:\n";
    std::cout << "  Pair:            " << config.symbol0 << " / " << config.symbol1 << "\n";
    std::cout << "  Initial Capital: $" << std::fixed << std::setprecision(2)
              << config.initial_capital << "\n";
    std::cout << "  Lookback:        " << config.strategy.lookback
              << " (max " << config.strategy.max_lookback << ")\n";
    std::cout << "  Entry Band:      " << config.strategy.enter_threshold_size << " std\n";
    std::cout << "  Exit Band:       " << config.strategy.exit_threshold_size << " std\n";
    std::cout << "  Loss Limit:      " << std::setprecision(4) << config.strategy.loss_limit << "\n";
    std::cout << "\n";

    double total_return = (run_stats.final_equity - config.initial_capital) / config.initial_capital;

    std::cout << "Performance:\n";
    std::cout << "  Final Value:     $" << std::fixed << std::setprecision(2)
              << run_stats.final_equity << "\n";
    std::cout << "  Total Return:    " << std::showpos << std::fixed << std::setprecision(2)
              << (total_return * 100.0) << "%\n" << std::noshowpos;
    std::cout << "  Max Drawdown:    " << std::fixed << std::setprecision(2)
              << (portfolio.getMaxDrawdown() * 100.0) << "%\n";
    std::cout << "  Realized P&L:    $" << std::showpos << std::fixed << std::setprecision(2)
              << portfolio.getTotalRealizedPnL() << "\n" << std::noshowpos;
    std::cout << "  Commission Paid: $" << std::fixed << std::setprecision(2)
              << strategy_stats.total_commission << "\n";
    std::cout << "\n";

    std::cout << "Activity:\n";
    std::cout << "  Entries:         " << strategy_stats.entries << "\n";
    std::cout << "  Flips:           " << strategy_stats.flips << "\n";
    std::cout << "  Exits:           " << strategy_stats.exits << "\n";
    std::cout << "  Stop-Loss Exits: " << strategy_stats.stop_losses << "\n";
    std::cout << "  Orders Filled:   " << strategy_stats.orders_completed
              << " / " << strategy_stats.orders_submitted << "\n";
    std::cout << "  Orders Rejected: " << strategy_stats.orders_rejected << "\n";
    std::cout << "\n";

    std::cout << "Execution:\n";
    std::cout << "  Time Elapsed:     " << std::fixed << std::setprecision(3)
              << elapsed_seconds << " seconds\n";
    std::cout << "  Bars Processed:   " << run_stats.bars_processed << "\n";
    std::cout << "  Events Processed: " << run_stats.events_processed << "\n";
    std::cout << "  Dispatch Errors:  " << run_stats.dispatcher_errors << "\n";
    std::cout << "\n";
}

// ============================================================================
// Main Function
// ============================================================================

int main(int argc, char* argv[]) {
    BacktestConfig config;
    if (!parseArguments(argc, argv, config)) {
        printUsage(argv[0]);
        return (argc > 1 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))
               ? 0 : 1;
    }

    if (config.verbose) {
        std::cout << "Loaded configuration:\n";
        std::cout << "  Bars:    " << config.num_bars << "\n";
        std::cout << "  Seed:    " << config.seed << "\n";
        std::cout << "  Capital: $" << config.initial_capital << "\n";
        std::cout << "\n";
    }

    try {
        auto start_time = std::chrono::steady_clock::now();

        Cerebro cerebro;
        cerebro.setInitialCapital(config.initial_capital);

        // Data
        std::vector<double> closes0, closes1;
        generateSyntheticPair(config, closes0, closes1);

        auto data_handler = std::make_unique<PairDataHandler>();
        data_handler->addCloses(config.symbol0, closes0);
        data_handler->addCloses(config.symbol1, closes1);

        if (config.verbose) {
            auto range = data_handler->getDateRange();
            std::cout << "Generated " << data_handler->getTotalBars() << " bars per instrument ("
                      << ConsoleObserver::formatTimestamp(range.first) << " to "
                      << ConsoleObserver::formatTimestamp(range.second) << ")\n";
        }

        // Portfolio and execution
        BasicPortfolio::PortfolioConfig portfolio_config;
        portfolio_config.initial_capital = config.initial_capital;
        auto portfolio = std::make_unique<BasicPortfolio>(portfolio_config);
        BasicPortfolio* portfolio_ptr = portfolio.get();

        SimulatedExecutionHandler::ExecutionConfig exec_config;
        exec_config.check_margin = config.check_margin;
        auto execution_handler = std::make_unique<SimulatedExecutionHandler>(exec_config);

        // Strategy
        auto strategy = std::make_unique<DistanceStrategy>(
            config.symbol0, config.symbol1, config.strategy, CommissionScheme());
        DistanceStrategy* strategy_ptr = strategy.get();

        // Analyzer
        MetricsAnalyzer::MetricsConfig metrics_config;
        metrics_config.lookback = config.metrics_lookback;
        auto metrics = std::make_unique<MetricsAnalyzer>(metrics_config);
        MetricsAnalyzer* metrics_ptr = metrics.get();

        cerebro.setDataHandler(std::move(data_handler));
        cerebro.setPortfolio(std::move(portfolio));
        cerebro.setExecutionHandler(std::move(execution_handler));
        cerebro.setStrategy(std::move(strategy));
        cerebro.addAnalyzer(std::move(metrics));

        if (config.verbose) {
            std::cout << "Running backtest on " << config.num_bars << " bars...\n";
        }

        cerebro.initialize();
        cerebro.run();

        auto end_time = std::chrono::steady_clock::now();
        double elapsed = std::chrono::duration<double>(end_time - start_time).count();

        auto run_stats = cerebro.getStats();
        printBacktestSummary(config, run_stats, strategy_ptr->getStats(), *portfolio_ptr, elapsed);
        metrics_ptr->printReport(std::cout);

        cerebro.shutdown();

    } catch (const ConfigException& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    } catch (const BacktestException& e) {
        std::cerr << "Backtest failed: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
