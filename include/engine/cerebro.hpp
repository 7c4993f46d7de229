// cerebro.hpp
// Main Engine (Cerebro) for the Distance-Method Pairs Backtester
// Bar-synchronous loop: market data, fills, strategy decision, analyzers

#pragma once

#include <memory>
#include <vector>
#include <chrono>
#include <variant>
#include <limits>
#include <algorithm>
#include <cstdint>
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../interfaces/data_handler.hpp"
#include "../interfaces/strategy.hpp"
#include "../interfaces/portfolio.hpp"
#include "../interfaces/execution_handler.hpp"
#include "../interfaces/analyzer.hpp"
#include "event_queue.hpp"
#include "event_dispatcher.hpp"

namespace distbt {

// ============================================================================
// Main Engine (Cerebro) with Lifecycle Management
// ============================================================================

class Cerebro {
private:
    EventQueue event_queue_;
    std::unique_ptr<IDataHandler> data_handler_;
    std::unique_ptr<IStrategy> strategy_;
    std::unique_ptr<IPortfolio> portfolio_;
    std::unique_ptr<IExecutionHandler> execution_handler_;
    std::vector<std::unique_ptr<IAnalyzer>> analyzers_;
    std::unique_ptr<EventDispatcher> dispatcher_;

    bool running_ = false;
    bool initialized_ = false;
    uint64_t bars_processed_ = 0;
    uint64_t events_processed_ = 0;

    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point end_time_;

    struct Config {
        double initial_capital = 100000.0;
        size_t max_events_per_tick = 1000;  // Prevent infinite loops
        bool verbose_errors = true;
    } config_;

    // Process everything currently queued, including events published while draining
    void drainQueue() {
        size_t events_this_tick = 0;
        while (auto event_opt = event_queue_.try_consume()) {
            if (++events_this_tick > config_.max_events_per_tick) {
                throw BacktestException("More than " + std::to_string(config_.max_events_per_tick) +
                                        " events in a single bar (at " +
                                        getEventTypeName(*event_opt) + ")");
            }
            std::visit(*dispatcher_, *event_opt);
            events_processed_++;
        }
    }

    BarContext makeContext() const {
        BarContext context;
        size_t min_bars = std::numeric_limits<size_t>::max();
        for (const auto& symbol : data_handler_->getSymbols()) {
            min_bars = std::min(min_bars, data_handler_->barCount(symbol));
            if (auto bar = data_handler_->getLatestBar(symbol)) {
                context.timestamp = std::max(context.timestamp, bar->timestamp);
            }
        }
        context.min_bars = (min_bars == std::numeric_limits<size_t>::max()) ? 0 : min_bars;
        context.portfolio_value = portfolio_->getEquity();
        context.status = strategy_->getStatus();
        return context;
    }

public:
    Cerebro() = default;
    ~Cerebro() {
        if (initialized_) {
            shutdown();
        }
    }

    Cerebro(const Cerebro&) = delete;
    Cerebro& operator=(const Cerebro&) = delete;

    // Component injection for modularity
    void setDataHandler(std::unique_ptr<IDataHandler> handler) {
        if (running_) throw BacktestException("Cannot change components while running");
        data_handler_ = std::move(handler);
        if (data_handler_) {
            data_handler_->setEventQueue(&event_queue_);
        }
    }

    void setStrategy(std::unique_ptr<IStrategy> strategy) {
        if (running_) throw BacktestException("Cannot change components while running");
        strategy_ = std::move(strategy);
        if (strategy_) {
            strategy_->setEventQueue(&event_queue_);
        }
    }

    void setPortfolio(std::unique_ptr<IPortfolio> portfolio) {
        if (running_) throw BacktestException("Cannot change components while running");
        portfolio_ = std::move(portfolio);
    }

    void setExecutionHandler(std::unique_ptr<IExecutionHandler> handler) {
        if (running_) throw BacktestException("Cannot change components while running");
        execution_handler_ = std::move(handler);
        if (execution_handler_) {
            execution_handler_->setEventQueue(&event_queue_);
        }
    }

    void addAnalyzer(std::unique_ptr<IAnalyzer> analyzer) {
        if (running_) throw BacktestException("Cannot change components while running");
        if (!analyzer) throw BacktestException("Analyzer must not be null");
        analyzers_.push_back(std::move(analyzer));
    }

    // Configuration
    void setInitialCapital(double capital) {
        if (capital <= 0) throw ConfigException("Initial capital must be positive");
        config_.initial_capital = capital;
    }

    void setMaxEventsPerBar(size_t limit) {
        if (limit == 0) throw ConfigException("Event limit must be positive");
        config_.max_events_per_tick = limit;
    }

    void setVerboseErrors(bool verbose) {
        config_.verbose_errors = verbose;
    }

    // Initialize all components
    void initialize() {
        if (initialized_) return;

        if (!data_handler_ || !strategy_ || !portfolio_ || !execution_handler_) {
            throw BacktestException("All components must be set before initialization");
        }

        // Host access for components that read other components
        strategy_->setDataHandler(data_handler_.get());
        strategy_->setPortfolio(portfolio_.get());
        execution_handler_->setPortfolio(portfolio_.get());

        dispatcher_ = std::make_unique<EventDispatcher>(strategy_.get(), portfolio_.get(),
                                                        execution_handler_.get());
        dispatcher_->setVerbose(config_.verbose_errors);

        // Initialize components in order
        data_handler_->initialize();
        portfolio_->initialize(config_.initial_capital);
        execution_handler_->initialize();
        strategy_->initialize();
        for (auto& analyzer : analyzers_) {
            analyzer->start();
        }

        bars_processed_ = 0;
        events_processed_ = 0;
        event_queue_.clear();
        event_queue_.resetStats();

        initialized_ = true;
    }

    // Shutdown all components
    void shutdown() {
        if (!initialized_) return;

        running_ = false;

        // Shutdown in reverse order
        strategy_->shutdown();
        execution_handler_->shutdown();
        portfolio_->shutdown();
        data_handler_->shutdown();

        initialized_ = false;
    }

    // Main simulation loop, one iteration per timestamp
    void run() {
        if (!initialized_) {
            initialize();
        }

        running_ = true;
        start_time_ = std::chrono::steady_clock::now();

        while (data_handler_->hasMoreData()) {
            // Market events for every instrument of this timestamp
            data_handler_->updateBars();
            drainQueue();

            // Orders from the previous bar fill at this bar's open
            execution_handler_->processPendingOrders();
            drainQueue();

            strategy_->next();
            drainQueue();

            BarContext context = makeContext();
            for (auto& analyzer : analyzers_) {
                analyzer->next(context);
            }

            bars_processed_++;
        }

        strategy_->stop();
        for (auto& analyzer : analyzers_) {
            analyzer->stop();
        }

        end_time_ = std::chrono::steady_clock::now();
        running_ = false;
    }

    struct RunStats {
        uint64_t bars_processed;
        uint64_t events_processed;
        uint64_t dispatcher_errors;
        double runtime_seconds;

        uint64_t queue_publishes;
        size_t queue_high_water_mark;

        double final_equity;
        double final_cash;
    };

    RunStats getStats() const {
        double runtime = std::chrono::duration<double>(end_time_ - start_time_).count();
        auto queue_stats = event_queue_.getStats();

        return {
            bars_processed_,
            events_processed_,
            dispatcher_ ? dispatcher_->getErrorCount() : 0,
            runtime > 0 ? runtime : 0.0,

            queue_stats.total_published,
            queue_stats.high_water_mark,

            portfolio_ ? portfolio_->getEquity() : 0.0,
            portfolio_ ? portfolio_->getCash() : 0.0
        };
    }
};

} // namespace distbt
