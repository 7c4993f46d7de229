// strategy_observer.hpp
// Output sink for strategy activity
// The console implementation prints "<ISO date>, <text>" lines gated by verbosity flags

#pragma once

#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <chrono>
#include <ctime>
#include "../core/event_types.hpp"
#include "../core/position_status.hpp"
#include "spread_state_machine.hpp"

namespace distbt {

// ============================================================================
// Observer Interface
// ============================================================================

class IStrategyObserver {
public:
    virtual ~IStrategyObserver() = default;

    virtual void onDecision(std::chrono::nanoseconds ts, const SpreadDecision& decision,
                            PositionStatus new_status) {}
    virtual void onOrderNotification(const OrderNotification& notification) {}
    virtual void onWarning(const std::string& message) {}
    virtual void onStop(double starting_value, double ending_value) {}
};

// Discards everything
class NullObserver : public IStrategyObserver {};

// ============================================================================
// Console Observer
// ============================================================================

class ConsoleObserver : public IStrategyObserver {
public:
    struct Config {
        bool print_bar = true;           // Progress tick when a run stops
        bool print_msg = false;          // Start/end value banner and decisions
        bool print_transaction = false;  // Fills and rejections
    };

private:
    Config config_;
    std::ostream& out_;

public:
    explicit ConsoleObserver(const Config& config, std::ostream& out = std::cout)
        : config_(config), out_(out) {}

    static Config fromStrategyConfig(const DistanceConfig& config) {
        Config c;
        c.print_bar = config.print_bar;
        c.print_msg = config.print_msg;
        c.print_transaction = config.print_transaction;
        return c;
    }

    static std::string formatTimestamp(std::chrono::nanoseconds ts) {
        std::time_t seconds = static_cast<std::time_t>(
            std::chrono::duration_cast<std::chrono::seconds>(ts).count());
        const std::tm* tm = std::gmtime(&seconds);
        if (!tm) {
            return std::to_string(seconds);
        }
        std::ostringstream ss;
        ss << std::put_time(tm, "%Y-%m-%dT%H:%M:%S");
        return ss.str();
    }

    void log(std::chrono::nanoseconds ts, const std::string& text) {
        out_ << formatTimestamp(ts) << ", " << text << std::endl;
    }

    void onDecision(std::chrono::nanoseconds ts, const SpreadDecision& decision,
                    PositionStatus new_status) override {
        if (!config_.print_msg || decision.action == SpreadAction::None) return;

        std::ostringstream ss;
        ss << toString(decision.action) << " spread=" << std::fixed << std::setprecision(4)
           << decision.spread << " -> " << toString(new_status);
        log(ts, ss.str());
    }

    void onOrderNotification(const OrderNotification& n) override {
        if (!config_.print_transaction) return;

        if (n.status == OrderStatus::Completed) {
            std::ostringstream ss;
            ss << (n.is_buy ? "BUY COMPLETE, " : "SELL COMPLETE, ")
               << std::fixed << std::setprecision(2) << n.price;
            log(n.timestamp, ss.str());
        } else if (isTerminal(n.status)) {
            log(n.timestamp, std::string(toString(n.status)) + " ,");
        }
    }

    void onWarning(const std::string& message) override {
        std::cerr << "Warning: " << message << std::endl;
    }

    void onStop(double starting_value, double ending_value) override {
        if (config_.print_bar) {
            out_ << "-" << std::flush;
        }

        if (config_.print_msg) {
            out_ << '\n' << std::string(50, '=') << '\n';
            out_ << "Starting Value: " << std::fixed << std::setprecision(2) << starting_value << '\n';
            out_ << "Ending   Value: " << std::fixed << std::setprecision(2) << ending_value << '\n';
            out_ << std::string(50, '=') << std::endl;
        }
    }
};

} // namespace distbt
