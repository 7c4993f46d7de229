// metrics_analyzer.hpp
// Records portfolio value and position status per bar once the pair has enough
// history, then derives value changes, their dispersion and trade statistics

#pragma once

#include <vector>
#include <string>
#include <iostream>
#include <iomanip>
#include "../interfaces/analyzer.hpp"
#include "../core/position_status.hpp"
#include "../core/exceptions.hpp"
#include "../strategies/rolling_statistics.hpp"
#include "trade_segmenter.hpp"

namespace distbt {

class MetricsAnalyzer : public IAnalyzer {
public:
    struct MetricsConfig {
        size_t lookback;   // Bars of both instruments before recording starts

        MetricsConfig() : lookback(10) {}

        static MetricsConfig getDefault() {
            return MetricsConfig();
        }
    };

private:
    MetricsConfig config_;

    std::vector<double> portfolio_values_;
    std::vector<PositionStatus> statuses_;
    std::vector<double> returns_;
    double returns_std_ = 0.0;
    TradeStatistics trade_stats_;
    bool stopped_ = false;

public:
    explicit MetricsAnalyzer(const MetricsConfig& config = MetricsConfig())
        : config_(config) {
        if (config_.lookback == 0) {
            throw ConfigException("metrics lookback must be positive");
        }
    }

    void start() override {
        portfolio_values_.clear();
        statuses_.clear();
        returns_.clear();
        returns_std_ = 0.0;
        trade_stats_ = TradeStatistics{};
        stopped_ = false;
    }

    void next(const BarContext& context) override {
        if (context.min_bars >= config_.lookback) {
            portfolio_values_.push_back(context.portfolio_value);
            statuses_.push_back(context.status);
        }
    }

    void stop() override {
        // Per-bar value changes; the first bar has no predecessor
        returns_.clear();
        RollingStatistics dispersion(RollingStatistics::UNBOUNDED);
        for (size_t i = 1; i < portfolio_values_.size(); ++i) {
            double change = portfolio_values_[i] - portfolio_values_[i - 1];
            returns_.push_back(change);
            dispersion.update(change);
        }
        returns_std_ = dispersion.getStdDev();

        trade_stats_ = segmentTrades(statuses_);
        stopped_ = true;
    }

    std::string getName() const override { return "Metrics"; }

    const std::vector<double>& portfolioValues() const { return portfolio_values_; }
    const std::vector<PositionStatus>& statuses() const { return statuses_; }
    const std::vector<double>& returns() const { return returns_; }
    double returnsStd() const { return returns_std_; }

    const TradeStatistics& tradeStatistics() const {
        if (!stopped_) {
            throw BacktestException("Trade statistics are available after stop()");
        }
        return trade_stats_;
    }

    void printReport(std::ostream& out = std::cout) const {
        const auto& t = tradeStatistics();
        out << "Trade Statistics:\n";
        out << "  Bars Recorded:        " << statuses_.size() << "\n";
        out << "  Trades:               " << t.n_trades << "\n";
        out << "  Resolved Trades:      " << t.n_resolved_trades << "\n";
        out << "  Unresolved Trades:    " << t.n_unresolved_trades << "\n";
        out << "  Avg Holding Period:   " << std::fixed << std::setprecision(2)
            << t.avg_holding_period << " bars\n";
        out << "  Open Trade Length:    " << t.len_unresolved_trade << " bars\n";
        out << "  Value Change Std:     " << std::fixed << std::setprecision(2)
            << returns_std_ << "\n";
    }
};

} // namespace distbt
