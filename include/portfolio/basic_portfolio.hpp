// basic_portfolio.hpp
// Broker bookkeeping for the pairs backtester
// Tracks cash, signed positions and marks them to the latest close

#pragma once

#include <unordered_map>
#include <string>
#include <vector>
#include <chrono>
#include <cmath>
#include <algorithm>
#include "../interfaces/portfolio.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"

namespace distbt {

// ============================================================================
// Basic Portfolio with Position Tracking
// ============================================================================

class BasicPortfolio : public IPortfolio {
public:
    struct PortfolioConfig {
        double initial_capital;
        bool allow_shorting;
        
        PortfolioConfig() 
            : initial_capital(100000.0)
            , allow_shorting(true) {}
            
        static PortfolioConfig getDefault() {
            return PortfolioConfig();
        }
    };
    
    struct Position {
        int quantity = 0;
        double avg_price = 0.0;
        double realized_pnl = 0.0;
        std::chrono::nanoseconds entry_time{0};
        std::chrono::nanoseconds last_update_time{0};
    };
    
    struct PortfolioSnapshot {
        double cash;
        double equity;
        double realized_pnl;
        size_t num_positions;
        std::chrono::nanoseconds timestamp;
    };
    
private:
    double cash_;
    double initial_capital_;
    std::unordered_map<std::string, Position> positions_;
    std::unordered_map<std::string, double> current_prices_;
    
    double total_cash_adjustments_ = 0.0;
    double total_realized_pnl_ = 0.0;
    double max_equity_ = 0.0;
    double max_drawdown_ = 0.0;
    std::vector<PortfolioSnapshot> equity_curve_;
    
    PortfolioConfig config_;
    bool initialized_ = false;
    
    void recordSnapshot(std::chrono::nanoseconds ts) {
        equity_curve_.push_back({cash_, getEquity(), total_realized_pnl_,
                                 positions_.size(), ts});
    }
    
public:
    BasicPortfolio()
        : cash_(PortfolioConfig::getDefault().initial_capital),
          initial_capital_(PortfolioConfig::getDefault().initial_capital),
          config_(PortfolioConfig::getDefault()) {}
    
    explicit BasicPortfolio(const PortfolioConfig& config)
        : cash_(config.initial_capital),
          initial_capital_(config.initial_capital),
          config_(config) {}
    
    // IPortfolio interface implementation
    void initialize(double initial_capital) override {
        if (initialized_) return;
        
        if (initial_capital > 0) {
            initial_capital_ = initial_capital;
            cash_ = initial_capital;
            config_.initial_capital = initial_capital;
        }
        
        max_equity_ = initial_capital_;
        equity_curve_.clear();
        recordSnapshot(std::chrono::nanoseconds(0));
        
        initialized_ = true;
    }
    
    void updateMarket(const MarketEvent& event) override {
        if (!initialized_) {
            throw BacktestException("Portfolio not initialized");
        }
        
        current_prices_[event.symbol] = event.close;
        
        double current_equity = getEquity();
        if (current_equity > max_equity_) {
            max_equity_ = current_equity;
        }
        if (max_equity_ > 0) {
            double drawdown = (max_equity_ - current_equity) / max_equity_;
            if (drawdown > max_drawdown_) {
                max_drawdown_ = drawdown;
            }
        }
    }
    
    // Only completed orders move cash and positions; commission arrives via addCash
    void updateFill(const OrderNotification& event) override {
        if (!initialized_) {
            throw BacktestException("Portfolio not initialized");
        }
        if (event.status != OrderStatus::Completed) {
            return;
        }
        
        int signed_qty = event.is_buy ? event.quantity : -event.quantity;
        if (!config_.allow_shorting && !event.is_buy) {
            int held = getPosition(event.symbol);
            if (held + signed_qty < 0) {
                throw ExecutionException("Short sale of " + event.symbol + " not allowed");
            }
        }
        
        double trade_value = event.quantity * event.price;
        cash_ += event.is_buy ? -trade_value : trade_value;
        
        auto& position = positions_[event.symbol];
        int old_quantity = position.quantity;
        int new_quantity = old_quantity + signed_qty;
        
        // Realized P&L on the reduced part of the position
        if ((old_quantity > 0 && !event.is_buy) || (old_quantity < 0 && event.is_buy)) {
            int closed_quantity = std::min(std::abs(old_quantity), event.quantity);
            double realized = closed_quantity * (event.price - position.avg_price);
            if (old_quantity < 0) realized = -realized;
            
            position.realized_pnl += realized;
            total_realized_pnl_ += realized;
        }
        
        if (new_quantity == 0) {
            positions_.erase(event.symbol);
        } else {
            if (old_quantity == 0 || (old_quantity > 0) != (new_quantity > 0)) {
                // Opened or crossed through zero: basis is this fill
                position.avg_price = event.price;
                position.entry_time = event.timestamp;
            } else if (std::abs(new_quantity) > std::abs(old_quantity)) {
                double old_value = std::abs(old_quantity) * position.avg_price;
                double new_value = event.quantity * event.price;
                position.avg_price = (old_value + new_value) / std::abs(new_quantity);
            }
            
            position.quantity = new_quantity;
            position.last_update_time = event.timestamp;
        }
        
        current_prices_.emplace(event.symbol, event.price);
        recordSnapshot(event.timestamp);
    }
    
    double getEquity() const override {
        double equity = cash_;
        for (const auto& [symbol, position] : positions_) {
            if (position.quantity == 0) continue;
            
            auto price_it = current_prices_.find(symbol);
            if (price_it != current_prices_.end()) {
                equity += position.quantity * price_it->second;
            }
        }
        return equity;
    }
    
    double getCash() const override {
        return cash_;
    }
    
    double getInitialCapital() const override {
        return initial_capital_;
    }
    
    void addCash(double delta) override {
        cash_ += delta;
        total_cash_adjustments_ += delta;
    }
    
    int getPosition(const std::string& symbol) const override {
        auto it = positions_.find(symbol);
        return (it != positions_.end()) ? it->second.quantity : 0;
    }
    
    std::unordered_map<std::string, int> getPositions() const override {
        std::unordered_map<std::string, int> result;
        for (const auto& [symbol, position] : positions_) {
            if (position.quantity != 0) {
                result[symbol] = position.quantity;
            }
        }
        return result;
    }
    
    void shutdown() override {
        initialized_ = false;
    }
    
    void reset() override {
        cash_ = initial_capital_;
        positions_.clear();
        current_prices_.clear();
        total_cash_adjustments_ = 0.0;
        total_realized_pnl_ = 0.0;
        max_equity_ = initial_capital_;
        max_drawdown_ = 0.0;
        equity_curve_.clear();
        
        if (initialized_) {
            recordSnapshot(std::chrono::nanoseconds(0));
        }
    }
    
    double getMaxDrawdown() const { return max_drawdown_; }
    double getTotalCashAdjustments() const { return total_cash_adjustments_; }
    double getTotalRealizedPnL() const { return total_realized_pnl_; }
    
    const std::vector<PortfolioSnapshot>& getEquityCurve() const {
        return equity_curve_;
    }
    
    Position getPositionDetails(const std::string& symbol) const {
        auto it = positions_.find(symbol);
        return (it != positions_.end()) ? it->second : Position{};
    }
};

} // namespace distbt
