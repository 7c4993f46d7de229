// simulated_execution_handler.hpp
// Simulated Execution Handler for the pairs backtester
// Market orders fill at the next bar's open; no slippage, impact or partial fills

#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <chrono>
#include <cmath>
#include "../interfaces/execution_handler.hpp"
#include "../interfaces/portfolio.hpp"
#include "../builders/event_builders.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"

namespace distbt {

// ============================================================================
// Simulated Execution Handler
// ============================================================================

class SimulatedExecutionHandler : public IExecutionHandler {
public:
    struct ExecutionConfig {
        // Reject buys whose cost exceeds available cash with a Margin status
        bool check_margin;
        
        ExecutionConfig()
            : check_margin(true) {}
        
        static ExecutionConfig getDefault() {
            return ExecutionConfig();
        }
    };
    
    struct ExecutionStats {
        uint64_t total_orders = 0;
        uint64_t filled_orders = 0;
        uint64_t margin_rejections = 0;
        uint64_t canceled_orders = 0;
        double traded_value = 0.0;
    };
    
private:
    ExecutionConfig config_;
    ExecutionStats stats_;
    
    // Accepted orders waiting for the next bar, in submission order
    std::vector<OrderEvent> pending_orders_;
    
    // Latest bar per symbol
    std::unordered_map<std::string, MarketEvent> latest_bars_;
    
    void acknowledge(const OrderEvent& order) {
        emitNotification(OrderNotificationBuilder(order)
                             .withStatus(OrderStatus::Submitted).build());
        emitNotification(OrderNotificationBuilder(order)
                             .withStatus(OrderStatus::Accepted).build());
    }
    
public:
    SimulatedExecutionHandler() : config_(ExecutionConfig::getDefault()) {}
    
    explicit SimulatedExecutionHandler(const ExecutionConfig& config)
        : config_(config) {}
    
    // IExecutionHandler interface implementation
    void executeOrder(const OrderEvent& order) override {
        stats_.total_orders++;
        
        OrderEvent resolved = order;
        if (order.close_position) {
            // Size the close against the position held right now
            int held = portfolio_ ? portfolio_->getPosition(order.symbol) : 0;
            if (held == 0) {
                stats_.canceled_orders++;
                emitNotification(OrderNotificationBuilder(order)
                                     .withStatus(OrderStatus::Canceled).build());
                return;
            }
            resolved.direction = held > 0 ? OrderEvent::Direction::SELL
                                          : OrderEvent::Direction::BUY;
            resolved.quantity = std::abs(held);
        }
        
        if (resolved.quantity <= 0) {
            throw ExecutionException("Order " + order.order_id + " has no size");
        }
        
        acknowledge(resolved);
        pending_orders_.push_back(resolved);
    }
    
    void updateMarket(const MarketEvent& event) override {
        latest_bars_[event.symbol] = event;
    }
    
    void processPendingOrders() override {
        if (pending_orders_.empty()) return;
        
        // Running cash so a sell earlier in the batch funds a later buy
        double available_cash = portfolio_ ? portfolio_->getCash() : 0.0;
        
        std::vector<OrderEvent> waiting;
        for (const auto& order : pending_orders_) {
            auto bar_it = latest_bars_.find(order.symbol);
            if (bar_it == latest_bars_.end() || bar_it->second.timestamp <= order.timestamp) {
                // No bar after submission yet
                waiting.push_back(order);
                continue;
            }
            
            const MarketEvent& bar = bar_it->second;
            bool is_buy = (order.direction == OrderEvent::Direction::BUY);
            double fill_price = bar.open;
            double value = order.quantity * fill_price;
            
            if (is_buy && config_.check_margin && portfolio_ && value > available_cash) {
                stats_.margin_rejections++;
                emitNotification(OrderNotificationBuilder(order)
                                     .withStatus(OrderStatus::Margin)
                                     .withTimestamp(bar.timestamp).build());
                continue;
            }
            
            available_cash += is_buy ? -value : value;
            stats_.filled_orders++;
            stats_.traded_value += value;
            
            emitNotification(OrderNotificationBuilder(order)
                                 .withStatus(OrderStatus::Completed)
                                 .withExecution(order.quantity, fill_price)
                                 .withTimestamp(bar.timestamp).build());
        }
        
        pending_orders_ = std::move(waiting);
    }
    
    void initialize() override {
        stats_ = ExecutionStats{};
        pending_orders_.clear();
        latest_bars_.clear();
    }
    
    void shutdown() override {
        pending_orders_.clear();
    }
    
    const ExecutionStats& getStats() const {
        return stats_;
    }
    
    size_t pendingOrderCount() const {
        return pending_orders_.size();
    }
};

} // namespace distbt
