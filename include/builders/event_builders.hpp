// event_builders.hpp
// Event Builder Pattern for the Distance-Method Pairs Backtester
// Provides fluent interface for clean event construction with validation

#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"

namespace distbt {

// ============================================================================
// Event Builders for Clean Event Construction
// ============================================================================

class MarketEventBuilder {
private:
    MarketEvent event_;
    inline static uint64_t sequence_counter_ = 1;
    
public:
    MarketEventBuilder& withSymbol(const std::string& symbol) {
        event_.symbol = symbol;
        return *this;
    }
    
    MarketEventBuilder& withOHLC(double o, double h, double l, double c) {
        event_.open = o;
        event_.high = h;
        event_.low = l;
        event_.close = c;
        return *this;
    }
    
    // Flat bar: open == high == low == close
    MarketEventBuilder& withClose(double c) {
        return withOHLC(c, c, c, c);
    }
    
    MarketEventBuilder& withVolume(double vol) {
        event_.volume = vol;
        return *this;
    }
    
    MarketEventBuilder& withTimestamp(std::chrono::nanoseconds ts) {
        event_.timestamp = ts;
        return *this;
    }
    
    MarketEvent build() {
        event_.sequence_id = sequence_counter_++;
        if (!event_.validate()) {
            throw BacktestException("Invalid MarketEvent configuration");
        }
        return event_;
    }
};

class OrderNotificationBuilder {
private:
    OrderNotification event_;
    
public:
    // Mirror the order: same symbol, id and side
    explicit OrderNotificationBuilder(const OrderEvent& order) {
        event_.symbol = order.symbol;
        event_.order_id = order.order_id;
        event_.is_buy = (order.direction == OrderEvent::Direction::BUY);
        event_.quantity = order.quantity;
        event_.timestamp = order.timestamp;
    }
    
    OrderNotificationBuilder& withStatus(OrderStatus status) {
        event_.status = status;
        return *this;
    }
    
    OrderNotificationBuilder& withExecution(int quantity, double price) {
        event_.quantity = quantity;
        event_.price = price;
        return *this;
    }
    
    OrderNotificationBuilder& withTimestamp(std::chrono::nanoseconds ts) {
        event_.timestamp = ts;
        return *this;
    }
    
    OrderNotification build() const {
        return event_;
    }
};

} // namespace distbt
