// event_types.hpp
// Event Type Definitions for the Distance-Method Pairs Backtester
// Market data, order requests and broker order notifications

#pragma once

#include <chrono>
#include <string>
#include <variant>
#include <cstdint>
#include <type_traits>

namespace distbt {

// ============================================================================
// Base Event
// ============================================================================

struct Event {
    std::chrono::nanoseconds timestamp;
    uint64_t sequence_id;
    
    Event() : timestamp(0), sequence_id(0) {}
    Event(std::chrono::nanoseconds ts, uint64_t seq) 
        : timestamp(ts), sequence_id(seq) {}
    
    virtual ~Event() = default;
    
    virtual bool validate() const { 
        return sequence_id > 0; 
    }
};

// ============================================================================
// Market Event - one bar of one instrument
// ============================================================================

struct MarketEvent : Event {
    std::string symbol;
    double open, high, low, close, volume;
    
    MarketEvent() : Event(), open(0), high(0), low(0), close(0), volume(0) {}
    
    bool validate() const override {
        return Event::validate() && 
               !symbol.empty() && 
               close > 0 && open > 0 &&
               high >= low && 
               high >= open && high >= close &&
               low <= open && low <= close &&
               volume >= 0;
    }
};

// ============================================================================
// Order Event - buy/sell/close request emitted by the strategy
// ============================================================================

struct OrderEvent : Event {
    std::string symbol;
    enum class Direction { BUY, SELL };
    Direction direction;
    int quantity;        // Ignored for close orders, sized by the broker
    bool close_position; // Flatten whatever is held in symbol
    std::string order_id;
    std::string strategy_id;
    
    OrderEvent() : Event(), direction(Direction::BUY), quantity(0),
                   close_position(false) {}
    
    bool validate() const override {
        return Event::validate() && 
               !symbol.empty() && 
               !order_id.empty() &&
               (close_position || quantity > 0);
    }
};

// ============================================================================
// Order Notification - broker feedback on an order's lifecycle
// ============================================================================

enum class OrderStatus { Submitted, Accepted, Completed, Expired, Canceled, Margin };

inline const char* toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::Submitted: return "Submitted";
        case OrderStatus::Accepted:  return "Accepted";
        case OrderStatus::Completed: return "Completed";
        case OrderStatus::Expired:   return "Expired";
        case OrderStatus::Canceled:  return "Canceled";
        case OrderStatus::Margin:    return "Margin";
    }
    return "Unknown";
}

// Submitted/Accepted are informational; everything else ends the order.
inline bool isTerminal(OrderStatus status) {
    return status != OrderStatus::Submitted && status != OrderStatus::Accepted;
}

struct OrderNotification : Event {
    std::string symbol;
    std::string order_id;
    OrderStatus status;
    bool is_buy;
    int quantity;        // Executed size (unsigned), valid when Completed
    double price;        // Executed price, valid when Completed
    
    OrderNotification() : Event(), status(OrderStatus::Submitted),
                          is_buy(true), quantity(0), price(0.0) {}
    
    bool validate() const override {
        if (!Event::validate() || symbol.empty() || order_id.empty()) {
            return false;
        }
        if (status == OrderStatus::Completed) {
            return quantity > 0 && price > 0;
        }
        return true;
    }
};

// ============================================================================
// Event Variant - Type-safe event container
// ============================================================================

using EventVariant = std::variant<MarketEvent, OrderEvent, OrderNotification>;

// ============================================================================
// Event Utility Functions
// ============================================================================

// Get event type name for logging/debugging
inline const char* getEventTypeName(const EventVariant& event) {
    return std::visit([](auto&& arg) -> const char* {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, MarketEvent>) return "MarketEvent";
        else if constexpr (std::is_same_v<T, OrderEvent>) return "OrderEvent";
        else if constexpr (std::is_same_v<T, OrderNotification>) return "OrderNotification";
        else return "UnknownEvent";
    }, event);
}

} // namespace distbt
