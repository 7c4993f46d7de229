// execution_handler.hpp
// Execution Handler Interface for the Distance-Method Pairs Backtester

#pragma once

#include "../core/event_types.hpp"
#include "../engine/event_queue.hpp"

namespace distbt {

class IPortfolio;

// ============================================================================
// Execution Handler Interface
// ============================================================================

class IExecutionHandler {
public:
    virtual ~IExecutionHandler() = default;
    
    // Accept an order from the strategy
    virtual void executeOrder(const OrderEvent& event) = 0;
    
    // New bar for a symbol
    virtual void updateMarket(const MarketEvent& event) = 0;
    
    // Called once per timestamp after all market events; fills or rejects waiting orders
    virtual void processPendingOrders() = 0;
    
    virtual void initialize() {}
    virtual void shutdown() {}
    
    void setEventQueue(EventQueue* queue) { 
        event_queue_ = queue; 
    }
    
    // Read access to positions and cash for sizing close orders and margin checks
    void setPortfolio(const IPortfolio* portfolio) {
        portfolio_ = portfolio;
    }
    
protected:
    EventQueue* event_queue_ = nullptr;
    const IPortfolio* portfolio_ = nullptr;
    
    void emitNotification(const OrderNotification& notification) {
        if (event_queue_) event_queue_->publish(notification);
    }
};

} // namespace distbt
