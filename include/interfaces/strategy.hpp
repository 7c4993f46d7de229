// strategy.hpp
// Strategy Interface for the Distance-Method Pairs Backtester

#pragma once

#include <string>
#include "../core/event_types.hpp"
#include "../core/position_status.hpp"
#include "../engine/event_queue.hpp"

namespace distbt {

class IDataHandler;
class IPortfolio;

// ============================================================================
// Strategy Interface
// ============================================================================

class IStrategy {
public:
    virtual ~IStrategy() = default;
    
    // Called once per timestamp after all market data and notifications are processed
    virtual void next() = 0;
    virtual void notifyOrder(const OrderNotification& notification) = 0;
    virtual PositionStatus getStatus() const = 0;
    virtual void reset() = 0;
    virtual void initialize() {}
    virtual void stop() {}
    virtual void shutdown() {}
    virtual std::string getName() const { return "UnnamedStrategy"; }
    
    void setEventQueue(EventQueue* queue) { 
        event_queue_ = queue; 
    }
    
    void setDataHandler(const IDataHandler* data) {
        data_ = data;
    }
    
    void setPortfolio(IPortfolio* portfolio) {
        broker_ = portfolio;
    }
    
protected:
    EventQueue* event_queue_ = nullptr;
    const IDataHandler* data_ = nullptr;
    IPortfolio* broker_ = nullptr;
    
    void emitOrder(const OrderEvent& order) {
        if (event_queue_) event_queue_->publish(order);
    }
};

} // namespace distbt
