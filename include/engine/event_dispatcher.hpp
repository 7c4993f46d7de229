// event_dispatcher.hpp
// Event Dispatcher for the Distance-Method Pairs Backtester
// Routes events to components with validation and per-event error handling

#pragma once

#include <exception>
#include <iostream>
#include <cstdint>
#include "../core/event_types.hpp"
#include "../interfaces/strategy.hpp"
#include "../interfaces/portfolio.hpp"
#include "../interfaces/execution_handler.hpp"

namespace distbt {

// ============================================================================
// Event Visitor with Error Handling
// ============================================================================

class EventDispatcher {
private:
    IStrategy* strategy_;
    IPortfolio* portfolio_;
    IExecutionHandler* execution_;
    uint64_t errors_ = 0;
    bool verbose_ = true;
    
    void reportError(const char* event_type, const std::exception& ex) {
        errors_++;
        if (verbose_) {
            std::cerr << "EventDispatcher: " << event_type << " failed: " << ex.what() << std::endl;
        }
    }
    
public:
    EventDispatcher(IStrategy* strat, IPortfolio* port, IExecutionHandler* exec)
        : strategy_(strat), portfolio_(port), execution_(exec) {}
    
    void setVerbose(bool verbose) { verbose_ = verbose; }
    
    void operator()(const MarketEvent& e) {
        try {
            if (!e.validate()) {
                errors_++;
                return;
            }
            if (portfolio_) portfolio_->updateMarket(e);
            if (execution_) execution_->updateMarket(e);
        } catch (const std::exception& ex) {
            reportError("MarketEvent", ex);
        }
    }
    
    void operator()(const OrderEvent& e) {
        try {
            if (!e.validate()) {
                errors_++;
                return;
            }
            if (execution_) execution_->executeOrder(e);
        } catch (const std::exception& ex) {
            reportError("OrderEvent", ex);
        }
    }
    
    void operator()(const OrderNotification& e) {
        try {
            if (!e.validate()) {
                errors_++;
                return;
            }
            if (portfolio_) portfolio_->updateFill(e);
            if (strategy_) strategy_->notifyOrder(e);
        } catch (const std::exception& ex) {
            reportError("OrderNotification", ex);
        }
    }
    
    uint64_t getErrorCount() const {
        return errors_;
    }
};

} // namespace distbt
