// data_handler.hpp
// Data Handler Interface for the Distance-Method Pairs Backtester

#pragma once

#include <string>
#include <vector>
#include <optional>
#include "../core/event_types.hpp"
#include "../engine/event_queue.hpp"

namespace distbt {

// ============================================================================
// Data Handler Interface
// ============================================================================

class IDataHandler {
public:
    virtual ~IDataHandler() = default;
    virtual bool hasMoreData() const = 0;
    virtual void updateBars() = 0;
    virtual std::optional<MarketEvent> getLatestBar(const std::string& symbol) const = 0;
    virtual std::vector<std::string> getSymbols() const = 0;
    
    // Number of bars of symbol delivered so far
    virtual size_t barCount(const std::string& symbol) const = 0;
    
    // Last `size` closes ending `ago` bars back from the current one, oldest first
    virtual std::vector<double> getCloses(const std::string& symbol, size_t size, size_t ago = 0) const = 0;
    
    virtual void initialize() {}
    virtual void shutdown() {}
    virtual void reset() {}  // Reset to beginning of data
    
    void setEventQueue(EventQueue* queue) { 
        event_queue_ = queue; 
    }
    
protected:
    EventQueue* event_queue_ = nullptr;
    
    void emitMarket(const MarketEvent& event) {
        if (event_queue_) event_queue_->publish(event);
    }
};

}  // namespace distbt
