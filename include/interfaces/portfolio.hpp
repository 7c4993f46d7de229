// portfolio.hpp
// Portfolio (broker bookkeeping) Interface for the Distance-Method Pairs Backtester

#pragma once

#include <string>
#include <unordered_map>

namespace distbt {

// Forward declarations only for types used in interfaces
struct OrderNotification;
struct MarketEvent;

// ============================================================================
// Portfolio Interface (Clean, Dependency-Free)
// ============================================================================

class IPortfolio {
public:
    virtual ~IPortfolio() = default;
    virtual void updateFill(const OrderNotification& event) = 0;
    virtual void updateMarket(const MarketEvent& event) = 0;
    
    // Mark-to-market value: cash plus signed position values
    virtual double getEquity() const = 0;
    virtual double getCash() const = 0;
    virtual double getInitialCapital() const = 0;
    
    // Credit (positive) or debit (negative) cash outside of fills
    virtual void addCash(double delta) = 0;
    
    virtual int getPosition(const std::string& symbol) const = 0;
    virtual std::unordered_map<std::string, int> getPositions() const = 0;
    
    virtual void initialize(double initial_capital) {}
    virtual void shutdown() {}
    virtual void reset() {}
};

} // namespace distbt
