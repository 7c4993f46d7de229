// analyzer.hpp
// Analyzer Interface: per-bar observers of a finished strategy step

#pragma once

#include <chrono>
#include <string>
#include "../core/position_status.hpp"

namespace distbt {

// What an analyzer sees after the strategy has processed a bar
struct BarContext {
    std::chrono::nanoseconds timestamp{0};
    size_t min_bars = 0;          // Bars available for the shorter of the two instruments
    double portfolio_value = 0.0;
    PositionStatus status = PositionStatus::Flat;
};

class IAnalyzer {
public:
    virtual ~IAnalyzer() = default;
    virtual void start() {}
    virtual void next(const BarContext& context) = 0;
    virtual void stop() {}
    virtual std::string getName() const = 0;
};

} // namespace distbt
