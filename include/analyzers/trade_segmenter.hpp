// trade_segmenter.hpp
// Infers trade episodes from a per-bar position status series
// A run is a maximal stretch of bars with the same non-flat status

#pragma once

#include <vector>
#include <cstdint>
#include <string>
#include "../core/position_status.hpp"
#include "../core/exceptions.hpp"

namespace distbt {

struct TradeStatistics {
    int64_t n_trades = 0;
    int64_t n_resolved_trades = 0;
    int64_t n_unresolved_trades = 0;   // 1 when the series ends inside a run
    double avg_holding_period = -1.0;  // Mean length of closed runs, -1 if none
    int64_t len_unresolved_trade = -1; // Length of the open run, -1 if none
    
    bool operator==(const TradeStatistics& other) const {
        return n_trades == other.n_trades &&
               n_resolved_trades == other.n_resolved_trades &&
               n_unresolved_trades == other.n_unresolved_trades &&
               avg_holding_period == other.avg_holding_period &&
               len_unresolved_trade == other.len_unresolved_trade;
    }
    bool operator!=(const TradeStatistics& other) const { return !(*this == other); }
};

// Single left-to-right scan. A change of status closes the current run; a direct
// ShortSpread <-> LongSpread flip closes one run and opens the next on the same bar.
inline TradeStatistics segmentTrades(const std::vector<PositionStatus>& statuses) {
    int64_t n = 0;
    double mean = 0.0;
    int64_t run_length = 0;
    PositionStatus current = PositionStatus::Flat;
    
    for (PositionStatus status : statuses) {
        if (current == PositionStatus::Flat) {
            if (status == PositionStatus::Flat) {
                continue;
            }
            current = status;
            run_length = 1;
        } else if (status != current) {
            mean = (n * mean + run_length) / static_cast<double>(n + 1);
            n++;
            run_length = 1;
            current = status;
        } else {
            run_length++;
        }
    }
    
    TradeStatistics stats;
    stats.n_resolved_trades = n;
    stats.n_unresolved_trades = (current == PositionStatus::Flat) ? 0 : 1;
    stats.n_trades = stats.n_resolved_trades + stats.n_unresolved_trades;
    stats.avg_holding_period = (n > 0) ? mean : -1.0;
    stats.len_unresolved_trade = (stats.n_unresolved_trades == 1) ? run_length : -1;
    return stats;
}

// Same scan over the raw 0/1/2 encoding; other values are rejected
inline TradeStatistics segmentTrades(const std::vector<int>& statuses) {
    std::vector<PositionStatus> typed;
    typed.reserve(statuses.size());
    for (int s : statuses) {
        if (s < 0 || s > 2) {
            throw DataException("Invalid position status " + std::to_string(s));
        }
        typed.push_back(static_cast<PositionStatus>(s));
    }
    return segmentTrades(typed);
}

} // namespace distbt
