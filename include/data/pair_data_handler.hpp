// pair_data_handler.hpp
// In-memory Data Handler for an aligned instrument pair
// Replays two bar series in lockstep, one timestamp per updateBars() call

#pragma once

#include <vector>
#include <string>
#include <unordered_map>
#include <optional>
#include <chrono>
#include <algorithm>
#include "../interfaces/data_handler.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"

namespace distbt {

// ============================================================================
// Pair Data Handler
// ============================================================================

class PairDataHandler : public IDataHandler {
public:
    struct Bar {
        std::chrono::nanoseconds timestamp{0};
        double open = 0.0, high = 0.0, low = 0.0, close = 0.0, volume = 0.0;
        
        bool validate() const {
            return close > 0 && open > 0 &&
                   high >= low && 
                   high >= open && high >= close &&
                   low <= open && low <= close &&
                   volume >= 0;
        }
    };
    
    static constexpr std::chrono::nanoseconds ONE_DAY = std::chrono::hours(24);
    
private:
    // Registration order defines instrument0 and instrument1
    std::vector<std::string> symbols_;
    std::unordered_map<std::string, std::vector<Bar>> symbol_data_;
    
    size_t current_index_ = 0;   // Bars delivered per symbol
    bool initialized_ = false;
    
    const std::vector<Bar>& barsOf(const std::string& symbol) const {
        auto it = symbol_data_.find(symbol);
        if (it == symbol_data_.end()) {
            throw DataException("Unknown symbol: " + symbol);
        }
        return it->second;
    }
    
    MarketEvent toEvent(const std::string& symbol, const Bar& bar) const {
        MarketEvent event;
        event.symbol = symbol;
        event.timestamp = bar.timestamp;
        event.open = bar.open;
        event.high = bar.high;
        event.low = bar.low;
        event.close = bar.close;
        event.volume = bar.volume;
        return event;
    }
    
public:
    PairDataHandler() = default;
    
    void addSeries(const std::string& symbol, std::vector<Bar> bars) {
        if (initialized_) {
            throw DataException("Cannot load data after initialization");
        }
        if (symbol_data_.count(symbol)) {
            throw DataException("Duplicate symbol: " + symbol);
        }
        if (symbols_.size() == 2) {
            throw DataException("A pair holds exactly two instruments");
        }
        if (bars.empty()) {
            throw DataException("No bars for symbol: " + symbol);
        }
        
        for (size_t i = 0; i < bars.size(); ++i) {
            if (!bars[i].validate()) {
                throw DataException("Invalid bar " + std::to_string(i) + " for " + symbol);
            }
        }
        
        // Ensure chronological order
        std::stable_sort(bars.begin(), bars.end(),
                         [](const Bar& a, const Bar& b) {
                             return a.timestamp < b.timestamp;
                         });
        
        symbols_.push_back(symbol);
        symbol_data_[symbol] = std::move(bars);
    }
    
    // Close-only series on a daily grid; open/high/low equal the close
    void addCloses(const std::string& symbol, const std::vector<double>& closes,
                   std::chrono::nanoseconds start = std::chrono::nanoseconds(0),
                   std::chrono::nanoseconds step = ONE_DAY) {
        std::vector<Bar> bars;
        bars.reserve(closes.size());
        for (size_t i = 0; i < closes.size(); ++i) {
            Bar bar;
            bar.timestamp = start + step * static_cast<int64_t>(i);
            bar.open = bar.high = bar.low = bar.close = closes[i];
            bar.volume = 0.0;
            bars.push_back(bar);
        }
        addSeries(symbol, std::move(bars));
    }
    
    // IDataHandler interface implementation
    void initialize() override {
        if (initialized_) return;
        
        if (symbols_.size() != 2) {
            throw DataException("Pair data handler needs two instruments, got " +
                                std::to_string(symbols_.size()));
        }
        
        const auto& bars0 = symbol_data_.at(symbols_[0]);
        const auto& bars1 = symbol_data_.at(symbols_[1]);
        if (bars0.size() != bars1.size()) {
            throw DataException("Series lengths differ: " + std::to_string(bars0.size()) +
                                " vs " + std::to_string(bars1.size()));
        }
        for (size_t i = 0; i < bars0.size(); ++i) {
            if (bars0[i].timestamp != bars1[i].timestamp) {
                throw DataException("Series misaligned at bar " + std::to_string(i));
            }
        }
        
        current_index_ = 0;
        initialized_ = true;
    }
    
    bool hasMoreData() const override {
        if (symbols_.empty()) return false;
        return current_index_ < symbol_data_.at(symbols_[0]).size();
    }
    
    void updateBars() override {
        if (!initialized_) {
            throw DataException("Data handler not initialized");
        }
        if (!hasMoreData()) {
            return;
        }
        
        for (const auto& symbol : symbols_) {
            const auto& bar = symbol_data_.at(symbol)[current_index_];
            emitMarket(toEvent(symbol, bar));
        }
        
        current_index_++;
    }
    
    std::optional<MarketEvent> getLatestBar(const std::string& symbol) const override {
        const auto& bars = barsOf(symbol);
        if (current_index_ == 0) {
            return std::nullopt;
        }
        return toEvent(symbol, bars[current_index_ - 1]);
    }
    
    std::vector<std::string> getSymbols() const override {
        return symbols_;
    }
    
    size_t barCount(const std::string& symbol) const override {
        barsOf(symbol);
        return current_index_;
    }
    
    std::vector<double> getCloses(const std::string& symbol, size_t size, size_t ago = 0) const override {
        const auto& bars = barsOf(symbol);
        if (size + ago > current_index_) {
            throw DataException("Requested " + std::to_string(size) + " bars " +
                                std::to_string(ago) + " ago for " + symbol + ", only " +
                                std::to_string(current_index_) + " available");
        }
        
        size_t end = current_index_ - ago;
        std::vector<double> closes;
        closes.reserve(size);
        for (size_t i = end - size; i < end; ++i) {
            closes.push_back(bars[i].close);
        }
        return closes;
    }
    
    void shutdown() override {
        initialized_ = false;
    }
    
    void reset() override {
        current_index_ = 0;
    }
    
    size_t getTotalBars() const {
        return symbols_.empty() ? 0 : symbol_data_.at(symbols_[0]).size();
    }
    
    std::pair<std::chrono::nanoseconds, std::chrono::nanoseconds> getDateRange() const {
        if (symbols_.empty()) {
            return {std::chrono::nanoseconds(0), std::chrono::nanoseconds(0)};
        }
        const auto& bars = symbol_data_.at(symbols_[0]);
        return {bars.front().timestamp, bars.back().timestamp};
    }
};

} // namespace distbt
