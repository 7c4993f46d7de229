// event_queue.hpp
// FIFO Event Queue for the bar-synchronous engine
// Single consumer, single thread; stamps sequence ids and keeps throughput stats

#pragma once

#include <deque>
#include <optional>
#include <variant>
#include <cstdint>
#include "../core/event_types.hpp"

namespace distbt {

// ============================================================================
// Event Queue
// ============================================================================

class EventQueue {
private:
    std::deque<EventVariant> buffer_;
    
    uint64_t next_sequence_ = 1;
    
    // Performance statistics
    uint64_t total_published_ = 0;
    uint64_t total_consumed_ = 0;
    size_t high_water_mark_ = 0;
    
public:
    EventQueue() = default;
    
    // Non-copyable: components hold a pointer to the engine's queue
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;
    
    // Events published without a sequence id get the next one
    void publish(EventVariant event) {
        std::visit([this](auto& e) {
            if (e.sequence_id == 0) {
                e.sequence_id = next_sequence_;
            }
        }, event);
        next_sequence_++;
        
        buffer_.push_back(std::move(event));
        total_published_++;
        if (buffer_.size() > high_water_mark_) {
            high_water_mark_ = buffer_.size();
        }
    }
    
    // Returns empty optional if no data available
    std::optional<EventVariant> try_consume() {
        if (buffer_.empty()) {
            return std::nullopt;
        }
        EventVariant item = std::move(buffer_.front());
        buffer_.pop_front();
        total_consumed_++;
        return item;
    }
    
    bool empty() const { return buffer_.empty(); }
    size_t size() const { return buffer_.size(); }
    
    void clear() { buffer_.clear(); }
    
    struct QueueStats {
        uint64_t total_published;
        uint64_t total_consumed;
        size_t current_size;
        size_t high_water_mark;
    };
    
    QueueStats getStats() const {
        return {total_published_, total_consumed_, buffer_.size(), high_water_mark_};
    }
    
    void resetStats() {
        total_published_ = 0;
        total_consumed_ = 0;
        high_water_mark_ = buffer_.size();
    }
};

} // namespace distbt
