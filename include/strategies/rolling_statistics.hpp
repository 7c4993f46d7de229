// rolling_statistics.hpp
// Rolling window mean / sample standard deviation
// Used for the spread bands and for return dispersion in the metrics analyzer

#pragma once

#include <cmath>
#include <deque>
#include <limits>
#include <algorithm>
#include <cstdint>

namespace distbt {

// ============================================================================
// Rolling Statistics over a fixed-size window
// ============================================================================

class RollingStatistics {
private:
    size_t window_size_;
    std::deque<double> values_;
    
    // Cached statistics for O(1) access
    double sum_ = 0.0;
    double sum_squares_ = 0.0;
    double mean_ = 0.0;
    double variance_ = 0.0;
    double std_dev_ = 0.0;
    
public:
    static constexpr size_t UNBOUNDED = std::numeric_limits<size_t>::max();
    
    explicit RollingStatistics(size_t window_size)
        : window_size_(window_size) {}
    
    void update(double value) {
        values_.push_back(value);
        sum_ += value;
        sum_squares_ += value * value;

        if (values_.size() > window_size_) {
            double old_value = values_.front();
            values_.pop_front();
            sum_ -= old_value;
            sum_squares_ -= old_value * old_value;
        }

        size_t count = values_.size();
        mean_ = count > 0 ? sum_ / static_cast<double>(count) : 0.0;

        if (count > 1) {
            // Sample variance: (sum x^2 - n*mean^2) / (n-1)
            double ss = sum_squares_ - static_cast<double>(count) * mean_ * mean_;
            variance_ = std::max(0.0, ss / static_cast<double>(count - 1));
            std_dev_ = std::sqrt(variance_);
        } else {
            variance_ = 0.0;
            std_dev_ = 0.0;
        }
    }
    
    double getMean() const { return mean_; }
    double getStdDev() const { return std_dev_; }
    size_t getCount() const { return values_.size(); }
    size_t getWindowSize() const { return window_size_; }
    bool isFull() const { return values_.size() >= window_size_; }
    
    void reset() {
        values_.clear();
        sum_ = 0.0;
        sum_squares_ = 0.0;
        mean_ = 0.0;
        variance_ = 0.0;
        std_dev_ = 0.0;
    }
};

} // namespace distbt
