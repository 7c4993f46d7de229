// commission.hpp
// Per-share commission with a minimum ticket charge and a value-based cap

#pragma once

#include <algorithm>
#include <cmath>

namespace distbt {

struct CommissionScheme {
    double per_share;
    double min_commission;
    double max_pct;          // Cap as fraction of traded value
    
    CommissionScheme()
        : per_share(0.005)
        , min_commission(1.0)
        , max_pct(0.01) {}
    
    static CommissionScheme getDefault() {
        return CommissionScheme();
    }
    
    // The cap is applied last, so it wins over the minimum on tiny tickets.
    double calculate(double price, double quantity) const {
        double qty = std::abs(quantity);
        double per_share_cost = std::max(min_commission, per_share * qty);
        return std::min(per_share_cost, max_pct * std::abs(price) * qty);
    }
};

} // namespace distbt
