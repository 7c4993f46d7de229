// spread_state_machine.hpp
// Distance-method decision logic for one instrument pair
// Owns position status, the open-position record and the spread bands.
// Pure: takes a bar snapshot, returns order intents, never prints or submits.

#pragma once

#include <vector>
#include <optional>
#include <string>
#include <cmath>
#include <algorithm>
#include <limits>
#include "../core/position_status.hpp"
#include "../core/exceptions.hpp"
#include "rolling_statistics.hpp"

namespace distbt {

// ============================================================================
// Strategy Parameters
// ============================================================================

struct DistanceConfig {
    size_t lookback;              // Bars in the spread mean/std window
    size_t max_lookback;          // Bars of both instruments required before acting
    double enter_threshold_size;  // Entry band width in standard deviations
    double exit_threshold_size;   // Exit band width in standard deviations
    double loss_limit;            // Forced exit below this trade return (negative fraction)

    // Output toggles, no effect on decisions
    bool print_bar;
    bool print_msg;
    bool print_transaction;

    DistanceConfig()
        : lookback(84)
        , max_lookback(84)
        , enter_threshold_size(2.0)
        , exit_threshold_size(0.5)
        , loss_limit(-0.015)
        , print_bar(true)
        , print_msg(false)
        , print_transaction(false) {}

    static DistanceConfig getDefault() {
        return DistanceConfig();
    }

    void validate() const {
        if (lookback < 2) {
            throw ConfigException("lookback must be at least 2, got " + std::to_string(lookback));
        }
        if (max_lookback < lookback) {
            throw ConfigException("max_lookback (" + std::to_string(max_lookback) +
                                  ") must not be smaller than lookback (" +
                                  std::to_string(lookback) + ")");
        }
        if (!(enter_threshold_size >= 0.0) || !(exit_threshold_size >= 0.0)) {
            throw ConfigException("threshold sizes must be non-negative");
        }
        if (!(loss_limit < 0.0)) {
            throw ConfigException("loss_limit must be a negative fraction");
        }
    }

    // Exit band inside entry band; not required, but the band invariants rely on it
    bool hasNestedBands() const {
        return exit_threshold_size <= enter_threshold_size;
    }
};

// ============================================================================
// Spread Bands
// ============================================================================

struct SpreadBands {
    double mean = 0.0;
    double std = 0.0;
    double upper_limit = 0.0;
    double lower_limit = 0.0;
    double up_medium = 0.0;
    double low_medium = 0.0;

    static SpreadBands fromMoments(double mean, double std,
                                   double enter_size, double exit_size) {
        SpreadBands bands;
        bands.mean = mean;
        bands.std = std;
        bands.upper_limit = mean + enter_size * std;
        bands.lower_limit = mean - enter_size * std;
        bands.up_medium = mean + exit_size * std;
        bands.low_medium = mean - exit_size * std;
        return bands;
    }

    // Mean and sample std of closes0[i] - closes1[i] over the whole window
    static SpreadBands fromWindows(const std::vector<double>& closes0,
                                   const std::vector<double>& closes1,
                                   double enter_size, double exit_size) {
        if (closes0.size() != closes1.size() || closes0.size() < 2) {
            throw BacktestException("Spread window needs two equal series of at least 2 bars");
        }

        RollingStatistics stats(closes0.size());
        for (size_t i = 0; i < closes0.size(); ++i) {
            stats.update(closes0[i] - closes1[i]);
        }
        return fromMoments(stats.getMean(), stats.getStdDev(), enter_size, exit_size);
    }

    bool isOrdered() const {
        return lower_limit <= low_medium && low_medium <= mean &&
               mean <= up_medium && up_medium <= upper_limit;
    }
};

// ============================================================================
// Open Position
// ============================================================================

// Present only while the pair is not flat
struct OpenPosition {
    PositionStatus side = PositionStatus::Flat;
    int qty0 = 0;                  // Share count of instrument0 (magnitude)
    int qty1 = 0;                  // Share count of instrument1 (magnitude)
    double entry_price0 = 0.0;
    double entry_price1 = 0.0;
    double initial_cash = 0.0;     // Long leg value plus half the short leg value
    double initial_long_pv = 0.0;
    double initial_short_pv = 0.0;
};

inline double longLegValue(double price, int qty) {
    return price * qty;
}

// Short leg marked against 150% collateral posted at entry
inline double shortLegValue(double entry_price, double current_price, int qty) {
    return qty * (1.5 * entry_price - current_price);
}

inline double tradeReturn(const OpenPosition& position, double long_value, double short_value) {
    double net_gain_long = long_value - position.initial_long_pv;
    double net_gain_short = short_value - position.initial_short_pv;
    return (net_gain_long + net_gain_short) / position.initial_cash;
}

inline bool lossLimitBreached(double trade_return, double short_value, double loss_limit) {
    return trade_return < loss_limit || short_value <= 0.0;
}

// ============================================================================
// Decisions
// ============================================================================

struct OrderIntent {
    enum class Action { BUY, SELL, CLOSE };
    size_t leg;      // 0 = instrument0, 1 = instrument1
    Action action;
    int quantity;    // Zero for CLOSE
};

enum class SpreadAction { None, EnterShort, EnterLong, FlipToShort, FlipToLong, Exit, StopLoss };

inline const char* toString(SpreadAction action) {
    switch (action) {
        case SpreadAction::None:        return "NONE";
        case SpreadAction::EnterShort:  return "ENTER_SHORT";
        case SpreadAction::EnterLong:   return "ENTER_LONG";
        case SpreadAction::FlipToShort: return "FLIP_TO_SHORT";
        case SpreadAction::FlipToLong:  return "FLIP_TO_LONG";
        case SpreadAction::Exit:        return "EXIT";
        case SpreadAction::StopLoss:    return "STOP_LOSS";
    }
    return "UNKNOWN";
}

struct SpreadDecision {
    SpreadAction action = SpreadAction::None;
    double spread = 0.0;
    std::vector<OrderIntent> orders;

    bool hasOrders() const { return !orders.empty(); }
};

// Everything the decision needs about the current bar
struct BarSnapshot {
    double price0 = 0.0;
    double price1 = 0.0;
    double portfolio_value = 0.0;
    size_t bars0 = 0;
    size_t bars1 = 0;

    // Last `lookback` closes, oldest first; only read while flat
    std::vector<double> window0;
    std::vector<double> window1;
};

// ============================================================================
// Spread State Machine
// ============================================================================

class SpreadStateMachine {
private:
    DistanceConfig config_;
    PositionStatus status_ = PositionStatus::Flat;
    std::optional<OpenPosition> position_;
    std::optional<SpreadBands> bands_;

    // Shares of one leg bought with two thirds of the portfolio value; 0 if unsizeable
    static int legSize(double portfolio_value, double price) {
        double shares = std::floor((2.0 * portfolio_value / 3.0) / price);
        if (!(shares > 0.0) || shares > static_cast<double>(std::numeric_limits<int>::max())) {
            return 0;
        }
        return static_cast<int>(shares);
    }

    SpreadDecision enter(PositionStatus side, SpreadAction action, const BarSnapshot& bar) {
        SpreadDecision decision;
        decision.spread = bar.price0 - bar.price1;

        int x = legSize(bar.portfolio_value, bar.price0);
        int y = legSize(bar.portfolio_value, bar.price1);
        if (x <= 0 || y <= 0) {
            // A flip that cannot be sized still leaves the old position
            if (position_) {
                return exit(SpreadAction::Exit, decision.spread);
            }
            return decision;
        }

        // Orders also unwind the legs of a position being flipped
        int prior0 = position_ ? position_->qty0 : 0;
        int prior1 = position_ ? position_->qty1 : 0;

        OpenPosition position;
        position.side = side;
        position.qty0 = x;
        position.qty1 = y;
        position.entry_price0 = bar.price0;
        position.entry_price1 = bar.price1;

        if (side == PositionStatus::ShortSpread) {
            decision.orders.push_back({0, OrderIntent::Action::SELL, x + prior0});
            decision.orders.push_back({1, OrderIntent::Action::BUY, y + prior1});
            position.initial_long_pv = longLegValue(bar.price1, y);
            position.initial_short_pv = 0.5 * bar.price0 * x;
        } else {
            decision.orders.push_back({0, OrderIntent::Action::BUY, x + prior0});
            decision.orders.push_back({1, OrderIntent::Action::SELL, y + prior1});
            position.initial_long_pv = longLegValue(bar.price0, x);
            position.initial_short_pv = 0.5 * bar.price1 * y;
        }
        position.initial_cash = position.initial_long_pv + position.initial_short_pv;

        position_ = position;
        status_ = side;
        decision.action = action;
        return decision;
    }

    SpreadDecision exit(SpreadAction action, double spread) {
        SpreadDecision decision;
        decision.spread = spread;
        decision.action = action;
        decision.orders.push_back({0, OrderIntent::Action::CLOSE, 0});
        decision.orders.push_back({1, OrderIntent::Action::CLOSE, 0});

        position_.reset();
        status_ = PositionStatus::Flat;
        return decision;
    }

    bool stopLossTriggered(const BarSnapshot& bar) const {
        const OpenPosition& pos = *position_;
        double long_value, short_value;
        if (pos.side == PositionStatus::ShortSpread) {
            long_value = longLegValue(bar.price1, pos.qty1);
            short_value = shortLegValue(pos.entry_price0, bar.price0, pos.qty0);
        } else {
            long_value = longLegValue(bar.price0, pos.qty0);
            short_value = shortLegValue(pos.entry_price1, bar.price1, pos.qty1);
        }
        return lossLimitBreached(tradeReturn(pos, long_value, short_value),
                                 short_value, config_.loss_limit);
    }

public:
    explicit SpreadStateMachine(const DistanceConfig& config = DistanceConfig())
        : config_(config) {
        config_.validate();
    }

    bool hasEnoughHistory(size_t bars0, size_t bars1) const {
        return std::min(bars0, bars1) >= config_.max_lookback;
    }

    // Bands are refreshed from the snapshot windows whenever the pair starts the bar flat
    bool needsWindows() const {
        return status_ == PositionStatus::Flat;
    }

    SpreadDecision onBar(const BarSnapshot& bar) {
        SpreadDecision decision;
        decision.spread = bar.price0 - bar.price1;

        if (!hasEnoughHistory(bar.bars0, bar.bars1)) {
            return decision;
        }

        if (status_ == PositionStatus::Flat) {
            bands_ = SpreadBands::fromWindows(bar.window0, bar.window1,
                                              config_.enter_threshold_size,
                                              config_.exit_threshold_size);
        }

        const SpreadBands& bands = *bands_;
        const double spread = decision.spread;

        switch (status_) {
            case PositionStatus::Flat:
                if (spread > bands.upper_limit) {
                    return enter(PositionStatus::ShortSpread, SpreadAction::EnterShort, bar);
                }
                if (spread < bands.lower_limit) {
                    return enter(PositionStatus::LongSpread, SpreadAction::EnterLong, bar);
                }
                break;

            case PositionStatus::ShortSpread:
                if (spread < bands.lower_limit) {
                    return enter(PositionStatus::LongSpread, SpreadAction::FlipToLong, bar);
                }
                if (spread < bands.up_medium) {
                    return exit(SpreadAction::Exit, spread);
                }
                if (stopLossTriggered(bar)) {
                    return exit(SpreadAction::StopLoss, spread);
                }
                break;

            case PositionStatus::LongSpread:
                if (spread > bands.upper_limit) {
                    return enter(PositionStatus::ShortSpread, SpreadAction::FlipToShort, bar);
                }
                if (spread > bands.low_medium) {
                    return exit(SpreadAction::Exit, spread);
                }
                if (stopLossTriggered(bar)) {
                    return exit(SpreadAction::StopLoss, spread);
                }
                break;
        }

        return decision;
    }

    void reset() {
        status_ = PositionStatus::Flat;
        position_.reset();
        bands_.reset();
    }

    PositionStatus status() const { return status_; }
    const std::optional<OpenPosition>& position() const { return position_; }
    const std::optional<SpreadBands>& bands() const { return bands_; }
    const DistanceConfig& config() const { return config_; }
};

} // namespace distbt
