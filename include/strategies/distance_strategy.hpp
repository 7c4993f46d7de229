// distance_strategy.hpp
// Distance-method pairs trading strategy
// Connects the spread state machine to the engine: pulls bars and portfolio value,
// submits orders, charges commission on fills and holds the pending-order latch

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <unordered_set>
#include <algorithm>
#include <chrono>
#include "../interfaces/strategy.hpp"
#include "../interfaces/data_handler.hpp"
#include "../interfaces/portfolio.hpp"
#include "../core/event_types.hpp"
#include "../core/exceptions.hpp"
#include "../portfolio/commission.hpp"
#include "spread_state_machine.hpp"
#include "strategy_observer.hpp"

namespace distbt {

// ============================================================================
// Distance Strategy
// ============================================================================

class DistanceStrategy : public IStrategy {
public:
    struct StrategyStats {
        uint64_t bars_evaluated = 0;
        uint64_t bars_blocked_by_pending = 0;
        uint64_t orders_submitted = 0;
        uint64_t orders_completed = 0;
        uint64_t orders_rejected = 0;   // Expired, canceled or margin
        uint64_t entries = 0;
        uint64_t flips = 0;
        uint64_t exits = 0;
        uint64_t stop_losses = 0;
        double total_commission = 0.0;
    };

private:
    DistanceConfig config_;
    CommissionScheme commission_;
    std::string strategy_name_;
    std::string symbol0_;
    std::string symbol1_;

    SpreadStateMachine machine_;
    std::unique_ptr<IStrategyObserver> observer_;

    // Orders awaiting a terminal notification; non-empty blocks new decisions
    std::unordered_set<std::string> pending_orders_;
    uint64_t order_id_counter_ = 1;

    StrategyStats stats_;

    std::string generateOrderId() {
        return strategy_name_ + "_" + std::to_string(order_id_counter_++);
    }

    void submit(const OrderIntent& intent, std::chrono::nanoseconds ts) {
        OrderEvent order;
        order.symbol = intent.leg == 0 ? symbol0_ : symbol1_;
        order.order_id = generateOrderId();
        order.strategy_id = strategy_name_;
        order.timestamp = ts;

        switch (intent.action) {
            case OrderIntent::Action::BUY:
                order.direction = OrderEvent::Direction::BUY;
                order.quantity = intent.quantity;
                break;
            case OrderIntent::Action::SELL:
                order.direction = OrderEvent::Direction::SELL;
                order.quantity = intent.quantity;
                break;
            case OrderIntent::Action::CLOSE:
                order.close_position = true;
                break;
        }

        pending_orders_.insert(order.order_id);
        stats_.orders_submitted++;
        emitOrder(order);
    }

    void countDecision(SpreadAction action) {
        switch (action) {
            case SpreadAction::EnterShort:
            case SpreadAction::EnterLong:   stats_.entries++; break;
            case SpreadAction::FlipToShort:
            case SpreadAction::FlipToLong:  stats_.flips++; break;
            case SpreadAction::Exit:        stats_.exits++; break;
            case SpreadAction::StopLoss:    stats_.stop_losses++; break;
            case SpreadAction::None:        break;
        }
    }

    void requireHost() const {
        if (!data_ || !broker_) {
            throw BacktestException("DistanceStrategy needs a data handler and a portfolio");
        }
    }

public:
    DistanceStrategy(const std::string& symbol0, const std::string& symbol1,
                     const DistanceConfig& config = DistanceConfig(),
                     const CommissionScheme& commission = CommissionScheme(),
                     const std::string& name = "Distance")
        : config_(config),
          commission_(commission),
          strategy_name_(name),
          symbol0_(symbol0),
          symbol1_(symbol1),
          machine_(config),
          observer_(std::make_unique<ConsoleObserver>(ConsoleObserver::fromStrategyConfig(config))) {
        if (symbol0_.empty() || symbol1_.empty() || symbol0_ == symbol1_) {
            throw ConfigException("A pair needs two distinct symbols");
        }
    }

    void setObserver(std::unique_ptr<IStrategyObserver> observer) {
        observer_ = observer ? std::move(observer) : std::make_unique<NullObserver>();
    }

    // IStrategy interface implementation
    void initialize() override {
        requireHost();
        auto symbols = data_->getSymbols();
        for (const auto& symbol : {symbol0_, symbol1_}) {
            if (std::find(symbols.begin(), symbols.end(), symbol) == symbols.end()) {
                throw ConfigException("Data handler has no series for " + symbol);
            }
        }
        if (!config_.hasNestedBands()) {
            observer_->onWarning("exit_threshold_size exceeds enter_threshold_size; "
                                 "exit band lies outside the entry band");
        }
    }

    void next() override {
        requireHost();

        size_t bars0 = data_->barCount(symbol0_);
        size_t bars1 = data_->barCount(symbol1_);
        if (!machine_.hasEnoughHistory(bars0, bars1)) {
            return;
        }

        if (!pending_orders_.empty()) {
            stats_.bars_blocked_by_pending++;
            return;
        }

        auto latest0 = data_->getLatestBar(symbol0_);
        auto latest1 = data_->getLatestBar(symbol1_);
        if (!latest0 || !latest1) {
            throw DataException("No current bar for " + symbol0_ + "/" + symbol1_);
        }

        BarSnapshot bar;
        bar.price0 = latest0->close;
        bar.price1 = latest1->close;
        bar.portfolio_value = broker_->getEquity();
        bar.bars0 = bars0;
        bar.bars1 = bars1;
        if (machine_.needsWindows()) {
            bar.window0 = data_->getCloses(symbol0_, config_.lookback);
            bar.window1 = data_->getCloses(symbol1_, config_.lookback);
        }

        stats_.bars_evaluated++;
        SpreadDecision decision = machine_.onBar(bar);
        countDecision(decision.action);

        for (const auto& intent : decision.orders) {
            submit(intent, latest0->timestamp);
        }

        observer_->onDecision(latest0->timestamp, decision, machine_.status());
    }

    void notifyOrder(const OrderNotification& notification) override {
        observer_->onOrderNotification(notification);

        switch (notification.status) {
            case OrderStatus::Submitted:
            case OrderStatus::Accepted:
                return;  // Await further notifications

            case OrderStatus::Completed:
                incurCommission(notification.price, notification.quantity);
                stats_.orders_completed++;
                break;

            case OrderStatus::Expired:
            case OrderStatus::Canceled:
            case OrderStatus::Margin:
                stats_.orders_rejected++;
                break;
        }

        // Allow new orders once every leg has resolved
        pending_orders_.erase(notification.order_id);
    }

    double incurCommission(double price, int quantity) {
        requireHost();
        double commission = commission_.calculate(price, quantity);
        broker_->addCash(-commission);
        stats_.total_commission += commission;
        return commission;
    }

    void stop() override {
        if (broker_) {
            observer_->onStop(broker_->getInitialCapital(), broker_->getEquity());
        }
    }

    void reset() override {
        machine_.reset();
        pending_orders_.clear();
        order_id_counter_ = 1;
        stats_ = StrategyStats{};
    }

    PositionStatus getStatus() const override {
        return machine_.status();
    }

    std::string getName() const override {
        return strategy_name_;
    }

    bool hasPendingOrders() const { return !pending_orders_.empty(); }
    size_t pendingOrderCount() const { return pending_orders_.size(); }
    const SpreadStateMachine& stateMachine() const { return machine_; }
    const StrategyStats& getStats() const { return stats_; }
};

} // namespace distbt
