// test_spread_state_machine.cpp
// Unit tests for the distance-method decision logic: bands, entries, exits,
// flips, stop-loss and the history precondition

#include <iostream>
#include <vector>
#include <random>
#include <cmath>
#include "../include/strategies/spread_state_machine.hpp"
#include "test_reporter.hpp"

using namespace distbt;

// ============================================================================
// Helpers
// ============================================================================

DistanceConfig makeConfig() {
    DistanceConfig config;
    config.lookback = 10;
    config.max_lookback = 10;
    config.print_bar = false;
    return config;
}

// Flat-state snapshot: instrument1 constant, instrument0 = instrument1 + spread.
// The last spread is the current bar.
BarSnapshot flatBar(const std::vector<double>& spreads, double price1 = 50.0,
                    double portfolio_value = 100000.0) {
    BarSnapshot bar;
    for (double s : spreads) {
        bar.window0.push_back(price1 + s);
        bar.window1.push_back(price1);
    }
    bar.price0 = bar.window0.back();
    bar.price1 = price1;
    bar.portfolio_value = portfolio_value;
    bar.bars0 = spreads.size();
    bar.bars1 = spreads.size();
    return bar;
}

// In-position snapshot: no windows are read
BarSnapshot openBar(double price0, double price1, double portfolio_value = 100000.0) {
    BarSnapshot bar;
    bar.price0 = price0;
    bar.price1 = price1;
    bar.portfolio_value = portfolio_value;
    bar.bars0 = 11;
    bar.bars1 = 11;
    return bar;
}

// Nine quiet bars around 1.0 followed by the current spread
std::vector<double> quietThen(double current) {
    return {0.9, 1.1, 0.9, 1.1, 0.9, 1.1, 0.9, 1.1, 0.9, current};
}

// ============================================================================
// Bands
// ============================================================================

void test_band_ordering() {
    auto bands = SpreadBands::fromMoments(0.5, 2.0, 2.0, 0.5);
    require(bands.isOrdered(), "nested thresholds give ordered bands");
    requireNear(bands.upper_limit, 4.5, 1e-12, "upper limit");
    requireNear(bands.low_medium, -0.5, 1e-12, "lower exit band");

    std::mt19937 rng(7);
    std::normal_distribution<> noise(0.0, 1.0);
    for (int trial = 0; trial < 100; ++trial) {
        std::vector<double> w0, w1;
        for (int i = 0; i < 20; ++i) {
            double p1 = 40.0 + noise(rng);
            w1.push_back(p1);
            w0.push_back(p1 + 3.0 + noise(rng));
        }
        auto b = SpreadBands::fromWindows(w0, w1, 2.0, 0.5);
        require(b.isOrdered(), "window bands ordered");
    }

    auto inverted = SpreadBands::fromMoments(0.0, 1.0, 0.5, 2.0);
    require(!inverted.isOrdered(), "exit band wider than entry band is not nested");
}

void test_window_moments() {
    std::vector<double> w0 = {11.0, 12.0, 13.0, 14.0};
    std::vector<double> w1 = {10.0, 10.0, 10.0, 10.0};
    auto bands = SpreadBands::fromWindows(w0, w1, 2.0, 0.5);
    requireNear(bands.mean, 2.5, 1e-12, "spread mean");
    requireNear(bands.std, std::sqrt(5.0 / 3.0), 1e-12, "sample std of spread");

    requireThrows<BacktestException>(
        [] { SpreadBands::fromWindows({1.0, 2.0}, {1.0}, 2.0, 0.5); },
        "mismatched windows");
}

// ============================================================================
// Flat state
// ============================================================================

void test_no_orders_inside_band() {
    SpreadStateMachine machine(makeConfig());
    for (double current : {0.9, 1.1, 1.2, 0.8}) {
        auto decision = machine.onBar(flatBar(quietThen(current)));
        require(decision.action == SpreadAction::None, "no action inside band");
        require(!decision.hasOrders(), "no orders inside band");
        require(machine.status() == PositionStatus::Flat, "still flat");
        require(!machine.position().has_value(), "no open position while flat");
    }
}

void test_enter_short_spread() {
    SpreadStateMachine machine(makeConfig());
    auto decision = machine.onBar(flatBar(quietThen(3.0)));

    require(decision.action == SpreadAction::EnterShort, "spread above upper band enters short");
    require(machine.status() == PositionStatus::ShortSpread, "status short");
    require(decision.orders.size() == 2, "two legs");

    // x = floor(66666.67 / 53), y = floor(66666.67 / 50)
    const auto& sell = decision.orders[0];
    const auto& buy = decision.orders[1];
    require(sell.leg == 0 && sell.action == OrderIntent::Action::SELL && sell.quantity == 1257,
            "sell instrument0");
    require(buy.leg == 1 && buy.action == OrderIntent::Action::BUY && buy.quantity == 1333,
            "buy instrument1");

    require(machine.position().has_value(), "open position recorded");
    const auto& pos = *machine.position();
    require(pos.side == PositionStatus::ShortSpread, "position side");
    require(pos.qty0 == 1257 && pos.qty1 == 1333, "position sizes");
    requireNear(pos.entry_price0, 53.0, 1e-9, "entry price 0");
    requireNear(pos.initial_long_pv, 50.0 * 1333, 1e-9, "long leg value");
    requireNear(pos.initial_short_pv, 0.5 * 53.0 * 1257, 1e-9, "short leg half value");
    requireNear(pos.initial_cash, pos.initial_long_pv + pos.initial_short_pv, 1e-9, "trade capital");
}

void test_enter_long_spread() {
    SpreadStateMachine machine(makeConfig());
    auto decision = machine.onBar(flatBar(quietThen(-1.0)));

    require(decision.action == SpreadAction::EnterLong, "spread below lower band enters long");
    require(machine.status() == PositionStatus::LongSpread, "status long");
    require(decision.orders[0].action == OrderIntent::Action::BUY &&
            decision.orders[0].quantity == 1360, "buy instrument0");
    require(decision.orders[1].action == OrderIntent::Action::SELL &&
            decision.orders[1].quantity == 1333, "sell instrument1");
    requireNear(machine.position()->initial_short_pv, 0.5 * 50.0 * 1333, 1e-9,
                "short leg is instrument1");
}

void test_no_entry_without_capital() {
    SpreadStateMachine machine(makeConfig());
    auto decision = machine.onBar(flatBar(quietThen(3.0), 50.0, 10.0));
    require(decision.action == SpreadAction::None, "cannot afford a share");
    require(!decision.hasOrders(), "no orders");
    require(machine.status() == PositionStatus::Flat, "still flat");
}

void test_history_precondition() {
    SpreadStateMachine machine(makeConfig());
    auto bar = flatBar(quietThen(3.0));
    bar.bars1 = 9;
    auto decision = machine.onBar(bar);
    require(decision.action == SpreadAction::None, "insufficient history is a no-op");
    require(machine.status() == PositionStatus::Flat, "status unchanged");
    require(!machine.bands().has_value(), "bands not computed");
    require(!machine.hasEnoughHistory(10, 9), "needs both instruments");
    require(machine.hasEnoughHistory(10, 12), "enough history");
}

// ============================================================================
// In position
// ============================================================================

void test_exit_clears_position() {
    SpreadStateMachine machine(makeConfig());
    machine.onBar(flatBar(quietThen(3.0)));

    auto decision = machine.onBar(openBar(51.0, 50.0));
    require(decision.action == SpreadAction::Exit, "spread back inside exit band");
    require(machine.status() == PositionStatus::Flat, "flat after exit");
    require(!machine.position().has_value(), "position cleared");
    require(decision.orders.size() == 2, "close both legs");
    for (const auto& order : decision.orders) {
        require(order.action == OrderIntent::Action::CLOSE, "close orders");
    }
}

void test_bands_frozen_while_in_position() {
    SpreadStateMachine machine(makeConfig());
    machine.onBar(flatBar(quietThen(3.0)));
    require(!machine.needsWindows(), "no windows needed in position");
    double mean_at_entry = machine.bands()->mean;

    // Between the exit band and the upper band with a gain on the short leg
    auto decision = machine.onBar(openBar(52.0, 50.0));
    require(decision.action == SpreadAction::None, "hold");
    require(machine.status() == PositionStatus::ShortSpread, "still short");
    requireNear(machine.bands()->mean, mean_at_entry, 0.0, "bands unchanged");
}

void test_flip_nets_prior_legs() {
    SpreadStateMachine machine(makeConfig());
    machine.onBar(flatBar(quietThen(3.0)));

    auto decision = machine.onBar(openBar(49.0, 50.0));
    require(decision.action == SpreadAction::FlipToLong, "spread below lower band flips");
    require(machine.status() == PositionStatus::LongSpread, "status long");
    require(decision.orders[0].action == OrderIntent::Action::BUY &&
            decision.orders[0].quantity == 1360 + 1257, "buy new size plus prior short");
    require(decision.orders[1].action == OrderIntent::Action::SELL &&
            decision.orders[1].quantity == 1333 + 1333, "sell new size plus prior long");

    const auto& pos = *machine.position();
    require(pos.qty0 == 1360 && pos.qty1 == 1333, "position holds the new sizes only");
    requireNear(pos.entry_price0, 49.0, 1e-12, "entry repriced");
}

void test_unsized_flip_exits() {
    SpreadStateMachine machine(makeConfig());
    machine.onBar(flatBar(quietThen(3.0)));

    // Crosses the lower band but 30 of equity cannot buy a share of either leg
    auto decision = machine.onBar(openBar(49.0, 50.0, 30.0));
    require(decision.action == SpreadAction::Exit, "unsized flip closes the old legs");
    require(machine.status() == PositionStatus::Flat, "flat instead of holding the short");
    require(!machine.position().has_value(), "position cleared");
    require(decision.orders.size() == 2, "close both legs");
    for (const auto& order : decision.orders) {
        require(order.action == OrderIntent::Action::CLOSE, "close orders");
    }
}

void test_oversized_leg_not_entered() {
    SpreadStateMachine machine(makeConfig());

    // Two thirds of 1e12 at a one-cent leg is far past the int share range
    auto decision = machine.onBar(flatBar(quietThen(3.0), 0.01, 1e12));
    require(decision.action == SpreadAction::None, "unsizeable entry is skipped");
    require(!decision.hasOrders(), "no orders");
    require(machine.status() == PositionStatus::Flat, "still flat");
}

void test_stop_loss_arithmetic() {
    OpenPosition pos;
    pos.initial_cash = 100000.0;
    pos.initial_long_pv = 50000.0;
    pos.initial_short_pv = 50000.0;

    double r = tradeReturn(pos, 48000.0, 49000.0);
    requireNear(r, -0.03, 1e-12, "trade return");
    require(lossLimitBreached(r, 49000.0, -0.015), "loss limit breached");
    require(!lossLimitBreached(-0.01, 49000.0, -0.015), "small loss holds");
    require(lossLimitBreached(0.02, 0.0, -0.015), "short leg wipeout forces exit");

    requireNear(shortLegValue(10.0, 12.0, 100), 300.0, 1e-12, "150% collateral convention");
    requireNear(longLegValue(12.0, 100), 1200.0, 1e-12, "long leg value");
}

void test_stop_loss_exit() {
    SpreadStateMachine machine(makeConfig());
    machine.onBar(flatBar(quietThen(3.0)));

    // Spread widens further: short leg loses 3771 on ~99960 of trade capital
    auto decision = machine.onBar(openBar(56.0, 50.0));
    require(decision.action == SpreadAction::StopLoss, "loss limit exit");
    require(machine.status() == PositionStatus::Flat, "flat after stop");
    require(!machine.position().has_value(), "position cleared");
}

void test_short_leg_wipeout() {
    SpreadStateMachine machine(makeConfig());
    machine.onBar(flatBar(quietThen(-1.0)));

    // Long leg gain outweighs the loss but instrument1 rose past 150% of entry
    auto decision = machine.onBar(openBar(80.0, 80.0));
    require(decision.action == SpreadAction::StopLoss, "wipeout exit");
    require(machine.status() == PositionStatus::Flat, "flat after wipeout");
}

void test_reset() {
    SpreadStateMachine machine(makeConfig());
    machine.onBar(flatBar(quietThen(3.0)));
    machine.reset();
    require(machine.status() == PositionStatus::Flat, "flat after reset");
    require(!machine.position().has_value() && !machine.bands().has_value(), "state cleared");
}

// ============================================================================
// Configuration
// ============================================================================

void test_config_validation() {
    DistanceConfig config = makeConfig();
    config.lookback = 1;
    requireThrows<ConfigException>([&] { SpreadStateMachine m(config); }, "lookback below 2");

    config = makeConfig();
    config.max_lookback = 5;
    requireThrows<ConfigException>([&] { SpreadStateMachine m(config); }, "max_lookback below lookback");

    config = makeConfig();
    config.loss_limit = 0.0;
    requireThrows<ConfigException>([&] { SpreadStateMachine m(config); }, "non-negative loss limit");

    config = makeConfig();
    config.exit_threshold_size = 3.0;
    require(!config.hasNestedBands(), "exit wider than entry");
    SpreadStateMachine allowed(config);
    require(allowed.status() == PositionStatus::Flat, "non-nested bands still accepted");

    DistanceConfig defaults = DistanceConfig::getDefault();
    require(defaults.lookback == 84 && defaults.max_lookback == 84, "default lookbacks");
    requireNear(defaults.loss_limit, -0.015, 1e-15, "default loss limit");
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== Spread State Machine Tests ===" << std::endl;

    TestReporter reporter;
    reporter.test("Band ordering", test_band_ordering);
    reporter.test("Window moments", test_window_moments);
    reporter.test("No orders inside band", test_no_orders_inside_band);
    reporter.test("Enter short spread", test_enter_short_spread);
    reporter.test("Enter long spread", test_enter_long_spread);
    reporter.test("No entry without capital", test_no_entry_without_capital);
    reporter.test("History precondition", test_history_precondition);
    reporter.test("Exit clears position", test_exit_clears_position);
    reporter.test("Bands frozen in position", test_bands_frozen_while_in_position);
    reporter.test("Flip nets prior legs", test_flip_nets_prior_legs);
    reporter.test("Unsized flip exits", test_unsized_flip_exits);
    reporter.test("Oversized leg not entered", test_oversized_leg_not_entered);
    reporter.test("Stop-loss arithmetic", test_stop_loss_arithmetic);
    reporter.test("Stop-loss exit", test_stop_loss_exit);
    reporter.test("Short leg wipeout", test_short_leg_wipeout);
    reporter.test("Reset", test_reset);
    reporter.test("Config validation", test_config_validation);

    return reporter.report() == 0 ? 0 : 1;
}
