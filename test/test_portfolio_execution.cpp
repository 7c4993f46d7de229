// test_portfolio_execution.cpp
// Tests for broker bookkeeping and simulated fills: next-open fills,
// margin rejection, close sizing and equity marking

#include <iostream>
#include <vector>
#include <chrono>
#include <algorithm>
#include "../include/portfolio/basic_portfolio.hpp"
#include "../include/execution/simulated_execution_handler.hpp"
#include "../include/data/pair_data_handler.hpp"
#include "../include/builders/event_builders.hpp"
#include "../include/engine/event_queue.hpp"
#include "test_reporter.hpp"

using namespace distbt;

// ============================================================================
// Helpers
// ============================================================================

constexpr std::chrono::nanoseconds DAY = std::chrono::hours(24);

MarketEvent bar(const std::string& symbol, int day, double open, double close) {
    double high = std::max(open, close);
    double low = std::min(open, close);
    return MarketEventBuilder()
        .withSymbol(symbol)
        .withOHLC(open, high, low, close)
        .withVolume(1000)
        .withTimestamp(DAY * day)
        .build();
}

OrderEvent order(const std::string& symbol, OrderEvent::Direction dir, int qty, int day,
                 const std::string& id) {
    OrderEvent o;
    o.symbol = symbol;
    o.direction = dir;
    o.quantity = qty;
    o.order_id = id;
    o.timestamp = DAY * day;
    return o;
}

OrderEvent closeOrder(const std::string& symbol, int day, const std::string& id) {
    OrderEvent o;
    o.symbol = symbol;
    o.close_position = true;
    o.order_id = id;
    o.timestamp = DAY * day;
    return o;
}

std::vector<OrderNotification> drainNotifications(EventQueue& queue) {
    std::vector<OrderNotification> out;
    while (auto event = queue.try_consume()) {
        if (auto* n = std::get_if<OrderNotification>(&*event)) {
            out.push_back(*n);
        }
    }
    return out;
}

struct BrokerFixture {
    EventQueue queue;
    BasicPortfolio portfolio;
    SimulatedExecutionHandler execution;

    explicit BrokerFixture(double capital = 100000.0) {
        portfolio.initialize(capital);
        execution.setEventQueue(&queue);
        execution.setPortfolio(&portfolio);
        execution.initialize();
    }

    void market(const MarketEvent& e) {
        portfolio.updateMarket(e);
        execution.updateMarket(e);
    }

    // Run the fill step and apply the results to the portfolio
    std::vector<OrderNotification> fill() {
        execution.processPendingOrders();
        auto notifications = drainNotifications(queue);
        for (const auto& n : notifications) {
            portfolio.updateFill(n);
        }
        return notifications;
    }
};

// ============================================================================
// Execution
// ============================================================================

void test_order_acknowledged() {
    BrokerFixture f;
    f.market(bar("A", 1, 10.0, 10.0));
    f.execution.executeOrder(order("A", OrderEvent::Direction::BUY, 10, 1, "o1"));

    auto acks = drainNotifications(f.queue);
    require(acks.size() == 2, "submitted and accepted");
    require(acks[0].status == OrderStatus::Submitted, "submitted first");
    require(acks[1].status == OrderStatus::Accepted, "then accepted");
    require(acks[0].order_id == "o1" && acks[0].is_buy, "mirrors the order");
    require(f.execution.pendingOrderCount() == 1, "queued for the next bar");
}

void test_fill_at_next_open() {
    BrokerFixture f;
    f.market(bar("A", 1, 10.0, 10.0));
    f.execution.executeOrder(order("A", OrderEvent::Direction::BUY, 10, 1, "o1"));
    drainNotifications(f.queue);

    // Same bar: nothing fills
    require(f.fill().empty(), "no fill on the submission bar");

    f.market(bar("A", 2, 11.0, 12.0));
    auto fills = f.fill();
    require(fills.size() == 1 && fills[0].status == OrderStatus::Completed, "filled");
    requireNear(fills[0].price, 11.0, 1e-12, "at the open");
    require(fills[0].quantity == 10, "full size");
    require(fills[0].timestamp == DAY * 2, "stamped with the fill bar");

    requireNear(f.portfolio.getCash(), 100000.0 - 110.0, 1e-9, "cash paid");
    require(f.portfolio.getPosition("A") == 10, "position opened");
    requireNear(f.portfolio.getPositionDetails("A").avg_price, 11.0, 1e-12, "cost basis");

    f.market(bar("A", 2, 11.0, 12.0));
    requireNear(f.portfolio.getEquity(), 100000.0 - 110.0 + 120.0, 1e-9, "marked at close");
    require(f.execution.getStats().filled_orders == 1, "fill counted");
    requireNear(f.execution.getStats().traded_value, 110.0, 1e-9, "traded value");
}

void test_margin_rejection() {
    BrokerFixture f(1000.0);
    f.market(bar("A", 1, 10.0, 10.0));
    f.execution.executeOrder(order("A", OrderEvent::Direction::BUY, 100, 1, "o1"));
    drainNotifications(f.queue);

    f.market(bar("A", 2, 11.0, 11.0));
    auto fills = f.fill();
    require(fills.size() == 1 && fills[0].status == OrderStatus::Margin, "rejected");
    requireNear(f.portfolio.getCash(), 1000.0, 1e-12, "cash untouched");
    require(f.portfolio.getPosition("A") == 0, "no position");
    require(f.execution.getStats().margin_rejections == 1, "rejection counted");
}

void test_margin_check_disabled() {
    EventQueue queue;
    BasicPortfolio portfolio;
    portfolio.initialize(1000.0);
    SimulatedExecutionHandler::ExecutionConfig config;
    config.check_margin = false;
    SimulatedExecutionHandler execution(config);
    execution.setEventQueue(&queue);
    execution.setPortfolio(&portfolio);

    execution.updateMarket(bar("A", 1, 10.0, 10.0));
    execution.executeOrder(order("A", OrderEvent::Direction::BUY, 100, 1, "o1"));
    drainNotifications(queue);
    execution.updateMarket(bar("A", 2, 11.0, 11.0));
    execution.processPendingOrders();
    auto fills = drainNotifications(queue);
    require(fills.size() == 1 && fills[0].status == OrderStatus::Completed, "filled on credit");
}

void test_sell_funds_later_buy() {
    BrokerFixture f(1000.0);
    f.market(bar("A", 1, 10.0, 10.0));
    f.market(bar("B", 1, 12.0, 12.0));
    f.execution.executeOrder(order("A", OrderEvent::Direction::SELL, 100, 1, "o1"));
    f.execution.executeOrder(order("B", OrderEvent::Direction::BUY, 150, 1, "o2"));
    drainNotifications(f.queue);

    f.market(bar("A", 2, 10.0, 10.0));
    f.market(bar("B", 2, 12.0, 12.0));
    auto fills = f.fill();
    require(fills.size() == 2, "both legs resolved");
    require(fills[0].status == OrderStatus::Completed && !fills[0].is_buy, "short sale first");
    require(fills[1].status == OrderStatus::Completed && fills[1].is_buy, "buy funded by the sale");
    require(f.portfolio.getPosition("A") == -100, "short position");
    require(f.portfolio.getPosition("B") == 150, "long position");
    requireNear(f.portfolio.getCash(), 1000.0 + 1000.0 - 1800.0, 1e-9, "net cash");
}

void test_close_orders() {
    BrokerFixture f;
    f.market(bar("A", 1, 10.0, 10.0));

    // Nothing held: canceled immediately
    f.execution.executeOrder(closeOrder("A", 1, "c1"));
    auto canceled = drainNotifications(f.queue);
    require(canceled.size() == 1 && canceled[0].status == OrderStatus::Canceled, "close with no position");
    require(f.execution.pendingOrderCount() == 0, "nothing queued");
    require(f.execution.getStats().canceled_orders == 1, "cancel counted");

    // Build a short position, then close it
    f.execution.executeOrder(order("A", OrderEvent::Direction::SELL, 5, 1, "o1"));
    drainNotifications(f.queue);
    f.market(bar("A", 2, 10.0, 10.0));
    f.fill();
    require(f.portfolio.getPosition("A") == -5, "short 5");

    f.execution.executeOrder(closeOrder("A", 2, "c2"));
    auto acks = drainNotifications(f.queue);
    require(acks.size() == 2 && acks[0].is_buy && acks[0].quantity == 5, "close sized as buy 5");

    f.market(bar("A", 3, 9.0, 9.0));
    auto fills = f.fill();
    require(fills.size() == 1 && fills[0].status == OrderStatus::Completed, "close filled");
    require(f.portfolio.getPosition("A") == 0, "flat");
    requireNear(f.portfolio.getTotalRealizedPnL(), 5.0, 1e-9, "short gained 1 per share");
    require(f.portfolio.getEquityCurve().size() == 3, "initial snapshot plus one per fill");
}

// ============================================================================
// Portfolio
// ============================================================================

void test_portfolio_ignores_non_fills() {
    BasicPortfolio portfolio;
    portfolio.initialize(5000.0);

    OrderEvent o = order("A", OrderEvent::Direction::BUY, 10, 1, "o1");
    for (auto status : {OrderStatus::Submitted, OrderStatus::Accepted, OrderStatus::Margin,
                        OrderStatus::Canceled, OrderStatus::Expired}) {
        portfolio.updateFill(OrderNotificationBuilder(o).withStatus(status).build());
    }
    requireNear(portfolio.getCash(), 5000.0, 1e-12, "cash unchanged");
    require(portfolio.getPositions().empty(), "no positions");
}

void test_cash_adjustments() {
    BasicPortfolio portfolio;
    portfolio.initialize(5000.0);
    portfolio.addCash(-12.5);
    portfolio.addCash(2.5);
    requireNear(portfolio.getCash(), 4990.0, 1e-12, "cash adjusted");
    requireNear(portfolio.getTotalCashAdjustments(), -10.0, 1e-12, "adjustments tracked");
    requireNear(portfolio.getEquity(), 4990.0, 1e-12, "equity follows cash");
    requireNear(portfolio.getInitialCapital(), 5000.0, 1e-12, "initial capital kept");
}

void test_portfolio_requires_initialization() {
    BasicPortfolio portfolio;
    requireThrows<BacktestException>(
        [&] { portfolio.updateMarket(bar("A", 1, 10.0, 10.0)); }, "market before initialize");
}

// ============================================================================
// Data handler
// ============================================================================

void test_pair_data_handler() {
    EventQueue queue;
    PairDataHandler data;
    data.addCloses("A", {10.0, 11.0, 12.0});
    data.addCloses("B", {20.0, 21.0, 22.0});
    data.setEventQueue(&queue);
    data.initialize();

    require(data.barCount("A") == 0 && !data.getLatestBar("A"), "nothing delivered yet");
    require(data.getTotalBars() == 3, "three bars loaded");
    require(data.getDateRange().second - data.getDateRange().first == PairDataHandler::ONE_DAY * 2,
            "daily grid");
    data.updateBars();
    data.updateBars();

    auto first = queue.try_consume();
    require(first && std::get<MarketEvent>(*first).symbol == "A", "registration order");
    require(data.barCount("B") == 2, "two bars delivered");
    requireNear(data.getLatestBar("B")->close, 21.0, 1e-12, "latest close");

    auto closes = data.getCloses("A", 2);
    require(closes.size() == 2 && closes[0] == 10.0 && closes[1] == 11.0, "oldest first");
    auto earlier = data.getCloses("A", 1, 1);
    require(earlier.size() == 1 && earlier[0] == 10.0, "ago offset");
    requireThrows<DataException>([&] { data.getCloses("A", 3); }, "beyond history");
    requireThrows<DataException>([&] { data.barCount("Z"); }, "unknown symbol");
}

void test_pair_data_validation() {
    PairDataHandler uneven;
    uneven.addCloses("A", {1.0, 2.0});
    uneven.addCloses("B", {1.0});
    requireThrows<DataException>([&] { uneven.initialize(); }, "unequal lengths");

    PairDataHandler single;
    single.addCloses("A", {1.0, 2.0});
    requireThrows<DataException>([&] { single.initialize(); }, "one instrument");

    PairDataHandler crowded;
    crowded.addCloses("A", {1.0});
    crowded.addCloses("B", {1.0});
    requireThrows<DataException>([&] { crowded.addCloses("C", {1.0}); }, "third instrument");

    PairDataHandler bad;
    requireThrows<DataException>([&] { bad.addCloses("A", {1.0, -2.0}); }, "negative price");
}

// ============================================================================
// Main
// ============================================================================

int main() {
    std::cout << "=== Portfolio and Execution Tests ===" << std::endl;

    TestReporter reporter;
    reporter.test("Order acknowledged", test_order_acknowledged);
    reporter.test("Fill at next open", test_fill_at_next_open);
    reporter.test("Margin rejection", test_margin_rejection);
    reporter.test("Margin check disabled", test_margin_check_disabled);
    reporter.test("Sell funds later buy", test_sell_funds_later_buy);
    reporter.test("Close orders", test_close_orders);
    reporter.test("Portfolio ignores non-fills", test_portfolio_ignores_non_fills);
    reporter.test("Cash adjustments", test_cash_adjustments);
    reporter.test("Portfolio requires initialization", test_portfolio_requires_initialization);
    reporter.test("Pair data handler", test_pair_data_handler);
    reporter.test("Pair data validation", test_pair_data_validation);

    return reporter.report() == 0 ? 0 : 1;
}
