#include "core/adapters/LoggingNotifier.h"
#include "core/adapters/PaperExchange.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace scalpbot;

static bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

int main() {
    std::cout << "[TEST] Starting PaperExchange Test..." << std::endl;

    core::PaperExchange exchange(1000.0);

    // No price yet
    auto rejected = exchange.placeOrder("BTCUSDT", OrderSide::BUY, 1.0);
    assert(!rejected.success);
    assert(!rejected.error.empty());
    assert(!exchange.getCurrentPrice("BTCUSDT").has_value());
    assert(!exchange.placeOrder("BTCUSDT", OrderSide::BUY, 0.0).success);

    exchange.updatePrice("BTCUSDT", 100.0);
    auto buy = exchange.placeOrder("BTCUSDT", OrderSide::BUY, 2.0);
    assert(buy.success);
    assert(buy.fill_price == 100.0);
    assert(!buy.order_id.empty());
    assert(near(exchange.cash(), 800.0));
    assert(near(exchange.holding("BTCUSDT"), 2.0));
    assert(near(*exchange.getBalance(), 1000.0));

    // Equity is marked to market
    exchange.updatePrice("BTCUSDT", 110.0);
    assert(near(*exchange.getBalance(), 1020.0));

    auto sell = exchange.placeOrder("BTCUSDT", OrderSide::SELL, 2.0);
    assert(sell.success);
    assert(sell.order_id != buy.order_id);
    assert(near(exchange.cash(), 1020.0));
    assert(near(exchange.holding("BTCUSDT"), 0.0));

    // Short: sell first, buy back lower
    exchange.updatePrice("ETHUSDT", 50.0);
    assert(exchange.placeOrder("ETHUSDT", OrderSide::SELL, 1.0).success);
    exchange.updatePrice("ETHUSDT", 45.0);
    assert(near(*exchange.getBalance(), 1025.0));
    assert(exchange.placeOrder("ETHUSDT", OrderSide::BUY, 1.0).success);
    assert(near(exchange.cash(), 1025.0));
    assert(exchange.filledOrders() == 4);

    // Fees
    core::PaperExchange with_fee(1000.0, 0.001);
    with_fee.updatePrice("BTCUSDT", 100.0);
    assert(with_fee.placeOrder("BTCUSDT", OrderSide::BUY, 1.0).success);
    assert(near(with_fee.cash(), 899.9));

    // Notifier accepts every event type
    core::LoggingNotifier notifier;
    core::CoreEvent closed;
    closed.type = core::CoreEventType::TRADE_CLOSED;
    closed.symbol = "BTCUSDT";
    closed.payload = {{"side", "BUY"}, {"entry_price", 100.0}, {"exit_price", 110.0},
                      {"quantity", 2.0}, {"pnl", 20.0}, {"reason", "take_profit"}};
    notifier.notify(closed);
    core::CoreEvent error;
    error.type = core::CoreEventType::ERROR;
    error.message = "exit order failed";
    notifier.notify(error);
    assert(notifier.eventCount() == 2);

    std::cout << "[TEST] PaperExchange PASSED" << std::endl;
    return 0;
}
