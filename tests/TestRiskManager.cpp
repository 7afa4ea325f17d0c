#include "risk/RiskManager.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

using namespace scalpbot;

namespace {
// 2024-01-01 10:00:00 UTC (Monday)
constexpr TimestampMs MONDAY_10AM = 1704103200000LL;
constexpr TimestampMs ONE_DAY = 24LL * 60 * 60 * 1000;

bool near(double a, double b, double eps = 1e-9) {
    return std::fabs(a - b) < eps;
}

strategy::Signal makeSignal(const std::string& symbol, double price) {
    strategy::Signal s;
    s.symbol = symbol;
    s.side = OrderSide::BUY;
    s.price = price;
    s.strength = 80.0;
    s.stop_loss = price * 0.993;
    s.take_profit = price * 1.018;
    return s;
}
}

static void testSizing() {
    auto clock = std::make_shared<ManualClock>(MONDAY_10AM);
    engine::RiskSettings settings;
    risk::RiskManager rm(settings, clock);

    assert(near(rm.size(50.0, 49.0, 1000.0), 1.0));
    assert(rm.size(0.0, 49.0, 1000.0) == 0.0);
    assert(rm.size(50.0, 0.0, 1000.0) == 0.0);
    assert(rm.size(50.0, 49.0, -1.0) == 0.0);

    engine::RiskSettings fixed = settings;
    fixed.use_fixed_lot = true;
    fixed.fixed_lot_size = 100.0;
    risk::RiskManager fixed_rm(fixed, clock);
    assert(near(fixed_rm.size(50.0, 49.0, 1000.0), 2.0));

    // default above max is clamped
    engine::RiskSettings clamped = settings;
    clamped.default_position_size = 0.5;
    risk::RiskManager clamped_rm(clamped, clock);
    assert(near(clamped_rm.size(50.0, 49.0, 1000.0), 2.0));

    assert(near(risk::RiskManager::positionRisk(2.0, 100.0, 99.0), 2.0));

    std::cout << "[TEST] Sizing PASSED" << std::endl;
}

static void testAdjustLevels() {
    auto clock = std::make_shared<ManualClock>(MONDAY_10AM);
    engine::RiskSettings settings;
    settings.max_position_loss = 0.02;
    risk::RiskManager rm(settings, clock);

    auto wide = makeSignal("BTCUSDT", 100.0);
    wide.stop_loss = 90.0;
    rm.adjustLevels(wide);
    assert(near(wide.stop_loss, 98.0));

    auto tight = makeSignal("BTCUSDT", 100.0);
    tight.stop_loss = 99.3;
    rm.adjustLevels(tight);
    assert(near(tight.stop_loss, 99.3));

    auto short_wide = makeSignal("BTCUSDT", 100.0);
    short_wide.side = OrderSide::SELL;
    short_wide.stop_loss = 110.0;
    rm.adjustLevels(short_wide);
    assert(near(short_wide.stop_loss, 102.0));

    std::cout << "[TEST] AdjustLevels PASSED" << std::endl;
}

static void testValidationOrder() {
    auto clock = std::make_shared<ManualClock>(MONDAY_10AM);
    engine::RiskSettings settings;
    settings.max_open_positions = 2;
    settings.min_time_between_trades_seconds = 300;
    risk::RiskManager rm(settings, clock);

    auto decision = rm.validate(makeSignal("BTCUSDT", 100.0), 1000.0);
    assert(decision.accepted);
    assert(near(decision.quantity, 0.5));

    // Invalid balance -> no size
    decision = rm.validate(makeSignal("BTCUSDT", 100.0), 0.0);
    assert(!decision.accepted);
    assert(decision.reason == risk::RiskRejectReason::INVALID_SIZE);

    // Trade spacing counts from the last opened position
    assert(rm.reserve(makeSignal("BTCUSDT", 100.0), 1000.0).accepted);
    rm.onPositionOpened("BTCUSDT");
    decision = rm.validate(makeSignal("ETHUSDT", 100.0), 1000.0);
    assert(decision.reason == risk::RiskRejectReason::TRADE_INTERVAL);

    clock->advance(301 * 1000);
    assert(rm.validate(makeSignal("ETHUSDT", 100.0), 1000.0).accepted);

    // Daily loss budget is checked first: 5% of 1000 = 50
    rm.recordResult("BTCUSDT", -50.0, risk::TradeOutcome::LOSS);
    decision = rm.validate(makeSignal("ETHUSDT", 100.0), 1000.0);
    assert(!decision.accepted);
    assert(decision.reason == risk::RiskRejectReason::DAILY_LOSS_LIMIT);

    std::cout << "[TEST] Validation order PASSED" << std::endl;
}

static void testReservations() {
    auto clock = std::make_shared<ManualClock>(MONDAY_10AM);
    engine::RiskSettings settings;
    settings.max_open_positions = 1;
    settings.min_time_between_trades_seconds = 0;
    risk::RiskManager rm(settings, clock);

    assert(rm.reserve(makeSignal("BTCUSDT", 100.0), 1000.0).accepted);

    // The pending reservation already occupies the only slot
    auto decision = rm.reserve(makeSignal("ETHUSDT", 100.0), 1000.0);
    assert(!decision.accepted);
    assert(decision.reason == risk::RiskRejectReason::MAX_OPEN_POSITIONS);

    // Same symbol cannot reserve twice
    decision = rm.reserve(makeSignal("BTCUSDT", 100.0), 1000.0);
    assert(decision.reason == risk::RiskRejectReason::SYMBOL_BUSY);

    // Order failure releases the slot
    rm.cancelReservation("BTCUSDT");
    assert(rm.reserve(makeSignal("ETHUSDT", 100.0), 1000.0).accepted);
    rm.onPositionOpened("ETHUSDT");
    assert(rm.openPositionCount() == 1);

    // Closing releases it as well
    rm.recordResult("ETHUSDT", 1.0, risk::TradeOutcome::WIN);
    assert(rm.openPositionCount() == 0);
    assert(rm.reserve(makeSignal("BTCUSDT", 100.0), 1000.0).accepted);

    std::cout << "[TEST] Reservations PASSED" << std::endl;
}

static void testDailyRollover() {
    auto clock = std::make_shared<ManualClock>(MONDAY_10AM);
    engine::RiskSettings settings;
    risk::RiskManager rm(settings, clock);

    rm.recordResult("BTCUSDT", 2.0, risk::TradeOutcome::WIN);
    rm.recordResult("BTCUSDT", -1.0, risk::TradeOutcome::LOSS);
    auto today = rm.getDailyStats();
    assert(today.date == 20240101);
    assert(today.trade_count == 2);
    assert(near(today.realized_pnl, 1.0));
    assert(today.wins == 1 && today.losses == 1);
    assert(!rm.takeCompletedDay().has_value());

    // Later the same day: no reset
    clock->advance(10LL * 60 * 60 * 1000);  // 20:00
    assert(rm.getDailyStats().trade_count == 2);

    // Next day: reset once, completed day handed out once
    clock->advance(ONE_DAY);
    rm.recordResult("BTCUSDT", 3.0, risk::TradeOutcome::WIN);
    rm.recordResult("BTCUSDT", 3.0, risk::TradeOutcome::WIN);
    auto next = rm.getDailyStats();
    assert(next.date == 20240102);
    assert(next.trade_count == 2);
    assert(near(next.realized_pnl, 6.0));

    auto completed = rm.takeCompletedDay();
    assert(completed.has_value());
    assert(completed->date == 20240101);
    assert(completed->trade_count == 2);
    assert(!rm.takeCompletedDay().has_value());

    // Trading stats span days
    auto stats = rm.getTradingStats();
    assert(stats.total_trades == 4);
    assert(near(stats.win_rate, 75.0));
    assert(near(stats.total_pnl, 7.0));
    assert(near(stats.avg_win, 8.0 / 3.0));
    assert(near(stats.avg_loss, -1.0));

    std::cout << "[TEST] Daily rollover PASSED" << std::endl;
}

static void testAdaptiveSizing() {
    auto clock = std::make_shared<ManualClock>(MONDAY_10AM);
    engine::RiskSettings settings;
    settings.adaptive_sizing = true;
    risk::RiskManager rm(settings, clock);

    rm.recordResult("BTCUSDT", 1.0, risk::TradeOutcome::WIN);
    // 100% win rate -> 0.05 * 1.2
    assert(near(rm.size(50.0, 49.0, 1000.0), 1.2));

    rm.recordResult("BTCUSDT", -1.0, risk::TradeOutcome::LOSS);
    rm.recordResult("BTCUSDT", -1.0, risk::TradeOutcome::LOSS);
    // 33% win rate -> 0.05 * 0.8
    assert(near(rm.size(50.0, 49.0, 1000.0), 0.8));

    std::cout << "[TEST] Adaptive sizing PASSED" << std::endl;
}

static void testHistoryBound() {
    auto clock = std::make_shared<ManualClock>(MONDAY_10AM);
    engine::RiskSettings settings;
    settings.max_trade_history = 3;
    risk::RiskManager rm(settings, clock);

    for (int i = 0; i < 5; ++i) {
        rm.recordResult("BTCUSDT", 1.0, risk::TradeOutcome::WIN);
    }
    assert(rm.getTradingStats().total_trades == 3);
    assert(rm.getDailyStats().trade_count == 5);

    std::cout << "[TEST] History bound PASSED" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting RiskManager Test..." << std::endl;
    testSizing();
    testAdjustLevels();
    testValidationOrder();
    testReservations();
    testDailyRollover();
    testAdaptiveSizing();
    testHistoryBound();
    std::cout << "[TEST] RiskManager PASSED" << std::endl;
    return 0;
}
