#include "strategy/SignalGenerator.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace scalpbot;

static bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

static analytics::IndicatorSnapshot longSnapshot() {
    analytics::IndicatorSnapshot s;
    s.status = analytics::IndicatorStatus::OK;
    s.close = 106.0;
    s.ema_short = 105.57;
    s.ema_long = 104.95;
    s.rsi = 60.0;
    s.macd = 1.18;
    s.macd_signal = 1.05;
    s.bb_mid = 104.5;
    s.bb_upper = 107.5;
    s.bb_lower = 101.5;
    s.momentum = 1.0;
    return s;
}

static analytics::IndicatorSnapshot shortSnapshot() {
    analytics::IndicatorSnapshot s;
    s.status = analytics::IndicatorStatus::OK;
    s.close = 194.0;
    s.ema_short = 194.43;
    s.ema_long = 195.05;
    s.rsi = 40.0;
    s.macd = -1.18;
    s.macd_signal = -1.05;
    s.bb_mid = 195.5;
    s.momentum = -1.0;
    return s;
}

int main() {
    std::cout << "[TEST] Starting SignalGenerator Test..." << std::endl;

    engine::TradingSettings settings;
    strategy::SignalGenerator generator(settings);

    // 1. LONG with every strength condition satisfied
    auto signal = generator.evaluate("BTCUSDT", longSnapshot(), 106.0, false, 5000);
    assert(signal.has_value());
    assert(signal->side == OrderSide::BUY);
    assert(signal->symbol == "BTCUSDT");
    assert(near(signal->strength, 100.0));
    assert(near(signal->stop_loss, 106.0 * (1.0 - 0.007)));
    assert(near(signal->take_profit, 106.0 * (1.0 + 0.018)));
    assert(signal->generated_at == 5000);

    // 2. Never a signal while a position is open or pending
    assert(!generator.evaluate("BTCUSDT", longSnapshot(), 106.0, true, 5000).has_value());

    // 3. Insufficient snapshot
    analytics::IndicatorSnapshot empty;
    assert(!generator.evaluate("BTCUSDT", empty, 106.0, false, 5000).has_value());

    // 4. SHORT mirrored, stop above entry
    auto short_signal = generator.evaluate("ETHUSDT", shortSnapshot(), 194.0, false, 6000);
    assert(short_signal.has_value());
    assert(short_signal->side == OrderSide::SELL);
    assert(short_signal->stop_loss > 194.0);
    assert(short_signal->take_profit < 194.0);

    // 5. RSI bands: 32 passes the long band but not the short one
    auto low_rsi = longSnapshot();
    low_rsi.rsi = 32.0;
    assert(strategy::SignalGenerator::longConditionsMet(low_rsi, 106.0));
    auto short_low_rsi = shortSnapshot();
    short_low_rsi.rsi = 32.0;
    assert(!strategy::SignalGenerator::shortConditionsMet(short_low_rsi, 194.0));
    auto overbought = longSnapshot();
    overbought.rsi = 80.0;
    assert(!generator.evaluate("BTCUSDT", overbought, 106.0, false, 5000).has_value());

    // 6. Strength threshold: price below ema_short and RSI outside the mid band
    auto weak = longSnapshot();
    weak.rsi = 32.0;
    const double weak_price = 105.0;    // > bb_mid, < ema_short
    const double weak_strength = strategy::SignalGenerator::calculateStrength(weak, weak_price, OrderSide::BUY);
    assert(near(weak_strength, (6.5 - 1.2 - 1.0) / 6.5 * 100.0));

    engine::TradingSettings strict = settings;
    strict.min_signal_strength = 70.0;
    strategy::SignalGenerator strict_generator(strict);
    assert(!strict_generator.evaluate("BTCUSDT", weak, weak_price, false, 5000).has_value());
    assert(generator.evaluate("BTCUSDT", weak, weak_price, false, 5000).has_value());

    // 7. Strength is always within [0, 100]
    for (double rsi = 0.0; rsi <= 100.0; rsi += 12.5) {
        for (double price : {90.0, 104.0, 106.0, 120.0}) {
            auto s = longSnapshot();
            s.rsi = rsi;
            for (OrderSide side : {OrderSide::BUY, OrderSide::SELL}) {
                const double strength = strategy::SignalGenerator::calculateStrength(s, price, side);
                assert(strength >= 0.0 && strength <= 100.0);
            }
        }
    }

    std::cout << "[TEST] SignalGenerator PASSED" << std::endl;
    return 0;
}
