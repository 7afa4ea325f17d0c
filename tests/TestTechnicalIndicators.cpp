#include "analytics/IndicatorEngine.h"
#include "analytics/TechnicalIndicators.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace scalpbot;
using analytics::TechnicalIndicators;

static bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

static std::vector<Candle> fromCloses(const std::vector<double>& closes) {
    std::vector<Candle> out;
    TimestampMs ts = 1000;
    for (double c : closes) {
        out.emplace_back("BTCUSDT", c, c, c, c, 10.0, ts);
        ts += 60000;
    }
    return out;
}

static void testPrimitives() {
    // EMA seeded by the first value
    auto ema = TechnicalIndicators::calculateEMAVector({10.0, 20.0}, 3);
    assert(ema.size() == 2);
    assert(near(ema[0], 10.0));
    assert(near(ema[1], 15.0));

    // RSI: no losses -> 100, always inside [0, 100]
    assert(near(TechnicalIndicators::calculateRSI({1, 2, 3, 4, 5, 6}, 5), 100.0));
    assert(near(TechnicalIndicators::calculateRSI({6, 5, 4, 3, 2, 1}, 5), 0.0));
    const double mixed = TechnicalIndicators::calculateRSI({100, 101, 102, 101, 102, 103}, 5);
    assert(near(mixed, 80.0));
    assert(mixed >= 0.0 && mixed <= 100.0);

    // Bollinger uses the sample standard deviation
    std::vector<double> one_to_ten{1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    auto bb = TechnicalIndicators::calculateBollingerBands(one_to_ten, 10.0, 10, 2.0);
    assert(near(bb.middle, 5.5));
    assert(near(bb.upper, 5.5 + 2.0 * std::sqrt(82.5 / 9.0)));
    assert(near(bb.lower, 5.5 - 2.0 * std::sqrt(82.5 / 9.0)));

    assert(near(TechnicalIndicators::calculateMomentum(one_to_ten, 3), 3.0));
    assert(near(TechnicalIndicators::calculateSMA(one_to_ten, 4), 8.5));

    // Volume ratio: last volume over the mean of the previous period
    auto candles = fromCloses({1, 1, 1, 1});
    candles.back().volume = 25.0;
    assert(near(TechnicalIndicators::calculateVolumeRatio(candles, 3), 2.5));
    assert(near(TechnicalIndicators::calculateVolumeRatio(candles, 10), 0.0));

    std::cout << "[TEST] Indicator primitives PASSED" << std::endl;
}

static void testInsufficientData() {
    analytics::IndicatorEngine indicator_engine(engine::IndicatorSettings{});
    // max(3, 7, 5+1, 8, 17, 10, 3+1)
    assert(indicator_engine.requiredCandles() == 17);

    std::vector<double> closes;
    for (int i = 0; i < 16; ++i) closes.push_back(100.0 + i);
    auto snap = indicator_engine.compute(fromCloses(closes));
    assert(!snap.isValid());
    assert(snap.status == analytics::IndicatorStatus::INSUFFICIENT_DATA);
    assert(snap.candle_count == 16);
    assert(snap.ema_short == 0.0 && snap.rsi == 0.0);

    assert(!indicator_engine.compute({}).isValid());
    std::cout << "[TEST] Insufficient data PASSED" << std::endl;
}

static void testLinearScenario() {
    analytics::IndicatorEngine indicator_engine(engine::IndicatorSettings{});

    std::vector<double> closes;
    for (int i = 0; i < 20; ++i) closes.push_back(100.0 + i);
    const auto candles = fromCloses(closes);

    auto snap = indicator_engine.compute(candles);
    assert(snap.isValid());
    assert(snap.close == 119.0);
    assert(snap.timestamp == candles.back().timestamp);
    assert(snap.ema_short > snap.ema_long);
    assert(near(snap.momentum, 3.0));
    assert(snap.rsi > 50.0);
    assert(snap.macd > snap.macd_signal);
    assert(near(snap.bb_mid, 114.5));

    // Purity: same input, same output, input untouched
    auto again = indicator_engine.compute(candles);
    assert(again.ema_short == snap.ema_short);
    assert(again.ema_long == snap.ema_long);
    assert(again.rsi == snap.rsi);
    assert(again.macd == snap.macd && again.macd_signal == snap.macd_signal);
    assert(again.bb_upper == snap.bb_upper && again.bb_lower == snap.bb_lower);
    assert(candles.size() == 20 && candles.back().close == 119.0);

    std::cout << "[TEST] Linear scenario PASSED" << std::endl;
}

static void testZigZagSnapshot() {
    analytics::IndicatorEngine indicator_engine(engine::IndicatorSettings{});

    // +1, +1, -1 staircase: 100, 101, 102, 101, 102, 103, ...
    std::vector<double> closes{100.0};
    const double steps[] = {1.0, 1.0, -1.0};
    for (int i = 0; closes.size() < 17; ++i) closes.push_back(closes.back() + steps[i % 3]);

    auto snap = indicator_engine.compute(fromCloses(closes));
    assert(snap.isValid());
    assert(snap.close == 106.0);
    assert(near(snap.rsi, 60.0));
    assert(near(snap.momentum, 1.0));
    assert(near(snap.bb_mid, 104.5));
    assert(snap.ema_short > snap.ema_long);
    assert(snap.macd > snap.macd_signal);

    std::cout << "[TEST] Zig-zag snapshot PASSED" << std::endl;
}

int main() {
    std::cout << "[TEST] Starting TechnicalIndicators Test..." << std::endl;
    testPrimitives();
    testInsufficientData();
    testLinearScenario();
    testZigZagSnapshot();
    std::cout << "[TEST] TechnicalIndicators PASSED" << std::endl;
    return 0;
}
