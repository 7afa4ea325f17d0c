#include "market/PriceWindow.h"

#include <cassert>
#include <iostream>

using namespace scalpbot;

static Candle candleAt(TimestampMs ts, double close) {
    return Candle("BTCUSDT", close, close, close, close, 1.0, ts);
}

int main() {
    std::cout << "[TEST] Starting PriceWindow Test..." << std::endl;

    // Bounded FIFO
    market::PriceWindow window(5);
    for (int i = 1; i <= 7; ++i) {
        assert(window.append(candleAt(i * 1000, 100.0 + i)) == market::AppendResult::APPENDED);
    }
    assert(window.size() == 5);
    assert(window.capacity() == 5);

    auto snap = window.snapshot();
    assert(snap.front().timestamp == 3000);
    assert(snap.back().timestamp == 7000);
    for (size_t i = 1; i < snap.size(); ++i) {
        assert(snap[i - 1].timestamp < snap[i].timestamp);
    }

    // Stale and duplicate candles leave the window untouched
    assert(window.append(candleAt(7000, 999.0)) == market::AppendResult::STALE);
    assert(window.append(candleAt(2000, 999.0)) == market::AppendResult::STALE);
    assert(window.size() == 5);
    assert(window.latest()->close == 107.0);
    auto closes = window.closes();
    assert(closes.size() == 5);
    assert(closes.front() == 103.0);

    // The snapshot is a copy
    snap.clear();
    assert(window.size() == 5);

    // Capacity 0 is coerced to 1
    market::PriceWindow tiny(0);
    assert(tiny.capacity() == 1);
    assert(!tiny.latest().has_value());
    tiny.append(candleAt(1, 1.0));
    tiny.append(candleAt(2, 2.0));
    assert(tiny.size() == 1);
    assert(tiny.latest()->timestamp == 2);

    std::cout << "[TEST] PriceWindow PASSED" << std::endl;
    return 0;
}
