#pragma once

#include <string>

namespace scalpbot {

using Price = double;
using Volume = double;
using Amount = double;

// Epoch milliseconds
using TimestampMs = long long;

enum class OrderSide { BUY, SELL };

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

inline OrderSide opposite(OrderSide side) {
    return side == OrderSide::BUY ? OrderSide::SELL : OrderSide::BUY;
}

struct Candle {
    std::string symbol;
    double open;
    double high;
    double low;
    double close;
    double volume;
    TimestampMs timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, TimestampMs t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}

    Candle(std::string s, double o, double h, double l, double c, double v, TimestampMs t)
        : symbol(std::move(s)), open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

} // namespace scalpbot
