#include "strategy/SignalGenerator.h"
#include "common/Logger.h"

#include <algorithm>
#include <array>

namespace scalpbot {
namespace strategy {

namespace {
constexpr double LONG_RSI_MIN = 30.0;
constexpr double SHORT_RSI_MIN = 35.0;
constexpr double RSI_MAX = 65.0;
constexpr double MID_BAND_MIN = 35.0;

// price vs ema_short, ema cross, rsi mid-band, macd relation, price vs bb mid, momentum
constexpr std::array<double, 6> STRENGTH_WEIGHTS{1.2, 1.2, 1.0, 1.1, 1.0, 1.0};
}

SignalGenerator::SignalGenerator(const engine::TradingSettings& settings)
    : settings_(settings)
{}

double SignalGenerator::calculateStrength(
    const analytics::IndicatorSnapshot& s,
    double price,
    OrderSide side
) {
    if (!s.isValid()) return 0.0;

    const bool is_long = (side == OrderSide::BUY);
    const std::array<bool, 6> conditions{
        is_long ? price > s.ema_short : price < s.ema_short,
        is_long ? s.ema_short > s.ema_long : s.ema_short < s.ema_long,
        s.rsi > MID_BAND_MIN && s.rsi < RSI_MAX,
        is_long ? s.macd > s.macd_signal : s.macd < s.macd_signal,
        is_long ? price > s.bb_mid : price < s.bb_mid,
        is_long ? s.momentum > 0.0 : s.momentum < 0.0
    };

    double weighted_sum = 0.0;
    double max_weighted_sum = 0.0;
    for (size_t i = 0; i < conditions.size(); ++i) {
        if (conditions[i]) weighted_sum += STRENGTH_WEIGHTS[i];
        max_weighted_sum += STRENGTH_WEIGHTS[i];
    }

    return std::clamp(weighted_sum / max_weighted_sum * 100.0, 0.0, 100.0);
}

bool SignalGenerator::longConditionsMet(const analytics::IndicatorSnapshot& s, double price) {
    return s.isValid() &&
           s.ema_short > s.ema_long &&
           s.rsi > LONG_RSI_MIN && s.rsi < RSI_MAX &&
           s.macd > s.macd_signal &&
           price > s.bb_mid &&
           s.momentum > 0.0;
}

bool SignalGenerator::shortConditionsMet(const analytics::IndicatorSnapshot& s, double price) {
    return s.isValid() &&
           s.ema_short < s.ema_long &&
           s.rsi > SHORT_RSI_MIN && s.rsi < RSI_MAX &&
           s.macd < s.macd_signal &&
           price < s.bb_mid &&
           s.momentum < 0.0;
}

double SignalGenerator::proposeStopLoss(double entry_price, OrderSide side) const {
    const double pct = settings_.stop_loss_percent / 100.0;
    return side == OrderSide::BUY ? entry_price * (1.0 - pct) : entry_price * (1.0 + pct);
}

double SignalGenerator::proposeTakeProfit(double entry_price, OrderSide side) const {
    const double pct = settings_.take_profit_percent / 100.0;
    return side == OrderSide::BUY ? entry_price * (1.0 + pct) : entry_price * (1.0 - pct);
}

std::optional<Signal> SignalGenerator::evaluate(
    const std::string& symbol,
    const analytics::IndicatorSnapshot& snapshot,
    double current_price,
    bool has_open_position,
    TimestampMs now_ms
) const {
    if (has_open_position) {
        LOG_DEBUG("{} skip signal evaluation: position already active", symbol);
        return std::nullopt;
    }
    if (!snapshot.isValid() || current_price <= 0.0) {
        return std::nullopt;
    }

    std::optional<OrderSide> side;
    double strength = 0.0;

    if (longConditionsMet(snapshot, current_price)) {
        strength = calculateStrength(snapshot, current_price, OrderSide::BUY);
        if (strength >= settings_.min_signal_strength) side = OrderSide::BUY;
    }
    if (!side && shortConditionsMet(snapshot, current_price)) {
        strength = calculateStrength(snapshot, current_price, OrderSide::SELL);
        if (strength >= settings_.min_signal_strength) side = OrderSide::SELL;
    }

    LOG_DEBUG("{} ema {:.6f}/{:.6f} rsi {:.2f} macd {:.6f}/{:.6f} bb_mid {:.6f} mom {:.6f}",
              symbol, snapshot.ema_short, snapshot.ema_long, snapshot.rsi,
              snapshot.macd, snapshot.macd_signal, snapshot.bb_mid, snapshot.momentum);

    if (!side) return std::nullopt;

    Signal signal;
    signal.symbol = symbol;
    signal.side = *side;
    signal.price = current_price;
    signal.strength = strength;
    signal.stop_loss = proposeStopLoss(current_price, *side);
    signal.take_profit = proposeTakeProfit(current_price, *side);
    signal.generated_at = now_ms;

    LOG_INFO("{} {} signal @ {:.6f} strength {:.2f}% (SL {:.6f}, TP {:.6f})",
             symbol, toString(signal.side), signal.price, signal.strength,
             signal.stop_loss, signal.take_profit);
    return signal;
}

} // namespace strategy
} // namespace scalpbot
