#pragma once

#include <optional>
#include <string>

#include "analytics/IndicatorEngine.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace scalpbot {
namespace strategy {

// Directional trade proposal, consumed immediately by the risk layer
struct Signal {
    std::string symbol;
    OrderSide side;
    double price;
    double strength;        // 0 ~ 100
    double stop_loss;
    double take_profit;
    TimestampMs generated_at;

    Signal()
        : side(OrderSide::BUY)
        , price(0.0)
        , strength(0.0)
        , stop_loss(0.0)
        , take_profit(0.0)
        , generated_at(0)
    {}
};

class SignalGenerator {
public:
    explicit SignalGenerator(const engine::TradingSettings& settings);

    // No signal when a position is already open (or pending) for the symbol,
    // when the snapshot is insufficient, or when neither condition set holds.
    // LONG is checked first.
    std::optional<Signal> evaluate(
        const std::string& symbol,
        const analytics::IndicatorSnapshot& snapshot,
        double current_price,
        bool has_open_position,
        TimestampMs now_ms
    ) const;

    // Weighted share of the six sub-conditions that favour `side`, scaled to 0~100
    static double calculateStrength(
        const analytics::IndicatorSnapshot& snapshot,
        double current_price,
        OrderSide side
    );

    static bool longConditionsMet(const analytics::IndicatorSnapshot& snapshot, double current_price);
    static bool shortConditionsMet(const analytics::IndicatorSnapshot& snapshot, double current_price);

    // Fixed-offset protective levels around the entry price
    double proposeStopLoss(double entry_price, OrderSide side) const;
    double proposeTakeProfit(double entry_price, OrderSide side) const;

private:
    engine::TradingSettings settings_;
};

} // namespace strategy
} // namespace scalpbot
