#pragma once

#include <optional>
#include <string>

#include "analytics/IndicatorEngine.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace scalpbot {
namespace execution {

// PENDING_* mark a decision handed to the order executor
enum class PositionState {
    NONE,
    PENDING_OPEN,
    OPEN,
    PENDING_CLOSE
};

enum class ExitReason {
    NONE,
    STOP_LOSS,
    TAKE_PROFIT,
    MAX_TIME,
    TECHNICAL_EXIT,
    SHUTDOWN
};

const char* toString(PositionState state);
const char* toString(ExitReason reason);

struct Position {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double entry_price = 0.0;
    double quantity = 0.0;
    double stop_loss = 0.0;
    double take_profit = 0.0;
    TimestampMs opened_at = 0;
    double signal_strength = 0.0;
    std::string order_id;
    double best_price = 0.0;    // most favourable price seen, for trailing
};

struct ClosedTrade {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    double entry_price = 0.0;
    double exit_price = 0.0;
    double quantity = 0.0;
    double pnl = 0.0;
    TimestampMs opened_at = 0;
    TimestampMs closed_at = 0;
    ExitReason reason = ExitReason::NONE;
    double signal_strength = 0.0;
};

// Single-symbol position state machine.
// Not synchronized; the owner serializes access (TradingEngine holds the symbol lock).
class PositionLifecycle {
public:
    PositionLifecycle(std::string symbol,
                      const engine::TradingSettings& trading,
                      const engine::IndicatorSettings& indicators);

    // NONE -> PENDING_OPEN. Anything else is a concurrency violation: rejected and logged.
    bool beginOpen();
    // PENDING_OPEN -> OPEN
    bool confirmOpen(const Position& position);
    // PENDING_OPEN -> NONE (order failed)
    void abortOpen();
    // NONE -> OPEN in one step (warm start, tests)
    bool open(const Position& position);

    // First matching exit condition in priority order, or NONE
    ExitReason evaluateExit(double current_price,
                            const analytics::IndicatorSnapshot& snapshot,
                            TimestampMs now_ms) const;

    // evaluateExit(); when nothing triggers, ratchets the trailing stop
    ExitReason manage(double current_price,
                      const analytics::IndicatorSnapshot& snapshot,
                      TimestampMs now_ms);

    // OPEN -> PENDING_CLOSE
    bool beginClose(ExitReason reason);
    // PENDING_CLOSE -> NONE, returns the completed trade
    std::optional<ClosedTrade> confirmClose(double exit_price, TimestampMs now_ms);
    // PENDING_CLOSE -> OPEN (flatten order failed)
    void abortClose();

    PositionState state() const { return state_; }
    bool isOpen() const { return state_ == PositionState::OPEN; }
    // True for every state but NONE
    bool hasPosition() const { return state_ != PositionState::NONE; }
    const std::optional<Position>& position() const { return position_; }
    ExitReason pendingExitReason() const { return pending_reason_; }
    const std::string& symbol() const { return symbol_; }

    // Direction aware: long (exit - entry) * qty, short (entry - exit) * qty
    static double realizedPnl(OrderSide side, double entry_price, double exit_price, double quantity);

private:
    bool technicalExit(const Position& pos,
                       double current_price,
                       const analytics::IndicatorSnapshot& snapshot) const;
    void updateTrailingStop(double current_price);

    std::string symbol_;
    engine::TradingSettings trading_;
    engine::IndicatorSettings indicators_;

    PositionState state_;
    std::optional<Position> position_;
    ExitReason pending_reason_;
};

} // namespace execution
} // namespace scalpbot
