#include "execution/PositionLifecycle.h"
#include "common/Logger.h"

namespace scalpbot {
namespace execution {

const char* toString(PositionState state) {
    switch (state) {
        case PositionState::NONE: return "NONE";
        case PositionState::PENDING_OPEN: return "PENDING_OPEN";
        case PositionState::OPEN: return "OPEN";
        case PositionState::PENDING_CLOSE: return "PENDING_CLOSE";
    }
    return "UNKNOWN";
}

const char* toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::NONE: return "none";
        case ExitReason::STOP_LOSS: return "stop_loss";
        case ExitReason::TAKE_PROFIT: return "take_profit";
        case ExitReason::MAX_TIME: return "max_time";
        case ExitReason::TECHNICAL_EXIT: return "technical_exit";
        case ExitReason::SHUTDOWN: return "shutdown";
    }
    return "unknown";
}

PositionLifecycle::PositionLifecycle(std::string symbol,
                                     const engine::TradingSettings& trading,
                                     const engine::IndicatorSettings& indicators)
    : symbol_(std::move(symbol))
    , trading_(trading)
    , indicators_(indicators)
    , state_(PositionState::NONE)
    , pending_reason_(ExitReason::NONE)
{}

bool PositionLifecycle::beginOpen() {
    if (state_ != PositionState::NONE) {
        LOG_ERROR("{} concurrency violation: open requested while {}", symbol_, toString(state_));
        return false;
    }
    state_ = PositionState::PENDING_OPEN;
    return true;
}

bool PositionLifecycle::confirmOpen(const Position& position) {
    if (state_ != PositionState::PENDING_OPEN) {
        LOG_ERROR("{} concurrency violation: confirmOpen while {}", symbol_, toString(state_));
        return false;
    }

    position_ = position;
    position_->symbol = symbol_;
    if (position_->best_price <= 0.0) {
        position_->best_price = position_->entry_price;
    }
    state_ = PositionState::OPEN;

    LOG_INFO("{} position opened: {} {:.8f} @ {:.6f} (SL {:.6f}, TP {:.6f})",
             symbol_, toString(position_->side), position_->quantity, position_->entry_price,
             position_->stop_loss, position_->take_profit);
    return true;
}

void PositionLifecycle::abortOpen() {
    if (state_ != PositionState::PENDING_OPEN) return;
    state_ = PositionState::NONE;
    position_.reset();
    LOG_WARN("{} open aborted, back to NONE", symbol_);
}

bool PositionLifecycle::open(const Position& position) {
    return beginOpen() && confirmOpen(position);
}

ExitReason PositionLifecycle::evaluateExit(double current_price,
                                           const analytics::IndicatorSnapshot& snapshot,
                                           TimestampMs now_ms) const {
    if (state_ != PositionState::OPEN || !position_ || current_price <= 0.0) {
        return ExitReason::NONE;
    }

    const auto& pos = *position_;
    const bool is_long = (pos.side == OrderSide::BUY);

    // 1. stop loss
    if (is_long ? current_price <= pos.stop_loss : current_price >= pos.stop_loss) {
        return ExitReason::STOP_LOSS;
    }

    // 2. take profit
    if (is_long ? current_price >= pos.take_profit : current_price <= pos.take_profit) {
        return ExitReason::TAKE_PROFIT;
    }

    // 3. holding time
    const TimestampMs max_hold_ms = static_cast<TimestampMs>(trading_.max_position_time_minutes) * 60 * 1000;
    if (now_ms - pos.opened_at > max_hold_ms) {
        return ExitReason::MAX_TIME;
    }

    // 4. technical reversal
    if (snapshot.isValid() && technicalExit(pos, current_price, snapshot)) {
        return ExitReason::TECHNICAL_EXIT;
    }

    return ExitReason::NONE;
}

bool PositionLifecycle::technicalExit(const Position& pos,
                                      double current_price,
                                      const analytics::IndicatorSnapshot& s) const {
    if (pos.side == OrderSide::BUY) {
        return s.rsi > indicators_.rsi_overbought ||
               current_price < s.ema_short ||
               s.macd < s.macd_signal;
    }
    return s.rsi < indicators_.rsi_oversold ||
           current_price > s.ema_short ||
           s.macd > s.macd_signal;
}

ExitReason PositionLifecycle::manage(double current_price,
                                     const analytics::IndicatorSnapshot& snapshot,
                                     TimestampMs now_ms) {
    const ExitReason reason = evaluateExit(current_price, snapshot, now_ms);
    if (reason != ExitReason::NONE) {
        LOG_INFO("{} exit triggered: {} @ {:.6f}", symbol_, toString(reason), current_price);
        return reason;
    }

    if (trading_.enable_trailing_stop && position_ && state_ == PositionState::OPEN) {
        updateTrailingStop(current_price);
    }
    return ExitReason::NONE;
}

void PositionLifecycle::updateTrailingStop(double current_price) {
    auto& pos = *position_;
    const double pct = trading_.trailing_stop_percent / 100.0;

    if (pos.side == OrderSide::BUY) {
        if (current_price > pos.best_price) pos.best_price = current_price;
        const double candidate = current_price * (1.0 - pct);
        if (candidate > pos.stop_loss) {
            LOG_DEBUG("{} trailing stop {:.6f} -> {:.6f}", symbol_, pos.stop_loss, candidate);
            pos.stop_loss = candidate;
        }
    } else {
        if (pos.best_price <= 0.0 || current_price < pos.best_price) pos.best_price = current_price;
        const double candidate = current_price * (1.0 + pct);
        if (candidate < pos.stop_loss) {
            LOG_DEBUG("{} trailing stop {:.6f} -> {:.6f}", symbol_, pos.stop_loss, candidate);
            pos.stop_loss = candidate;
        }
    }
}

bool PositionLifecycle::beginClose(ExitReason reason) {
    if (state_ != PositionState::OPEN) {
        LOG_ERROR("{} concurrency violation: close requested while {}", symbol_, toString(state_));
        return false;
    }
    state_ = PositionState::PENDING_CLOSE;
    pending_reason_ = reason;
    return true;
}

std::optional<ClosedTrade> PositionLifecycle::confirmClose(double exit_price, TimestampMs now_ms) {
    if (state_ != PositionState::PENDING_CLOSE || !position_) {
        LOG_ERROR("{} concurrency violation: confirmClose while {}", symbol_, toString(state_));
        return std::nullopt;
    }

    const auto& pos = *position_;
    ClosedTrade trade;
    trade.symbol = symbol_;
    trade.side = pos.side;
    trade.entry_price = pos.entry_price;
    trade.exit_price = exit_price;
    trade.quantity = pos.quantity;
    trade.pnl = realizedPnl(pos.side, pos.entry_price, exit_price, pos.quantity);
    trade.opened_at = pos.opened_at;
    trade.closed_at = now_ms;
    trade.reason = pending_reason_;
    trade.signal_strength = pos.signal_strength;

    position_.reset();
    state_ = PositionState::NONE;
    pending_reason_ = ExitReason::NONE;

    LOG_INFO("{} position closed ({}): {:.6f} -> {:.6f}, pnl {:+.4f}",
             symbol_, toString(trade.reason), trade.entry_price, trade.exit_price, trade.pnl);
    return trade;
}

void PositionLifecycle::abortClose() {
    if (state_ != PositionState::PENDING_CLOSE) return;
    state_ = PositionState::OPEN;
    LOG_WARN("{} close aborted ({}), position stays OPEN", symbol_, toString(pending_reason_));
    pending_reason_ = ExitReason::NONE;
}

double PositionLifecycle::realizedPnl(OrderSide side, double entry_price, double exit_price, double quantity) {
    return side == OrderSide::BUY
        ? (exit_price - entry_price) * quantity
        : (entry_price - exit_price) * quantity;
}

} // namespace execution
} // namespace scalpbot
