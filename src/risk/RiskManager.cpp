#include "risk/RiskManager.h"
#include "common/Logger.h"
#include <algorithm>
#include <cmath>

namespace scalpbot {
namespace risk {

namespace {
constexpr double NOTIONAL_EPSILON = 1e-9;

RiskDecision reject(RiskRejectReason reason, std::string message) {
    RiskDecision d;
    d.accepted = false;
    d.reason = reason;
    d.message = std::move(message);
    return d;
}
}

const char* toString(RiskRejectReason reason) {
    switch (reason) {
        case RiskRejectReason::NONE: return "none";
        case RiskRejectReason::DAILY_LOSS_LIMIT: return "daily_loss_limit";
        case RiskRejectReason::MAX_OPEN_POSITIONS: return "max_open_positions";
        case RiskRejectReason::TRADE_INTERVAL: return "min_time_between_trades";
        case RiskRejectReason::NOTIONAL_CAP: return "notional_cap";
        case RiskRejectReason::INVALID_SIZE: return "invalid_size";
        case RiskRejectReason::SYMBOL_BUSY: return "symbol_busy";
    }
    return "unknown";
}

RiskManager::RiskManager(const engine::RiskSettings& settings, std::shared_ptr<Clock> clock)
    : settings_(settings)
    , clock_(std::move(clock))
{
    daily_.date = clock_->dateKey(clock_->nowMs());
    LOG_INFO("RiskManager initialized - max open {}, daily loss {:.2f}%, size {:.2f}% [{:.2f}%, {:.2f}%]{}",
             settings_.max_open_positions, settings_.max_daily_loss * 100.0,
             settings_.default_position_size * 100.0, settings_.min_position_size * 100.0,
             settings_.max_position_size * 100.0,
             settings_.use_fixed_lot ? " (fixed lot)" : "");
}

// ===== Entry checks =====

RiskDecision RiskManager::validate(const strategy::Signal& signal, double account_balance) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return validateLocked(signal, account_balance);
}

RiskDecision RiskManager::reserve(const strategy::Signal& signal, double account_balance) {
    std::lock_guard<std::mutex> lock(mutex_);
    rolloverIfNeededLocked();

    if (open_symbols_.count(signal.symbol) > 0 || reserved_symbols_.count(signal.symbol) > 0) {
        LOG_WARN("{} already holds a risk slot", signal.symbol);
        return reject(RiskRejectReason::SYMBOL_BUSY, signal.symbol + " already holds a risk slot");
    }

    auto decision = validateLocked(signal, account_balance);
    if (decision.accepted) {
        reserved_symbols_.insert(signal.symbol);
    }
    return decision;
}

void RiskManager::cancelReservation(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reserved_symbols_.erase(symbol) > 0) {
        LOG_INFO("{} risk reservation released", symbol);
    }
}

void RiskManager::onPositionOpened(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_symbols_.erase(symbol);
    open_symbols_.insert(symbol);
    last_trade_time_ms_ = clock_->nowMs();
}

RiskDecision RiskManager::validateLocked(const strategy::Signal& signal, double account_balance) const {
    const auto& symbol = signal.symbol;

    // 1) daily realized loss budget
    const double realized = todayRealizedPnlLocked();
    const double loss_budget = std::max(0.0, account_balance) * settings_.max_daily_loss;
    if (realized < 0.0 && -realized >= loss_budget) {
        LOG_WARN("{} blocked: daily loss {:.2f} reached budget {:.2f}", symbol, -realized, loss_budget);
        return reject(RiskRejectReason::DAILY_LOSS_LIMIT, "daily loss limit reached");
    }

    // 2) open position slots (reservations included)
    const int occupied = static_cast<int>(open_symbols_.size() + reserved_symbols_.size());
    if (occupied >= settings_.max_open_positions) {
        LOG_WARN("{} blocked: max open positions reached ({}/{})", symbol, occupied, settings_.max_open_positions);
        return reject(RiskRejectReason::MAX_OPEN_POSITIONS, "max open positions reached");
    }

    // 3) spacing between trades on any symbol
    if (last_trade_time_ms_) {
        const TimestampMs elapsed_ms = clock_->nowMs() - *last_trade_time_ms_;
        const TimestampMs required_ms = static_cast<TimestampMs>(settings_.min_time_between_trades_seconds) * 1000;
        if (elapsed_ms < required_ms) {
            LOG_WARN("{} blocked: {}s since last trade (< {}s)", symbol, elapsed_ms / 1000,
                     settings_.min_time_between_trades_seconds);
            return reject(RiskRejectReason::TRADE_INTERVAL, "minimum time between trades not reached");
        }
    }

    // 4) notional cap
    const double quantity = sizeLocked(signal.price, signal.stop_loss, account_balance);
    if (quantity <= 0.0) {
        LOG_WARN("{} blocked: invalid position size (price {:.6f}, balance {:.2f})",
                 symbol, signal.price, account_balance);
        return reject(RiskRejectReason::INVALID_SIZE, "invalid position size");
    }

    const double notional = quantity * signal.price;
    const double cap = account_balance * settings_.max_position_size;
    if (notional > cap * (1.0 + NOTIONAL_EPSILON)) {
        LOG_WARN("{} blocked: notional {:.2f} exceeds cap {:.2f}", symbol, notional, cap);
        return reject(RiskRejectReason::NOTIONAL_CAP, "position notional exceeds balance cap");
    }

    RiskDecision decision;
    decision.accepted = true;
    decision.quantity = quantity;
    decision.message = "accepted";

    LOG_INFO("{} risk validated: qty {:.8f}, notional {:.2f} / cap {:.2f}, risk {:.2f}",
             symbol, quantity, notional, cap, positionRisk(quantity, signal.price, signal.stop_loss));
    return decision;
}

// ===== Sizing =====

double RiskManager::size(double entry_price, double stop_loss, double balance) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sizeLocked(entry_price, stop_loss, balance);
}

double RiskManager::sizeLocked(double entry_price, double stop_loss, double balance) const {
    if (entry_price <= 0.0 || stop_loss <= 0.0 || balance <= 0.0) {
        return 0.0;
    }

    if (settings_.use_fixed_lot) {
        return settings_.fixed_lot_size > 0.0 ? settings_.fixed_lot_size / entry_price : 0.0;
    }

    double fraction = settings_.default_position_size;

    if (settings_.adaptive_sizing && daily_.trade_count > 0) {
        const double win_rate = static_cast<double>(daily_.wins) / daily_.trade_count;
        if (win_rate > 0.6) fraction *= 1.2;
        else if (win_rate < 0.4) fraction *= 0.8;
    }

    fraction = std::clamp(fraction, settings_.min_position_size, settings_.max_position_size);
    return (balance * fraction) / entry_price;
}

void RiskManager::adjustLevels(strategy::Signal& signal) const {
    if (signal.price <= 0.0 || settings_.max_position_loss <= 0.0) return;

    const double max_distance = signal.price * settings_.max_position_loss;
    if (signal.side == OrderSide::BUY) {
        const double floor_price = signal.price - max_distance;
        if (signal.stop_loss < floor_price) {
            LOG_INFO("{} stop tightened {:.6f} -> {:.6f}", signal.symbol, signal.stop_loss, floor_price);
            signal.stop_loss = floor_price;
        }
    } else {
        const double ceiling_price = signal.price + max_distance;
        if (signal.stop_loss > ceiling_price) {
            LOG_INFO("{} stop tightened {:.6f} -> {:.6f}", signal.symbol, signal.stop_loss, ceiling_price);
            signal.stop_loss = ceiling_price;
        }
    }
}

double RiskManager::positionRisk(double quantity, double current_price, double stop_loss) {
    return std::fabs(current_price - stop_loss) * quantity;
}

// ===== Results =====

void RiskManager::recordResult(const std::string& symbol, double pnl, TradeOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    rolloverIfNeededLocked();

    daily_.trade_count++;
    daily_.realized_pnl += pnl;
    if (outcome == TradeOutcome::WIN) daily_.wins++;
    else daily_.losses++;

    open_symbols_.erase(symbol);
    reserved_symbols_.erase(symbol);

    trade_history_.push_back({clock_->nowMs(), pnl, outcome});
    while (trade_history_.size() > static_cast<size_t>(settings_.max_trade_history)) {
        trade_history_.pop_front();
    }

    LOG_INFO("{} result recorded: pnl {:+.4f} ({}) | today {} trades, pnl {:+.4f}, W/L {}/{}",
             symbol, pnl, outcome == TradeOutcome::WIN ? "WIN" : "LOSS",
             daily_.trade_count, daily_.realized_pnl, daily_.wins, daily_.losses);
}

DailyRiskStats RiskManager::getDailyStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    rolloverIfNeededLocked();
    return daily_;
}

std::optional<DailyRiskStats> RiskManager::takeCompletedDay() {
    std::lock_guard<std::mutex> lock(mutex_);
    rolloverIfNeededLocked();
    auto out = completed_day_;
    completed_day_.reset();
    return out;
}

TradingStats RiskManager::getTradingStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    TradingStats stats;
    stats.total_trades = static_cast<int>(trade_history_.size());
    if (stats.total_trades == 0) return stats;

    int wins = 0;
    int losses = 0;
    double win_sum = 0.0;
    double loss_sum = 0.0;
    for (const auto& t : trade_history_) {
        stats.total_pnl += t.pnl;
        if (t.pnl > 0.0) {
            wins++;
            win_sum += t.pnl;
        } else {
            losses++;
            loss_sum += t.pnl;
        }
    }

    stats.win_rate = static_cast<double>(wins) / stats.total_trades * 100.0;
    stats.avg_win = wins > 0 ? win_sum / wins : 0.0;
    stats.avg_loss = losses > 0 ? loss_sum / losses : 0.0;
    return stats;
}

int RiskManager::openPositionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(open_symbols_.size());
}

double RiskManager::todayRealizedPnlLocked() const {
    // A stale day counts as a fresh one; the actual reset happens on the next write
    return clock_->dateKey(clock_->nowMs()) == daily_.date ? daily_.realized_pnl : 0.0;
}

void RiskManager::rolloverIfNeededLocked() {
    const int today = clock_->dateKey(clock_->nowMs());
    if (today == daily_.date) return;

    LOG_INFO("Daily risk stats reset {} -> {} (trades {}, pnl {:+.4f})",
             daily_.date, today, daily_.trade_count, daily_.realized_pnl);
    completed_day_ = daily_;
    daily_ = DailyRiskStats();
    daily_.date = today;
}

} // namespace risk
} // namespace scalpbot
