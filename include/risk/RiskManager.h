#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "common/Clock.h"
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "strategy/SignalGenerator.h"

namespace scalpbot {
namespace risk {

// Realized results for one calendar day
struct DailyRiskStats {
    int date;               // yyyymmdd
    int trade_count;
    double realized_pnl;
    int wins;
    int losses;

    DailyRiskStats()
        : date(0), trade_count(0), realized_pnl(0.0), wins(0), losses(0)
    {}
};

enum class RiskRejectReason {
    NONE,
    DAILY_LOSS_LIMIT,
    MAX_OPEN_POSITIONS,
    TRADE_INTERVAL,
    NOTIONAL_CAP,
    INVALID_SIZE,
    SYMBOL_BUSY
};

const char* toString(RiskRejectReason reason);

struct RiskDecision {
    bool accepted = false;
    RiskRejectReason reason = RiskRejectReason::NONE;
    double quantity = 0.0;
    std::string message;
};

enum class TradeOutcome { WIN, LOSS };

struct TradingStats {
    int total_trades = 0;
    double win_rate = 0.0;      // percent
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double total_pnl = 0.0;
};

// Risk Manager - daily budget, position slots, sizing
class RiskManager {
public:
    RiskManager(const engine::RiskSettings& settings, std::shared_ptr<Clock> clock);

    // ===== Entry checks =====

    // (a) daily loss budget, (b) open positions, (c) trade interval, (d) notional cap
    RiskDecision validate(const strategy::Signal& signal, double account_balance) const;

    // validate() plus an atomic slot reservation for signal.symbol
    RiskDecision reserve(const strategy::Signal& signal, double account_balance);
    void cancelReservation(const std::string& symbol);
    void onPositionOpened(const std::string& symbol);

    // ===== Sizing =====

    double size(double entry_price, double stop_loss, double balance) const;

    // Tightens the stop when it sits further than max_position_loss from entry
    void adjustLevels(strategy::Signal& signal) const;

    static double positionRisk(double quantity, double current_price, double stop_loss);

    // ===== Results =====

    void recordResult(const std::string& symbol, double pnl, TradeOutcome outcome);

    DailyRiskStats getDailyStats();
    // The day that was rolled over most recently, handed out once
    std::optional<DailyRiskStats> takeCompletedDay();
    TradingStats getTradingStats() const;
    int openPositionCount() const;

    const engine::RiskSettings& settings() const { return settings_; }

private:
    struct TradeRecord {
        TimestampMs timestamp;
        double pnl;
        TradeOutcome outcome;
    };

    RiskDecision validateLocked(const strategy::Signal& signal, double account_balance) const;
    double sizeLocked(double entry_price, double stop_loss, double balance) const;
    double todayRealizedPnlLocked() const;
    void rolloverIfNeededLocked();

    engine::RiskSettings settings_;
    std::shared_ptr<Clock> clock_;

    DailyRiskStats daily_;
    std::optional<DailyRiskStats> completed_day_;
    std::set<std::string> open_symbols_;
    std::set<std::string> reserved_symbols_;
    std::optional<TimestampMs> last_trade_time_ms_;
    std::deque<TradeRecord> trade_history_;

    mutable std::mutex mutex_;
};

} // namespace risk
} // namespace scalpbot
