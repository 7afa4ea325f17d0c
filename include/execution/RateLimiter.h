#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "common/Clock.h"
#include "engine/EngineConfig.h"

namespace scalpbot {
namespace execution {

struct RateLimitStatus {
    int daily_orders = 0;
    int max_daily_orders = 0;
    bool is_trading_time = false;
    int trading_hours_start = 0;
    int trading_hours_end = 0;
};

// Rate Limiter - trading window, per-symbol cooldowns, daily order budget (thread-safe)
class RateLimiter {
public:
    RateLimiter(const engine::RateLimitSettings& settings, std::shared_ptr<Clock> clock);

    // Gates; they only read state. register*() is called after the gated action succeeds.
    bool canCheckSignal(const std::string& symbol);
    bool canPlaceOrder(const std::string& symbol);

    void registerSignal(const std::string& symbol);
    void registerOrder(const std::string& symbol);

    // Local hour in [start, end) and ISO weekday listed in trading_days
    bool isTradingTime() const;

    // Earliest time the cooldown lets the symbol through (nullopt when never gated)
    std::optional<TimestampMs> nextSignalTime(const std::string& symbol) const;
    std::optional<TimestampMs> nextOrderTime(const std::string& symbol) const;

    RateLimitStatus getStatus();

private:
    bool isTradingTimeAt(TimestampMs now_ms) const;
    void resetDailyIfNeeded(TimestampMs now_ms);

    engine::RateLimitSettings settings_;
    std::shared_ptr<Clock> clock_;

    std::map<std::string, TimestampMs> last_signal_check_;
    std::map<std::string, TimestampMs> last_order_;
    int daily_orders_;
    int daily_date_;

    mutable std::mutex mutex_;
};

} // namespace execution
} // namespace scalpbot
