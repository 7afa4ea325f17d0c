#include "execution/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace scalpbot {
namespace execution {

RateLimiter::RateLimiter(const engine::RateLimitSettings& settings, std::shared_ptr<Clock> clock)
    : settings_(settings)
    , clock_(std::move(clock))
    , daily_orders_(0)
    , daily_date_(0)
{
    daily_date_ = clock_->dateKey(clock_->nowMs());
    LOG_INFO("RateLimiter initialized - signal every {}s, order cooldown {}s, {} orders/day, hours [{}, {})",
             settings_.signal_check_interval_seconds, settings_.order_cooldown_seconds,
             settings_.max_daily_orders, settings_.trading_hours_start, settings_.trading_hours_end);
}

bool RateLimiter::canCheckSignal(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimestampMs now = clock_->nowMs();

    if (!isTradingTimeAt(now)) {
        LOG_DEBUG("{} signal check skipped: outside trading window", symbol);
        return false;
    }

    auto it = last_signal_check_.find(symbol);
    if (it != last_signal_check_.end()) {
        const TimestampMs elapsed = now - it->second;
        if (elapsed < static_cast<TimestampMs>(settings_.signal_check_interval_seconds) * 1000) {
            LOG_DEBUG("{} signal check skipped: {}s since last check", symbol, elapsed / 1000);
            return false;
        }
    }
    return true;
}

bool RateLimiter::canPlaceOrder(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimestampMs now = clock_->nowMs();
    resetDailyIfNeeded(now);

    if (!isTradingTimeAt(now)) {
        LOG_INFO("{} order blocked: outside trading window", symbol);
        return false;
    }

    if (daily_orders_ >= settings_.max_daily_orders) {
        LOG_WARN("{} order blocked: daily order limit reached ({}/{})",
                 symbol, daily_orders_, settings_.max_daily_orders);
        return false;
    }

    auto it = last_order_.find(symbol);
    if (it != last_order_.end()) {
        const TimestampMs elapsed = now - it->second;
        if (elapsed < static_cast<TimestampMs>(settings_.order_cooldown_seconds) * 1000) {
            LOG_INFO("{} order blocked: cooldown ({}s / {}s)",
                     symbol, elapsed / 1000, settings_.order_cooldown_seconds);
            return false;
        }
    }
    return true;
}

void RateLimiter::registerSignal(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_signal_check_[symbol] = clock_->nowMs();
}

void RateLimiter::registerOrder(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimestampMs now = clock_->nowMs();
    resetDailyIfNeeded(now);
    last_order_[symbol] = now;
    daily_orders_++;
    LOG_INFO("{} order registered ({}/{} today)", symbol, daily_orders_, settings_.max_daily_orders);
}

bool RateLimiter::isTradingTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isTradingTimeAt(clock_->nowMs());
}

std::optional<TimestampMs> RateLimiter::nextSignalTime(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_signal_check_.find(symbol);
    if (it == last_signal_check_.end()) return std::nullopt;
    return it->second + static_cast<TimestampMs>(settings_.signal_check_interval_seconds) * 1000;
}

std::optional<TimestampMs> RateLimiter::nextOrderTime(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_order_.find(symbol);
    if (it == last_order_.end()) return std::nullopt;
    return it->second + static_cast<TimestampMs>(settings_.order_cooldown_seconds) * 1000;
}

RateLimitStatus RateLimiter::getStatus() {
    std::lock_guard<std::mutex> lock(mutex_);
    const TimestampMs now = clock_->nowMs();
    resetDailyIfNeeded(now);

    RateLimitStatus status;
    status.daily_orders = daily_orders_;
    status.max_daily_orders = settings_.max_daily_orders;
    status.is_trading_time = isTradingTimeAt(now);
    status.trading_hours_start = settings_.trading_hours_start;
    status.trading_hours_end = settings_.trading_hours_end;
    return status;
}

bool RateLimiter::isTradingTimeAt(TimestampMs now_ms) const {
    const int weekday = clock_->isoWeekday(now_ms);
    const auto& days = settings_.trading_days;
    if (std::find(days.begin(), days.end(), weekday) == days.end()) {
        return false;
    }

    const int hour = clock_->hourOf(now_ms);
    return hour >= settings_.trading_hours_start && hour < settings_.trading_hours_end;
}

void RateLimiter::resetDailyIfNeeded(TimestampMs now_ms) {
    const int today = clock_->dateKey(now_ms);
    if (today == daily_date_) return;

    LOG_INFO("Daily order counter reset {} -> {} ({} orders)", daily_date_, today, daily_orders_);
    daily_date_ = today;
    daily_orders_ = 0;
}

} // namespace execution
} // namespace scalpbot
