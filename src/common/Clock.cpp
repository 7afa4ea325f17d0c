#include "common/Clock.h"

#include <chrono>

namespace scalpbot {

std::tm Clock::toLocalTime(TimestampMs ts_ms) const {
    std::time_t t = static_cast<std::time_t>(ts_ms / 1000);
    std::tm lt{};
    localtime_r(&t, &lt);
    return lt;
}

int Clock::dateKey(TimestampMs ts_ms) const {
    const std::tm lt = toLocalTime(ts_ms);
    return (lt.tm_year + 1900) * 10000 + (lt.tm_mon + 1) * 100 + lt.tm_mday;
}

int Clock::hourOf(TimestampMs ts_ms) const {
    return toLocalTime(ts_ms).tm_hour;
}

int Clock::isoWeekday(TimestampMs ts_ms) const {
    const int wday = toLocalTime(ts_ms).tm_wday;  // 0 = Sunday
    return wday == 0 ? 7 : wday;
}

TimestampMs SystemClock::nowMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

ManualClock::ManualClock(TimestampMs start_ms, int utc_offset_minutes)
    : now_ms_(start_ms)
    , utc_offset_minutes_(utc_offset_minutes)
{}

std::tm ManualClock::toLocalTime(TimestampMs ts_ms) const {
    std::time_t t = static_cast<std::time_t>(ts_ms / 1000) + utc_offset_minutes_ * 60;
    std::tm lt{};
    gmtime_r(&t, &lt);
    return lt;
}

} // namespace scalpbot
