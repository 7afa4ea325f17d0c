#pragma once

#include <atomic>
#include <ctime>

#include "common/Types.h"

namespace scalpbot {

// Time source shared by the rate limiter, risk manager and engine.
// Calendar helpers go through toLocalTime() so that day/hour rules follow
// the clock's notion of local time.
class Clock {
public:
    virtual ~Clock() = default;

    virtual TimestampMs nowMs() const = 0;
    virtual std::tm toLocalTime(TimestampMs ts_ms) const;

    // yyyymmdd
    int dateKey(TimestampMs ts_ms) const;
    int hourOf(TimestampMs ts_ms) const;
    // ISO weekday, Monday = 1 ... Sunday = 7
    int isoWeekday(TimestampMs ts_ms) const;
};

class SystemClock : public Clock {
public:
    TimestampMs nowMs() const override;
};

// Externally driven clock used by historical replay and tests.
// Local time is UTC shifted by a fixed offset.
class ManualClock : public Clock {
public:
    explicit ManualClock(TimestampMs start_ms = 0, int utc_offset_minutes = 0);

    TimestampMs nowMs() const override { return now_ms_.load(); }
    std::tm toLocalTime(TimestampMs ts_ms) const override;

    void set(TimestampMs ts_ms) { now_ms_.store(ts_ms); }
    void advance(TimestampMs delta_ms) { now_ms_.fetch_add(delta_ms); }

private:
    std::atomic<TimestampMs> now_ms_;
    int utc_offset_minutes_;
};

} // namespace scalpbot
