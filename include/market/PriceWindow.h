#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

#include "common/Types.h"

namespace scalpbot {
namespace market {

enum class AppendResult {
    APPENDED,
    STALE       // timestamp <= last stored, window untouched
};

// Bounded rolling candle buffer for one symbol. Not synchronized: the owner
// (the engine's per-symbol state) serializes access.
class PriceWindow {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 100;

    explicit PriceWindow(std::size_t capacity = DEFAULT_CAPACITY);

    AppendResult append(const Candle& candle);

    // Ordered oldest -> newest copy
    std::vector<Candle> snapshot() const;
    std::vector<double> closes() const;

    std::optional<Candle> latest() const;
    std::size_t size() const { return candles_.size(); }
    std::size_t capacity() const { return capacity_; }
    bool empty() const { return candles_.empty(); }
    void clear() { candles_.clear(); }

private:
    std::deque<Candle> candles_;
    std::size_t capacity_;
};

} // namespace market
} // namespace scalpbot
