#include "market/PriceWindow.h"

#include <algorithm>

namespace scalpbot {
namespace market {

PriceWindow::PriceWindow(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity))
{}

AppendResult PriceWindow::append(const Candle& candle) {
    if (!candles_.empty() && candle.timestamp <= candles_.back().timestamp) {
        return AppendResult::STALE;
    }

    candles_.push_back(candle);
    while (candles_.size() > capacity_) {
        candles_.pop_front();
    }
    return AppendResult::APPENDED;
}

std::vector<Candle> PriceWindow::snapshot() const {
    return std::vector<Candle>(candles_.begin(), candles_.end());
}

std::vector<double> PriceWindow::closes() const {
    std::vector<double> out;
    out.reserve(candles_.size());
    for (const auto& c : candles_) {
        out.push_back(c.close);
    }
    return out;
}

std::optional<Candle> PriceWindow::latest() const {
    if (candles_.empty()) return std::nullopt;
    return candles_.back();
}

} // namespace market
} // namespace scalpbot
