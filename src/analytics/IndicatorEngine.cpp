#include "analytics/IndicatorEngine.h"
#include "analytics/TechnicalIndicators.h"

#include <algorithm>

namespace scalpbot {
namespace analytics {

namespace {
engine::IndicatorSettings sanitize(engine::IndicatorSettings s) {
    s.ema_short = std::max(1, s.ema_short);
    s.ema_long = std::max(1, s.ema_long);
    s.rsi_period = std::max(1, s.rsi_period);
    s.macd_fast = std::max(1, s.macd_fast);
    s.macd_slow = std::max(1, s.macd_slow);
    s.macd_signal = std::max(1, s.macd_signal);
    s.bb_period = std::max(2, s.bb_period);
    s.momentum_period = std::max(1, s.momentum_period);
    return s;
}
}

IndicatorEngine::IndicatorEngine(const engine::IndicatorSettings& settings)
    : settings_(sanitize(settings))
{}

std::size_t IndicatorEngine::requiredCandles() const {
    const int lookback = std::max({
        settings_.ema_short,
        settings_.ema_long,
        settings_.rsi_period + 1,
        settings_.macd_fast,
        settings_.macd_slow,
        settings_.bb_period,
        settings_.momentum_period + 1
    });
    return static_cast<std::size_t>(lookback);
}

double IndicatorEngine::volumeRatio(const std::vector<Candle>& candles, int period) {
    return TechnicalIndicators::calculateVolumeRatio(candles, std::max(1, period));
}

IndicatorSnapshot IndicatorEngine::compute(const std::vector<Candle>& candles) const {
    IndicatorSnapshot snap;
    snap.candle_count = candles.size();

    if (candles.size() < requiredCandles()) {
        snap.status = IndicatorStatus::INSUFFICIENT_DATA;
        if (!candles.empty()) snap.timestamp = candles.back().timestamp;
        return snap;
    }

    const auto closes = TechnicalIndicators::extractClosePrices(candles);
    const double close = closes.back();

    snap.timestamp = candles.back().timestamp;
    snap.close = close;
    snap.ema_short = TechnicalIndicators::calculateEMA(closes, settings_.ema_short);
    snap.ema_long = TechnicalIndicators::calculateEMA(closes, settings_.ema_long);
    snap.rsi = TechnicalIndicators::calculateRSI(closes, settings_.rsi_period);

    auto macd = TechnicalIndicators::calculateMACD(
        closes, settings_.macd_fast, settings_.macd_slow, settings_.macd_signal);
    snap.macd = macd.macd;
    snap.macd_signal = macd.signal;

    auto bb = TechnicalIndicators::calculateBollingerBands(
        closes, close, settings_.bb_period, settings_.bb_stddev);
    snap.bb_upper = bb.upper;
    snap.bb_mid = bb.middle;
    snap.bb_lower = bb.lower;

    snap.momentum = TechnicalIndicators::calculateMomentum(closes, settings_.momentum_period);
    snap.status = IndicatorStatus::OK;
    return snap;
}

} // namespace analytics
} // namespace scalpbot
