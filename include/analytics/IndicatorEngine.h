#pragma once

#include <cstddef>
#include <vector>

#include "common/Types.h"
#include "engine/EngineConfig.h"

namespace scalpbot {
namespace analytics {

enum class IndicatorStatus {
    OK,
    INSUFFICIENT_DATA
};

// Indicator values for the newest candle of a window.
// Numeric fields are meaningful only when status == OK.
struct IndicatorSnapshot {
    IndicatorStatus status = IndicatorStatus::INSUFFICIENT_DATA;
    TimestampMs timestamp = 0;
    std::size_t candle_count = 0;

    double close = 0.0;
    double ema_short = 0.0;
    double ema_long = 0.0;
    double rsi = 0.0;
    double macd = 0.0;
    double macd_signal = 0.0;
    double bb_upper = 0.0;
    double bb_mid = 0.0;
    double bb_lower = 0.0;
    double momentum = 0.0;

    bool isValid() const { return status == IndicatorStatus::OK; }
};

// Stateless window -> snapshot transform
class IndicatorEngine {
public:
    explicit IndicatorEngine(const engine::IndicatorSettings& settings);

    IndicatorSnapshot compute(const std::vector<Candle>& candles) const;

    // Last volume / mean volume of the previous `period` candles (0 when undersized)
    static double volumeRatio(const std::vector<Candle>& candles, int period);

    // Longest lookback over all configured indicators
    std::size_t requiredCandles() const;

    const engine::IndicatorSettings& settings() const { return settings_; }

private:
    engine::IndicatorSettings settings_;
};

} // namespace analytics
} // namespace scalpbot
