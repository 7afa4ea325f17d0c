#pragma once

#include <vector>
#include "common/Types.h"

namespace scalpbot {
namespace analytics {

// Indicator primitives over price series ordered oldest -> newest.
// Callers are expected to check lengths first; undersized inputs get the
// neutral fallback noted per function.
class TechnicalIndicators {
public:
    // EMA seeded with the first value, alpha = 2 / (period + 1).
    // Returns one value per input price.
    static std::vector<double> calculateEMAVector(const std::vector<double>& prices, int period);
    // Latest EMA value (0 for empty input)
    static double calculateEMA(const std::vector<double>& prices, int period);

    // Mean of the last `period` values (0 when undersized)
    static double calculateSMA(const std::vector<double>& prices, int period);

    // Simple-average RSI over the last `period` deltas.
    // loss == 0 -> 100. Needs period + 1 prices, otherwise 50.
    static double calculateRSI(const std::vector<double>& prices, int period = 14);

    struct MACDResult {
        double macd;        // EMA(fast) - EMA(slow)
        double signal;      // EMA of the MACD series
        double histogram;   // macd - signal

        MACDResult() : macd(0), signal(0), histogram(0) {}
    };
    static MACDResult calculateMACD(const std::vector<double>& prices,
                                    int fast = 12, int slow = 26, int signal_period = 9);

    struct BollingerBands {
        double upper;
        double middle;      // SMA
        double lower;
        double width;
        double percent_b;   // position of current_price inside the band (0~1)

        BollingerBands() : upper(0), middle(0), lower(0), width(0), percent_b(0) {}
    };
    // Sample standard deviation (n - 1) over the last `period` prices
    static BollingerBands calculateBollingerBands(const std::vector<double>& prices,
                                                  double current_price,
                                                  int period = 20,
                                                  double std_dev_mult = 2.0);

    // close[t] - close[t - period] (0 when undersized)
    static double calculateMomentum(const std::vector<double>& prices, int period);

    // Last volume / mean of the `period` volumes before it (0 when undersized)
    static double calculateVolumeRatio(const std::vector<Candle>& candles, int period = 20);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);

private:
    static double calculateStandardDeviation(const std::vector<double>& values, double mean);
    static double calculateMean(const std::vector<double>& values);
};

} // namespace analytics
} // namespace scalpbot
