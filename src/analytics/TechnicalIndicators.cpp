#include "analytics/TechnicalIndicators.h"
#include <cmath>
#include <algorithm>
#include <numeric>

namespace scalpbot {
namespace analytics {

std::vector<double> TechnicalIndicators::calculateEMAVector(
    const std::vector<double>& prices,
    int period
) {
    std::vector<double> ema_values;
    if (prices.empty() || period <= 0) return ema_values;

    const double multiplier = 2.0 / (period + 1.0);
    ema_values.reserve(prices.size());

    double ema = prices.front();
    ema_values.push_back(ema);

    for (size_t i = 1; i < prices.size(); ++i) {
        ema = (prices[i] - ema) * multiplier + ema;
        ema_values.push_back(ema);
    }

    return ema_values;
}

double TechnicalIndicators::calculateEMA(const std::vector<double>& prices, int period) {
    auto series = calculateEMAVector(prices, period);
    return series.empty() ? 0.0 : series.back();
}

double TechnicalIndicators::calculateSMA(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        sum += prices[i];
    }

    return sum / period;
}

double TechnicalIndicators::calculateRSI(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;

    for (size_t i = prices.size() - period; i < prices.size(); ++i) {
        double change = prices[i] - prices[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += -change;
    }

    avg_gain /= period;
    avg_loss /= period;

    if (avg_loss <= 0.0) return 100.0;

    double rs = avg_gain / avg_loss;
    return std::clamp(100.0 - (100.0 / (1.0 + rs)), 0.0, 100.0);
}

TechnicalIndicators::MACDResult TechnicalIndicators::calculateMACD(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDResult result;
    if (prices.empty()) return result;

    auto fast_ema_vec = calculateEMAVector(prices, fast);
    auto slow_ema_vec = calculateEMAVector(prices, slow);
    if (fast_ema_vec.empty() || slow_ema_vec.empty()) return result;

    // Both series are aligned one value per price
    std::vector<double> macd_series;
    macd_series.reserve(prices.size());
    for (size_t i = 0; i < prices.size(); ++i) {
        macd_series.push_back(fast_ema_vec[i] - slow_ema_vec[i]);
    }

    result.macd = macd_series.back();
    result.signal = calculateEMA(macd_series, signal_period);
    result.histogram = result.macd - result.signal;

    return result;
}

TechnicalIndicators::BollingerBands TechnicalIndicators::calculateBollingerBands(
    const std::vector<double>& prices,
    double current_price,
    int period,
    double std_dev_mult
) {
    BollingerBands result;

    if (period <= 1 || prices.size() < static_cast<size_t>(period)) {
        return result;
    }

    std::vector<double> recent_prices(prices.end() - period, prices.end());

    result.middle = calculateMean(recent_prices);
    double std_dev = calculateStandardDeviation(recent_prices, result.middle);

    result.upper = result.middle + (std_dev * std_dev_mult);
    result.lower = result.middle - (std_dev * std_dev_mult);
    result.width = result.upper - result.lower;

    if (result.width > 1e-12) {
        result.percent_b = (current_price - result.lower) / result.width;
    } else {
        result.percent_b = 0.5;
    }

    return result;
}

double TechnicalIndicators::calculateMomentum(const std::vector<double>& prices, int period) {
    if (period <= 0 || prices.size() < static_cast<size_t>(period + 1)) return 0.0;
    return prices.back() - prices[prices.size() - 1 - period];
}

double TechnicalIndicators::calculateVolumeRatio(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) return 0.0;

    double sum = 0.0;
    for (size_t i = candles.size() - 1 - period; i < candles.size() - 1; ++i) {
        sum += candles[i].volume;
    }
    const double avg = sum / period;
    if (avg <= 0.0) return 0.0;

    return candles.back().volume / avg;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& c : candles) {
        closes.push_back(c.close);
    }
    return closes;
}

double TechnicalIndicators::calculateStandardDeviation(
    const std::vector<double>& values,
    double mean
) {
    if (values.size() < 2) return 0.0;
    double sum_sq_diff = 0.0;
    for (double val : values) {
        sum_sq_diff += (val - mean) * (val - mean);
    }
    return std::sqrt(sum_sq_diff / (values.size() - 1));
}

double TechnicalIndicators::calculateMean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;

    return std::accumulate(values.begin(), values.end(), 0.0) / values.size();
}

} // namespace analytics
} // namespace scalpbot
