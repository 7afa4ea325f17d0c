#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace scalpbot {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file
    // Expected format: timestamp,open,high,low,close,volume (header rows skipped)
    static std::vector<Candle> loadCSV(const std::string& file_path, const std::string& symbol);

    // Load candles from a JSON array; accepts long (open/close...) or short (o/c...) keys
    static std::vector<Candle> loadJSON(const std::string& file_path, const std::string& symbol);

    // Picks the loader from the file extension
    static std::vector<Candle> load(const std::string& file_path, const std::string& symbol);

    // Keep candles with start_ms <= timestamp < end_ms
    static std::vector<Candle> filterByRange(const std::vector<Candle>& candles,
                                             TimestampMs start_ms,
                                             TimestampMs end_ms);
};

} // namespace backtest
} // namespace scalpbot
