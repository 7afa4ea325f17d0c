#include "backtest/DataHistory.h"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include "common/Logger.h"

namespace scalpbot {
namespace backtest {

namespace {
void sortByTimestamp(std::vector<Candle>& candles) {
    std::stable_sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.timestamp < b.timestamp;
    });
}

template<typename T>
T firstOf(const nlohmann::json& item, const char* long_key, const char* short_key, T fallback) {
    if (item.contains(long_key)) return item.at(long_key).get<T>();
    if (item.contains(short_key)) return item.at(short_key).get<T>();
    return fallback;
}
}

std::vector<Candle> DataHistory::loadCSV(const std::string& file_path, const std::string& symbol) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open CSV file: {}", file_path);
        return candles;
    }

    auto trim = [](std::string s) {
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
            s.erase(s.begin());
        }
        while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
            s.pop_back();
        }
        return s;
    };

    auto normalizeCell = [&](std::string s) {
        s = trim(std::move(s));

        // UTF-8 BOM on the first cell
        if (s.size() >= 3 &&
            static_cast<unsigned char>(s[0]) == 0xEF &&
            static_cast<unsigned char>(s[1]) == 0xBB &&
            static_cast<unsigned char>(s[2]) == 0xBF) {
            s = s.substr(3);
        }

        if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
            s = s.substr(1, s.size() - 2);
        }
        return trim(std::move(s));
    };

    std::string line;
    int skipped = 0;

    while (std::getline(file, line)) {
        std::stringstream ss(line);
        std::string cell;
        std::vector<std::string> row;

        while (std::getline(ss, cell, ',')) {
            row.push_back(normalizeCell(cell));
        }

        if (row.size() < 6 || row[0].empty()) continue;
        if (!std::isdigit(static_cast<unsigned char>(row[0][0]))) {
            // header
            continue;
        }

        try {
            candles.emplace_back(symbol,
                                 std::stod(row[1]), std::stod(row[2]), std::stod(row[3]),
                                 std::stod(row[4]), std::stod(row[5]), std::stoll(row[0]));
        } catch (const std::exception& e) {
            skipped++;
            LOG_WARN("Error parsing row: {} - {}", line, e.what());
        }
    }

    sortByTimestamp(candles);
    LOG_INFO("Loaded {} candles for {} from {} ({} skipped)", candles.size(), symbol, file_path, skipped);
    return candles;
}

std::vector<Candle> DataHistory::loadJSON(const std::string& file_path, const std::string& symbol) {
    std::vector<Candle> candles;
    std::ifstream file(file_path);

    if (!file.is_open()) {
        LOG_ERROR("Failed to open JSON file: {}", file_path);
        return candles;
    }

    try {
        nlohmann::json j;
        file >> j;
        if (!j.is_array()) {
            LOG_ERROR("JSON candle file {} is not an array", file_path);
            return candles;
        }

        for (const auto& item : j) {
            Candle candle;
            candle.symbol = symbol;
            candle.timestamp = firstOf<TimestampMs>(item, "timestamp", "t", 0);
            candle.open = firstOf<double>(item, "open", "o", 0.0);
            candle.high = firstOf<double>(item, "high", "h", 0.0);
            candle.low = firstOf<double>(item, "low", "l", 0.0);
            candle.close = firstOf<double>(item, "close", "c", 0.0);
            candle.volume = firstOf<double>(item, "volume", "v", 0.0);
            candles.push_back(candle);
        }
        sortByTimestamp(candles);
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Error parsing JSON file: {} - {}", file_path, e.what());
        candles.clear();
    }

    LOG_INFO("Loaded {} candles for {} from {}", candles.size(), symbol, file_path);
    return candles;
}

std::vector<Candle> DataHistory::load(const std::string& file_path, const std::string& symbol) {
    std::string ext = std::filesystem::path(file_path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext == ".json" ? loadJSON(file_path, symbol) : loadCSV(file_path, symbol);
}

std::vector<Candle> DataHistory::filterByRange(const std::vector<Candle>& candles,
                                               TimestampMs start_ms,
                                               TimestampMs end_ms) {
    std::vector<Candle> out;
    std::copy_if(candles.begin(), candles.end(), std::back_inserter(out), [&](const Candle& c) {
        return c.timestamp >= start_ms && c.timestamp < end_ms;
    });
    return out;
}

} // namespace backtest
} // namespace scalpbot
