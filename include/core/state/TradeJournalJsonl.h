#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/contracts/IPersister.h"

namespace scalpbot {
namespace core {

enum class JournalEntryType {
    SIGNAL,
    TRADE
};

struct JournalEntry {
    std::uint64_t seq = 0;
    TimestampMs ts_ms = 0;
    JournalEntryType type = JournalEntryType::SIGNAL;
    std::string symbol;
    nlohmann::json payload;
};

// Append-only JSON-lines journal of signals and closed trades
class TradeJournalJsonl : public IPersister {
public:
    explicit TradeJournalJsonl(std::filesystem::path file_path);

    bool saveSignal(const strategy::Signal& signal) override;
    bool saveTrade(const execution::ClosedTrade& trade) override;

    std::vector<JournalEntry> readFrom(std::uint64_t seq_inclusive);
    std::vector<JournalEntry> readAll() { return readFrom(0); }
    std::uint64_t lastSeq() const;

private:
    bool append(JournalEntryType type, const std::string& symbol, TimestampMs ts_ms, nlohmann::json payload);

    static std::string toString(JournalEntryType type);
    static JournalEntryType fromString(const std::string& value);

    std::filesystem::path file_path_;
    mutable std::mutex mutex_;
    std::uint64_t last_seq_ = 0;
};

} // namespace core
} // namespace scalpbot
