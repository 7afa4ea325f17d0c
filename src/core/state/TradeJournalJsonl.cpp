#include "core/state/TradeJournalJsonl.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>

namespace scalpbot {
namespace core {

namespace {
std::uint64_t parseSeq(const nlohmann::json& line) {
    return line.value("seq", static_cast<std::uint64_t>(0));
}
}

TradeJournalJsonl::TradeJournalJsonl(std::filesystem::path file_path)
    : file_path_(std::move(file_path)) {
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }
        try {
            last_seq_ = (std::max)(last_seq_, parseSeq(nlohmann::json::parse(row)));
        } catch (const nlohmann::json::exception& e) {
            LOG_WARN("Skipping malformed journal line in {}: {}", file_path_.string(), e.what());
        }
    }
}

bool TradeJournalJsonl::saveSignal(const strategy::Signal& signal) {
    nlohmann::json payload;
    payload["side"] = scalpbot::toString(signal.side);
    payload["price"] = signal.price;
    payload["strength"] = signal.strength;
    payload["stop_loss"] = signal.stop_loss;
    payload["take_profit"] = signal.take_profit;
    return append(JournalEntryType::SIGNAL, signal.symbol, signal.generated_at, std::move(payload));
}

bool TradeJournalJsonl::saveTrade(const execution::ClosedTrade& trade) {
    nlohmann::json payload;
    payload["side"] = scalpbot::toString(trade.side);
    payload["entry_price"] = trade.entry_price;
    payload["exit_price"] = trade.exit_price;
    payload["quantity"] = trade.quantity;
    payload["pnl"] = trade.pnl;
    payload["opened_at"] = trade.opened_at;
    payload["closed_at"] = trade.closed_at;
    payload["reason"] = execution::toString(trade.reason);
    payload["signal_strength"] = trade.signal_strength;
    return append(JournalEntryType::TRADE, trade.symbol, trade.closed_at, std::move(payload));
}

bool TradeJournalJsonl::append(JournalEntryType type,
                               const std::string& symbol,
                               TimestampMs ts_ms,
                               nlohmann::json payload) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path(), ec);
        if (ec) {
            LOG_ERROR("Journal directory {} unavailable: {}", file_path_.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream out(file_path_, std::ios::binary | std::ios::app);
    if (!out.is_open()) {
        LOG_ERROR("Journal file {} could not be opened", file_path_.string());
        return false;
    }

    const std::uint64_t next_seq = last_seq_ + 1;
    nlohmann::json line;
    line["seq"] = next_seq;
    line["ts_ms"] = ts_ms;
    line["type"] = toString(type);
    line["symbol"] = symbol;
    line["payload"] = std::move(payload);

    out << line.dump() << "\n";
    if (!out) {
        LOG_ERROR("Journal write to {} failed", file_path_.string());
        return false;
    }
    last_seq_ = next_seq;
    return true;
}

std::vector<JournalEntry> TradeJournalJsonl::readFrom(std::uint64_t seq_inclusive) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEntry> out;
    std::ifstream in(file_path_, std::ios::binary);
    if (!in.is_open()) {
        return out;
    }

    std::string row;
    while (std::getline(in, row)) {
        if (row.empty()) {
            continue;
        }

        nlohmann::json line;
        try {
            line = nlohmann::json::parse(row);
        } catch (const nlohmann::json::exception&) {
            continue;
        }

        const auto seq = parseSeq(line);
        if (seq < seq_inclusive) {
            continue;
        }

        JournalEntry entry;
        entry.seq = seq;
        entry.ts_ms = line.value("ts_ms", 0LL);
        entry.type = fromString(line.value("type", std::string("SIGNAL")));
        entry.symbol = line.value("symbol", std::string());
        entry.payload = line.value("payload", nlohmann::json::object());
        out.push_back(std::move(entry));
    }

    return out;
}

std::uint64_t TradeJournalJsonl::lastSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_seq_;
}

std::string TradeJournalJsonl::toString(JournalEntryType type) {
    switch (type) {
        case JournalEntryType::SIGNAL: return "SIGNAL";
        case JournalEntryType::TRADE: return "TRADE";
    }
    return "SIGNAL";
}

JournalEntryType TradeJournalJsonl::fromString(const std::string& value) {
    if (value == "TRADE") return JournalEntryType::TRADE;
    return JournalEntryType::SIGNAL;
}

} // namespace core
} // namespace scalpbot
