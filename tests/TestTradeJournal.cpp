#include "core/state/TradeJournalJsonl.h"

#include <filesystem>
#include <iostream>

using namespace scalpbot;

int main() {
    const auto path = std::filesystem::temp_directory_path() / "scalpbot_test" / "trade_journal.jsonl";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    {
        core::TradeJournalJsonl journal(path);

        strategy::Signal signal;
        signal.symbol = "BTCUSDT";
        signal.side = OrderSide::BUY;
        signal.price = 106.0;
        signal.strength = 100.0;
        signal.stop_loss = 105.258;
        signal.take_profit = 107.908;
        signal.generated_at = 1000;

        execution::ClosedTrade trade;
        trade.symbol = "BTCUSDT";
        trade.side = OrderSide::BUY;
        trade.entry_price = 106.0;
        trade.exit_price = 107.0;
        trade.quantity = 0.5;
        trade.pnl = 0.5;
        trade.opened_at = 1000;
        trade.closed_at = 2000;
        trade.reason = execution::ExitReason::TECHNICAL_EXIT;

        if (!journal.saveSignal(signal)) {
            std::cerr << "[TEST] saveSignal failed\n";
            return 1;
        }
        if (!journal.saveTrade(trade)) {
            std::cerr << "[TEST] saveTrade failed\n";
            return 1;
        }

        if (journal.lastSeq() != 2) {
            std::cerr << "[TEST] lastSeq should be 2, got " << journal.lastSeq() << "\n";
            return 1;
        }

        const auto rows = journal.readFrom(2);
        if (rows.size() != 1 || rows.front().type != core::JournalEntryType::TRADE) {
            std::cerr << "[TEST] readFrom(2) should return the trade only\n";
            return 1;
        }
        if (rows.front().payload.value("reason", std::string()) != "technical_exit" ||
            rows.front().ts_ms != 2000) {
            std::cerr << "[TEST] unexpected trade row: " << rows.front().payload.dump() << "\n";
            return 1;
        }

        const auto all = journal.readAll();
        if (all.size() != 2 || all.front().symbol != "BTCUSDT" ||
            all.front().payload.value("side", std::string()) != "BUY") {
            std::cerr << "[TEST] readAll mismatch\n";
            return 1;
        }
    }

    // Sequence numbers continue after reopening
    core::TradeJournalJsonl reopened(path);
    if (reopened.lastSeq() != 2) {
        std::cerr << "[TEST] reopened lastSeq should be 2, got " << reopened.lastSeq() << "\n";
        return 1;
    }
    strategy::Signal another;
    another.symbol = "ETHUSDT";
    if (!reopened.saveSignal(another) || reopened.lastSeq() != 3) {
        std::cerr << "[TEST] append after reopen failed\n";
        return 1;
    }

    std::filesystem::remove_all(path.parent_path(), ec);
    std::cout << "[TEST] TradeJournal PASSED\n";
    return 0;
}
