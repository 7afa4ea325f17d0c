#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "common/Types.h"
#include "core/contracts/INotifier.h"
#include "core/contracts/IPersister.h"
#include "engine/EngineConfig.h"
#include "engine/TradingEngine.h"

namespace scalpbot {
namespace backtest {

struct ReplaySummary {
    int candles = 0;
    std::map<engine::CandleProcessResult, int> outcomes;
    int ticks = 0;
    int total_trades = 0;
    double win_rate = 0.0;
    double total_pnl = 0.0;
    double initial_balance = 0.0;
    double final_balance = 0.0;

    int count(engine::CandleProcessResult result) const {
        auto it = outcomes.find(result);
        return it == outcomes.end() ? 0 : it->second;
    }
};

// Drives the engine through historical candles on a manual clock with paper fills.
// Candles of all symbols are merged in timestamp order.
class ReplayRunner {
public:
    ReplayRunner(const engine::EngineConfig& config,
                 std::shared_ptr<core::INotifier> notifier,
                 std::shared_ptr<core::IPersister> persister,
                 int utc_offset_minutes = 0);

    void addSeries(const std::string& symbol, std::vector<Candle> candles);

    ReplaySummary run();

private:
    engine::EngineConfig config_;
    std::shared_ptr<core::INotifier> notifier_;
    std::shared_ptr<core::IPersister> persister_;
    int utc_offset_minutes_;
    std::vector<Candle> candles_;
};

} // namespace backtest
} // namespace scalpbot
