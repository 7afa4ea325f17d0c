#include "backtest/ReplayRunner.h"
#include "common/Clock.h"
#include "common/Logger.h"
#include "core/adapters/PaperExchange.h"

#include <algorithm>

namespace scalpbot {
namespace backtest {

ReplayRunner::ReplayRunner(const engine::EngineConfig& config,
                           std::shared_ptr<core::INotifier> notifier,
                           std::shared_ptr<core::IPersister> persister,
                           int utc_offset_minutes)
    : config_(config)
    , notifier_(std::move(notifier))
    , persister_(std::move(persister))
    , utc_offset_minutes_(utc_offset_minutes)
{}

void ReplayRunner::addSeries(const std::string& symbol, std::vector<Candle> candles) {
    for (auto& candle : candles) {
        candle.symbol = symbol;
        candles_.push_back(std::move(candle));
    }
    if (std::find(config_.symbols.begin(), config_.symbols.end(), symbol) == config_.symbols.end()) {
        config_.symbols.push_back(symbol);
    }
}

ReplaySummary ReplayRunner::run() {
    ReplaySummary summary;
    summary.initial_balance = config_.initial_balance;

    std::stable_sort(candles_.begin(), candles_.end(), [](const Candle& a, const Candle& b) {
        if (a.timestamp != b.timestamp) return a.timestamp < b.timestamp;
        return a.symbol < b.symbol;
    });

    if (candles_.empty()) {
        LOG_WARN("Replay has no candles");
        summary.final_balance = config_.initial_balance;
        return summary;
    }

    auto clock = std::make_shared<ManualClock>(candles_.front().timestamp, utc_offset_minutes_);
    auto exchange = std::make_shared<core::PaperExchange>(config_.initial_balance);

    LOG_INFO("Replay: {} candle(s) across {} symbol(s)", candles_.size(), config_.symbols.size());

    {
        engine::TradingEngine engine(config_, exchange, exchange, notifier_, persister_, clock);

        const TimestampMs tick_ms = static_cast<TimestampMs>(std::max(1, config_.tick_interval_seconds)) * 1000;
        TimestampMs last_tick = candles_.front().timestamp;

        for (const auto& candle : candles_) {
            clock->set(candle.timestamp);
            exchange->updatePrice(candle.symbol, candle.close);

            const auto result = engine.onCandleClosed(candle);
            summary.outcomes[result]++;
            summary.candles++;

            if (candle.timestamp - last_tick >= tick_ms) {
                engine.tick();
                summary.ticks++;
                last_tick = candle.timestamp;
            }
        }

        engine.stop();

        const auto stats = engine.riskManager().getTradingStats();
        summary.total_trades = stats.total_trades;
        summary.win_rate = stats.win_rate;
        summary.total_pnl = stats.total_pnl;
    }

    summary.final_balance = exchange->getBalance().value_or(config_.initial_balance);

    LOG_INFO("Replay finished: {} candle(s), {} opened, {} trade(s), pnl {:+.4f}, balance {:.2f} -> {:.2f}",
             summary.candles, summary.count(engine::CandleProcessResult::OPENED),
             summary.total_trades, summary.total_pnl, summary.initial_balance, summary.final_balance);
    return summary;
}

} // namespace backtest
} // namespace scalpbot
