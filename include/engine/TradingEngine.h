#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "analytics/IndicatorEngine.h"
#include "common/Clock.h"
#include "common/Types.h"
#include "core/contracts/IAccountFeed.h"
#include "core/contracts/INotifier.h"
#include "core/contracts/IOrderExecutor.h"
#include "core/contracts/IPersister.h"
#include "engine/EngineConfig.h"
#include "execution/PositionLifecycle.h"
#include "execution/RateLimiter.h"
#include "market/PriceWindow.h"
#include "risk/RiskManager.h"
#include "strategy/SignalGenerator.h"

namespace scalpbot {
namespace engine {

// Outcome of one candle-closed event
enum class CandleProcessResult {
    STALE,
    INSUFFICIENT_DATA,
    POSITION_ACTIVE,
    FILTERED,           // volume confirmation failed
    GATED,              // rate limiter / trading window
    NO_SIGNAL,
    RISK_REJECTED,
    ORDER_FAILED,
    OPENED,
    SHUT_DOWN
};

const char* toString(CandleProcessResult result);

// Trading Engine - candle events + periodic position management.
// Per-symbol state is serialized by its own mutex; external collaborators are
// never called while a symbol lock is held.
class TradingEngine {
public:
    TradingEngine(
        const EngineConfig& config,
        std::shared_ptr<core::IOrderExecutor> executor,
        std::shared_ptr<core::IAccountFeed> account_feed,
        std::shared_ptr<core::INotifier> notifier,
        std::shared_ptr<core::IPersister> persister,
        std::shared_ptr<Clock> clock = std::make_shared<SystemClock>()
    );

    ~TradingEngine();

    // ===== Engine control =====

    // Starts the periodic tick thread
    bool start();
    // Stops accepting events, joins the tick thread, waits for in-flight orders
    // (shutdown_grace_seconds) and optionally flattens open positions. Idempotent.
    void stop();
    bool isRunning() const { return running_; }

    // ===== Event entry points =====

    CandleProcessResult onCandleClosed(const Candle& candle);

    // Warm-up history; no signals are evaluated. Returns the number of candles kept.
    std::size_t seedHistory(const std::string& symbol, const std::vector<Candle>& candles);

    // One management pass over every open position
    void tick();

    // ===== Manual control =====

    bool closePosition(const std::string& symbol, execution::ExitReason reason);
    int closeAllPositions(execution::ExitReason reason);

    // ===== Queries =====

    std::vector<execution::Position> getOpenPositions() const;
    std::optional<execution::Position> getPosition(const std::string& symbol) const;
    execution::PositionState positionState(const std::string& symbol) const;
    std::size_t windowSize(const std::string& symbol) const;
    std::optional<analytics::IndicatorSnapshot> lastSnapshot(const std::string& symbol) const;
    double lastBalance() const { return last_balance_.load(); }

    risk::RiskManager& riskManager() { return risk_manager_; }
    execution::RateLimiter& rateLimiter() { return rate_limiter_; }

private:
    struct SymbolState {
        SymbolState(const std::string& symbol, const EngineConfig& config);

        std::mutex mutex;
        market::PriceWindow window;
        execution::PositionLifecycle lifecycle;
        analytics::IndicatorSnapshot last_snapshot;
        double last_price = 0.0;
    };

    // Counts an action the shutdown path has to wait for
    class InFlightGuard {
    public:
        explicit InFlightGuard(TradingEngine& engine);
        ~InFlightGuard();
        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;
    private:
        TradingEngine& engine_;
    };

    void run();

    SymbolState& stateFor(const std::string& symbol);
    SymbolState* findState(const std::string& symbol) const;
    std::vector<std::pair<std::string, SymbolState*>> allStates() const;

    CandleProcessResult openFromSignal(SymbolState& state, const strategy::Signal& signal, double quantity);
    void managePosition(const std::string& symbol, SymbolState& state);
    // Flatten order for a position already in PENDING_CLOSE
    bool executeClose(const std::string& symbol, SymbolState& state, const execution::Position& position);

    double refreshBalance();
    std::optional<double> fetchPrice(const std::string& symbol);
    void emitDailySummaryIfDue();

    void emit(core::CoreEventType type, const std::string& symbol,
              const std::string& message, nlohmann::json payload = nlohmann::json::object());
    void persistSignal(const strategy::Signal& signal);
    void persistTrade(const execution::ClosedTrade& trade);
    void logPerformance();

    EngineConfig config_;
    std::shared_ptr<core::IOrderExecutor> executor_;
    std::shared_ptr<core::IAccountFeed> account_feed_;
    std::shared_ptr<core::INotifier> notifier_;
    std::shared_ptr<core::IPersister> persister_;
    std::shared_ptr<Clock> clock_;

    analytics::IndicatorEngine indicator_engine_;
    strategy::SignalGenerator signal_generator_;
    risk::RiskManager risk_manager_;
    execution::RateLimiter rate_limiter_;

    std::map<std::string, std::unique_ptr<SymbolState>> symbols_;
    mutable std::mutex registry_mutex_;

    std::atomic<bool> running_;
    std::atomic<bool> accepting_;
    std::atomic<bool> stopped_;
    std::atomic<double> last_balance_;

    std::unique_ptr<std::thread> worker_thread_;
    std::mutex tick_mutex_;
    std::condition_variable tick_cv_;

    int in_flight_;
    std::mutex in_flight_mutex_;
    std::condition_variable in_flight_cv_;
};

} // namespace engine
} // namespace scalpbot
