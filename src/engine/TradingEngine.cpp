#include "engine/TradingEngine.h"
#include "common/Logger.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace scalpbot {
namespace engine {

const char* toString(CandleProcessResult result) {
    switch (result) {
        case CandleProcessResult::STALE: return "stale";
        case CandleProcessResult::INSUFFICIENT_DATA: return "insufficient_data";
        case CandleProcessResult::POSITION_ACTIVE: return "position_active";
        case CandleProcessResult::FILTERED: return "filtered";
        case CandleProcessResult::GATED: return "gated";
        case CandleProcessResult::NO_SIGNAL: return "no_signal";
        case CandleProcessResult::RISK_REJECTED: return "risk_rejected";
        case CandleProcessResult::ORDER_FAILED: return "order_failed";
        case CandleProcessResult::OPENED: return "opened";
        case CandleProcessResult::SHUT_DOWN: return "shut_down";
    }
    return "unknown";
}

TradingEngine::SymbolState::SymbolState(const std::string& symbol, const EngineConfig& config)
    : window(config.window_capacity)
    , lifecycle(symbol, config.trading, config.indicators)
{}

TradingEngine::InFlightGuard::InFlightGuard(TradingEngine& engine)
    : engine_(engine) {
    std::lock_guard<std::mutex> lock(engine_.in_flight_mutex_);
    engine_.in_flight_++;
}

TradingEngine::InFlightGuard::~InFlightGuard() {
    {
        std::lock_guard<std::mutex> lock(engine_.in_flight_mutex_);
        engine_.in_flight_--;
    }
    engine_.in_flight_cv_.notify_all();
}

TradingEngine::TradingEngine(
    const EngineConfig& config,
    std::shared_ptr<core::IOrderExecutor> executor,
    std::shared_ptr<core::IAccountFeed> account_feed,
    std::shared_ptr<core::INotifier> notifier,
    std::shared_ptr<core::IPersister> persister,
    std::shared_ptr<Clock> clock
)
    : config_(config)
    , executor_(std::move(executor))
    , account_feed_(std::move(account_feed))
    , notifier_(std::move(notifier))
    , persister_(std::move(persister))
    , clock_(clock ? std::move(clock) : std::make_shared<SystemClock>())
    , indicator_engine_(config_.indicators)
    , signal_generator_(config_.trading)
    , risk_manager_(config_.risk, clock_)
    , rate_limiter_(config_.rate_limit, clock_)
    , running_(false)
    , accepting_(true)
    , stopped_(false)
    , last_balance_(config.initial_balance)
    , in_flight_(0)
{
    if (!executor_ || !account_feed_) {
        throw std::invalid_argument("TradingEngine requires an order executor and an account feed");
    }

    if (config_.window_capacity < indicator_engine_.requiredCandles()) {
        LOG_WARN("window_capacity {} is below the indicator lookback {}, raised to {}",
                 config_.window_capacity, indicator_engine_.requiredCandles(),
                 indicator_engine_.requiredCandles());
        config_.window_capacity = indicator_engine_.requiredCandles();
    }

    for (const auto& symbol : config_.symbols) {
        symbols_.emplace(symbol, std::make_unique<SymbolState>(symbol, config_));
    }

    LOG_INFO("TradingEngine initialized - {} symbol(s), window {}, lookback {}, tick {}s",
             symbols_.size(), config_.window_capacity, indicator_engine_.requiredCandles(),
             config_.tick_interval_seconds);
}

TradingEngine::~TradingEngine() {
    stop();
}

// ===== Engine control =====

bool TradingEngine::start() {
    if (running_ || stopped_) {
        LOG_WARN("TradingEngine start ignored ({})", running_ ? "already running" : "already stopped");
        return false;
    }

    LOG_INFO("========================================");
    LOG_INFO("TradingEngine starting");
    LOG_INFO("========================================");

    refreshBalance();
    LOG_INFO("Risk per trade {:.2f}%, stop {:.2f}%, target {:.2f}%, max open {}",
             config_.trading.max_risk_percent, config_.trading.stop_loss_percent,
             config_.trading.take_profit_percent, config_.risk.max_open_positions);
    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&TradingEngine::run, this);
    return true;
}

void TradingEngine::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    LOG_INFO("========================================");
    LOG_INFO("TradingEngine stopping");
    LOG_INFO("========================================");

    accepting_ = false;
    {
        std::lock_guard<std::mutex> lock(tick_mutex_);
        running_ = false;
    }
    tick_cv_.notify_all();

    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }

    {
        std::unique_lock<std::mutex> lock(in_flight_mutex_);
        const bool drained = in_flight_cv_.wait_for(
            lock,
            std::chrono::seconds(std::max(0, config_.shutdown_grace_seconds)),
            [this] { return in_flight_ == 0; }
        );
        if (!drained) {
            LOG_WARN("Shutdown grace period ({}s) elapsed with {} action(s) in flight, abandoning them",
                     config_.shutdown_grace_seconds, in_flight_);
        }
    }

    if (config_.close_positions_on_shutdown) {
        const int closed = closeAllPositions(execution::ExitReason::SHUTDOWN);
        LOG_INFO("Shutdown flattened {} position(s)", closed);
    }

    logPerformance();
}

void TradingEngine::run() {
    LOG_INFO("Tick loop started (every {}s)", config_.tick_interval_seconds);
    const auto interval = std::chrono::seconds(std::max(1, config_.tick_interval_seconds));

    while (running_) {
        try {
            tick();
        } catch (const std::exception& e) {
            LOG_ERROR("Tick failed: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(tick_mutex_);
        tick_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
    }

    LOG_INFO("Tick loop stopped");
}

// ===== Event entry points =====

CandleProcessResult TradingEngine::onCandleClosed(const Candle& candle) {
    InFlightGuard guard(*this);
    if (!accepting_) {
        LOG_DEBUG("{} candle ignored: engine shutting down", candle.symbol);
        return CandleProcessResult::SHUT_DOWN;
    }

    const std::string& symbol = candle.symbol;
    const double balance = refreshBalance();
    auto& state = stateFor(symbol);

    std::optional<strategy::Signal> signal;
    risk::RiskDecision decision;
    CandleProcessResult outcome = CandleProcessResult::NO_SIGNAL;

    {
        std::lock_guard<std::mutex> lock(state.mutex);

        if (state.window.append(candle) == market::AppendResult::STALE) {
            LOG_DEBUG("{} stale candle {} rejected", symbol, candle.timestamp);
            return CandleProcessResult::STALE;
        }

        const auto candles = state.window.snapshot();
        state.last_snapshot = indicator_engine_.compute(candles);
        state.last_price = candle.close;

        if (!state.last_snapshot.isValid()) {
            LOG_DEBUG("{} insufficient data ({}/{})", symbol, candles.size(), indicator_engine_.requiredCandles());
            return CandleProcessResult::INSUFFICIENT_DATA;
        }

        if (state.lifecycle.hasPosition()) {
            return CandleProcessResult::POSITION_ACTIVE;
        }

        if (config_.trading.volume_filter_enabled) {
            const double ratio = analytics::IndicatorEngine::volumeRatio(candles, config_.trading.volume_ma_period);
            if (ratio <= config_.trading.volume_multiplier) {
                LOG_DEBUG("{} volume ratio {:.2f} <= {:.2f}, skipped", symbol, ratio, config_.trading.volume_multiplier);
                return CandleProcessResult::FILTERED;
            }
        }

        if (!rate_limiter_.canCheckSignal(symbol)) {
            return CandleProcessResult::GATED;
        }

        signal = signal_generator_.evaluate(
            symbol, state.last_snapshot, candle.close, state.lifecycle.hasPosition(), clock_->nowMs());
        rate_limiter_.registerSignal(symbol);
        if (!signal) {
            return CandleProcessResult::NO_SIGNAL;
        }

        if (!rate_limiter_.canPlaceOrder(symbol)) {
            outcome = CandleProcessResult::GATED;
        } else {
            risk_manager_.adjustLevels(*signal);
            decision = risk_manager_.reserve(*signal, balance);
            if (!decision.accepted) {
                outcome = CandleProcessResult::RISK_REJECTED;
            } else if (!state.lifecycle.beginOpen()) {
                risk_manager_.cancelReservation(symbol);
                outcome = CandleProcessResult::POSITION_ACTIVE;
            } else {
                outcome = CandleProcessResult::OPENED;
            }
        }
    }

    persistSignal(*signal);
    emit(core::CoreEventType::SIGNAL_GENERATED, symbol,
         std::string(scalpbot::toString(signal->side)) + " signal",
         {{"side", scalpbot::toString(signal->side)},
          {"price", signal->price},
          {"strength", signal->strength},
          {"stop_loss", signal->stop_loss},
          {"take_profit", signal->take_profit}});

    if (outcome == CandleProcessResult::RISK_REJECTED) {
        emit(core::CoreEventType::RISK_REJECTED, symbol, decision.message,
             {{"reason", risk::toString(decision.reason)}, {"balance", balance}});
        return outcome;
    }
    if (outcome != CandleProcessResult::OPENED) {
        return outcome;
    }

    return openFromSignal(state, *signal, decision.quantity);
}

CandleProcessResult TradingEngine::openFromSignal(SymbolState& state,
                                                  const strategy::Signal& signal,
                                                  double quantity) {
    const std::string& symbol = signal.symbol;

    core::OrderResult result;
    try {
        result = executor_->placeOrder(symbol, signal.side, quantity);
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
    }

    if (!result.success) {
        {
            std::lock_guard<std::mutex> lock(state.mutex);
            state.lifecycle.abortOpen();
            risk_manager_.cancelReservation(symbol);
        }
        LOG_ERROR("{} entry order failed: {}", symbol, result.error);
        emit(core::CoreEventType::ERROR, symbol, "entry order failed: " + result.error);
        return CandleProcessResult::ORDER_FAILED;
    }

    execution::Position position;
    position.symbol = symbol;
    position.side = signal.side;
    position.entry_price = result.fill_price > 0.0 ? result.fill_price : signal.price;
    position.quantity = quantity;
    position.stop_loss = signal.stop_loss;
    position.take_profit = signal.take_profit;
    if (signal.price > 0.0 && position.entry_price != signal.price) {
        // Keep the configured percentage distances from the actual fill
        const double scale = position.entry_price / signal.price;
        position.stop_loss *= scale;
        position.take_profit *= scale;
        LOG_DEBUG("{} filled at {:.6f} (signal {:.6f}), levels re-based", symbol,
                  position.entry_price, signal.price);
    }
    position.opened_at = clock_->nowMs();
    position.signal_strength = signal.strength;
    position.order_id = result.order_id;
    position.best_price = position.entry_price;

    // Risk slot and order budget commit together with the lifecycle, under the symbol lock
    bool confirmed = false;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        confirmed = state.lifecycle.confirmOpen(position);
        if (confirmed) {
            risk_manager_.onPositionOpened(symbol);
            rate_limiter_.registerOrder(symbol);
        } else {
            risk_manager_.cancelReservation(symbol);
        }
    }
    if (!confirmed) {
        emit(core::CoreEventType::ERROR, symbol, "filled order " + result.order_id + " could not be recorded");
        return CandleProcessResult::ORDER_FAILED;
    }

    emit(core::CoreEventType::TRADE_OPENED, symbol,
         std::string(scalpbot::toString(position.side)) + " opened",
         {{"side", scalpbot::toString(position.side)},
          {"entry_price", position.entry_price},
          {"quantity", position.quantity},
          {"stop_loss", position.stop_loss},
          {"take_profit", position.take_profit},
          {"order_id", position.order_id}});
    return CandleProcessResult::OPENED;
}

std::size_t TradingEngine::seedHistory(const std::string& symbol, const std::vector<Candle>& candles) {
    auto& state = stateFor(symbol);
    std::lock_guard<std::mutex> lock(state.mutex);

    std::size_t appended = 0;
    for (const auto& candle : candles) {
        if (state.window.append(candle) == market::AppendResult::APPENDED) {
            appended++;
        }
    }

    state.last_snapshot = indicator_engine_.compute(state.window.snapshot());
    if (auto latest = state.window.latest()) {
        state.last_price = latest->close;
    }

    LOG_INFO("{} seeded with {} candle(s), window {}/{}", symbol, appended,
             state.window.size(), state.window.capacity());
    return state.window.size();
}

// ===== Periodic management =====

void TradingEngine::tick() {
    InFlightGuard guard(*this);
    refreshBalance();

    for (const auto& [symbol, state] : allStates()) {
        try {
            managePosition(symbol, *state);
        } catch (const std::exception& e) {
            LOG_ERROR("{} position management failed: {}", symbol, e.what());
        }
    }

    emitDailySummaryIfDue();
}

void TradingEngine::managePosition(const std::string& symbol, SymbolState& state) {
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.lifecycle.isOpen()) return;
    }

    const auto price = fetchPrice(symbol);

    std::optional<execution::Position> to_close;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.lifecycle.isOpen()) return;

        const double current_price = price ? *price : state.last_price;
        if (current_price <= 0.0) return;
        if (price) state.last_price = *price;

        const auto reason = state.lifecycle.manage(current_price, state.last_snapshot, clock_->nowMs());
        if (reason == execution::ExitReason::NONE) return;
        if (!state.lifecycle.beginClose(reason)) return;
        to_close = state.lifecycle.position();
    }

    if (to_close) {
        executeClose(symbol, state, *to_close);
    }
}

bool TradingEngine::executeClose(const std::string& symbol,
                                 SymbolState& state,
                                 const execution::Position& position) {
    core::OrderResult result;
    try {
        result = executor_->placeOrder(symbol, opposite(position.side), position.quantity);
    } catch (const std::exception& e) {
        result.success = false;
        result.error = e.what();
    }

    std::optional<execution::ClosedTrade> trade;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!result.success) {
            state.lifecycle.abortClose();
        } else {
            double exit_price = result.fill_price;
            if (exit_price <= 0.0) {
                exit_price = state.last_price > 0.0 ? state.last_price : position.entry_price;
            }
            trade = state.lifecycle.confirmClose(exit_price, clock_->nowMs());
            if (trade) {
                risk_manager_.recordResult(symbol, trade->pnl,
                                           trade->pnl > 0.0 ? risk::TradeOutcome::WIN : risk::TradeOutcome::LOSS);
            }
        }
    }

    if (!result.success) {
        LOG_ERROR("{} exit order failed: {}", symbol, result.error);
        emit(core::CoreEventType::ERROR, symbol, "exit order failed: " + result.error);
        return false;
    }
    if (!trade) {
        return false;
    }

    persistTrade(*trade);

    emit(core::CoreEventType::TRADE_CLOSED, symbol,
         std::string("closed (") + execution::toString(trade->reason) + ")",
         {{"side", scalpbot::toString(trade->side)},
          {"entry_price", trade->entry_price},
          {"exit_price", trade->exit_price},
          {"quantity", trade->quantity},
          {"pnl", trade->pnl},
          {"reason", execution::toString(trade->reason)}});
    return true;
}

// ===== Manual control =====

bool TradingEngine::closePosition(const std::string& symbol, execution::ExitReason reason) {
    auto* state = findState(symbol);
    if (!state) {
        return false;
    }

    std::optional<execution::Position> to_close;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->lifecycle.isOpen()) return false;
        if (!state->lifecycle.beginClose(reason)) return false;
        to_close = state->lifecycle.position();
    }

    return to_close && executeClose(symbol, *state, *to_close);
}

int TradingEngine::closeAllPositions(execution::ExitReason reason) {
    int closed = 0;
    for (const auto& [symbol, state] : allStates()) {
        if (closePosition(symbol, reason)) {
            closed++;
        }
    }
    return closed;
}

// ===== Queries =====

std::vector<execution::Position> TradingEngine::getOpenPositions() const {
    std::vector<execution::Position> out;
    for (const auto& [symbol, state] : allStates()) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->lifecycle.isOpen() && state->lifecycle.position()) {
            out.push_back(*state->lifecycle.position());
        }
    }
    return out;
}

std::optional<execution::Position> TradingEngine::getPosition(const std::string& symbol) const {
    auto* state = findState(symbol);
    if (!state) return std::nullopt;
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->lifecycle.position();
}

execution::PositionState TradingEngine::positionState(const std::string& symbol) const {
    auto* state = findState(symbol);
    if (!state) return execution::PositionState::NONE;
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->lifecycle.state();
}

std::size_t TradingEngine::windowSize(const std::string& symbol) const {
    auto* state = findState(symbol);
    if (!state) return 0;
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->window.size();
}

std::optional<analytics::IndicatorSnapshot> TradingEngine::lastSnapshot(const std::string& symbol) const {
    auto* state = findState(symbol);
    if (!state) return std::nullopt;
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->last_snapshot;
}

// ===== Helpers =====

TradingEngine::SymbolState& TradingEngine::stateFor(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        LOG_INFO("Tracking new symbol {}", symbol);
        it = symbols_.emplace(symbol, std::make_unique<SymbolState>(symbol, config_)).first;
    }
    return *it->second;
}

TradingEngine::SymbolState* TradingEngine::findState(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = symbols_.find(symbol);
    return it == symbols_.end() ? nullptr : it->second.get();
}

std::vector<std::pair<std::string, TradingEngine::SymbolState*>> TradingEngine::allStates() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<std::pair<std::string, SymbolState*>> out;
    out.reserve(symbols_.size());
    for (const auto& [symbol, state] : symbols_) {
        out.emplace_back(symbol, state.get());
    }
    return out;
}

double TradingEngine::refreshBalance() {
    try {
        auto balance = account_feed_->getBalance();
        if (balance) {
            last_balance_ = *balance;
        } else {
            LOG_WARN("Balance unavailable, using cached {:.2f}", last_balance_.load());
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Balance query failed: {}", e.what());
        emit(core::CoreEventType::ERROR, "", std::string("balance query failed: ") + e.what());
    }
    return last_balance_.load();
}

std::optional<double> TradingEngine::fetchPrice(const std::string& symbol) {
    try {
        return account_feed_->getCurrentPrice(symbol);
    } catch (const std::exception& e) {
        LOG_ERROR("{} price query failed: {}", symbol, e.what());
        return std::nullopt;
    }
}

void TradingEngine::emitDailySummaryIfDue() {
    auto day = risk_manager_.takeCompletedDay();
    if (!day) return;

    emit(core::CoreEventType::DAILY_SUMMARY, "",
         "day " + std::to_string(day->date) + " closed",
         {{"date", day->date},
          {"trade_count", day->trade_count},
          {"realized_pnl", day->realized_pnl},
          {"wins", day->wins},
          {"losses", day->losses}});
}

void TradingEngine::emit(core::CoreEventType type, const std::string& symbol,
                         const std::string& message, nlohmann::json payload) {
    if (!notifier_) return;

    core::CoreEvent event;
    event.type = type;
    event.symbol = symbol;
    event.ts_ms = clock_->nowMs();
    event.message = message;
    event.payload = std::move(payload);

    try {
        notifier_->notify(event);
    } catch (const std::exception& e) {
        LOG_ERROR("Notifier failed on {}: {}", core::toString(type), e.what());
    }
}

void TradingEngine::persistSignal(const strategy::Signal& signal) {
    if (!persister_) return;

    bool saved = false;
    try {
        saved = persister_->saveSignal(signal);
    } catch (const std::exception& e) {
        LOG_ERROR("{} signal persistence threw: {}", signal.symbol, e.what());
    }
    if (!saved) {
        emit(core::CoreEventType::ERROR, signal.symbol, "signal persistence failed");
    }
}

void TradingEngine::persistTrade(const execution::ClosedTrade& trade) {
    if (!persister_) return;

    bool saved = false;
    try {
        saved = persister_->saveTrade(trade);
    } catch (const std::exception& e) {
        LOG_ERROR("{} trade persistence threw: {}", trade.symbol, e.what());
    }
    if (!saved) {
        emit(core::CoreEventType::ERROR, trade.symbol, "trade persistence failed");
    }
}

void TradingEngine::logPerformance() {
    const auto stats = risk_manager_.getTradingStats();
    const auto daily = risk_manager_.getDailyStats();

    LOG_INFO("========================================");
    LOG_INFO("Performance: {} trade(s), win rate {:.1f}%, total pnl {:+.4f}",
             stats.total_trades, stats.win_rate, stats.total_pnl);
    LOG_INFO("  avg win {:+.4f} / avg loss {:+.4f}", stats.avg_win, stats.avg_loss);
    LOG_INFO("  today {}: {} trade(s), pnl {:+.4f}, W/L {}/{}",
             daily.date, daily.trade_count, daily.realized_pnl, daily.wins, daily.losses);
    LOG_INFO("  balance {:.2f}", last_balance_.load());
    LOG_INFO("========================================");
}

} // namespace engine
} // namespace scalpbot
