#pragma once

#include <string>
#include <vector>

namespace scalpbot {
namespace engine {

// Indicator periods (candles)
struct IndicatorSettings {
    int ema_short = 3;
    int ema_long = 7;
    int rsi_period = 5;
    double rsi_overbought = 70.0;
    double rsi_oversold = 30.0;
    int macd_fast = 8;
    int macd_slow = 17;
    int macd_signal = 7;
    int bb_period = 10;
    double bb_stddev = 2.0;
    int momentum_period = 3;
};

// Percent fields are in percent units (0.7 = 0.7%)
struct TradingSettings {
    int max_position_time_minutes = 10;
    double max_risk_percent = 5.0;
    double min_signal_strength = 50.0;
    double stop_loss_percent = 0.7;
    double take_profit_percent = 1.8;
    bool enable_trailing_stop = true;
    double trailing_stop_percent = 0.5;

    bool volume_filter_enabled = false;
    int volume_ma_period = 20;
    double volume_multiplier = 1.2;
};

// Size/loss fields are fractions of balance (0.05 = 5%)
struct RiskSettings {
    double max_position_size = 0.1;
    double min_position_size = 0.01;
    double default_position_size = 0.05;
    bool use_fixed_lot = false;
    double fixed_lot_size = 100.0;
    double max_daily_loss = 0.05;
    double max_position_loss = 0.02;
    int max_open_positions = 3;
    int min_time_between_trades_seconds = 300;
    int max_trade_history = 1000;
    bool adaptive_sizing = false;
};

struct RateLimitSettings {
    int signal_check_interval_seconds = 300;
    int order_cooldown_seconds = 1800;
    int max_daily_orders = 10;
    int trading_hours_start = 9;
    int trading_hours_end = 21;
    std::vector<int> trading_days{1, 2, 3, 4, 5};  // ISO weekdays
};

struct EngineConfig {
    std::vector<std::string> symbols;
    std::size_t window_capacity = 100;
    int tick_interval_seconds = 60;
    int shutdown_grace_seconds = 10;
    bool close_positions_on_shutdown = true;
    double initial_balance = 1000.0;
    std::string log_dir = "logs";
    std::string log_level = "info";
    std::string journal_path = "logs/trade_journal.jsonl";

    IndicatorSettings indicators;
    TradingSettings trading;
    RiskSettings risk;
    RateLimitSettings rate_limit;
};

} // namespace engine
} // namespace scalpbot
