#include "common/Config.h"
#include "common/Logger.h"
#include <iostream>
#include <cassert>
#include <cmath>
#include <filesystem>
#include <fstream>

int main() {
    using namespace scalpbot;

    spdlog::set_level(spdlog::level::debug);
    std::cout << "[TEST] Starting Config Test..." << std::endl;

    // 1. Defaults
    engine::EngineConfig defaults = Config::fromJson(nlohmann::json::object());
    assert(defaults.window_capacity == 100);
    assert(defaults.indicators.ema_short == 3 && defaults.indicators.ema_long == 7);
    assert(defaults.indicators.macd_slow == 17);
    assert(std::abs(defaults.trading.stop_loss_percent - 0.7) < 1e-9);
    assert(std::abs(defaults.trading.take_profit_percent - 1.8) < 1e-9);
    assert(std::abs(defaults.trading.max_risk_percent - 5.0) < 1e-9);
    assert(defaults.risk.max_open_positions == 3);
    assert(defaults.rate_limit.order_cooldown_seconds == 1800);
    assert(defaults.rate_limit.trading_days.size() == 5);
    assert(defaults.close_positions_on_shutdown);

    // 2. Sectioned overrides, normalization and clamping
    nlohmann::json j = {
        {"engine", {
            {"symbols", {"btc/usdt", " eth/usdt "}},
            {"window_capacity", 0},
            {"tick_interval_seconds", 30}
        }},
        {"indicators", {{"rsi_period", 9}, {"bb_period", 1}}},
        {"trading", {{"min_signal_strength", 150.0}, {"max_position_time", 15}, {"max_risk_percent", 250.0}}},
        {"risk", {{"min_position_size", 0.2}, {"max_position_size", 0.05}, {"min_time_between_trades", 60}}},
        {"rate_limit", {{"trading_days", "1, 3,9,x"}, {"trading_hours_end", 30}, {"order_cooldown", 600}}}
    };
    auto cfg = Config::fromJson(j);
    assert(cfg.symbols.size() == 2);
    assert(cfg.symbols[0] == "BTCUSDT");
    assert(cfg.symbols[1] == "ETHUSDT");
    assert(cfg.window_capacity == 1);
    assert(cfg.tick_interval_seconds == 30);
    assert(cfg.indicators.rsi_period == 9);
    assert(cfg.indicators.bb_period == 2);
    assert(cfg.trading.min_signal_strength == 100.0);
    assert(cfg.trading.max_position_time_minutes == 15);
    assert(cfg.trading.max_risk_percent == 100.0);
    assert(cfg.risk.min_position_size == 0.05 && cfg.risk.max_position_size == 0.2);
    assert(cfg.risk.min_time_between_trades_seconds == 60);
    assert((cfg.rate_limit.trading_days == std::vector<int>{1, 3}));
    assert(cfg.rate_limit.trading_hours_end == 24);
    assert(cfg.rate_limit.order_cooldown_seconds == 600);

    auto array_days = Config::fromJson({{"rate_limit", {{"trading_days", {6, 7}}}}});
    assert((array_days.rate_limit.trading_days == std::vector<int>{6, 7}));

    // 3. File loading
    const auto dir = std::filesystem::temp_directory_path() / "scalpbot_test_config";
    std::filesystem::create_directories(dir);
    const auto path = dir / "config.json";
    {
        std::ofstream out(path);
        out << R"({"engine": {"symbols": ["SOL/USDT"], "initial_balance": 2500.0},
                   "risk": {"max_open_positions": 5}})";
    }

    Config& config = Config::getInstance();
    assert(config.load(path.string()));
    assert(config.getSymbols().size() == 1 && config.getSymbols()[0] == "SOLUSDT");
    assert(config.getEngineConfig().initial_balance == 2500.0);
    assert(config.getEngineConfig().risk.max_open_positions == 5);

    // Missing and malformed files keep the last good config
    assert(!config.load((dir / "missing.json").string()));
    {
        std::ofstream out(dir / "broken.json");
        out << "{ not json";
    }
    assert(!config.load((dir / "broken.json").string()));
    assert(config.getSymbols()[0] == "SOLUSDT");

    std::filesystem::remove_all(dir);

    assert(Config::normalizeSymbol(" btc/krw ") == "BTCKRW");

    std::cout << "[TEST] Config Test PASSED!" << std::endl;
    return 0;
}
