#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace scalpbot {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

// Accepts either [1,2,3] or "1,2,3"
std::vector<int> parseTradingDays(const nlohmann::json& value, std::vector<int> fallback) {
    std::vector<int> days;
    if (value.is_array()) {
        for (const auto& d : value) {
            if (d.is_number_integer()) days.push_back(d.get<int>());
        }
    } else if (value.is_string()) {
        std::stringstream ss(value.get<std::string>());
        std::string cell;
        while (std::getline(ss, cell, ',')) {
            cell = trimCopy(cell);
            if (cell.empty()) continue;
            try {
                days.push_back(std::stoi(cell));
            } catch (const std::exception&) {
                LOG_WARN("Ignoring invalid trading day '{}'", cell);
            }
        }
    }

    days.erase(std::remove_if(days.begin(), days.end(), [](int d) { return d < 1 || d > 7; }),
               days.end());
    return days.empty() ? fallback : days;
}
}

std::string Config::normalizeSymbol(std::string symbol) {
    symbol = trimCopy(symbol);
    symbol.erase(std::remove(symbol.begin(), symbol.end(), '/'), symbol.end());
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return symbol;
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

engine::EngineConfig Config::fromJson(const nlohmann::json& j) {
    engine::EngineConfig cfg;

    if (j.contains("engine")) {
        auto& e = j["engine"];
        if (e.contains("symbols")) {
            for (const auto& s : e["symbols"].get<std::vector<std::string>>()) {
                auto symbol = normalizeSymbol(s);
                if (!symbol.empty()) cfg.symbols.push_back(symbol);
            }
        }
        cfg.window_capacity = std::max<std::size_t>(1, e.value("window_capacity", cfg.window_capacity));
        cfg.tick_interval_seconds = std::max(1, e.value("tick_interval_seconds", cfg.tick_interval_seconds));
        cfg.shutdown_grace_seconds = std::max(0, e.value("shutdown_grace_seconds", cfg.shutdown_grace_seconds));
        cfg.close_positions_on_shutdown = e.value("close_positions_on_shutdown", cfg.close_positions_on_shutdown);
        cfg.initial_balance = e.value("initial_balance", cfg.initial_balance);
        cfg.log_dir = e.value("log_dir", cfg.log_dir);
        cfg.log_level = e.value("log_level", cfg.log_level);
        cfg.journal_path = e.value("journal_path", cfg.journal_path);
    }

    if (j.contains("indicators")) {
        auto& i = j["indicators"];
        auto& s = cfg.indicators;
        s.ema_short = std::max(1, i.value("ema_short", s.ema_short));
        s.ema_long = std::max(1, i.value("ema_long", s.ema_long));
        s.rsi_period = std::max(1, i.value("rsi_period", s.rsi_period));
        s.rsi_overbought = i.value("rsi_overbought", s.rsi_overbought);
        s.rsi_oversold = i.value("rsi_oversold", s.rsi_oversold);
        s.macd_fast = std::max(1, i.value("macd_fast", s.macd_fast));
        s.macd_slow = std::max(1, i.value("macd_slow", s.macd_slow));
        s.macd_signal = std::max(1, i.value("macd_signal", s.macd_signal));
        s.bb_period = std::max(2, i.value("bb_period", s.bb_period));
        s.bb_stddev = i.value("bb_stddev", s.bb_stddev);
        s.momentum_period = std::max(1, i.value("momentum_period", s.momentum_period));
    }

    if (j.contains("trading")) {
        auto& t = j["trading"];
        auto& s = cfg.trading;
        s.max_position_time_minutes = t.value("max_position_time", s.max_position_time_minutes);
        s.max_risk_percent = std::clamp(t.value("max_risk_percent", s.max_risk_percent), 0.0, 100.0);
        s.min_signal_strength = std::clamp(t.value("min_signal_strength", s.min_signal_strength), 0.0, 100.0);
        s.stop_loss_percent = t.value("stop_loss_percent", s.stop_loss_percent);
        s.take_profit_percent = t.value("take_profit_percent", s.take_profit_percent);
        s.enable_trailing_stop = t.value("enable_trailing_stop", s.enable_trailing_stop);
        s.trailing_stop_percent = t.value("trailing_stop_percent", s.trailing_stop_percent);
        s.volume_filter_enabled = t.value("volume_filter_enabled", s.volume_filter_enabled);
        s.volume_ma_period = std::max(1, t.value("volume_ma_period", s.volume_ma_period));
        s.volume_multiplier = t.value("volume_multiplier", s.volume_multiplier);
    }

    if (j.contains("risk")) {
        auto& r = j["risk"];
        auto& s = cfg.risk;
        s.max_position_size = r.value("max_position_size", s.max_position_size);
        s.min_position_size = r.value("min_position_size", s.min_position_size);
        s.default_position_size = r.value("default_position_size", s.default_position_size);
        s.use_fixed_lot = r.value("use_fixed_lot", s.use_fixed_lot);
        s.fixed_lot_size = r.value("fixed_lot_size", s.fixed_lot_size);
        s.max_daily_loss = r.value("max_daily_loss", s.max_daily_loss);
        s.max_position_loss = r.value("max_position_loss", s.max_position_loss);
        s.max_open_positions = std::max(1, r.value("max_open_positions", s.max_open_positions));
        s.min_time_between_trades_seconds = std::max(0, r.value("min_time_between_trades", s.min_time_between_trades_seconds));
        s.max_trade_history = std::max(1, r.value("max_trade_history", s.max_trade_history));
        s.adaptive_sizing = r.value("adaptive_sizing", s.adaptive_sizing);

        if (s.min_position_size > s.max_position_size) {
            LOG_WARN("min_position_size {:.4f} > max_position_size {:.4f}, swapping",
                     s.min_position_size, s.max_position_size);
            std::swap(s.min_position_size, s.max_position_size);
        }
    }

    if (j.contains("rate_limit")) {
        auto& l = j["rate_limit"];
        auto& s = cfg.rate_limit;
        s.signal_check_interval_seconds = std::max(0, l.value("signal_check_interval", s.signal_check_interval_seconds));
        s.order_cooldown_seconds = std::max(0, l.value("order_cooldown", s.order_cooldown_seconds));
        s.max_daily_orders = std::max(0, l.value("max_daily_orders", s.max_daily_orders));
        s.trading_hours_start = std::clamp(l.value("trading_hours_start", s.trading_hours_start), 0, 24);
        s.trading_hours_end = std::clamp(l.value("trading_hours_end", s.trading_hours_end), 0, 24);
        if (l.contains("trading_days")) {
            s.trading_days = parseTradingDays(l["trading_days"], s.trading_days);
        }
    }

    return cfg;
}

bool Config::load(const std::string& path) {
    try {
        std::filesystem::path config_path;
        if (std::filesystem::path(path).is_absolute()) {
            config_path = path;
        } else if (std::filesystem::exists(path)) {
            config_path = std::filesystem::absolute(path);
        } else {
            config_path = utils::PathUtils::resolveRelativePath(path);
        }

        LOG_INFO("Config path: {}", config_path.string());

        if (!std::filesystem::exists(config_path)) {
            LOG_WARN("Config file not found: {} (using defaults)", config_path.string());
            return false;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            LOG_WARN("Config file could not be opened: {}", config_path.string());
            return false;
        }

        nlohmann::json j;
        file >> j;
        engine_config_ = fromJson(j);

        LOG_INFO("Config loaded: {} symbols, window={}, tick={}s",
                 engine_config_.symbols.size(), engine_config_.window_capacity,
                 engine_config_.tick_interval_seconds);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config load error: {}", e.what());
        return false;
    }
}

} // namespace scalpbot
