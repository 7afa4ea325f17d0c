#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace scalpbot {

class Config {
public:
    static Config& getInstance();

    // Missing file or malformed JSON leaves the defaults in place
    bool load(const std::string& config_path);

    // Section parser shared by load() and callers holding an in-memory document
    static engine::EngineConfig fromJson(const nlohmann::json& j);

    // "btc/usdt " -> "BTCUSDT"
    static std::string normalizeSymbol(std::string symbol);

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    const std::vector<std::string>& getSymbols() const { return engine_config_.symbols; }
    std::string getLogDir() const { return engine_config_.log_dir; }
    std::string getLogLevel() const { return engine_config_.log_level; }

private:
    Config() = default;
    engine::EngineConfig engine_config_;
};

} // namespace scalpbot
