#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "backtest/DataHistory.h"
#include "backtest/ReplayRunner.h"
#include "core/adapters/LoggingNotifier.h"
#include "core/state/TradeJournalJsonl.h"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace scalpbot;

static void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <config.json>] [--utc-offset <minutes>] SYMBOL=<candles.csv|json> ...\n"
              << "  Replays historical candles through the decision core with paper fills.\n";
}

static std::string resolveConfigPath(const std::string& cli_path) {
    if (!cli_path.empty()) {
        return cli_path;
    }
    if (std::filesystem::exists("config/config.json")) {
        return "config/config.json";
    }
    return (utils::PathUtils::getConfigDir() / "config.json").string();
}

int main(int argc, char* argv[]) {
    std::string config_path;
    int utc_offset_minutes = 0;
    std::vector<std::pair<std::string, std::string>> series;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }
        if (arg == "--utc-offset" && i + 1 < argc) {
            try {
                utc_offset_minutes = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --utc-offset value. Ignored.\n";
            }
            continue;
        }

        const auto eq = arg.find('=');
        if (eq == std::string::npos || eq == 0 || eq + 1 == arg.size()) {
            std::cerr << "Unrecognized argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
        series.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
    }

    if (series.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto& config = Config::getInstance();
        const std::string resolved = resolveConfigPath(config_path);
        const bool loaded = config.load(resolved);

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());
        if (!loaded) {
            LOG_WARN("Config {} not loaded, running with defaults", resolved);
        }

        LOG_INFO("=============================================");
        LOG_INFO("       scalpbot - paper replay");
        LOG_INFO("=============================================");

        auto engine_config = config.getEngineConfig();
        auto notifier = std::make_shared<core::LoggingNotifier>();
        auto journal = std::make_shared<core::TradeJournalJsonl>(engine_config.journal_path);

        backtest::ReplayRunner runner(engine_config, notifier, journal, utc_offset_minutes);
        for (const auto& [raw_symbol, path] : series) {
            const std::string symbol = Config::normalizeSymbol(raw_symbol);
            auto candles = backtest::DataHistory::load(path, symbol);
            if (candles.empty()) {
                LOG_WARN("{}: no candles loaded from {}", symbol, path);
                continue;
            }
            runner.addSeries(symbol, std::move(candles));
        }

        const auto summary = runner.run();

        std::cout << "\n=== Replay summary ===\n"
                  << "candles:        " << summary.candles << "\n"
                  << "positions:      " << summary.count(engine::CandleProcessResult::OPENED) << "\n"
                  << "risk rejected:  " << summary.count(engine::CandleProcessResult::RISK_REJECTED) << "\n"
                  << "closed trades:  " << summary.total_trades << "\n"
                  << "win rate:       " << summary.win_rate << "%\n"
                  << "total pnl:      " << summary.total_pnl << "\n"
                  << "balance:        " << summary.initial_balance << " -> " << summary.final_balance << "\n"
                  << "journal:        " << engine_config.journal_path << " (" << journal->lastSeq() << " entries)\n";
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
