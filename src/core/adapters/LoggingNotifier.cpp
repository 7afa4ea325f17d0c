#include "core/adapters/LoggingNotifier.h"
#include "common/Logger.h"

namespace scalpbot {
namespace core {

void LoggingNotifier::notify(const CoreEvent& event) {
    event_count_.fetch_add(1);

    switch (event.type) {
        case CoreEventType::TRADE_CLOSED: {
            const auto& p = event.payload;
            Logger::getInstance().logTrade(
                event.symbol,
                p.value("side", std::string("BUY")),
                p.value("entry_price", 0.0),
                p.value("exit_price", 0.0),
                p.value("quantity", 0.0),
                p.value("pnl", 0.0),
                p.value("reason", std::string("unknown")));
            LOG_INFO("[{}] {} {}", toString(event.type), event.symbol, event.message);
            break;
        }
        case CoreEventType::RISK_REJECTED:
            LOG_WARN("[{}] {} {}", toString(event.type), event.symbol, event.message);
            break;
        case CoreEventType::ERROR:
            LOG_ERROR("[{}] {} {}", toString(event.type), event.symbol, event.message);
            break;
        case CoreEventType::DAILY_SUMMARY:
            LOG_INFO("[{}] {} {}", toString(event.type), event.message, event.payload.dump());
            break;
        default:
            LOG_INFO("[{}] {} {}", toString(event.type), event.symbol, event.message);
            break;
    }
}

} // namespace core
} // namespace scalpbot
