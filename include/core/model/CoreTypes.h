#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace scalpbot {
namespace core {

struct OrderResult {
    bool success = false;
    std::string order_id;
    double fill_price = 0.0;
    std::string error;
};

enum class CoreEventType {
    SIGNAL_GENERATED,
    TRADE_OPENED,
    TRADE_CLOSED,
    RISK_REJECTED,
    DAILY_SUMMARY,
    ERROR
};

inline const char* toString(CoreEventType type) {
    switch (type) {
        case CoreEventType::SIGNAL_GENERATED: return "SIGNAL_GENERATED";
        case CoreEventType::TRADE_OPENED: return "TRADE_OPENED";
        case CoreEventType::TRADE_CLOSED: return "TRADE_CLOSED";
        case CoreEventType::RISK_REJECTED: return "RISK_REJECTED";
        case CoreEventType::DAILY_SUMMARY: return "DAILY_SUMMARY";
        case CoreEventType::ERROR: return "ERROR";
    }
    return "ERROR";
}

struct CoreEvent {
    CoreEventType type = CoreEventType::ERROR;
    std::string symbol;
    TimestampMs ts_ms = 0;
    std::string message;
    nlohmann::json payload = nlohmann::json::object();
};

} // namespace core
} // namespace scalpbot
