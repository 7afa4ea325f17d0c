#pragma once

#include "execution/PositionLifecycle.h"
#include "strategy/SignalGenerator.h"

namespace scalpbot {
namespace core {

class IPersister {
public:
    virtual ~IPersister() = default;

    virtual bool saveSignal(const strategy::Signal& signal) = 0;
    virtual bool saveTrade(const execution::ClosedTrade& trade) = 0;
};

} // namespace core
} // namespace scalpbot
