#pragma once

#include <atomic>

#include "core/contracts/INotifier.h"

namespace scalpbot {
namespace core {

// Routes engine events to the application log; closed trades also go to the trade log
class LoggingNotifier : public INotifier {
public:
    void notify(const CoreEvent& event) override;

    int eventCount() const { return event_count_.load(); }

private:
    std::atomic<int> event_count_{0};
};

} // namespace core
} // namespace scalpbot
