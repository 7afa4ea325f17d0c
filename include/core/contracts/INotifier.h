#pragma once

#include "core/model/CoreTypes.h"

namespace scalpbot {
namespace core {

class INotifier {
public:
    virtual ~INotifier() = default;

    virtual void notify(const CoreEvent& event) = 0;
};

} // namespace core
} // namespace scalpbot
