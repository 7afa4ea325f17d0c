#pragma once

#include <string>

#include "core/model/CoreTypes.h"

namespace scalpbot {
namespace core {

class IOrderExecutor {
public:
    virtual ~IOrderExecutor() = default;

    // Market order; implementations report failures through OrderResult
    virtual OrderResult placeOrder(const std::string& symbol, OrderSide side, double quantity) = 0;
};

} // namespace core
} // namespace scalpbot
