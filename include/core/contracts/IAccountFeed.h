#pragma once

#include <optional>
#include <string>

namespace scalpbot {
namespace core {

class IAccountFeed {
public:
    virtual ~IAccountFeed() = default;

    virtual std::optional<double> getBalance() = 0;
    virtual std::optional<double> getCurrentPrice(const std::string& symbol) = 0;
};

} // namespace core
} // namespace scalpbot
