#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "core/contracts/IAccountFeed.h"
#include "core/contracts/IOrderExecutor.h"

namespace scalpbot {
namespace core {

// Simulated venue: market orders fill at the last known price.
// Balance is reported as equity (cash + marked-to-market holdings).
class PaperExchange : public IOrderExecutor, public IAccountFeed {
public:
    explicit PaperExchange(double initial_cash, double fee_rate = 0.0);

    OrderResult placeOrder(const std::string& symbol, OrderSide side, double quantity) override;

    std::optional<double> getBalance() override;
    std::optional<double> getCurrentPrice(const std::string& symbol) override;

    void updatePrice(const std::string& symbol, double price);

    double cash() const;
    double holding(const std::string& symbol) const;
    int filledOrders() const;

private:
    double fee_rate_;
    double cash_;
    std::map<std::string, double> holdings_;    // signed quantity, negative = short
    std::map<std::string, double> last_prices_;
    int order_seq_;

    mutable std::mutex mutex_;
};

} // namespace core
} // namespace scalpbot
