#include "core/adapters/PaperExchange.h"
#include "common/Logger.h"

namespace scalpbot {
namespace core {

PaperExchange::PaperExchange(double initial_cash, double fee_rate)
    : fee_rate_(fee_rate)
    , cash_(initial_cash)
    , order_seq_(0)
{
    LOG_INFO("PaperExchange ready - cash {:.2f}, fee {:.4f}%", cash_, fee_rate_ * 100.0);
}

OrderResult PaperExchange::placeOrder(const std::string& symbol, OrderSide side, double quantity) {
    std::lock_guard<std::mutex> lock(mutex_);

    OrderResult result;
    if (quantity <= 0.0) {
        result.error = "invalid quantity";
        return result;
    }

    auto it = last_prices_.find(symbol);
    if (it == last_prices_.end() || it->second <= 0.0) {
        result.error = "no price for " + symbol;
        return result;
    }

    const double price = it->second;
    const double notional = price * quantity;
    const double fee = notional * fee_rate_;

    if (side == OrderSide::BUY) {
        cash_ -= notional + fee;
        holdings_[symbol] += quantity;
    } else {
        cash_ += notional - fee;
        holdings_[symbol] -= quantity;
    }

    result.success = true;
    result.order_id = "paper-" + std::to_string(++order_seq_);
    result.fill_price = price;

    LOG_DEBUG("[PAPER] {} {} {:.8f} @ {:.6f} (fee {:.6f}) -> cash {:.2f}",
              symbol, scalpbot::toString(side), quantity, price, fee, cash_);
    return result;
}

std::optional<double> PaperExchange::getBalance() {
    std::lock_guard<std::mutex> lock(mutex_);
    double equity = cash_;
    for (const auto& [symbol, qty] : holdings_) {
        auto it = last_prices_.find(symbol);
        if (it != last_prices_.end()) {
            equity += qty * it->second;
        }
    }
    return equity;
}

std::optional<double> PaperExchange::getCurrentPrice(const std::string& symbol) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_prices_.find(symbol);
    if (it == last_prices_.end()) return std::nullopt;
    return it->second;
}

void PaperExchange::updatePrice(const std::string& symbol, double price) {
    if (price <= 0.0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    last_prices_[symbol] = price;
}

double PaperExchange::cash() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cash_;
}

double PaperExchange::holding(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = holdings_.find(symbol);
    return it == holdings_.end() ? 0.0 : it->second;
}

int PaperExchange::filledOrders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return order_seq_;
}

} // namespace core
} // namespace scalpbot
