#include "execution/BalanceTracker.h"

#include "common/Logger.h"

#include <algorithm>

namespace gridpilot {
namespace execution {

BalanceTracker::BalanceTracker(core::EventBus& event_bus,
                               FeeCalculator fee_calculator,
                               double initial_balance,
                               double initial_crypto_balance)
    : event_bus_(event_bus)
    , fee_calculator_(fee_calculator)
    , balance_(initial_balance)
    , crypto_balance_(initial_crypto_balance) {
    completed_subscription_ = event_bus_.subscribe(
        core::EventType::ORDER_COMPLETED,
        [this](const core::EventPayload& payload) { onOrderCompleted(payload); });
    cancelled_subscription_ = event_bus_.subscribe(
        core::EventType::ORDER_CANCELLED,
        [this](const core::EventPayload& payload) { onOrderCancelled(payload); });
}

BalanceTracker::~BalanceTracker() {
    event_bus_.unsubscribe(completed_subscription_);
    event_bus_.unsubscribe(cancelled_subscription_);
}

void BalanceTracker::setupBalances(double balance, double crypto_balance) {
    std::lock_guard<std::mutex> lock(mutex_);
    balance_ = balance;
    crypto_balance_ = crypto_balance;
    LOG_INFO("Balances initialized: fiat={:.2f}, crypto={:.8f}", balance_, crypto_balance_);
}

// ===== Reservations =====

ReservationResult BalanceTracker::reserveFundsForBuy(double amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (balance_ < amount) {
        return ReservationResult::INSUFFICIENT_BALANCE;
    }
    balance_ -= amount;
    reserved_fiat_ += amount;
    LOG_DEBUG("Reserved {:.2f} fiat for buy (available {:.2f}, reserved {:.2f})",
              amount, balance_, reserved_fiat_);
    return ReservationResult::OK;
}

ReservationResult BalanceTracker::reserveFundsForSell(double quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (crypto_balance_ < quantity) {
        return ReservationResult::INSUFFICIENT_CRYPTO_BALANCE;
    }
    crypto_balance_ -= quantity;
    reserved_crypto_ += quantity;
    LOG_DEBUG("Reserved {:.8f} crypto for sell (available {:.8f}, reserved {:.8f})",
              quantity, crypto_balance_, reserved_crypto_);
    return ReservationResult::OK;
}

void BalanceTracker::releaseReservedFiat(double amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double released = std::min(amount, reserved_fiat_);
    reserved_fiat_ -= released;
    balance_ += released;
}

void BalanceTracker::releaseReservedCrypto(double quantity) {
    std::lock_guard<std::mutex> lock(mutex_);
    const double released = std::min(quantity, reserved_crypto_);
    reserved_crypto_ -= released;
    crypto_balance_ += released;
}

// ===== Settlement =====

void BalanceTracker::settleBuyFill(double quantity, double price) {
    const double fee = fee_calculator_.calculateFee(quantity * price);
    const double total_cost = quantity * price + fee;

    reserved_fiat_ -= total_cost;
    if (reserved_fiat_ < 0.0) {
        balance_ += reserved_fiat_;
        reserved_fiat_ = 0.0;
    }
    crypto_balance_ += quantity;
    total_fees_ += fee;
}

void BalanceTracker::settleSellFill(double quantity, double price) {
    const double fee = fee_calculator_.calculateFee(quantity * price);

    reserved_crypto_ -= quantity;
    if (reserved_crypto_ < 0.0) {
        crypto_balance_ += reserved_crypto_;
        reserved_crypto_ = 0.0;
    }
    balance_ += quantity * price - fee;
    total_fees_ += fee;
}

void BalanceTracker::onOrderCompleted(const core::EventPayload& payload) {
    if (!payload.order) {
        LOG_WARN("Order completed event without order payload");
        return;
    }
    const auto& order = *payload.order;
    const double price = order.fillPrice();

    std::lock_guard<std::mutex> lock(mutex_);
    if (order.side == OrderSide::BUY) {
        settleBuyFill(order.filled, price);
    } else {
        settleSellFill(order.filled, price);
    }
    LOG_INFO("Balance updated after {} {}: fiat={:.2f}, crypto={:.8f}, reserved_fiat={:.2f}, "
             "reserved_crypto={:.8f}, fees={:.4f}",
             orderSideToString(order.side), order.identifier,
             balance_, crypto_balance_, reserved_fiat_, reserved_crypto_, total_fees_);
}

void BalanceTracker::onOrderCancelled(const core::EventPayload& payload) {
    if (!payload.order) {
        LOG_WARN("Order cancelled event without order payload");
        return;
    }
    const auto& order = *payload.order;
    const double price = order.fillPrice();
    const double remaining = std::max(0.0, order.amount - order.filled);

    std::lock_guard<std::mutex> lock(mutex_);
    if (order.side == OrderSide::BUY) {
        if (order.filled > 0.0) {
            settleBuyFill(order.filled, price);
        }
        const double released = std::min(remaining * order.price, reserved_fiat_);
        reserved_fiat_ -= released;
        balance_ += released;
    } else {
        if (order.filled > 0.0) {
            settleSellFill(order.filled, price);
        }
        const double released = std::min(remaining, reserved_crypto_);
        reserved_crypto_ -= released;
        crypto_balance_ += released;
    }
    LOG_INFO("Reservation released after cancelled {} {}: fiat={:.2f}, crypto={:.8f}",
             orderSideToString(order.side), order.identifier, balance_, crypto_balance_);
}

// ===== Accessors =====

double BalanceTracker::getBalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balance_;
}

double BalanceTracker::getCryptoBalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return crypto_balance_;
}

double BalanceTracker::getReservedFiat() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_fiat_;
}

double BalanceTracker::getReservedCrypto() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reserved_crypto_;
}

double BalanceTracker::getTotalFees() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_fees_;
}

double BalanceTracker::getAdjustedFiatBalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balance_ + reserved_fiat_;
}

double BalanceTracker::getAdjustedCryptoBalance() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return crypto_balance_ + reserved_crypto_;
}

double BalanceTracker::getTotalBalanceValue(double price) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return (balance_ + reserved_fiat_) + (crypto_balance_ + reserved_crypto_) * price;
}

} // namespace execution
} // namespace gridpilot
