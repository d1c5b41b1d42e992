#include "execution/OrderValidator.h"

#include "common/Logger.h"

namespace gridpilot {
namespace execution {

ValidatedQuantity OrderValidator::adjustAndValidateBuyQuantity(
    double balance, double order_quantity, double price) const {
    ValidatedQuantity result;

    if (price <= 0.0) {
        result.outcome = ValidationOutcome::INVALID_QUANTITY;
        return result;
    }

    double quantity = order_quantity;
    const double total_cost = order_quantity * price;
    if (total_cost > balance) {
        quantity = (balance - tolerance_) / price;
        if (quantity <= 0.0) {
            LOG_WARN("Insufficient balance {:.2f} to place any buy order at price {:.2f}", balance, price);
            result.outcome = ValidationOutcome::INSUFFICIENT_BALANCE;
            return result;
        }
        LOG_DEBUG("Buy quantity adjusted from {:.8f} to {:.8f} to fit balance {:.2f}",
                  order_quantity, quantity, balance);
    }

    if (quantity <= 0.0) {
        LOG_WARN("Invalid buy quantity: {:.8f}", quantity);
        result.outcome = ValidationOutcome::INVALID_QUANTITY;
        return result;
    }

    result.quantity = quantity;
    return result;
}

ValidatedQuantity OrderValidator::adjustAndValidateSellQuantity(
    double crypto_balance, double order_quantity) const {
    ValidatedQuantity result;

    double quantity = order_quantity;
    if (order_quantity > crypto_balance) {
        quantity = crypto_balance - tolerance_;
        if (quantity <= 0.0) {
            LOG_WARN("Insufficient crypto balance {:.8f} to place any sell order", crypto_balance);
            result.outcome = ValidationOutcome::INSUFFICIENT_CRYPTO_BALANCE;
            return result;
        }
        LOG_DEBUG("Sell quantity adjusted from {:.8f} to {:.8f} to fit crypto balance {:.8f}",
                  order_quantity, quantity, crypto_balance);
    }

    if (quantity <= 0.0) {
        LOG_WARN("Invalid sell quantity: {:.8f}", quantity);
        result.outcome = ValidationOutcome::INVALID_QUANTITY;
        return result;
    }

    result.quantity = quantity;
    return result;
}

} // namespace execution
} // namespace gridpilot
