#pragma once

namespace gridpilot {
namespace execution {

enum class ValidationOutcome {
    OK,
    INSUFFICIENT_BALANCE,
    INSUFFICIENT_CRYPTO_BALANCE,
    INVALID_QUANTITY
};

inline const char* validationOutcomeToString(ValidationOutcome outcome) {
    switch (outcome) {
        case ValidationOutcome::OK: return "ok";
        case ValidationOutcome::INSUFFICIENT_BALANCE: return "insufficient_balance";
        case ValidationOutcome::INSUFFICIENT_CRYPTO_BALANCE: return "insufficient_crypto_balance";
        case ValidationOutcome::INVALID_QUANTITY: return "invalid_quantity";
    }
    return "unknown";
}

struct ValidatedQuantity {
    ValidationOutcome outcome = ValidationOutcome::OK;
    double quantity = 0.0;

    bool ok() const { return outcome == ValidationOutcome::OK; }
};

// Clamps an order quantity to what the balances can cover.
class OrderValidator {
public:
    explicit OrderValidator(double tolerance = 1e-6) : tolerance_(tolerance) {}

    // Oversize buys are scaled down to (balance - tolerance) / price
    ValidatedQuantity adjustAndValidateBuyQuantity(double balance, double order_quantity, double price) const;

    // Oversize sells are capped at crypto_balance - tolerance
    ValidatedQuantity adjustAndValidateSellQuantity(double crypto_balance, double order_quantity) const;

private:
    double tolerance_;
};

} // namespace execution
} // namespace gridpilot
