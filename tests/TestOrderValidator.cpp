#include "execution/OrderValidator.h"

#include "TestSupport.h"

#include <cassert>
#include <iostream>

using gridpilot::execution::OrderValidator;
using gridpilot::execution::ValidationOutcome;
using gridpilot::test::approx;

int main() {
    OrderValidator validator;

    {
        auto r = validator.adjustAndValidateBuyQuantity(1000.0, 5.0, 100.0);
        assert(r.ok());
        assert(r.quantity == 5.0);
    }

    {
        // scaled down to what the balance covers, minus tolerance
        auto r = validator.adjustAndValidateBuyQuantity(1000.0, 20.0, 100.0);
        assert(r.ok());
        assert(approx(r.quantity, (1000.0 - 1e-6) / 100.0, 1e-12));
        assert(r.quantity * 100.0 < 1000.0);
    }

    {
        auto r = validator.adjustAndValidateBuyQuantity(0.0, 1.0, 100.0);
        assert(r.outcome == ValidationOutcome::INSUFFICIENT_BALANCE);
        assert(!r.ok());
    }

    assert(validator.adjustAndValidateBuyQuantity(1000.0, 1.0, 0.0).outcome == ValidationOutcome::INVALID_QUANTITY);
    assert(validator.adjustAndValidateBuyQuantity(1000.0, 0.0, 100.0).outcome == ValidationOutcome::INVALID_QUANTITY);

    {
        auto r = validator.adjustAndValidateSellQuantity(5.0, 3.0);
        assert(r.ok() && r.quantity == 3.0);

        r = validator.adjustAndValidateSellQuantity(5.0, 10.0);
        assert(r.ok());
        assert(approx(r.quantity, 5.0 - 1e-6, 1e-12));
    }

    assert(validator.adjustAndValidateSellQuantity(0.0, 1.0).outcome == ValidationOutcome::INSUFFICIENT_CRYPTO_BALANCE);
    assert(validator.adjustAndValidateSellQuantity(5.0, -1.0).outcome == ValidationOutcome::INVALID_QUANTITY);

    std::cout << "[TEST] OrderValidator PASSED\n";
    return 0;
}
