#include "execution/FeeCalculator.h"

#include <cassert>
#include <cmath>
#include <iostream>

using gridpilot::execution::FeeCalculator;

int main() {
    {
        FeeCalculator calc(0.001);
        assert(std::fabs(calc.calculateFee(1000.0) - 1.0) < 1e-12);
        assert(calc.calculateFee(0.0) == 0.0);
        assert(calc.getTradingFee() == 0.001);
    }

    {
        FeeCalculator free_trading(0.0);
        assert(free_trading.calculateFee(123456.0) == 0.0);
    }

    std::cout << "[TEST] FeeCalculator PASSED\n";
    return 0;
}
