#pragma once

namespace gridpilot {
namespace execution {

class FeeCalculator {
public:
    explicit FeeCalculator(double trading_fee) : trading_fee_(trading_fee) {}

    double calculateFee(double trade_value) const { return trade_value * trading_fee_; }
    double getTradingFee() const { return trading_fee_; }

private:
    double trading_fee_;
};

} // namespace execution
} // namespace gridpilot
