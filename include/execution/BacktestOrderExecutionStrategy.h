#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "execution/OrderExecutionStrategy.h"

namespace gridpilot {
namespace execution {

// Deterministic simulated execution. Orders are accepted OPEN with zero
// fill; simulateFills resolves them against each candle's range.
class BacktestOrderExecutionStrategy : public IOrderExecutionStrategy {
public:
    Order executeMarketOrder(OrderSide side, const std::string& pair,
                             double quantity, double price) override;
    Order executeLimitOrder(OrderSide side, const std::string& pair,
                            double quantity, double price) override;

    // Throws DataFetchError for unknown ids
    Order getOrder(const std::string& order_id, const std::string& pair) override;

    // Market orders fill at their price; buy limits fill when low <= price,
    // sell limits when high >= price. Returns the number of orders filled.
    std::size_t simulateFills(double low, double high, Timestamp timestamp);

    void setCurrentTimestamp(Timestamp timestamp);

private:
    Order createOrder(OrderSide side, OrderType type, const std::string& pair,
                      double quantity, double price);

    std::mutex mutex_;
    std::map<std::string, Order> orders_;
    std::uint64_t next_id_ = 1;
    Timestamp current_timestamp_ = 0;
};

} // namespace execution
} // namespace gridpilot
