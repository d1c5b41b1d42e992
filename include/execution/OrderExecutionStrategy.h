#pragma once

#include <string>

#include "common/Types.h"

namespace gridpilot {
namespace execution {

// Turns an order intent into a placed order
class IOrderExecutionStrategy {
public:
    virtual ~IOrderExecutionStrategy() = default;

    virtual Order executeMarketOrder(OrderSide side, const std::string& pair,
                                     double quantity, double price) = 0;

    virtual Order executeLimitOrder(OrderSide side, const std::string& pair,
                                    double quantity, double price) = 0;

    // Current state of a previously placed order
    virtual Order getOrder(const std::string& order_id, const std::string& pair) = 0;
};

} // namespace execution
} // namespace gridpilot
