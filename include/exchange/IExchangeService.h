#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace gridpilot {
namespace exchange {

// Exchange adapter boundary. Order documents use the unified order
// structure understood by core::execution::parseOrder. Transport failures
// raise DataFetchError (OrderCancellationError for cancels).
class IExchangeService {
public:
    virtual ~IExchangeService() = default;

    // price is ignored for market orders
    virtual nlohmann::json placeOrder(
        const std::string& pair,
        OrderSide side,
        OrderType type,
        double amount,
        std::optional<double> price = std::nullopt
    ) = 0;

    virtual nlohmann::json cancelOrder(const std::string& order_id, const std::string& pair) = 0;

    virtual nlohmann::json fetchOrder(const std::string& order_id, const std::string& pair) = 0;

    // {"free": {currency: amount}, "total": {currency: amount}}
    virtual nlohmann::json getBalance() = 0;

    virtual double getCurrentPrice(const std::string& pair) = 0;
};

} // namespace exchange
} // namespace gridpilot
