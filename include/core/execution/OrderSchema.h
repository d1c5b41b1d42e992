#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace gridpilot {
namespace core {
namespace execution {

// Raw exchange order document <-> Order. Field names follow the unified
// exchange order structure: id, status, type, side, price, average, amount,
// filled, remaining, timestamp, datetime, lastTradeTimestamp, symbol,
// timeInForce, cost, fee {cost, currency}.
Order parseOrder(const nlohmann::json& raw);

nlohmann::json toJson(const Order& order);

// Compact one-line description for logs and notifications
std::string describeOrder(const Order& order);

} // namespace execution
} // namespace core
} // namespace gridpilot
