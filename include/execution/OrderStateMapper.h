#pragma once

#include "common/Types.h"
#include <string>

namespace gridpilot {
namespace execution {

struct ExchangeOrderStateResult {
    OrderStatus status = OrderStatus::UNKNOWN;
    bool recognized = false;   // false for missing or unexpected status strings
    bool missing = false;      // no status reported at all
};

class OrderStateMapper {
public:
    // "open", "closed", "canceled", "expired", "rejected", ... -> OrderStatus
    static ExchangeOrderStateResult map(const std::string& exchange_state);

    static OrderSide parseSide(const std::string& side, OrderSide fallback);
    static OrderType parseType(const std::string& type, OrderType fallback);
};

} // namespace execution
} // namespace gridpilot
