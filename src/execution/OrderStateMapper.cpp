#include "execution/OrderStateMapper.h"

#include <algorithm>
#include <cctype>

namespace gridpilot {
namespace execution {

namespace {
std::string normalize(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}
} // namespace

ExchangeOrderStateResult OrderStateMapper::map(const std::string& exchange_state) {
    ExchangeOrderStateResult result;
    const std::string state = normalize(exchange_state);

    if (state.empty() || state == "unknown") {
        result.missing = true;
        return result;
    }

    if (state == "open" || state == "new" || state == "partially_filled") {
        result.status = OrderStatus::OPEN;
        result.recognized = true;
    } else if (state == "closed" || state == "filled") {
        result.status = OrderStatus::CLOSED;
        result.recognized = true;
    } else if (state == "canceled" || state == "cancelled" ||
               state == "expired" || state == "rejected") {
        // The order is dead either way; reservations must be released
        result.status = OrderStatus::CANCELED;
        result.recognized = true;
    }
    return result;
}

OrderSide OrderStateMapper::parseSide(const std::string& side, OrderSide fallback) {
    const std::string s = normalize(side);
    if (s == "buy" || s == "bid") {
        return OrderSide::BUY;
    }
    if (s == "sell" || s == "ask") {
        return OrderSide::SELL;
    }
    return fallback;
}

OrderType OrderStateMapper::parseType(const std::string& type, OrderType fallback) {
    const std::string t = normalize(type);
    if (t == "market") {
        return OrderType::MARKET;
    }
    if (t == "limit") {
        return OrderType::LIMIT;
    }
    return fallback;
}

} // namespace execution
} // namespace gridpilot
