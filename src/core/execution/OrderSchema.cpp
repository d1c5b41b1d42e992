#include "core/execution/OrderSchema.h"

#include "execution/OrderStateMapper.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace gridpilot {
namespace core {
namespace execution {

namespace {
bool hasValue(const nlohmann::json& json, const char* key) {
    return json.is_object() && json.contains(key) && !json[key].is_null();
}

// Exchanges disagree on whether numbers arrive quoted
double parseJsonNumber(const nlohmann::json& json, const char* key) {
    if (!hasValue(json, key)) {
        return 0.0;
    }
    if (json[key].is_string()) {
        const auto value = json[key].get<std::string>();
        if (value.empty()) {
            return 0.0;
        }
        return std::stod(value);
    }
    return json[key].get<double>();
}

std::optional<double> optionalNumber(const nlohmann::json& json, const char* key) {
    if (!hasValue(json, key)) {
        return std::nullopt;
    }
    return parseJsonNumber(json, key);
}

std::optional<std::string> optionalString(const nlohmann::json& json, const char* key) {
    if (!hasValue(json, key) || !json[key].is_string()) {
        return std::nullopt;
    }
    return json[key].get<std::string>();
}

std::string stringField(const nlohmann::json& json, const char* key) {
    if (!hasValue(json, key)) {
        return "";
    }
    if (json[key].is_string()) {
        return json[key].get<std::string>();
    }
    return json[key].dump();
}
} // namespace

Order parseOrder(const nlohmann::json& raw) {
    Order order;
    order.identifier = stringField(raw, "id");
    order.raw_status = stringField(raw, "status");
    order.status = gridpilot::execution::OrderStateMapper::map(order.raw_status).status;
    order.type = gridpilot::execution::OrderStateMapper::parseType(stringField(raw, "type"), OrderType::LIMIT);
    order.side = gridpilot::execution::OrderStateMapper::parseSide(stringField(raw, "side"), OrderSide::BUY);
    order.price = parseJsonNumber(raw, "price");
    order.amount = parseJsonNumber(raw, "amount");
    order.filled = parseJsonNumber(raw, "filled");
    order.remaining = hasValue(raw, "remaining")
        ? parseJsonNumber(raw, "remaining")
        : std::max(0.0, order.amount - order.filled);
    order.timestamp = hasValue(raw, "timestamp") ? raw["timestamp"].get<long long>() : 0;
    order.symbol = stringField(raw, "symbol");

    order.average = optionalNumber(raw, "average");
    order.datetime = optionalString(raw, "datetime");
    if (hasValue(raw, "lastTradeTimestamp")) {
        order.last_trade_timestamp = raw["lastTradeTimestamp"].get<long long>();
    }
    order.time_in_force = optionalString(raw, "timeInForce");
    order.cost = optionalNumber(raw, "cost");
    if (hasValue(raw, "fee") && raw["fee"].is_object()) {
        order.fee_cost = optionalNumber(raw["fee"], "cost");
        order.fee_currency = optionalString(raw["fee"], "currency");
    }
    return order;
}

nlohmann::json toJson(const Order& order) {
    nlohmann::json j;
    j["id"] = order.identifier;
    j["status"] = order.raw_status.empty() ? orderStatusToString(order.status) : order.raw_status;
    j["type"] = order.type == OrderType::MARKET ? "market" : "limit";
    j["side"] = order.side == OrderSide::BUY ? "buy" : "sell";
    j["price"] = order.price;
    j["amount"] = order.amount;
    j["filled"] = order.filled;
    j["remaining"] = order.remaining;
    j["timestamp"] = order.timestamp;
    j["symbol"] = order.symbol;
    if (order.average) j["average"] = *order.average;
    if (order.datetime) j["datetime"] = *order.datetime;
    if (order.last_trade_timestamp) j["lastTradeTimestamp"] = *order.last_trade_timestamp;
    if (order.time_in_force) j["timeInForce"] = *order.time_in_force;
    if (order.cost) j["cost"] = *order.cost;
    if (order.fee_cost) {
        j["fee"]["cost"] = *order.fee_cost;
        j["fee"]["currency"] = order.fee_currency.value_or("");
    }
    return j;
}

std::string describeOrder(const Order& order) {
    std::ostringstream oss;
    oss << "Order(id=" << order.identifier
        << ", status=" << orderStatusToString(order.status)
        << ", type=" << orderTypeToString(order.type)
        << ", side=" << orderSideToString(order.side)
        << std::fixed << std::setprecision(8)
        << ", price=" << order.price
        << ", amount=" << order.amount
        << ", filled=" << order.filled
        << ", remaining=" << order.remaining
        << ", symbol=" << order.symbol
        << ", timestamp=" << order.timestamp << ")";
    return oss.str();
}

} // namespace execution
} // namespace core
} // namespace gridpilot
