#include "core/execution/OrderSchema.h"

#include <cassert>
#include <iostream>

using gridpilot::Order;
using gridpilot::OrderSide;
using gridpilot::OrderStatus;
using gridpilot::OrderType;
using namespace gridpilot::core::execution;

int main() {
    {
        const nlohmann::json raw = {
            {"id", "abc-1"},
            {"status", "open"},
            {"type", "limit"},
            {"side", "sell"},
            {"price", "101.5"},
            {"amount", 2.0},
            {"filled", "0.5"},
            {"timestamp", 1704067200000LL},
            {"symbol", "SOL/USDT"},
            {"average", nullptr},
            {"fee", {{"cost", 0.1}, {"currency", "USDT"}}}
        };

        const Order order = parseOrder(raw);
        assert(order.identifier == "abc-1");
        assert(order.status == OrderStatus::OPEN);
        assert(order.side == OrderSide::SELL);
        assert(order.type == OrderType::LIMIT);
        assert(order.price == 101.5);
        assert(order.filled == 0.5);
        assert(order.remaining == 1.5);
        assert(!order.average);
        assert(order.fee_cost && *order.fee_cost == 0.1);
        assert(order.fee_currency && *order.fee_currency == "USDT");
        assert(order.fillPrice() == 101.5);

        const auto back = toJson(order);
        assert(back["id"] == "abc-1");
        assert(back["side"] == "sell");
        assert(back["fee"]["currency"] == "USDT");
        assert(!back.contains("average"));
    }

    {
        // numeric ids and missing status survive parsing
        const Order order = parseOrder(nlohmann::json{{"id", 42}, {"amount", 1.0}});
        assert(order.identifier == "42");
        assert(order.raw_status.empty());
        assert(order.status == OrderStatus::UNKNOWN);
    }

    {
        Order order;
        order.identifier = "x-9";
        order.status = OrderStatus::CLOSED;
        const auto text = describeOrder(order);
        assert(text.find("x-9") != std::string::npos);
        assert(text.find("CLOSED") != std::string::npos);
    }

    std::cout << "[TEST] OrderSchema PASSED\n";
    return 0;
}
