#include "execution/LiveOrderExecutionStrategy.h"

#include "TestSupport.h"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace gridpilot;
using gridpilot::execution::LiveOrderExecutionStrategy;
using gridpilot::test::FakeExchange;
using gridpilot::test::approx;
using gridpilot::test::orderJson;

namespace {
engine::ExecutionConfig fastConfig() {
    engine::ExecutionConfig config;
    config.max_retries = 3;
    config.retry_delay_ms = 0;
    config.max_slippage = 0.01;
    return config;
}
} // namespace

int main() {
    {
        auto exchange = std::make_shared<FakeExchange>();
        exchange->on_place = [](OrderSide, OrderType, double amount, std::optional<double> price) {
            return orderJson("m-1", "closed", "buy", "market", price.value_or(0.0), amount, amount);
        };
        LiveOrderExecutionStrategy strategy(exchange, fastConfig());

        const Order order = strategy.executeMarketOrder(OrderSide::BUY, "SOL/USDT", 2.0, 100.0);
        assert(order.isFilled());
        assert(order.filled == 2.0);
        assert(exchange->place_calls == 1);
    }

    {
        // every attempt fails: exactly max_retries placements, then a typed failure
        auto exchange = std::make_shared<FakeExchange>();
        exchange->on_place = [](OrderSide, OrderType, double, std::optional<double>) -> nlohmann::json {
            throw std::runtime_error("exchange down");
        };
        LiveOrderExecutionStrategy strategy(exchange, fastConfig());

        bool failed = false;
        try {
            strategy.executeMarketOrder(OrderSide::SELL, "SOL/USDT", 1.5, 100.0);
        } catch (const OrderExecutionFailed& e) {
            failed = true;
            assert(e.side() == OrderSide::SELL);
            assert(e.type() == OrderType::MARKET);
            assert(e.pair() == "SOL/USDT");
            assert(e.quantity() == 1.5);
        }
        assert(failed);
        assert(exchange->place_calls == 3);
    }

    {
        // partial fill: cancel, then retry only the unfilled remainder
        auto exchange = std::make_shared<FakeExchange>();
        exchange->on_place = [&exchange](OrderSide, OrderType, double amount, std::optional<double> price) {
            if (exchange->place_calls == 1) {
                return orderJson("m-1", "open", "buy", "market", price.value_or(0.0), amount, 4.0);
            }
            return orderJson("m-2", "closed", "buy", "market", price.value_or(0.0), amount, amount);
        };
        exchange->on_cancel = [](const std::string& id) {
            return orderJson(id, "canceled", "buy", "market", 100.0, 10.0, 4.0);
        };
        LiveOrderExecutionStrategy strategy(exchange, fastConfig());

        const Order order = strategy.executeMarketOrder(OrderSide::BUY, "SOL/USDT", 10.0, 100.0);
        assert(order.identifier == "m-2");
        assert(exchange->place_calls == 2);
        assert(exchange->cancel_calls == 1);
        assert(exchange->placed_amounts[1] == 6.0);
        // merged result carries the fill of the cancelled attempt too
        assert(order.isFilled());
        assert(approx(order.amount, 10.0));
        assert(approx(order.filled, 10.0));
        assert(approx(order.remaining, 0.0));
        assert(order.average && approx(*order.average, 100.0));
    }

    {
        // fills at different prices average by cost
        auto exchange = std::make_shared<FakeExchange>();
        exchange->on_place = [&exchange](OrderSide, OrderType, double amount, std::optional<double>) {
            if (exchange->place_calls == 1) {
                return orderJson("m-1", "open", "sell", "market", 100.0, amount, 4.0);
            }
            return orderJson("m-2", "closed", "sell", "market", 90.0, amount, amount);
        };
        exchange->on_cancel = [](const std::string& id) {
            return orderJson(id, "canceled", "sell", "market", 100.0, 10.0, 4.0);
        };
        LiveOrderExecutionStrategy strategy(exchange, fastConfig());

        const Order order = strategy.executeMarketOrder(OrderSide::SELL, "SOL/USDT", 10.0, 100.0);
        assert(approx(order.filled, 10.0));
        assert(order.cost && approx(*order.cost, 4.0 * 100.0 + 6.0 * 90.0));
        assert(approx(order.fillPrice(), 94.0));
    }

    {
        // retries run out after a partial fill: the executed part is still reported
        auto exchange = std::make_shared<FakeExchange>();
        exchange->on_place = [&exchange](OrderSide, OrderType, double amount, std::optional<double>) -> nlohmann::json {
            if (exchange->place_calls == 1) {
                return orderJson("m-1", "open", "sell", "market", 100.0, amount, 3.0);
            }
            throw std::runtime_error("exchange down");
        };
        exchange->on_cancel = [](const std::string& id) {
            return orderJson(id, "canceled", "sell", "market", 100.0, 10.0, 3.0);
        };
        LiveOrderExecutionStrategy strategy(exchange, fastConfig());

        const Order order = strategy.executeMarketOrder(OrderSide::SELL, "SOL/USDT", 10.0, 100.0);
        assert(order.isCanceled());
        assert(approx(order.amount, 10.0));
        assert(approx(order.filled, 3.0));
        assert(approx(order.remaining, 7.0));
        assert(exchange->place_calls == 3);
    }

    {
        auto exchange = std::make_shared<FakeExchange>();
        LiveOrderExecutionStrategy strategy(exchange, fastConfig());
        assert(approx(strategy.adjustPrice(OrderSide::BUY, 100.0, 0), 100.0));
        assert(approx(strategy.adjustPrice(OrderSide::BUY, 100.0, 1), 100.0 * (1.0 + 0.01 / 3.0)));
        assert(approx(strategy.adjustPrice(OrderSide::SELL, 100.0, 2), 100.0 * (1.0 - 0.02 / 3.0)));
    }

    {
        auto exchange = std::make_shared<FakeExchange>();
        exchange->on_place = [](OrderSide, OrderType, double amount, std::optional<double> price) {
            return orderJson("l-1", "open", "buy", "limit", *price, amount, 0.0);
        };
        LiveOrderExecutionStrategy strategy(exchange, fastConfig());

        const Order order = strategy.executeLimitOrder(OrderSide::BUY, "SOL/USDT", 3.0, 95.0);
        assert(order.isOpen());
        assert(order.price == 95.0);
        assert(exchange->place_calls == 1);
    }

    {
        auto exchange = std::make_shared<FakeExchange>();
        exchange->on_place = [](OrderSide, OrderType, double, std::optional<double>) -> nlohmann::json {
            throw DataFetchError("timeout");
        };
        LiveOrderExecutionStrategy strategy(exchange, fastConfig());

        bool fetch_error = false;
        try {
            strategy.executeLimitOrder(OrderSide::BUY, "SOL/USDT", 1.0, 95.0);
        } catch (const DataFetchError&) {
            fetch_error = true;
        }
        assert(fetch_error);

        exchange->on_place = [](OrderSide, OrderType, double, std::optional<double>) -> nlohmann::json {
            throw std::runtime_error("insufficient funds");
        };
        bool failed = false;
        try {
            strategy.executeLimitOrder(OrderSide::SELL, "SOL/USDT", 1.0, 105.0);
        } catch (const OrderExecutionFailed& e) {
            failed = (e.type() == OrderType::LIMIT && e.price() == 105.0);
        }
        assert(failed);
    }

    {
        auto exchange = std::make_shared<FakeExchange>();
        exchange->on_fetch = [](const std::string&) -> nlohmann::json {
            throw std::runtime_error("bad payload");
        };
        LiveOrderExecutionStrategy strategy(exchange, fastConfig());

        bool wrapped = false;
        try {
            strategy.getOrder("x", "SOL/USDT");
        } catch (const DataFetchError&) {
            wrapped = true;
        }
        assert(wrapped);
    }

    {
        bool rejected = false;
        try {
            LiveOrderExecutionStrategy strategy(nullptr, fastConfig());
        } catch (const std::invalid_argument&) {
            rejected = true;
        }
        assert(rejected);
    }

    std::cout << "[TEST] LiveOrderExecutionStrategy PASSED\n";
    return 0;
}
