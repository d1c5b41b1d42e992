#pragma once

#include <cmath>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Exceptions.h"
#include "exchange/IExchangeService.h"
#include "execution/OrderExecutionStrategy.h"
#include "notify/INotificationSink.h"

namespace gridpilot {
namespace test {

inline bool approx(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) <= eps;
}

inline nlohmann::json orderJson(const std::string& id,
                                const std::string& status,
                                const std::string& side,
                                const std::string& type,
                                double price,
                                double amount,
                                double filled) {
    nlohmann::json j;
    j["id"] = id;
    j["status"] = status;
    j["side"] = side;
    j["type"] = type;
    j["price"] = price;
    j["amount"] = amount;
    j["filled"] = filled;
    j["remaining"] = amount - filled;
    j["timestamp"] = 1704067200000LL;
    j["symbol"] = "SOL/USDT";
    return j;
}

// Exchange whose responses are scripted per test. Unscripted calls throw DataFetchError.
class FakeExchange : public exchange::IExchangeService {
public:
    using PlaceHandler = std::function<nlohmann::json(OrderSide, OrderType, double, std::optional<double>)>;
    using IdHandler = std::function<nlohmann::json(const std::string&)>;

    PlaceHandler on_place;
    IdHandler on_cancel;
    IdHandler on_fetch;
    nlohmann::json balance = {{"free", nlohmann::json::object()}, {"total", nlohmann::json::object()}};
    std::deque<double> prices;

    int place_calls = 0;
    int cancel_calls = 0;
    int fetch_calls = 0;
    std::vector<double> placed_amounts;
    std::vector<double> placed_prices;

    nlohmann::json placeOrder(const std::string&, OrderSide side, OrderType type,
                              double amount, std::optional<double> price) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++place_calls;
        placed_amounts.push_back(amount);
        placed_prices.push_back(price.value_or(0.0));
        if (!on_place) {
            throw DataFetchError("placeOrder not scripted");
        }
        return on_place(side, type, amount, price);
    }

    nlohmann::json cancelOrder(const std::string& order_id, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++cancel_calls;
        if (!on_cancel) {
            throw OrderCancellationError("cancelOrder not scripted");
        }
        return on_cancel(order_id);
    }

    nlohmann::json fetchOrder(const std::string& order_id, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++fetch_calls;
        if (!on_fetch) {
            throw DataFetchError("fetchOrder not scripted");
        }
        return on_fetch(order_id);
    }

    nlohmann::json getBalance() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return balance;
    }

    double getCurrentPrice(const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (prices.empty()) {
            throw DataFetchError("no price scripted");
        }
        const double price = prices.front();
        prices.pop_front();
        return price;
    }

private:
    std::mutex mutex_;
};

// Execution strategy that answers getOrder from a per-id table
class ScriptedExecution : public execution::IOrderExecutionStrategy {
public:
    std::map<std::string, Order> remote;
    bool fail_limit = false;

    Order executeMarketOrder(OrderSide side, const std::string& pair, double quantity, double price) override {
        throw OrderExecutionFailed("market rejected", side, OrderType::MARKET, pair, quantity, price);
    }

    Order executeLimitOrder(OrderSide side, const std::string& pair, double quantity, double price) override {
        if (fail_limit) {
            throw OrderExecutionFailed("limit rejected", side, OrderType::LIMIT, pair, quantity, price);
        }
        throw std::runtime_error("limit not scripted");
    }

    Order getOrder(const std::string& order_id, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = remote.find(order_id);
        if (it == remote.end()) {
            throw DataFetchError("order " + order_id + " not scripted");
        }
        return it->second;
    }

    void setRemote(const Order& order) {
        std::lock_guard<std::mutex> lock(mutex_);
        remote[order.identifier] = order;
    }

private:
    std::mutex mutex_;
};

class RecordingNotifier : public notify::INotificationSink {
public:
    void asyncSendNotification(notify::NotificationType type, const notify::NotificationFields& fields) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(type);
        last_fields_ = fields;
    }

    int count(notify::NotificationType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (auto t : sent_) {
            if (t == type) ++n;
        }
        return n;
    }

    std::size_t total() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<notify::NotificationType> sent_;
    notify::NotificationFields last_fields_;
};

inline Order makeOrder(const std::string& id, OrderSide side, OrderStatus status,
                       double price, double amount, double filled) {
    Order order;
    order.identifier = id;
    order.side = side;
    order.type = OrderType::LIMIT;
    order.status = status;
    order.raw_status = orderStatusToString(status);
    order.price = price;
    order.amount = amount;
    order.filled = filled;
    order.remaining = amount - filled;
    order.symbol = "SOL/USDT";
    return order;
}

} // namespace test
} // namespace gridpilot
