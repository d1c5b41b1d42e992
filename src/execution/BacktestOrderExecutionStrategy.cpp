#include "execution/BacktestOrderExecutionStrategy.h"

#include "common/Exceptions.h"
#include "common/Logger.h"

namespace gridpilot {
namespace execution {

Order BacktestOrderExecutionStrategy::createOrder(OrderSide side, OrderType type,
                                                  const std::string& pair,
                                                  double quantity, double price) {
    std::lock_guard<std::mutex> lock(mutex_);

    Order order;
    order.identifier = "backtest-" + std::to_string(next_id_++);
    order.status = OrderStatus::OPEN;
    order.raw_status = "open";
    order.type = type;
    order.side = side;
    order.price = price;
    order.amount = quantity;
    order.filled = 0.0;
    order.remaining = quantity;
    order.timestamp = current_timestamp_;
    order.symbol = pair;

    orders_[order.identifier] = order;
    return order;
}

Order BacktestOrderExecutionStrategy::executeMarketOrder(OrderSide side, const std::string& pair,
                                                         double quantity, double price) {
    return createOrder(side, OrderType::MARKET, pair, quantity, price);
}

Order BacktestOrderExecutionStrategy::executeLimitOrder(OrderSide side, const std::string& pair,
                                                        double quantity, double price) {
    return createOrder(side, OrderType::LIMIT, pair, quantity, price);
}

Order BacktestOrderExecutionStrategy::getOrder(const std::string& order_id, const std::string& pair) {
    (void)pair;
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        throw DataFetchError("Backtest order " + order_id + " not found");
    }
    return it->second;
}

std::size_t BacktestOrderExecutionStrategy::simulateFills(double low, double high, Timestamp timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_timestamp_ = timestamp;

    std::size_t filled = 0;
    for (auto& entry : orders_) {
        auto& order = entry.second;
        if (!order.isOpen()) {
            continue;
        }

        bool fills = false;
        if (order.type == OrderType::MARKET) {
            fills = true;
        } else if (order.side == OrderSide::BUY) {
            fills = low <= order.price;
        } else {
            fills = high >= order.price;
        }
        if (!fills) {
            continue;
        }

        order.status = OrderStatus::CLOSED;
        order.raw_status = "closed";
        order.filled = order.amount;
        order.remaining = 0.0;
        order.average = order.price;
        order.cost = order.amount * order.price;
        order.last_trade_timestamp = timestamp;
        ++filled;
        LOG_DEBUG("Simulated fill for {} {} {:.8f} @ {:.8f}",
                  orderSideToString(order.side), order.identifier, order.amount, order.price);
    }
    return filled;
}

void BacktestOrderExecutionStrategy::setCurrentTimestamp(Timestamp timestamp) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_timestamp_ = timestamp;
}

} // namespace execution
} // namespace gridpilot
