#include "execution/OrderBook.h"

#include "common/Logger.h"
#include "core/execution/OrderLifecycleStateMachine.h"

namespace gridpilot {
namespace execution {

bool OrderBook::addOrder(const Order& order, std::optional<double> grid_level_price) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (order.identifier.empty()) {
        LOG_ERROR("Refusing to book an order without identifier");
        return false;
    }
    if (orders_.count(order.identifier) > 0) {
        LOG_ERROR("Order {} is already booked", order.identifier);
        return false;
    }

    orders_.emplace(order.identifier, order);
    insertion_order_.push_back(order.identifier);

    if (grid_level_price) {
        if (order.side == OrderSide::BUY) {
            buy_order_ids_.push_back(order.identifier);
        } else {
            sell_order_ids_.push_back(order.identifier);
        }
        order_to_grid_[order.identifier] = *grid_level_price;
    } else {
        non_grid_order_ids_.push_back(order.identifier);
    }
    return true;
}

OrderUpdateResult OrderBook::updateOrderFromRemote(const Order& remote) {
    std::lock_guard<std::mutex> lock(mutex_);
    OrderUpdateResult result;

    auto it = orders_.find(remote.identifier);
    if (it == orders_.end()) {
        return result;
    }
    result.found = true;

    auto& local = it->second;
    const auto transitioned = core::execution::OrderLifecycleStateMachine::transition(
        local.status,
        local.filled,
        local.amount,
        remote.status,
        remote.filled
    );

    if (transitioned.changed) {
        const bool was_terminal = isTerminalStatus(local.status);
        local.status = transitioned.status;
        local.filled = transitioned.filled_volume;
        local.remaining = (local.amount > local.filled) ? local.amount - local.filled : 0.0;
        if (remote.average) local.average = remote.average;
        if (remote.cost) local.cost = remote.cost;
        if (remote.fee_cost) {
            local.fee_cost = remote.fee_cost;
            local.fee_currency = remote.fee_currency;
        }
        if (remote.last_trade_timestamp) local.last_trade_timestamp = remote.last_trade_timestamp;
        if (!remote.raw_status.empty()) local.raw_status = remote.raw_status;

        result.changed = true;
        result.became_terminal = !was_terminal && transitioned.terminal;
    }

    result.order = local;
    return result;
}

std::optional<Order> OrderBook::getOrder(const std::string& order_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> OrderBook::getGridLevelPrice(const std::string& order_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = order_to_grid_.find(order_id);
    if (it == order_to_grid_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Order> OrderBook::collect(const std::vector<std::string>& ids) const {
    std::vector<Order> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = orders_.find(id);
        if (it != orders_.end()) {
            out.push_back(it->second);
        }
    }
    return out;
}

std::vector<std::pair<Order, std::optional<double>>> OrderBook::collectWithGrid(
    const std::vector<std::string>& ids) const {
    std::vector<std::pair<Order, std::optional<double>>> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        auto it = orders_.find(id);
        if (it == orders_.end()) {
            continue;
        }
        auto grid_it = order_to_grid_.find(id);
        std::optional<double> grid_price;
        if (grid_it != order_to_grid_.end()) {
            grid_price = grid_it->second;
        }
        out.emplace_back(it->second, grid_price);
    }
    return out;
}

std::vector<Order> OrderBook::getAllBuyOrders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collect(buy_order_ids_);
}

std::vector<Order> OrderBook::getAllSellOrders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collect(sell_order_ids_);
}

std::vector<Order> OrderBook::getNonGridOrders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collect(non_grid_order_ids_);
}

std::vector<std::pair<Order, std::optional<double>>> OrderBook::getBuyOrdersWithGrid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collectWithGrid(buy_order_ids_);
}

std::vector<std::pair<Order, std::optional<double>>> OrderBook::getSellOrdersWithGrid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collectWithGrid(sell_order_ids_);
}

std::vector<Order> OrderBook::getOpenOrders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Order> out;
    for (const auto& id : insertion_order_) {
        const auto& order = orders_.at(id);
        if (order.isOpen()) {
            out.push_back(order);
        }
    }
    return out;
}

std::vector<Order> OrderBook::getCompletedOrders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Order> out;
    for (const auto& id : insertion_order_) {
        const auto& order = orders_.at(id);
        if (order.isFilled()) {
            out.push_back(order);
        }
    }
    return out;
}

std::size_t OrderBook::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return orders_.size();
}

} // namespace execution
} // namespace gridpilot
