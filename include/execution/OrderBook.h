#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/Types.h"

namespace gridpilot {
namespace execution {

struct OrderUpdateResult {
    bool found = false;
    bool changed = false;        // status or fill moved forward
    bool became_terminal = false;
    Order order;                 // state after the update
};

// Index of every order the bot placed. Grid orders live in exactly one of the
// buy/sell lists and map to their grid level price; take-profit / stop-loss
// orders live in the non-grid list only.
class OrderBook {
public:
    // false when the id is empty or already known
    bool addOrder(const Order& order, std::optional<double> grid_level_price = std::nullopt);

    // Applies a remote snapshot through the lifecycle state machine.
    // Terminal orders are never changed.
    OrderUpdateResult updateOrderFromRemote(const Order& remote);

    std::optional<Order> getOrder(const std::string& order_id) const;
    std::optional<double> getGridLevelPrice(const std::string& order_id) const;

    std::vector<Order> getAllBuyOrders() const;
    std::vector<Order> getAllSellOrders() const;
    std::vector<Order> getNonGridOrders() const;
    std::vector<std::pair<Order, std::optional<double>>> getBuyOrdersWithGrid() const;
    std::vector<std::pair<Order, std::optional<double>>> getSellOrdersWithGrid() const;

    std::vector<Order> getOpenOrders() const;
    std::vector<Order> getCompletedOrders() const;

    std::size_t size() const;

private:
    std::vector<Order> collect(const std::vector<std::string>& ids) const;
    std::vector<std::pair<Order, std::optional<double>>> collectWithGrid(const std::vector<std::string>& ids) const;

    mutable std::mutex mutex_;
    std::map<std::string, Order> orders_;
    std::vector<std::string> buy_order_ids_;
    std::vector<std::string> sell_order_ids_;
    std::vector<std::string> non_grid_order_ids_;
    std::map<std::string, double> order_to_grid_;
    std::vector<std::string> insertion_order_;
};

} // namespace execution
} // namespace gridpilot
