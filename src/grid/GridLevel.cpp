#include "grid/GridLevel.h"

#include <sstream>

namespace gridpilot {
namespace grid {

GridLevel::GridLevel(double price, GridCycleState state)
    : price_(price)
    , state_(state) {
}

bool GridLevel::placeBuyOrder(const std::string& order_id) {
    if (!canPlaceBuyOrder()) {
        return false;
    }
    buy_order_ids_.push_back(order_id);
    state_ = GridCycleState::READY_TO_SELL;
    return true;
}

bool GridLevel::placeSellOrder(const std::string& order_id) {
    if (!canPlaceSellOrder()) {
        return false;
    }
    sell_order_ids_.push_back(order_id);
    return true;
}

void GridLevel::resetBuyLevelCycle() {
    state_ = GridCycleState::READY_TO_BUY;
}

std::string GridLevel::latestBuyOrderId() const {
    return buy_order_ids_.empty() ? std::string() : buy_order_ids_.back();
}

std::string GridLevel::latestSellOrderId() const {
    return sell_order_ids_.empty() ? std::string() : sell_order_ids_.back();
}

std::string GridLevel::toString() const {
    std::ostringstream oss;
    oss << "GridLevel(price=" << price_
        << ", state=" << gridCycleStateToString(state_)
        << ", num_buy_orders=" << buy_order_ids_.size()
        << ", num_sell_orders=" << sell_order_ids_.size()
        << ", latest_buy_order=" << (buy_order_ids_.empty() ? "None" : buy_order_ids_.back())
        << ", latest_sell_order=" << (sell_order_ids_.empty() ? "None" : sell_order_ids_.back())
        << ")";
    return oss.str();
}

} // namespace grid
} // namespace gridpilot
