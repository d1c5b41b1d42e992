#pragma once

#include <string>
#include <vector>

namespace gridpilot {
namespace grid {

enum class GridCycleState {
    READY_TO_BUY,           // no unmatched buy at this level
    READY_TO_SELL,          // buy placed (buy level) or sell level waiting for a sell
    COMPLETED,              // reserved, never entered
    READY_TO_BUY_OR_SELL    // reserved for hedged levels, never entered
};

inline const char* gridCycleStateToString(GridCycleState state) {
    switch (state) {
        case GridCycleState::READY_TO_BUY: return "READY_TO_BUY";
        case GridCycleState::READY_TO_SELL: return "READY_TO_SELL";
        case GridCycleState::COMPLETED: return "COMPLETED";
        case GridCycleState::READY_TO_BUY_OR_SELL: return "READY_TO_BUY_OR_SELL";
    }
    return "UNKNOWN";
}

// One price point of the ladder. Orders are referenced by exchange id;
// the OrderBook owns the order data.
class GridLevel {
public:
    GridLevel(double price, GridCycleState state);

    double getPrice() const { return price_; }
    GridCycleState getState() const { return state_; }

    bool canPlaceBuyOrder() const { return state_ == GridCycleState::READY_TO_BUY; }
    bool canPlaceSellOrder() const { return state_ == GridCycleState::READY_TO_SELL; }

    // Returns false (and leaves the level untouched) when the state forbids it
    bool placeBuyOrder(const std::string& order_id);
    bool placeSellOrder(const std::string& order_id);

    // Close a buy cycle once its matching sell is placed
    void resetBuyLevelCycle();

    const std::vector<std::string>& getBuyOrderIds() const { return buy_order_ids_; }
    const std::vector<std::string>& getSellOrderIds() const { return sell_order_ids_; }
    std::string latestBuyOrderId() const;
    std::string latestSellOrderId() const;

    void setPairedPrice(double price) { paired_price_ = price; }
    double getPairedPrice() const { return paired_price_; }

    std::string toString() const;

private:
    double price_;
    GridCycleState state_;
    std::vector<std::string> buy_order_ids_;
    std::vector<std::string> sell_order_ids_;
    double paired_price_ = 0.0;  // sell level that closed the last cycle
};

} // namespace grid
} // namespace gridpilot
