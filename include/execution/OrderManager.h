#pragma once

#include <mutex>
#include <string>

#include "common/Types.h"
#include "core/events/EventBus.h"
#include "engine/EngineConfig.h"
#include "execution/BalanceTracker.h"
#include "execution/OrderBook.h"
#include "execution/OrderExecutionStrategy.h"
#include "execution/OrderValidator.h"
#include "grid/GridManager.h"
#include "notify/INotificationSink.h"

namespace gridpilot {
namespace execution {

enum class RiskTrigger {
    TAKE_PROFIT,
    STOP_LOSS
};

enum class OrderPlacementResult {
    PLACED,
    NO_CROSSING,
    NO_COMPLETED_BUY,           // sell crossing without an unmatched buy
    GRID_LEVEL_NOT_READY,
    INSUFFICIENT_BALANCE,
    INSUFFICIENT_CRYPTO_BALANCE,
    INVALID_QUANTITY,
    EXECUTION_FAILED,
    ERROR
};

const char* orderPlacementResultToString(OrderPlacementResult result);

// Turns price ticks into grid orders: crossing -> validation -> reservation
// -> execution -> book recording. Nothing thrown inside a tick escapes.
class OrderManager {
public:
    OrderManager(grid::GridManager& grid_manager,
                 OrderValidator order_validator,
                 BalanceTracker& balance_tracker,
                 OrderBook& order_book,
                 IOrderExecutionStrategy& execution_strategy,
                 notify::INotificationSink& notifier,
                 core::EventBus& event_bus,
                 engine::TradingMode trading_mode,
                 std::string pair);

    OrderPlacementResult executeOrder(OrderSide side,
                                      double current_price,
                                      double previous_price,
                                      Timestamp timestamp);

    // Market-sells the whole available crypto balance. True when an order was placed.
    bool executeTakeProfitOrStopLossOrder(double current_price, Timestamp timestamp, RiskTrigger trigger);

private:
    OrderPlacementResult processBuyOrder(grid::GridLevel& grid_level, double current_price, Timestamp timestamp);
    OrderPlacementResult processSellOrder(grid::GridLevel& grid_level, double current_price, Timestamp timestamp);

    // Orders the exchange reports terminal at placement never reach the
    // status tracker, so their completion is published here
    void publishIfTerminal(const Order& placed);

    grid::GridManager& grid_manager_;
    OrderValidator order_validator_;
    BalanceTracker& balance_tracker_;
    OrderBook& order_book_;
    IOrderExecutionStrategy& execution_strategy_;
    notify::INotificationSink& notifier_;
    core::EventBus& event_bus_;
    engine::TradingMode trading_mode_;
    std::string pair_;

    // Guards GridLevel mutation and the level/book recording step
    std::mutex finalize_mutex_;
};

} // namespace execution
} // namespace gridpilot
