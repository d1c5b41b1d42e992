#include "execution/OrderManager.h"

#include "common/Exceptions.h"
#include "common/Logger.h"
#include "core/execution/OrderSchema.h"

namespace {
void logExecutionLifecycle(const char* event,
                           const gridpilot::Order& order,
                           std::optional<double> grid_price) {
    LOG_INFO(
        "Execution lifecycle: event={}, order_id={}, pair={}, side={}, type={}, status={}, price={:.8f}, amount={:.8f}, grid_level={}",
        event,
        order.identifier,
        order.symbol,
        gridpilot::orderSideToString(order.side),
        gridpilot::orderTypeToString(order.type),
        gridpilot::orderStatusToString(order.status),
        order.price,
        order.amount,
        grid_price ? std::to_string(*grid_price) : std::string("none")
    );
}
} // namespace

namespace gridpilot {
namespace execution {

const char* orderPlacementResultToString(OrderPlacementResult result) {
    switch (result) {
        case OrderPlacementResult::PLACED: return "placed";
        case OrderPlacementResult::NO_CROSSING: return "no_crossing";
        case OrderPlacementResult::NO_COMPLETED_BUY: return "no_completed_buy";
        case OrderPlacementResult::GRID_LEVEL_NOT_READY: return "grid_level_not_ready";
        case OrderPlacementResult::INSUFFICIENT_BALANCE: return "insufficient_balance";
        case OrderPlacementResult::INSUFFICIENT_CRYPTO_BALANCE: return "insufficient_crypto_balance";
        case OrderPlacementResult::INVALID_QUANTITY: return "invalid_quantity";
        case OrderPlacementResult::EXECUTION_FAILED: return "execution_failed";
        case OrderPlacementResult::ERROR: return "error";
    }
    return "unknown";
}

namespace {
OrderPlacementResult fromValidation(ValidationOutcome outcome) {
    switch (outcome) {
        case ValidationOutcome::INSUFFICIENT_BALANCE: return OrderPlacementResult::INSUFFICIENT_BALANCE;
        case ValidationOutcome::INSUFFICIENT_CRYPTO_BALANCE: return OrderPlacementResult::INSUFFICIENT_CRYPTO_BALANCE;
        case ValidationOutcome::INVALID_QUANTITY: return OrderPlacementResult::INVALID_QUANTITY;
        case ValidationOutcome::OK: break;
    }
    return OrderPlacementResult::PLACED;
}

std::string describeFailure(const OrderExecutionFailed& e) {
    return std::string(e.what()) + " (side=" + orderSideToString(e.side()) +
           ", type=" + orderTypeToString(e.type()) +
           ", pair=" + e.pair() +
           ", quantity=" + std::to_string(e.quantity()) +
           ", price=" + std::to_string(e.price()) + ")";
}
} // namespace

OrderManager::OrderManager(grid::GridManager& grid_manager,
                           OrderValidator order_validator,
                           BalanceTracker& balance_tracker,
                           OrderBook& order_book,
                           IOrderExecutionStrategy& execution_strategy,
                           notify::INotificationSink& notifier,
                           core::EventBus& event_bus,
                           engine::TradingMode trading_mode,
                           std::string pair)
    : grid_manager_(grid_manager)
    , order_validator_(order_validator)
    , balance_tracker_(balance_tracker)
    , order_book_(order_book)
    , execution_strategy_(execution_strategy)
    , notifier_(notifier)
    , event_bus_(event_bus)
    , trading_mode_(trading_mode)
    , pair_(std::move(pair)) {
}

OrderPlacementResult OrderManager::executeOrder(OrderSide side,
                                                double current_price,
                                                double previous_price,
                                                Timestamp timestamp) {
    grid::GridLevel* grid_level = grid_manager_.getCrossedGridLevel(current_price, previous_price, side);
    if (grid_level == nullptr) {
        LOG_DEBUG("No {} grid level crossed ({:.8f} -> {:.8f})",
                  orderSideToString(side), previous_price, current_price);
        return OrderPlacementResult::NO_CROSSING;
    }

    try {
        if (side == OrderSide::BUY) {
            return processBuyOrder(*grid_level, current_price, timestamp);
        }
        return processSellOrder(*grid_level, current_price, timestamp);
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error while processing {} order at grid level {:.8f}: {}",
                  orderSideToString(side), grid_level->getPrice(), e.what());
        notifier_.asyncSendNotification(notify::NotificationType::ERROR_OCCURRED,
                                        {{"error_details", e.what()}});
        return OrderPlacementResult::ERROR;
    }
}

OrderPlacementResult OrderManager::processBuyOrder(grid::GridLevel& grid_level,
                                                   double current_price,
                                                   Timestamp timestamp) {
    const double level_price = grid_level.getPrice();

    {
        std::lock_guard<std::mutex> lock(finalize_mutex_);
        if (!grid_level.canPlaceBuyOrder()) {
            LOG_INFO("Grid level {:.8f} is not ready for a buy order, current state: {}",
                     level_price, grid::gridCycleStateToString(grid_level.getState()));
            return OrderPlacementResult::GRID_LEVEL_NOT_READY;
        }
    }

    const double total_value = balance_tracker_.getTotalBalanceValue(current_price);
    const double desired_quantity = grid_manager_.getOrderSizePerGrid(total_value, level_price);

    const auto validated = order_validator_.adjustAndValidateBuyQuantity(
        balance_tracker_.getBalance(), desired_quantity, level_price);
    if (!validated.ok()) {
        LOG_INFO("Cannot process buy order at {:.8f}: {}", level_price,
                 validationOutcomeToString(validated.outcome));
        return fromValidation(validated.outcome);
    }

    const double reserved_amount = validated.quantity * level_price;
    const auto reservation = balance_tracker_.reserveFundsForBuy(reserved_amount);
    if (reservation != ReservationResult::OK) {
        LOG_INFO("Cannot reserve {:.2f} for buy at {:.8f}: {}", reserved_amount, level_price,
                 reservationResultToString(reservation));
        return OrderPlacementResult::INSUFFICIENT_BALANCE;
    }

    Order order;
    try {
        order = execution_strategy_.executeLimitOrder(OrderSide::BUY, pair_, validated.quantity, level_price);
    } catch (const OrderExecutionFailed& e) {
        balance_tracker_.releaseReservedFiat(reserved_amount);
        LOG_ERROR("Buy order execution failed: {}", describeFailure(e));
        notifier_.asyncSendNotification(notify::NotificationType::ORDER_FAILED,
                                        {{"error_details", describeFailure(e)}});
        return OrderPlacementResult::EXECUTION_FAILED;
    } catch (const std::exception& e) {
        balance_tracker_.releaseReservedFiat(reserved_amount);
        LOG_ERROR("Unexpected error while placing buy order at {:.8f}: {}", level_price, e.what());
        notifier_.asyncSendNotification(notify::NotificationType::ERROR_OCCURRED,
                                        {{"error_details", e.what()}});
        return OrderPlacementResult::ERROR;
    }

    if (order.timestamp == 0) {
        order.timestamp = timestamp;
    }

    {
        std::lock_guard<std::mutex> lock(finalize_mutex_);
        if (!grid_level.placeBuyOrder(order.identifier)) {
            LOG_ERROR("Grid level {:.8f} changed state while buy {} was in flight",
                      level_price, order.identifier);
        }
        if (!order_book_.addOrder(order, level_price)) {
            LOG_ERROR("Buy order {} could not be booked", order.identifier);
        }
    }

    logExecutionLifecycle("placed", order, level_price);
    publishIfTerminal(order);
    notifier_.asyncSendNotification(notify::NotificationType::ORDER_PLACED,
                                    {{"order_details", core::execution::describeOrder(order)}});
    return OrderPlacementResult::PLACED;
}

OrderPlacementResult OrderManager::processSellOrder(grid::GridLevel& grid_level,
                                                    double current_price,
                                                    Timestamp timestamp) {
    (void)current_price;
    const double level_price = grid_level.getPrice();

    grid::GridLevel* buy_grid_level = nullptr;
    std::optional<Order> buy_order;
    {
        std::lock_guard<std::mutex> lock(finalize_mutex_);
        for (;;) {
            buy_grid_level = grid_manager_.findLowestCompletedBuyGrid();
            if (buy_grid_level == nullptr) {
                LOG_DEBUG("No grid level found with a completed buy order");
                return OrderPlacementResult::NO_COMPLETED_BUY;
            }
            const std::string buy_order_id = buy_grid_level->latestBuyOrderId();
            buy_order = order_book_.getOrder(buy_order_id);
            if (!buy_order) {
                LOG_ERROR("Buy order {} of grid level {:.8f} is missing from the order book",
                          buy_order_id, buy_grid_level->getPrice());
                return OrderPlacementResult::ERROR;
            }
            if (!(buy_order->isCanceled() && buy_order->filled <= 0.0)) {
                break;
            }
            // Nothing was bought at this level, so there is nothing to sell for it
            LOG_INFO("Buy order {} at {:.8f} was cancelled unfilled; resetting the level",
                     buy_order_id, buy_grid_level->getPrice());
            grid_manager_.resetGridCycle(*buy_grid_level);
        }
        if (!grid_level.canPlaceSellOrder()) {
            LOG_INFO("Grid level {:.8f} is not ready for a sell order, current state: {}",
                     level_price, grid::gridCycleStateToString(grid_level.getState()));
            return OrderPlacementResult::GRID_LEVEL_NOT_READY;
        }
    }
    const double desired_quantity = (buy_order->filled > 0.0) ? buy_order->filled : buy_order->amount;

    const auto validated = order_validator_.adjustAndValidateSellQuantity(
        balance_tracker_.getCryptoBalance(), desired_quantity);
    if (!validated.ok()) {
        LOG_INFO("Cannot process sell order at {:.8f}: {}", level_price,
                 validationOutcomeToString(validated.outcome));
        return fromValidation(validated.outcome);
    }

    const auto reservation = balance_tracker_.reserveFundsForSell(validated.quantity);
    if (reservation != ReservationResult::OK) {
        LOG_INFO("Cannot reserve {:.8f} crypto for sell at {:.8f}: {}", validated.quantity, level_price,
                 reservationResultToString(reservation));
        return OrderPlacementResult::INSUFFICIENT_CRYPTO_BALANCE;
    }

    Order order;
    try {
        order = execution_strategy_.executeLimitOrder(OrderSide::SELL, pair_, validated.quantity, level_price);
    } catch (const OrderExecutionFailed& e) {
        balance_tracker_.releaseReservedCrypto(validated.quantity);
        LOG_ERROR("Sell order execution failed: {}", describeFailure(e));
        notifier_.asyncSendNotification(notify::NotificationType::ORDER_FAILED,
                                        {{"error_details", describeFailure(e)}});
        return OrderPlacementResult::EXECUTION_FAILED;
    } catch (const std::exception& e) {
        balance_tracker_.releaseReservedCrypto(validated.quantity);
        LOG_ERROR("Unexpected error while placing sell order at {:.8f}: {}", level_price, e.what());
        notifier_.asyncSendNotification(notify::NotificationType::ERROR_OCCURRED,
                                        {{"error_details", e.what()}});
        return OrderPlacementResult::ERROR;
    }

    if (order.timestamp == 0) {
        order.timestamp = timestamp;
    }

    {
        std::lock_guard<std::mutex> lock(finalize_mutex_);
        if (!grid_level.placeSellOrder(order.identifier)) {
            LOG_ERROR("Grid level {:.8f} changed state while sell {} was in flight",
                      level_price, order.identifier);
        }
        if (!order_book_.addOrder(order, level_price)) {
            LOG_ERROR("Sell order {} could not be booked", order.identifier);
        }
        buy_grid_level->setPairedPrice(level_price);
        grid_manager_.resetGridCycle(*buy_grid_level);
    }

    logExecutionLifecycle("placed", order, level_price);
    publishIfTerminal(order);
    notifier_.asyncSendNotification(notify::NotificationType::ORDER_PLACED,
                                    {{"order_details", core::execution::describeOrder(order)}});
    return OrderPlacementResult::PLACED;
}

void OrderManager::publishIfTerminal(const Order& placed) {
    Order order = placed;
    if (order.status == OrderStatus::CLOSED) {
        if (order.filled <= 0.0) {
            order.filled = order.amount;
            order.remaining = 0.0;
        }
        event_bus_.publishSync(core::EventType::ORDER_COMPLETED, core::EventPayload::forOrder(order));
        Logger::getInstance().logTrade(order.symbol, orderSideToString(order.side),
                                       order.fillPrice(), order.filled, order.fee_cost.value_or(0.0));
    } else if (order.status == OrderStatus::CANCELED) {
        event_bus_.publishSync(core::EventType::ORDER_CANCELLED, core::EventPayload::forOrder(order));
    }
}

bool OrderManager::executeTakeProfitOrStopLossOrder(double current_price,
                                                    Timestamp timestamp,
                                                    RiskTrigger trigger) {
    const char* event = (trigger == RiskTrigger::TAKE_PROFIT) ? "Take profit" : "Stop loss";
    const double quantity = balance_tracker_.getCryptoBalance();
    if (quantity <= 0.0) {
        LOG_INFO("{} triggered at {:.8f} but there is no crypto to sell", event, current_price);
        return false;
    }

    if (balance_tracker_.reserveFundsForSell(quantity) != ReservationResult::OK) {
        LOG_WARN("{} triggered at {:.8f} but {:.8f} crypto could not be reserved", event, current_price, quantity);
        return false;
    }

    Order order;
    try {
        order = execution_strategy_.executeMarketOrder(OrderSide::SELL, pair_, quantity, current_price);
    } catch (const OrderExecutionFailed& e) {
        balance_tracker_.releaseReservedCrypto(quantity);
        LOG_ERROR("{} sell failed: {}", event, describeFailure(e));
        notifier_.asyncSendNotification(notify::NotificationType::ORDER_FAILED,
                                        {{"error_details", describeFailure(e)}});
        return false;
    } catch (const std::exception& e) {
        balance_tracker_.releaseReservedCrypto(quantity);
        LOG_ERROR("Unexpected error during {} sell: {}", event, e.what());
        notifier_.asyncSendNotification(notify::NotificationType::ERROR_OCCURRED,
                                        {{"error_details", e.what()}});
        return false;
    }

    if (order.timestamp == 0) {
        order.timestamp = timestamp;
    }
    if (!order_book_.addOrder(order)) {
        LOG_ERROR("{} order {} could not be booked", event, order.identifier);
    }

    LOG_INFO("{} triggered at {:.8f} in {} mode, selling {:.8f}",
             event, current_price, engine::tradingModeToString(trading_mode_), quantity);
    logExecutionLifecycle("placed", order, std::nullopt);
    publishIfTerminal(order);
    notifier_.asyncSendNotification(
        (trigger == RiskTrigger::TAKE_PROFIT) ? notify::NotificationType::TAKE_PROFIT_TRIGGERED
                                              : notify::NotificationType::STOP_LOSS_TRIGGERED,
        {{"order_details", core::execution::describeOrder(order)}});
    return true;
}

} // namespace execution
} // namespace gridpilot
