#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "common/WorkerPool.h"
#include "core/events/EventBus.h"
#include "engine/EngineConfig.h"
#include "exchange/IExchangeService.h"
#include "exchange/ReplayExchangeService.h"
#include "execution/BacktestOrderExecutionStrategy.h"
#include "execution/BalanceTracker.h"
#include "execution/OrderBook.h"
#include "execution/OrderExecutionStrategy.h"
#include "execution/OrderManager.h"
#include "execution/OrderStatusTracker.h"
#include "grid/GridManager.h"
#include "notify/INotificationSink.h"
#include "strategy/GridTradingStrategy.h"

namespace gridpilot {
namespace engine {

// Wires one trading pair end to end and reacts to START_BOT / STOP_BOT
class GridTradingBot {
public:
    struct BalanceSnapshot {
        double fiat = 0.0;
        double crypto = 0.0;
        double reserved_fiat = 0.0;
        double reserved_crypto = 0.0;
    };

    // exchange_service == nullptr: created from the configuration
    GridTradingBot(const BotConfig& config,
                   core::EventBus& event_bus,
                   notify::INotificationSink& notifier,
                   std::shared_ptr<exchange::IExchangeService> exchange_service = nullptr);
    ~GridTradingBot();

    GridTradingBot(const GridTradingBot&) = delete;
    GridTradingBot& operator=(const GridTradingBot&) = delete;

    // Blocks for the trading session(s). A START_BOT received during run()
    // stops the current session and starts another on the same grid,
    // balances and order book; one received outside run() is ignored.
    strategy::GridTradingStrategy::Result run();

    bool isRunning() const { return running_.load(); }
    int sessionCount() const { return sessions_.load(); }
    BalanceSnapshot getBalance() const;

    execution::OrderBook& getOrderBook() { return order_book_; }
    grid::GridManager& getGridManager() { return *grid_manager_; }
    strategy::GridTradingStrategy& getStrategy() { return *strategy_; }

private:
    void runSession();
    void initializeBalances();
    void handleStopBotEvent(const core::EventPayload& payload);
    void handleStartBotEvent(const core::EventPayload& payload);
    void stop();

    BotConfig config_;
    core::EventBus& event_bus_;
    notify::INotificationSink& notifier_;

    std::shared_ptr<exchange::IExchangeService> exchange_service_;
    std::shared_ptr<exchange::ReplayExchangeService> replay_;
    std::unique_ptr<execution::IOrderExecutionStrategy> execution_strategy_;
    execution::BacktestOrderExecutionStrategy* simulator_ = nullptr;

    // Separate from the event pool: START_BOT handlers join the tracker
    WorkerPool query_pool_{4};
    std::unique_ptr<grid::GridManager> grid_manager_;
    execution::OrderBook order_book_;
    std::unique_ptr<execution::BalanceTracker> balance_tracker_;
    std::unique_ptr<execution::OrderStatusTracker> status_tracker_;
    std::unique_ptr<execution::OrderManager> order_manager_;
    std::unique_ptr<strategy::GridTradingStrategy> strategy_;

    core::SubscriptionId stop_subscription_ = 0;
    core::SubscriptionId start_subscription_ = 0;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<bool> in_run_{false};
    std::atomic<bool> restart_requested_{false};
    std::atomic<int> sessions_{0};
};

} // namespace engine
} // namespace gridpilot
