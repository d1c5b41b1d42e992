#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

#include "common/WorkerPool.h"
#include "core/events/EventBus.h"
#include "execution/OrderBook.h"
#include "execution/OrderExecutionStrategy.h"

namespace gridpilot {
namespace execution {

// Polls the exchange for every locally open order and publishes
// ORDER_COMPLETED / ORDER_CANCELLED once per order when it turns terminal.
// Status queries of one cycle run on query_pool, which must not be the
// pool that delivers events to a caller of stopTracking().
class OrderStatusTracker {
public:
    OrderStatusTracker(OrderBook& order_book,
                       IOrderExecutionStrategy& execution_strategy,
                       core::EventBus& event_bus,
                       WorkerPool& query_pool,
                       std::string pair,
                       std::chrono::milliseconds polling_interval = std::chrono::seconds(15));
    ~OrderStatusTracker();

    OrderStatusTracker(const OrderStatusTracker&) = delete;
    OrderStatusTracker& operator=(const OrderStatusTracker&) = delete;

    void startTracking();

    // Wakes the poller and joins it; results of in-flight queries are dropped
    void stopTracking();

    bool isTracking() const { return running_.load(); }

    // One synchronous reconciliation cycle. Returns the number of events published.
    std::size_t processOpenOrders();

private:
    void trackLoop();
    bool handleOrderStatusChange(const Order& local_order, Order remote_order);

    OrderBook& order_book_;
    IOrderExecutionStrategy& execution_strategy_;
    core::EventBus& event_bus_;
    WorkerPool& query_pool_;
    std::string pair_;
    std::chrono::milliseconds polling_interval_;

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
};

} // namespace execution
} // namespace gridpilot
