#include "execution/OrderStatusTracker.h"

#include "common/Exceptions.h"
#include "common/Logger.h"
#include "core/execution/OrderSchema.h"
#include "execution/OrderStateMapper.h"

#include <future>
#include <vector>

namespace gridpilot {
namespace execution {

OrderStatusTracker::OrderStatusTracker(OrderBook& order_book,
                                       IOrderExecutionStrategy& execution_strategy,
                                       core::EventBus& event_bus,
                                       WorkerPool& query_pool,
                                       std::string pair,
                                       std::chrono::milliseconds polling_interval)
    : order_book_(order_book)
    , execution_strategy_(execution_strategy)
    , event_bus_(event_bus)
    , query_pool_(query_pool)
    , pair_(std::move(pair))
    , polling_interval_(polling_interval) {
}

OrderStatusTracker::~OrderStatusTracker() {
    stopTracking();
}

void OrderStatusTracker::startTracking() {
    if (running_.exchange(true)) {
        return;
    }
    stop_requested_ = false;
    worker_ = std::thread(&OrderStatusTracker::trackLoop, this);
    LOG_INFO("OrderStatusTracker has started tracking orders (interval {} ms)", polling_interval_.count());
}

void OrderStatusTracker::stopTracking() {
    if (!running_.load()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
    LOG_INFO("OrderStatusTracker has stopped tracking orders");
}

void OrderStatusTracker::trackLoop() {
    while (!stop_requested_.load()) {
        try {
            processOpenOrders();
        } catch (const std::exception& e) {
            LOG_ERROR("Unexpected error in OrderStatusTracker: {}", e.what());
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, polling_interval_, [this]() { return stop_requested_.load(); });
    }
}

std::size_t OrderStatusTracker::processOpenOrders() {
    const auto open_orders = order_book_.getOpenOrders();
    if (open_orders.empty()) {
        return 0;
    }

    // Collect everything first so a stop request drops the whole batch
    std::vector<std::pair<bool, Order>> results(open_orders.size());
    std::vector<std::string> errors(open_orders.size());
    auto query = [this, &open_orders, &results, &errors](std::size_t i) {
        try {
            results[i].second = execution_strategy_.getOrder(open_orders[i].identifier, pair_);
            results[i].first = true;
        } catch (const std::exception& e) {
            errors[i] = e.what();
        }
    };

    std::vector<std::future<void>> queries;
    queries.reserve(open_orders.size());
    for (std::size_t i = 0; i < open_orders.size(); ++i) {
        try {
            queries.push_back(query_pool_.submit([&query, i]() { query(i); }));
        } catch (const std::exception& e) {
            // Pool already shut down: query on the caller thread instead
            LOG_WARN("Query pool unavailable ({}), fetching order {} inline", e.what(), open_orders[i].identifier);
            query(i);
        }
    }
    for (auto& f : queries) {
        f.wait();
    }

    if (stop_requested_.load()) {
        LOG_DEBUG("Discarding {} order status results after stop request", results.size());
        return 0;
    }

    std::size_t published = 0;
    for (std::size_t i = 0; i < open_orders.size(); ++i) {
        const auto& local = open_orders[i];
        if (!results[i].first) {
            LOG_ERROR("Failed to query status for order {}: {}", local.identifier, errors[i]);
            continue;
        }
        try {
            if (handleOrderStatusChange(local, results[i].second)) {
                ++published;
            }
        } catch (const MalformedOrderData& e) {
            LOG_ERROR("Malformed order data for {}: {}", local.identifier, e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to apply status for order {}: {}", local.identifier, e.what());
        }
    }
    return published;
}

bool OrderStatusTracker::handleOrderStatusChange(const Order& local_order, Order remote_order) {
    if (remote_order.identifier.empty()) {
        remote_order.identifier = local_order.identifier;
    }

    switch (remote_order.status) {
        case OrderStatus::CLOSED: {
            const auto update = order_book_.updateOrderFromRemote(remote_order);
            if (!update.became_terminal) {
                return false;
            }
            event_bus_.publishSync(core::EventType::ORDER_COMPLETED, core::EventPayload::forOrder(update.order));
            Logger::getInstance().logTrade(
                update.order.symbol,
                orderSideToString(update.order.side),
                update.order.fillPrice(),
                update.order.filled,
                update.order.fee_cost.value_or(0.0));
            LOG_INFO("Order {} completed", local_order.identifier);
            return true;
        }
        case OrderStatus::CANCELED: {
            const auto update = order_book_.updateOrderFromRemote(remote_order);
            if (!update.became_terminal) {
                return false;
            }
            event_bus_.publishSync(core::EventType::ORDER_CANCELLED, core::EventPayload::forOrder(update.order));
            LOG_WARN("Order {} was cancelled", local_order.identifier);
            return true;
        }
        case OrderStatus::OPEN: {
            order_book_.updateOrderFromRemote(remote_order);
            if (remote_order.filled > 0.0) {
                LOG_INFO("Order {} partially filled. Filled: {:.8f}, Remaining: {:.8f}",
                         local_order.identifier, remote_order.filled, remote_order.remaining);
            } else {
                LOG_DEBUG("Order {} is still open. No fills yet", local_order.identifier);
            }
            return false;
        }
        case OrderStatus::UNKNOWN:
            break;
    }

    const auto mapped = OrderStateMapper::map(remote_order.raw_status);
    if (mapped.missing) {
        throw MalformedOrderData("Order data from the exchange is missing the 'status' field: " +
                                 core::execution::toJson(remote_order).dump());
    }
    LOG_WARN("Unhandled order status '{}' for order {}", remote_order.raw_status, local_order.identifier);
    return false;
}

} // namespace execution
} // namespace gridpilot
