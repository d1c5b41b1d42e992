#include "execution/LiveOrderExecutionStrategy.h"

#include "common/Exceptions.h"
#include "common/Logger.h"
#include "core/execution/OrderSchema.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace gridpilot {
namespace execution {

LiveOrderExecutionStrategy::LiveOrderExecutionStrategy(
    std::shared_ptr<exchange::IExchangeService> exchange_service,
    const engine::ExecutionConfig& config)
    : exchange_service_(std::move(exchange_service))
    , max_retries_(config.max_retries)
    , retry_delay_ms_(config.retry_delay_ms)
    , max_slippage_(config.max_slippage) {
    if (!exchange_service_) {
        throw std::invalid_argument("LiveOrderExecutionStrategy requires an exchange service");
    }
    if (max_retries_ < 1) {
        throw std::invalid_argument("LiveOrderExecutionStrategy: max_retries must be at least 1");
    }
}

void LiveOrderExecutionStrategy::sleepRetryDelay() const {
    if (retry_delay_ms_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(retry_delay_ms_));
    }
}

double LiveOrderExecutionStrategy::adjustPrice(OrderSide side, double price, int attempt) const {
    const double adjustment = max_slippage_ / static_cast<double>(max_retries_) * static_cast<double>(attempt);
    return (side == OrderSide::BUY) ? price * (1.0 + adjustment) : price * (1.0 - adjustment);
}

Order LiveOrderExecutionStrategy::executeMarketOrder(OrderSide side, const std::string& pair,
                                                     double quantity, double price) {
    double remaining_quantity = quantity;
    PartialFills partial;

    for (int attempt = 0; attempt < max_retries_; ++attempt) {
        try {
            const auto raw = exchange_service_->placeOrder(pair, side, OrderType::MARKET, remaining_quantity, price);
            const Order order = core::execution::parseOrder(raw);

            if (order.status == OrderStatus::CLOSED) {
                const double filled = (order.filled > 0.0) ? order.filled : order.amount;
                partial.add(order, filled);
                return partial.merge(order, quantity, OrderStatus::CLOSED);
            }

            if (order.status == OrderStatus::OPEN) {
                LOG_INFO("Market order {} partially filled with {:.8f}; cancelling to retry the remainder",
                         order.identifier, order.filled);
                if (!retryCancelOrder(order.identifier, pair)) {
                    LOG_ERROR("Unable to cancel partially filled order {} after {} attempts; fill of {:.8f} unresolved",
                              order.identifier, max_retries_, order.filled);
                }
                if (order.filled > 0.0 && order.filled < remaining_quantity) {
                    partial.add(order, order.filled);
                    remaining_quantity -= order.filled;
                }
                partial.last = order;
            }

            LOG_INFO("Retrying market order. Attempt {}/{}", attempt + 1, max_retries_);
            sleepRetryDelay();
            price = adjustPrice(side, price, attempt);
        } catch (const std::exception& e) {
            LOG_ERROR("Market order attempt {} failed with error: {}", attempt + 1, e.what());
            sleepRetryDelay();
        }
    }

    if (partial.filled > 0.0 && partial.last) {
        // Executed part stays on the books; the caller releases the rest
        LOG_WARN("Market order for {} stopped after {} attempts with {:.8f} of {:.8f} filled",
                 pair, max_retries_, partial.filled, quantity);
        return partial.merge(*partial.last, quantity, OrderStatus::CANCELED);
    }

    throw OrderExecutionFailed("Failed to execute Market order after maximum retries.",
                               side, OrderType::MARKET, pair, quantity, price);
}

void LiveOrderExecutionStrategy::PartialFills::add(const Order& order, double quantity) {
    filled += quantity;
    cost += quantity * order.fillPrice();
    if (order.fee_cost) {
        fee_cost = fee_cost.value_or(0.0) + *order.fee_cost;
    }
}

Order LiveOrderExecutionStrategy::PartialFills::merge(const Order& last_order,
                                                      double requested,
                                                      OrderStatus status) const {
    Order merged = last_order;
    merged.status = status;
    merged.raw_status = orderStatusToString(status);
    merged.amount = requested;
    merged.filled = filled;
    merged.remaining = std::max(0.0, requested - filled);
    merged.cost = cost;
    merged.fee_cost = fee_cost;
    if (filled > 0.0) {
        merged.average = cost / filled;
    }
    return merged;
}

Order LiveOrderExecutionStrategy::executeLimitOrder(OrderSide side, const std::string& pair,
                                                    double quantity, double price) {
    try {
        const auto raw = exchange_service_->placeOrder(pair, side, OrderType::LIMIT, quantity, price);
        return core::execution::parseOrder(raw);
    } catch (const DataFetchError& e) {
        LOG_ERROR("DataFetchError during limit order execution for {}: {}", pair, e.what());
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error during limit order execution for {}: {}", pair, e.what());
        throw OrderExecutionFailed(std::string("Failed to execute Limit order on ") + pair + ": " + e.what(),
                                   side, OrderType::LIMIT, pair, quantity, price);
    }
}

Order LiveOrderExecutionStrategy::getOrder(const std::string& order_id, const std::string& pair) {
    try {
        const auto raw = exchange_service_->fetchOrder(order_id, pair);
        return core::execution::parseOrder(raw);
    } catch (const DataFetchError&) {
        throw;
    } catch (const std::exception& e) {
        throw DataFetchError(std::string("Unexpected error during order status retrieval: ") + e.what());
    }
}

bool LiveOrderExecutionStrategy::retryCancelOrder(const std::string& order_id, const std::string& pair) {
    for (int cancel_attempt = 0; cancel_attempt < max_retries_; ++cancel_attempt) {
        try {
            const auto result = core::execution::parseOrder(exchange_service_->cancelOrder(order_id, pair));
            if (result.status == OrderStatus::CANCELED) {
                LOG_INFO("Successfully cancelled order {}", order_id);
                return true;
            }
            LOG_WARN("Cancel attempt {} for order {} failed", cancel_attempt + 1, order_id);
        } catch (const std::exception& e) {
            LOG_WARN("Error during cancel attempt {} for order {}: {}", cancel_attempt + 1, order_id, e.what());
        }
        sleepRetryDelay();
    }
    return false;
}

} // namespace execution
} // namespace gridpilot
