#pragma once

#include <memory>
#include <optional>

#include "engine/EngineConfig.h"
#include "exchange/IExchangeService.h"
#include "execution/OrderExecutionStrategy.h"

namespace gridpilot {
namespace execution {

class LiveOrderExecutionStrategy : public IOrderExecutionStrategy {
public:
    LiveOrderExecutionStrategy(std::shared_ptr<exchange::IExchangeService> exchange_service,
                               const engine::ExecutionConfig& config);

    // Up to max_retries attempts; an OPEN result is cancelled and the
    // unfilled remainder retried at a slippage-adjusted price.
    // The returned order covers every attempt: amount is the requested
    // quantity, filled and average aggregate all fills. CANCELED when
    // retries ran out after a partial fill.
    // Throws OrderExecutionFailed when nothing was filled.
    Order executeMarketOrder(OrderSide side, const std::string& pair,
                             double quantity, double price) override;

    // Single attempt. DataFetchError propagates, anything else becomes OrderExecutionFailed.
    Order executeLimitOrder(OrderSide side, const std::string& pair,
                            double quantity, double price) override;

    // DataFetchError propagates, anything else becomes DataFetchError
    Order getOrder(const std::string& order_id, const std::string& pair) override;

    double adjustPrice(OrderSide side, double price, int attempt) const;

private:
    struct PartialFills {
        double filled = 0.0;
        double cost = 0.0;
        std::optional<double> fee_cost;
        std::optional<Order> last;

        void add(const Order& order, double quantity);
        Order merge(const Order& last_order, double requested, OrderStatus status) const;
    };

    bool retryCancelOrder(const std::string& order_id, const std::string& pair);
    void sleepRetryDelay() const;

    std::shared_ptr<exchange::IExchangeService> exchange_service_;
    int max_retries_;
    int retry_delay_ms_;
    double max_slippage_;
};

} // namespace execution
} // namespace gridpilot
