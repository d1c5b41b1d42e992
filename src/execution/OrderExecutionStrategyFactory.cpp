#include "execution/OrderExecutionStrategyFactory.h"

#include "execution/BacktestOrderExecutionStrategy.h"
#include "execution/LiveOrderExecutionStrategy.h"

namespace gridpilot {
namespace execution {

std::unique_ptr<IOrderExecutionStrategy> OrderExecutionStrategyFactory::create(
    engine::TradingMode mode,
    std::shared_ptr<exchange::IExchangeService> exchange_service,
    const engine::ExecutionConfig& config) {
    if (mode == engine::TradingMode::BACKTEST) {
        return std::make_unique<BacktestOrderExecutionStrategy>();
    }
    return std::make_unique<LiveOrderExecutionStrategy>(std::move(exchange_service), config);
}

} // namespace execution
} // namespace gridpilot
