#pragma once

#include <memory>

#include "engine/EngineConfig.h"
#include "exchange/IExchangeService.h"
#include "execution/OrderExecutionStrategy.h"

namespace gridpilot {
namespace execution {

class OrderExecutionStrategyFactory {
public:
    // BACKTEST -> simulated fills, PAPER / LIVE -> exchange-backed with retries
    static std::unique_ptr<IOrderExecutionStrategy> create(
        engine::TradingMode mode,
        std::shared_ptr<exchange::IExchangeService> exchange_service,
        const engine::ExecutionConfig& config);
};

} // namespace execution
} // namespace gridpilot
