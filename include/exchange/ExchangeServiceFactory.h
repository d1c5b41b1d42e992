#pragma once

#include <memory>

#include "engine/EngineConfig.h"
#include "exchange/IExchangeService.h"
#include "exchange/ReplayExchangeService.h"

namespace gridpilot {
namespace exchange {

class ExchangeServiceFactory {
public:
    // BACKTEST / PAPER: candle replay over the configured historical data file.
    // LIVE: no network adapter is linked into this build, so UnsupportedExchange.
    static std::shared_ptr<IExchangeService> create(const engine::BotConfig& config);

    // Loads and date-filters the historical data file. Throws DataFetchError
    // when the file is missing or holds no candles in the configured period.
    static std::shared_ptr<ReplayExchangeService> createReplay(const engine::BotConfig& config);
};

} // namespace exchange
} // namespace gridpilot
