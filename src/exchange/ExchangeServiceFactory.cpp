#include "exchange/ExchangeServiceFactory.h"

#include "backtest/DataHistory.h"
#include "common/Exceptions.h"
#include "common/Logger.h"

namespace gridpilot {
namespace exchange {

std::shared_ptr<IExchangeService> ExchangeServiceFactory::create(const engine::BotConfig& config) {
    switch (config.mode) {
        case engine::TradingMode::BACKTEST:
        case engine::TradingMode::PAPER:
            return createReplay(config);
        case engine::TradingMode::LIVE:
            break;
    }
    throw UnsupportedExchange("No live adapter available for exchange '" + config.exchange_name + "'");
}

std::shared_ptr<ReplayExchangeService> ExchangeServiceFactory::createReplay(const engine::BotConfig& config) {
    auto candles = backtest::DataHistory::loadCSV(config.historical_data_file);
    candles = backtest::DataHistory::filterByDate(candles, config.start_date, config.end_date);
    if (candles.empty()) {
        throw DataFetchError("No candles in " + config.historical_data_file +
                             " for period [" + config.start_date + ", " + config.end_date + "]");
    }

    LOG_INFO("Using replay exchange for {} mode ({} candles, timeframe {})",
             engine::tradingModeToString(config.mode), candles.size(), config.timeframe);

    return std::make_shared<ReplayExchangeService>(
        std::move(candles),
        config.pair(),
        config.initial_balance,
        0.0,
        config.trading_fee
    );
}

} // namespace exchange
} // namespace gridpilot
