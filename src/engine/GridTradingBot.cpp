#include "engine/GridTradingBot.h"

#include "common/Exceptions.h"
#include "common/Logger.h"
#include "exchange/ExchangeServiceFactory.h"
#include "execution/FeeCalculator.h"
#include "execution/OrderExecutionStrategyFactory.h"
#include "execution/OrderValidator.h"

namespace gridpilot {
namespace engine {

namespace {
double balanceOf(const nlohmann::json& balance, const std::string& currency) {
    if (!balance.contains("free") || !balance["free"].is_object()) {
        throw DataFetchError("Balance response has no 'free' section");
    }
    const auto& free = balance["free"];
    if (!free.contains(currency) || free[currency].is_null()) {
        return 0.0;
    }
    return free[currency].get<double>();
}
} // namespace

GridTradingBot::GridTradingBot(const BotConfig& config,
                               core::EventBus& event_bus,
                               notify::INotificationSink& notifier,
                               std::shared_ptr<exchange::IExchangeService> exchange_service)
    : config_(config)
    , event_bus_(event_bus)
    , notifier_(notifier)
    , exchange_service_(std::move(exchange_service)) {
    LOG_INFO("Starting Grid Trading Bot in {} mode for {}", tradingModeToString(config_.mode), config_.pair());

    if (!exchange_service_) {
        exchange_service_ = exchange::ExchangeServiceFactory::create(config_);
    }
    replay_ = std::dynamic_pointer_cast<exchange::ReplayExchangeService>(exchange_service_);

    execution_strategy_ = execution::OrderExecutionStrategyFactory::create(
        config_.mode, exchange_service_, config_.execution);
    simulator_ = dynamic_cast<execution::BacktestOrderExecutionStrategy*>(execution_strategy_.get());

    grid_manager_ = std::make_unique<grid::GridManager>(config_.grid);
    balance_tracker_ = std::make_unique<execution::BalanceTracker>(
        event_bus_, execution::FeeCalculator(config_.trading_fee), config_.initial_balance, 0.0);

    status_tracker_ = std::make_unique<execution::OrderStatusTracker>(
        order_book_, *execution_strategy_, event_bus_, query_pool_, config_.pair(),
        std::chrono::seconds(config_.execution.polling_interval_seconds));

    order_manager_ = std::make_unique<execution::OrderManager>(
        *grid_manager_, execution::OrderValidator(), *balance_tracker_, order_book_,
        *execution_strategy_, notifier_, event_bus_, config_.mode, config_.pair());

    strategy_ = std::make_unique<strategy::GridTradingStrategy>(
        config_, *grid_manager_, *order_manager_, *balance_tracker_, order_book_,
        *status_tracker_, exchange_service_, replay_, simulator_);
    strategy_->setStopRequestHandler([this](const std::string& reason) {
        event_bus_.publish(core::EventType::STOP_BOT, core::EventPayload::withMessage(reason));
    });

    stop_subscription_ = event_bus_.subscribe(
        core::EventType::STOP_BOT,
        [this](const core::EventPayload& payload) { handleStopBotEvent(payload); });
    start_subscription_ = event_bus_.subscribe(
        core::EventType::START_BOT,
        [this](const core::EventPayload& payload) { handleStartBotEvent(payload); });

    initializeBalances();
    strategy_->initializeStrategy();
}

GridTradingBot::~GridTradingBot() {
    event_bus_.unsubscribe(stop_subscription_);
    event_bus_.unsubscribe(start_subscription_);
    event_bus_.drain();
    status_tracker_->stopTracking();
}

void GridTradingBot::initializeBalances() {
    if (config_.mode == TradingMode::BACKTEST) {
        balance_tracker_->setupBalances(config_.initial_balance, 0.0);
        return;
    }

    const auto balance = exchange_service_->getBalance();
    balance_tracker_->setupBalances(balanceOf(balance, config_.quote_currency),
                                    balanceOf(balance, config_.base_currency));
}

strategy::GridTradingStrategy::Result GridTradingBot::run() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        in_run_ = true;
        restart_requested_ = false;
    }

    bool another_session = true;
    while (another_session) {
        try {
            runSession();
        } catch (const std::exception&) {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            in_run_ = false;
            throw;
        }

        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        another_session = restart_requested_.exchange(false);
        if (another_session) {
            LOG_INFO("Restarting Grid Trading Bot");
        } else {
            in_run_ = false;
        }
    }

    auto result = strategy_->getResult();
    strategy_->logSummary();
    return result;
}

void GridTradingBot::runSession() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        running_ = true;
        ++sessions_;
        strategy_->prepareRun();
        if (config_.mode != TradingMode::BACKTEST) {
            status_tracker_->startTracking();
        }
    }

    try {
        strategy_->run();
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error while trading: {}", e.what());
        stop();
        throw;
    }
    stop();
}

void GridTradingBot::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!running_.load()) {
        LOG_DEBUG("Bot is not running. Nothing to stop");
        return;
    }

    LOG_INFO("Stopping Grid Trading Bot...");
    status_tracker_->stopTracking();
    strategy_->stop();
    running_ = false;
    LOG_INFO("Grid Trading Bot has been stopped");
}

void GridTradingBot::handleStopBotEvent(const core::EventPayload& payload) {
    if (!running_.load()) {
        LOG_WARN("Stop event received but bot is already stopped: {}", payload.message);
        return;
    }
    LOG_INFO("Handling STOP_BOT event: {}", payload.message);
    stop();
}

void GridTradingBot::handleStartBotEvent(const core::EventPayload& payload) {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (!in_run_.load()) {
            LOG_WARN("Start event received outside run(), ignoring: {}", payload.message);
            return;
        }
        restart_requested_ = true;
    }

    LOG_INFO("Handling START_BOT event: {}", payload.message);
    if (running_.load()) {
        LOG_INFO("Bot is already running. Restarting...");
        stop();
    }
}

GridTradingBot::BalanceSnapshot GridTradingBot::getBalance() const {
    BalanceSnapshot snapshot;
    snapshot.fiat = balance_tracker_->getBalance();
    snapshot.crypto = balance_tracker_->getCryptoBalance();
    snapshot.reserved_fiat = balance_tracker_->getReservedFiat();
    snapshot.reserved_crypto = balance_tracker_->getReservedCrypto();
    return snapshot;
}

} // namespace engine
} // namespace gridpilot
