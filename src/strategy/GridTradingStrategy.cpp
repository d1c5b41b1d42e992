#include "strategy/GridTradingStrategy.h"

#include "common/Exceptions.h"
#include "common/Logger.h"

#include <algorithm>

namespace gridpilot {
namespace strategy {

GridTradingStrategy::GridTradingStrategy(const engine::BotConfig& config,
                                         grid::GridManager& grid_manager,
                                         execution::OrderManager& order_manager,
                                         execution::BalanceTracker& balance_tracker,
                                         execution::OrderBook& order_book,
                                         execution::OrderStatusTracker& status_tracker,
                                         std::shared_ptr<exchange::IExchangeService> exchange_service,
                                         std::shared_ptr<exchange::ReplayExchangeService> replay,
                                         execution::BacktestOrderExecutionStrategy* simulator)
    : config_(config)
    , grid_manager_(grid_manager)
    , order_manager_(order_manager)
    , balance_tracker_(balance_tracker)
    , order_book_(order_book)
    , status_tracker_(status_tracker)
    , exchange_service_(std::move(exchange_service))
    , replay_(std::move(replay))
    , simulator_(simulator) {
}

void GridTradingStrategy::initializeStrategy() {
    grid_manager_.initializeGridLevels();
}

void GridTradingStrategy::prepareRun() {
    resetRunState();
    prepared_ = true;
}

void GridTradingStrategy::resetRunState() {
    running_ = true;
    std::lock_guard<std::mutex> lock(result_mutex_);
    stopped_by_risk_ = false;
    stop_reason_.clear();
}

void GridTradingStrategy::run() {
    // A stop() between prepareRun() and run() must not be overwritten
    if (!prepared_.exchange(false)) {
        resetRunState();
    }

    if (replay_) {
        LOG_INFO("Starting {} simulation over {} candles",
                 engine::tradingModeToString(config_.mode), replay_->candleCount());
        runReplay();
        LOG_INFO("Ending {} simulation", engine::tradingModeToString(config_.mode));
    } else {
        LOG_INFO("Starting {} trading on {}", engine::tradingModeToString(config_.mode), config_.pair());
        runLive();
    }
    running_ = false;
}

void GridTradingStrategy::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_ = false;
    }
    wait_cv_.notify_all();
    LOG_INFO("Trading execution stopped");
}

void GridTradingStrategy::runReplay() {
    Candle candle;
    while (running_.load() && replay_->hasCandle()) {
        candle = replay_->currentCandle();

        if (simulator_) {
            simulator_->simulateFills(candle.low, candle.high, candle.timestamp);
        }
        status_tracker_.processOpenOrders();

        if (!onTick(candle.close, candle.timestamp)) {
            break;
        }
        if (!replay_->advance()) {
            break;
        }
    }

    // Exit orders placed on the last processed candle still need to settle
    if (stopped_by_risk_ && simulator_) {
        simulator_->simulateFills(candle.low, candle.high, candle.timestamp);
    }
    status_tracker_.processOpenOrders();
}

void GridTradingStrategy::runLive() {
    const std::string pair = config_.pair();
    while (running_.load()) {
        double price = 0.0;
        try {
            price = exchange_service_->getCurrentPrice(pair);
        } catch (const DataFetchError& e) {
            LOG_ERROR("Failed to fetch current price for {}: {}", pair, e.what());
            waitTickerInterval();
            continue;
        }

        if (!onTick(price, currentTimeMs())) {
            break;
        }
        waitTickerInterval();
    }
}

void GridTradingStrategy::waitTickerInterval() {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, ticker_interval_, [this]() { return !running_.load(); });
}

bool GridTradingStrategy::onTick(double current_price, Timestamp timestamp) {
    if (!running_.load()) {
        LOG_INFO("Trading stopped; halting price updates");
        return false;
    }

    if (checkTakeProfitStopLoss(current_price, timestamp)) {
        LOG_INFO("Take-profit or stop-loss triggered, ending trading session");
        recordEquity(current_price);
        return false;
    }

    std::optional<double> previous;
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        previous = previous_price_;
    }
    if (previous) {
        order_manager_.executeOrder(OrderSide::BUY, current_price, *previous, timestamp);
        order_manager_.executeOrder(OrderSide::SELL, current_price, *previous, timestamp);
    }

    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        previous_price_ = current_price;
    }
    recordEquity(current_price);
    return true;
}

bool GridTradingStrategy::checkTakeProfitStopLoss(double current_price, Timestamp timestamp) {
    if (balance_tracker_.getCryptoBalance() <= 0.0) {
        return false;
    }

    const auto& risk = config_.risk;
    std::optional<execution::RiskTrigger> trigger;
    if (risk.take_profit.enabled && current_price >= risk.take_profit.threshold) {
        trigger = execution::RiskTrigger::TAKE_PROFIT;
    } else if (risk.stop_loss.enabled && current_price <= risk.stop_loss.threshold) {
        trigger = execution::RiskTrigger::STOP_LOSS;
    }
    if (!trigger) {
        return false;
    }

    const bool placed = order_manager_.executeTakeProfitOrStopLossOrder(current_price, timestamp, *trigger);
    if (!placed) {
        // Nothing was sold, keep trading
        return false;
    }

    const std::string reason = (*trigger == execution::RiskTrigger::TAKE_PROFIT) ? "TP hit." : "SL hit.";
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        stopped_by_risk_ = true;
        stop_reason_ = reason;
    }
    requestStop(reason);
    return true;
}

void GridTradingStrategy::requestStop(const std::string& reason) {
    if (stop_request_handler_) {
        stop_request_handler_(reason);
    } else {
        stop();
    }
}

void GridTradingStrategy::recordEquity(double current_price) {
    const double value = balance_tracker_.getTotalBalanceValue(current_price);

    std::lock_guard<std::mutex> lock(result_mutex_);
    if (ticks_ == 0) {
        initial_value_ = value;
        peak_value_ = value;
    }
    ++ticks_;
    last_price_ = current_price;
    peak_value_ = std::max(peak_value_, value);
    if (peak_value_ > 0.0) {
        max_drawdown_pct_ = std::max(max_drawdown_pct_, (peak_value_ - value) / peak_value_ * 100.0);
    }
}

GridTradingStrategy::Result GridTradingStrategy::getResult() const {
    Result result;
    {
        std::lock_guard<std::mutex> lock(result_mutex_);
        result.initial_value = initial_value_;
        result.max_drawdown_pct = max_drawdown_pct_;
        result.final_price = last_price_;
        result.ticks = ticks_;
        result.stopped_by_risk = stopped_by_risk_;
        result.stop_reason = stop_reason_;
    }

    result.final_fiat = balance_tracker_.getAdjustedFiatBalance();
    result.final_crypto = balance_tracker_.getAdjustedCryptoBalance();
    result.total_fees = balance_tracker_.getTotalFees();
    result.final_value = balance_tracker_.getTotalBalanceValue(result.final_price);
    result.total_profit = result.final_value - result.initial_value;
    if (result.initial_value > 0.0) {
        result.roi_pct = result.total_profit / result.initial_value * 100.0;
    }

    result.buy_orders = static_cast<int>(order_book_.getAllBuyOrders().size());
    result.sell_orders = static_cast<int>(order_book_.getAllSellOrders().size());
    result.non_grid_orders = static_cast<int>(order_book_.getNonGridOrders().size());
    result.completed_orders = static_cast<int>(order_book_.getCompletedOrders().size());
    return result;
}

void GridTradingStrategy::logSummary() const {
    const auto result = getResult();
    LOG_INFO("===== Grid Trading Summary ({}) =====", config_.pair());
    LOG_INFO("Mode: {}, ticks: {}", engine::tradingModeToString(config_.mode), result.ticks);
    LOG_INFO("Initial value: {:.2f}, final value: {:.2f}, profit: {:.2f} ({:.2f}%)",
             result.initial_value, result.final_value, result.total_profit, result.roi_pct);
    LOG_INFO("Max drawdown: {:.2f}%, total fees: {:.4f}", result.max_drawdown_pct, result.total_fees);
    LOG_INFO("Final fiat: {:.2f}, final crypto: {:.8f} @ {:.8f}",
             result.final_fiat, result.final_crypto, result.final_price);
    LOG_INFO("Orders: {} buy, {} sell, {} take-profit/stop-loss, {} filled",
             result.buy_orders, result.sell_orders, result.non_grid_orders, result.completed_orders);
    if (result.stopped_by_risk) {
        LOG_INFO("Session ended early: {}", result.stop_reason);
    }
}

} // namespace strategy
} // namespace gridpilot
