#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "engine/EngineConfig.h"
#include "exchange/IExchangeService.h"
#include "exchange/ReplayExchangeService.h"
#include "execution/BacktestOrderExecutionStrategy.h"
#include "execution/BalanceTracker.h"
#include "execution/OrderBook.h"
#include "execution/OrderManager.h"
#include "execution/OrderStatusTracker.h"
#include "grid/GridManager.h"

namespace gridpilot {
namespace strategy {

// Drives price ticks into the OrderManager.
//   BACKTEST: candle replay, simulated fills, synchronous reconciliation
//   PAPER:    candle replay through the exchange-backed execution path
//   LIVE:     polls the exchange ticker every ticker interval
class GridTradingStrategy {
public:
    struct Result {
        double initial_value = 0.0;
        double final_value = 0.0;
        double total_profit = 0.0;
        double roi_pct = 0.0;
        double max_drawdown_pct = 0.0;
        double total_fees = 0.0;
        double final_fiat = 0.0;
        double final_crypto = 0.0;
        double final_price = 0.0;
        int ticks = 0;
        int buy_orders = 0;
        int sell_orders = 0;
        int non_grid_orders = 0;
        int completed_orders = 0;
        bool stopped_by_risk = false;
        std::string stop_reason;
    };

    using StopRequestHandler = std::function<void(const std::string& reason)>;

    GridTradingStrategy(const engine::BotConfig& config,
                        grid::GridManager& grid_manager,
                        execution::OrderManager& order_manager,
                        execution::BalanceTracker& balance_tracker,
                        execution::OrderBook& order_book,
                        execution::OrderStatusTracker& status_tracker,
                        std::shared_ptr<exchange::IExchangeService> exchange_service,
                        std::shared_ptr<exchange::ReplayExchangeService> replay = nullptr,
                        execution::BacktestOrderExecutionStrategy* simulator = nullptr);

    void initializeStrategy();

    // Arms the next run() so that a stop() issued before it starts still wins
    void prepareRun();

    // Blocks until the data runs out, a risk threshold fires or stop() is called
    void run();
    void stop();
    bool isRunning() const { return running_.load(); }

    // Called on the run thread when take-profit / stop-loss ends the session
    void setStopRequestHandler(StopRequestHandler handler) { stop_request_handler_ = std::move(handler); }

    void setTickerInterval(std::chrono::milliseconds interval) { ticker_interval_ = interval; }

    // Returns true when a threshold fired and the exit order was handled
    bool checkTakeProfitStopLoss(double current_price, Timestamp timestamp);

    Result getResult() const;
    void logSummary() const;

private:
    void runReplay();
    void runLive();
    bool onTick(double current_price, Timestamp timestamp);
    void recordEquity(double current_price);
    void requestStop(const std::string& reason);
    void waitTickerInterval();
    void resetRunState();

    const engine::BotConfig& config_;
    grid::GridManager& grid_manager_;
    execution::OrderManager& order_manager_;
    execution::BalanceTracker& balance_tracker_;
    execution::OrderBook& order_book_;
    execution::OrderStatusTracker& status_tracker_;
    std::shared_ptr<exchange::IExchangeService> exchange_service_;
    std::shared_ptr<exchange::ReplayExchangeService> replay_;
    execution::BacktestOrderExecutionStrategy* simulator_;

    StopRequestHandler stop_request_handler_;
    std::chrono::milliseconds ticker_interval_{3000};

    std::atomic<bool> running_{false};
    std::atomic<bool> prepared_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    mutable std::mutex result_mutex_;
    std::optional<double> previous_price_;
    double initial_value_ = 0.0;
    double peak_value_ = 0.0;
    double max_drawdown_pct_ = 0.0;
    double last_price_ = 0.0;
    int ticks_ = 0;
    bool stopped_by_risk_ = false;
    std::string stop_reason_;
};

} // namespace strategy
} // namespace gridpilot
