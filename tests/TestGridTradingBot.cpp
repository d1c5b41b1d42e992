#include "engine/GridTradingBot.h"

#include "TestSupport.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

using namespace gridpilot;
using gridpilot::engine::GridTradingBot;
using gridpilot::test::FakeExchange;
using gridpilot::test::RecordingNotifier;
using gridpilot::test::approx;

namespace {
engine::BotConfig sampleConfig() {
    engine::BotConfig config;
    config.mode = engine::TradingMode::BACKTEST;
    config.base_currency = "SOL";
    config.quote_currency = "USDT";
    config.trading_fee = 0.001;
    config.initial_balance = 10000.0;
    config.historical_data_file = "data/SOL_USDT_1h_sample.csv";
    config.grid.bottom = 92.0;
    config.grid.top = 108.0;
    config.grid.num_grids = 9;
    config.execution.retry_delay_ms = 0;
    config.execution.polling_interval_seconds = 1;
    return config;
}

template <typename Predicate>
bool waitFor(Predicate predicate) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}
} // namespace

int main() {
    WorkerPool pool(3);
    core::EventBus bus(pool);

    {
        RecordingNotifier notifier;
        GridTradingBot bot(sampleConfig(), bus, notifier);
        assert(bot.getGridManager().getLevelCount() == 9);
        assert(bot.getBalance().fiat == 10000.0);

        const auto r = bot.run();
        assert(!bot.isRunning());
        assert(r.ticks == 96);
        assert(approx(r.initial_value, 10000.0));
        assert(r.buy_orders > 0);
        assert(r.sell_orders > 0);
        assert(r.sell_orders <= r.buy_orders);
        assert(r.total_fees > 0.0);
        assert(r.final_fiat >= 0.0);
        assert(r.final_crypto >= 0.0);
        assert(approx(r.final_value, r.final_fiat + r.final_crypto * r.final_price, 1e-4));

        // settled buys draw their fee from the pooled reservation, never more
        double open_buy_value = 0.0;
        for (const auto& order : bot.getOrderBook().getOpenOrders()) {
            if (order.side == OrderSide::BUY) {
                open_buy_value += order.remaining * order.price;
            }
        }
        const double reserved = bot.getBalance().reserved_fiat;
        assert(reserved <= open_buy_value + 1e-4);
        assert(reserved >= open_buy_value - r.total_fees - 1e-4);

        assert(notifier.count(notify::NotificationType::ORDER_PLACED) == r.buy_orders + r.sell_orders);

        // stop requests for an idle bot are ignored
        bus.publish(core::EventType::STOP_BOT, core::EventPayload::withMessage("late stop"));
        assert(!bot.isRunning());
    }
    assert(bus.subscriberCount(core::EventType::STOP_BOT) == 0);
    assert(bus.subscriberCount(core::EventType::ORDER_COMPLETED) == 0);

    {
        // take-profit ends the session through STOP_BOT
        auto config = sampleConfig();
        config.risk.take_profit.enabled = true;
        config.risk.take_profit.threshold = 104.0;
        RecordingNotifier notifier;
        GridTradingBot bot(config, bus, notifier);

        const auto r = bot.run();
        assert(r.stopped_by_risk);
        assert(r.stop_reason == "TP hit.");
        assert(r.non_grid_orders == 1);
        assert(r.ticks < 96);
        assert(!bot.isRunning());
        assert(notifier.count(notify::NotificationType::TAKE_PROFIT_TRIGGERED) == 1);
    }

    {
        // paper mode seeds balances from the exchange and trades through it
        auto config = sampleConfig();
        config.mode = engine::TradingMode::PAPER;
        std::vector<Candle> candles = {
            Candle(100.0, 100.5, 99.5, 100.0, 1.0, 1000),
            Candle(100.0, 100.0, 95.0, 97.0, 1.0, 2000),
            Candle(97.0, 107.0, 96.0, 106.0, 1.0, 3000),
            Candle(106.0, 108.0, 103.0, 104.0, 1.0, 4000),
        };
        auto replay = std::make_shared<exchange::ReplayExchangeService>(candles, "SOL/USDT", 5000.0, 0.0, 0.0);
        config.trading_fee = 0.0;
        RecordingNotifier notifier;
        GridTradingBot bot(config, bus, notifier, replay);
        assert(bot.getBalance().fiat == 5000.0);

        // a start request outside run() is not queued
        bus.publish(core::EventType::START_BOT, core::EventPayload::withMessage("restart"));

        const auto r = bot.run();
        assert(bot.sessionCount() == 1);
        assert(r.buy_orders >= 1);
        assert(r.sell_orders >= 1);
        assert(r.ticks == 4);
        assert(r.final_fiat > 5000.0);
        assert(!bot.isRunning());
    }

    {
        // a start request while trading restarts the session
        auto config = sampleConfig();
        config.mode = engine::TradingMode::PAPER;
        auto exchange = std::make_shared<FakeExchange>();
        exchange->balance["free"]["USDT"] = 1000.0;
        exchange->balance["free"]["SOL"] = 0.0;
        for (int i = 0; i < 20000; ++i) {
            exchange->prices.push_back(100.0);
        }
        RecordingNotifier notifier;
        GridTradingBot bot(config, bus, notifier, exchange);
        bot.getStrategy().setTickerInterval(std::chrono::milliseconds(5));

        std::thread runner([&bot]() { bot.run(); });

        assert(waitFor([&bot]() { return bot.isRunning() && bot.getStrategy().getResult().ticks >= 2; }));
        bus.publish(core::EventType::START_BOT, core::EventPayload::withMessage("restart"));
        assert(waitFor([&bot]() { return bot.sessionCount() == 2 && bot.isRunning(); }));

        const int ticks_before = bot.getStrategy().getResult().ticks;
        assert(waitFor([&bot, ticks_before]() { return bot.getStrategy().getResult().ticks > ticks_before; }));

        bus.publish(core::EventType::STOP_BOT, core::EventPayload::withMessage("done"));
        runner.join();
        assert(bot.sessionCount() == 2);
        assert(!bot.isRunning());
    }

    {
        auto config = sampleConfig();
        config.mode = engine::TradingMode::LIVE;
        RecordingNotifier notifier;
        bool unsupported = false;
        try {
            GridTradingBot bot(config, bus, notifier);
        } catch (const UnsupportedExchange&) {
            unsupported = true;
        }
        assert(unsupported);
    }

    std::cout << "[TEST] GridTradingBot PASSED\n";
    return 0;
}
