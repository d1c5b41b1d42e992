#include "common/Config.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "common/WorkerPool.h"
#include "core/events/EventBus.h"
#include "engine/GridTradingBot.h"
#include "notify/NotificationHandler.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

using namespace gridpilot;

namespace {

std::atomic<bool> g_stop_signal{false};

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_stop_signal = true;
    }
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " --config <path> [--log-dir <dir>] [--json]\n";
}

nlohmann::json resultToJson(const strategy::GridTradingStrategy::Result& result,
                            const std::string& config_path) {
    return {
        {"config", config_path},
        {"initial_value", result.initial_value},
        {"final_value", result.final_value},
        {"total_profit", result.total_profit},
        {"roi_pct", result.roi_pct},
        {"max_drawdown_pct", result.max_drawdown_pct},
        {"total_fees", result.total_fees},
        {"final_fiat", result.final_fiat},
        {"final_crypto", result.final_crypto},
        {"final_price", result.final_price},
        {"ticks", result.ticks},
        {"buy_orders", result.buy_orders},
        {"sell_orders", result.sell_orders},
        {"non_grid_orders", result.non_grid_orders},
        {"completed_orders", result.completed_orders},
        {"stopped_by_risk", result.stopped_by_risk},
        {"stop_reason", result.stop_reason}
    };
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string log_dir_override;
    bool json_mode = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            log_dir_override = argv[++i];
        } else if (arg == "--json") {
            json_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        auto& config = Config::getInstance();
        config.load(config_path);
        auto bot_config = config.getBotConfig();
        if (!log_dir_override.empty()) {
            bot_config.log_dir = log_dir_override;
        }

        Logger::getInstance().initialize(bot_config.log_dir, bot_config.log_level);
        LOG_INFO("GridPilot starting: {} {} mode, config {}",
                 bot_config.pair(), engine::tradingModeToString(bot_config.mode), config_path);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        WorkerPool pool(3);
        core::EventBus event_bus(pool);

        const bool notifications_enabled = bot_config.notifications_enabled &&
            bot_config.mode != engine::TradingMode::BACKTEST;
        notify::NotificationHandler notification_handler(
            event_bus,
            pool,
            notify::NotificationHandler::createChannels(bot_config.notification_channels),
            notifications_enabled);

        strategy::GridTradingStrategy::Result result;
        {
            engine::GridTradingBot bot(bot_config, event_bus, notification_handler);

            std::atomic<bool> finished{false};
            std::thread signal_watcher([&]() {
                while (!finished.load()) {
                    if (g_stop_signal.exchange(false)) {
                        LOG_INFO("Stop signal received");
                        event_bus.publish(core::EventType::STOP_BOT,
                                          core::EventPayload::withMessage("Stop signal received"));
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(200));
                }
            });

            try {
                result = bot.run();
            } catch (...) {
                finished = true;
                signal_watcher.join();
                throw;
            }
            finished = true;
            signal_watcher.join();
        }

        event_bus.drain();
        pool.shutdown();

        if (json_mode) {
            std::cout << resultToJson(result, config_path).dump() << "\n";
            return 0;
        }

        std::cout << "\nGrid trading results (" << bot_config.pair() << ")\n";
        std::cout << "---------------------------------------------\n";
        std::cout << std::fixed << std::setprecision(2);
        std::cout << "Initial value:    " << result.initial_value << " " << bot_config.quote_currency << "\n";
        std::cout << "Final value:      " << result.final_value << " " << bot_config.quote_currency << "\n";
        std::cout << "Total profit:     " << result.total_profit << " (" << result.roi_pct << "%)\n";
        std::cout << "Max drawdown:     " << result.max_drawdown_pct << "%\n";
        std::cout << "Total fees:       " << std::setprecision(4) << result.total_fees << "\n";
        std::cout << "Final balances:   " << std::setprecision(2) << result.final_fiat << " "
                  << bot_config.quote_currency << ", " << std::setprecision(8) << result.final_crypto
                  << " " << bot_config.base_currency << "\n";
        std::cout << "Orders:           " << result.buy_orders << " buy, " << result.sell_orders
                  << " sell, " << result.non_grid_orders << " TP/SL, " << result.completed_orders << " filled\n";
        if (result.stopped_by_risk) {
            std::cout << "Ended early:      " << result.stop_reason << "\n";
        }
        std::cout << "---------------------------------------------\n";

        LOG_INFO("Program terminated");
        return 0;
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    } catch (const MissingEnvironmentVariable& e) {
        std::cerr << "Missing environment variable: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
