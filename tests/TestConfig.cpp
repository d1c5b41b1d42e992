#include "common/Config.h"

#include "common/Exceptions.h"

#include <cassert>
#include <cstdlib>
#include <iostream>

using namespace gridpilot;

namespace {
nlohmann::json baseConfig() {
    return nlohmann::json::parse(R"({
        "exchange": {"name": "Binance", "trading_fee": 0.002, "trading_mode": "paper_trading"},
        "pair": {"base_currency": "ETH", "quote_currency": "USDT"},
        "trading_settings": {
            "timeframe": "15m",
            "period": {"start_date": "2024-01-01", "end_date": "2024-02-01"},
            "initial_balance": 5000,
            "historical_data_file": "data/eth.csv"
        },
        "grid_strategy": {
            "type": "simple_grid",
            "spacing": "geometric",
            "num_grids": 12,
            "range": {"top": 2500, "bottom": 2000},
            "percentage_spacing": 0.02
        },
        "risk_management": {
            "take_profit": {"enabled": true, "threshold": 3000},
            "stop_loss": {"enabled": true, "threshold": 1800}
        },
        "execution": {"max_retries": 5, "retry_delay_ms": 250, "max_slippage": 0.005, "polling_interval_seconds": 5},
        "logging": {"log_level": "DEBUG", "log_dir": "out/logs"},
        "notifications": {"enabled": true, "channels": ["log"]}
    })");
}

template <typename Error>
bool rejects(const nlohmann::json& j) {
    try {
        Config::getInstance().loadFromJson(j);
    } catch (const Error&) {
        return true;
    }
    return false;
}
} // namespace

int main() {
    Config& config = Config::getInstance();

    {
        config.loadFromJson(baseConfig());
        const auto bot = config.getBotConfig();
        assert(bot.mode == engine::TradingMode::PAPER);
        assert(bot.exchange_name == "binance");
        assert(bot.trading_fee == 0.002);
        assert(bot.pair() == "ETH/USDT");
        assert(bot.timeframe == "15m");
        assert(bot.start_date == "2024-01-01");
        assert(bot.initial_balance == 5000.0);
        assert(bot.grid.spacing == engine::SpacingType::GEOMETRIC);
        assert(bot.grid.num_grids == 12);
        assert(bot.grid.top == 2500.0);
        assert(bot.risk.take_profit.enabled);
        assert(bot.risk.stop_loss.threshold == 1800.0);
        assert(bot.execution.max_retries == 5);
        assert(bot.execution.polling_interval_seconds == 5);
        assert(bot.log_level == "debug");
        assert(bot.notifications_enabled);
        assert(bot.notification_channels.size() == 1);
        assert(config.getPair() == "ETH/USDT");
    }

    {
        auto j = baseConfig();
        j["exchange"]["trading_mode"] = "yolo";
        assert(rejects<ConfigError>(j));

        j = baseConfig();
        j["grid_strategy"]["type"] = "hedged_grid";
        assert(rejects<ConfigError>(j));

        j = baseConfig();
        j["grid_strategy"]["range"]["top"] = 1000;
        assert(rejects<ConfigError>(j));

        j = baseConfig();
        j["risk_management"]["stop_loss"]["threshold"] = 3500;
        assert(rejects<ConfigError>(j));

        j = baseConfig();
        j["grid_strategy"]["num_grids"] = "many";
        assert(rejects<ConfigError>(j));

        // a rejected document leaves the previous configuration in place
        assert(config.getBotConfig().pair() == "ETH/USDT");
    }

    {
        unsetenv("EXCHANGE_API_KEY");
        unsetenv("EXCHANGE_SECRET_KEY");
        auto j = baseConfig();
        j["exchange"]["trading_mode"] = "live";
        assert(rejects<MissingEnvironmentVariable>(j));

        setenv("EXCHANGE_API_KEY", " key ", 1);
        setenv("EXCHANGE_SECRET_KEY", "secret", 1);
        config.loadFromJson(j);
        assert(config.getTradingMode() == engine::TradingMode::LIVE);
        assert(config.getApiKey() == "key");
        unsetenv("EXCHANGE_API_KEY");
        unsetenv("EXCHANGE_SECRET_KEY");
    }

    {
        config.load("config/config.json");
        assert(config.getTradingMode() == engine::TradingMode::BACKTEST);
        assert(config.getPair() == "SOL/USDT");
        assert(config.getGridConfig().num_grids == 9);

        bool missing = false;
        try {
            config.load("config/nope.json");
        } catch (const ConfigError&) {
            missing = true;
        }
        assert(missing);
    }

    std::cout << "[TEST] Config PASSED\n";
    return 0;
}
