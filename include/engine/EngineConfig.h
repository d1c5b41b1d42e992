#pragma once

#include <string>
#include <vector>

namespace gridpilot {
namespace engine {

enum class TradingMode {
    BACKTEST,       // historical replay, simulated fills
    PAPER,          // replayed prices through the live execution path
    LIVE            // real exchange
};

enum class SpacingType {
    ARITHMETIC,     // evenly spaced levels
    GEOMETRIC       // percentage spaced levels
};

inline const char* tradingModeToString(TradingMode mode) {
    switch (mode) {
        case TradingMode::BACKTEST: return "backtest";
        case TradingMode::PAPER: return "paper_trading";
        case TradingMode::LIVE: return "live";
    }
    return "unknown";
}

inline const char* spacingTypeToString(SpacingType spacing) {
    return (spacing == SpacingType::ARITHMETIC) ? "arithmetic" : "geometric";
}

struct GridConfig {
    double bottom = 0.0;
    double top = 0.0;
    int num_grids = 0;
    SpacingType spacing = SpacingType::ARITHMETIC;
    double percentage_spacing = 0.0;     // geometric only, e.g. 0.05 = 5%
};

struct ExecutionConfig {
    int max_retries = 3;
    int retry_delay_ms = 1000;
    double max_slippage = 0.01;
    int polling_interval_seconds = 15;
};

struct ThresholdSetting {
    bool enabled = false;
    double threshold = 0.0;
};

struct RiskConfig {
    ThresholdSetting take_profit;
    ThresholdSetting stop_loss;
};

struct BotConfig {
    TradingMode mode = TradingMode::BACKTEST;
    std::string exchange_name = "binance";
    double trading_fee = 0.001;

    std::string base_currency;
    std::string quote_currency;

    std::string timeframe = "1h";
    std::string start_date;
    std::string end_date;
    double initial_balance = 10000.0;
    std::string historical_data_file;

    GridConfig grid;
    ExecutionConfig execution;
    RiskConfig risk;

    std::string log_level = "info";
    std::string log_dir = "logs";

    bool notifications_enabled = false;
    std::vector<std::string> notification_channels;

    std::string pair() const { return base_currency + "/" + quote_currency; }
};

} // namespace engine
} // namespace gridpilot
