#pragma once

#include <string>
#include <mutex>
#include <nlohmann/json.hpp>
#include "engine/EngineConfig.h"

namespace gridpilot {

class Config {
public:
    static Config& getInstance();

    // Throws ConfigError when the file is missing, unparsable or invalid
    void load(const std::string& config_path);
    void loadFromJson(const nlohmann::json& j);

    std::string getApiKey() const { return api_key_; }
    std::string getSecretKey() const { return secret_key_; }

    engine::BotConfig getBotConfig() const { return bot_config_; }
    engine::TradingMode getTradingMode() const { return bot_config_.mode; }
    engine::GridConfig getGridConfig() const { return bot_config_.grid; }
    engine::ExecutionConfig getExecutionConfig() const { return bot_config_.execution; }
    engine::RiskConfig getRiskConfig() const { return bot_config_.risk; }

    double getTradingFee() const { return bot_config_.trading_fee; }
    double getInitialBalance() const { return bot_config_.initial_balance; }
    std::string getPair() const { return bot_config_.pair(); }
    std::string getLogLevel() const { return bot_config_.log_level; }

private:
    Config() = default;

    std::string api_key_;
    std::string secret_key_;
    engine::BotConfig bot_config_;
};

} // namespace gridpilot
