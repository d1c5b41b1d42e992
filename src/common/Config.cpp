#include "common/Config.h"
#include "common/ConfigValidator.h"
#include "common/Exceptions.h"
#include "common/Logger.h"
#include "common/PathUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace gridpilot {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? trimCopy(value) : "";
}

engine::TradingMode parseTradingMode(const std::string& value) {
    const std::string mode = toLowerCopy(trimCopy(value));
    if (mode == "backtest") {
        return engine::TradingMode::BACKTEST;
    }
    if (mode == "paper_trading" || mode == "paper") {
        return engine::TradingMode::PAPER;
    }
    if (mode == "live") {
        return engine::TradingMode::LIVE;
    }
    throw ConfigError("Invalid trading mode: '" + value + "'. Available modes are: backtest, paper_trading, live");
}

engine::SpacingType parseSpacingType(const std::string& value) {
    const std::string spacing = toLowerCopy(trimCopy(value));
    if (spacing == "arithmetic") {
        return engine::SpacingType::ARITHMETIC;
    }
    if (spacing == "geometric") {
        return engine::SpacingType::GEOMETRIC;
    }
    throw ConfigError("Invalid grid spacing: '" + value + "'. Available spacings are: arithmetic, geometric");
}

engine::ThresholdSetting parseThreshold(const nlohmann::json& node) {
    engine::ThresholdSetting setting;
    setting.enabled = node.value("enabled", false);
    setting.threshold = node.value("threshold", 0.0);
    return setting;
}

std::filesystem::path resolveConfigPath(const std::string& path) {
    std::filesystem::path candidate(path);
    if (candidate.is_absolute() || std::filesystem::exists(candidate)) {
        return candidate;
    }
    return utils::PathUtils::resolveRelativePath(path);
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    const auto config_path = resolveConfigPath(path);

    if (!std::filesystem::exists(config_path)) {
        throw ConfigError("Config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        throw ConfigError("Config file could not be opened: " + config_path.string());
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Config file is not valid JSON: " + std::string(e.what()));
    }

    loadFromJson(j);
    LOG_INFO("Config loaded from {}", config_path.string());
}

void Config::loadFromJson(const nlohmann::json& j) {
    engine::BotConfig config;

    try {
        if (j.contains("exchange")) {
            const auto& e = j["exchange"];
            config.exchange_name = toLowerCopy(e.value("name", "binance"));
            config.trading_fee = e.value("trading_fee", 0.001);
            config.mode = parseTradingMode(e.value("trading_mode", "backtest"));
        }

        if (j.contains("pair")) {
            const auto& p = j["pair"];
            config.base_currency = p.value("base_currency", "");
            config.quote_currency = p.value("quote_currency", "");
        }

        if (j.contains("trading_settings")) {
            const auto& t = j["trading_settings"];
            config.timeframe = t.value("timeframe", "1h");
            config.initial_balance = t.value("initial_balance", 10000.0);
            config.historical_data_file = t.value("historical_data_file", "");
            if (t.contains("period")) {
                config.start_date = t["period"].value("start_date", "");
                config.end_date = t["period"].value("end_date", "");
            }
        }

        if (j.contains("grid_strategy")) {
            const auto& g = j["grid_strategy"];
            const std::string type = toLowerCopy(g.value("type", "simple_grid"));
            if (type != "simple_grid") {
                throw ConfigError("Unsupported grid strategy type: '" + type + "'. Available types are: simple_grid");
            }
            config.grid.spacing = parseSpacingType(g.value("spacing", "arithmetic"));
            config.grid.num_grids = g.value("num_grids", 0);
            config.grid.percentage_spacing = g.value("percentage_spacing", 0.0);
            if (g.contains("range")) {
                config.grid.top = g["range"].value("top", 0.0);
                config.grid.bottom = g["range"].value("bottom", 0.0);
            }
        }

        if (j.contains("risk_management")) {
            const auto& r = j["risk_management"];
            if (r.contains("take_profit")) {
                config.risk.take_profit = parseThreshold(r["take_profit"]);
            }
            if (r.contains("stop_loss")) {
                config.risk.stop_loss = parseThreshold(r["stop_loss"]);
            }
        }

        if (j.contains("execution")) {
            const auto& x = j["execution"];
            config.execution.max_retries = x.value("max_retries", 3);
            config.execution.retry_delay_ms = x.value("retry_delay_ms", 1000);
            config.execution.max_slippage = x.value("max_slippage", 0.01);
            config.execution.polling_interval_seconds = x.value("polling_interval_seconds", 15);
        }

        if (j.contains("logging")) {
            const auto& l = j["logging"];
            config.log_level = toLowerCopy(l.value("log_level", "info"));
            config.log_dir = l.value("log_dir", "logs");
        }

        if (j.contains("notifications")) {
            const auto& n = j["notifications"];
            config.notifications_enabled = n.value("enabled", false);
            if (n.contains("channels")) {
                config.notification_channels = n["channels"].get<std::vector<std::string>>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Config has an invalid field type: " + std::string(e.what()));
    }

    const auto errors = ConfigValidator::validate(config);
    if (!errors.empty()) {
        std::ostringstream oss;
        oss << "Config validation failed:";
        for (const auto& err : errors) {
            oss << "\n  - " << err;
        }
        throw ConfigError(oss.str());
    }

    api_key_ = readEnvVar("EXCHANGE_API_KEY");
    secret_key_ = readEnvVar("EXCHANGE_SECRET_KEY");
    if (config.mode == engine::TradingMode::LIVE && (api_key_.empty() || secret_key_.empty())) {
        throw MissingEnvironmentVariable("EXCHANGE_API_KEY and EXCHANGE_SECRET_KEY are required in live mode");
    }

    bot_config_ = config;
}

} // namespace gridpilot
