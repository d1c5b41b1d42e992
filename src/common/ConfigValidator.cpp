#include "common/ConfigValidator.h"

namespace gridpilot {

std::vector<std::string> ConfigValidator::validate(const engine::BotConfig& config) {
    std::vector<std::string> errors;

    if (config.base_currency.empty() || config.quote_currency.empty()) {
        errors.push_back("pair.base_currency and pair.quote_currency are required");
    }
    if (config.trading_fee < 0.0 || config.trading_fee >= 1.0) {
        errors.push_back("exchange.trading_fee must be in [0, 1)");
    }
    if (config.initial_balance <= 0.0) {
        errors.push_back("trading_settings.initial_balance must be positive");
    }
    if (config.mode != engine::TradingMode::LIVE && config.historical_data_file.empty()) {
        errors.push_back("trading_settings.historical_data_file is required outside live mode");
    }

    const auto& grid = config.grid;
    if (grid.num_grids < 2) {
        errors.push_back("grid_strategy.num_grids must be at least 2");
    }
    if (grid.bottom <= 0.0) {
        errors.push_back("grid_strategy.range.bottom must be positive");
    }
    if (grid.top <= grid.bottom) {
        errors.push_back("grid_strategy.range.top must be greater than range.bottom");
    }
    if (grid.spacing == engine::SpacingType::GEOMETRIC && grid.percentage_spacing <= 0.0) {
        errors.push_back("grid_strategy.percentage_spacing must be positive for geometric spacing");
    }

    const auto& exec = config.execution;
    if (exec.max_retries < 1) {
        errors.push_back("execution.max_retries must be at least 1");
    }
    if (exec.retry_delay_ms < 0) {
        errors.push_back("execution.retry_delay_ms must not be negative");
    }
    if (exec.max_slippage < 0.0 || exec.max_slippage >= 1.0) {
        errors.push_back("execution.max_slippage must be in [0, 1)");
    }
    if (exec.polling_interval_seconds < 1) {
        errors.push_back("execution.polling_interval_seconds must be at least 1");
    }

    const auto& risk = config.risk;
    if (risk.take_profit.enabled && risk.take_profit.threshold <= 0.0) {
        errors.push_back("risk_management.take_profit.threshold must be positive when enabled");
    }
    if (risk.stop_loss.enabled && risk.stop_loss.threshold <= 0.0) {
        errors.push_back("risk_management.stop_loss.threshold must be positive when enabled");
    }
    if (risk.take_profit.enabled && risk.stop_loss.enabled &&
        risk.stop_loss.threshold >= risk.take_profit.threshold) {
        errors.push_back("risk_management.stop_loss.threshold must be below take_profit.threshold");
    }

    return errors;
}

} // namespace gridpilot
