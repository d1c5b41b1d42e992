#include "grid/GridManager.h"

#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace gridpilot {
namespace grid {

GridManager::GridManager(const engine::GridConfig& config)
    : config_(config) {
    if (config_.num_grids < 2) {
        throw std::invalid_argument("GridManager: num_grids must be at least 2");
    }
    if (config_.bottom <= 0.0 || config_.top <= config_.bottom) {
        throw std::invalid_argument("GridManager: range must satisfy 0 < bottom < top");
    }
    if (config_.spacing == engine::SpacingType::GEOMETRIC && config_.percentage_spacing <= 0.0) {
        throw std::invalid_argument("GridManager: geometric spacing needs a positive percentage");
    }

    if (config_.spacing == engine::SpacingType::ARITHMETIC) {
        price_grids_ = generateArithmeticGrid(config_.bottom, config_.top, config_.num_grids);
        central_price_ = (config_.top + config_.bottom) / 2.0;
    } else {
        price_grids_ = generateGeometricGrid(config_.bottom, config_.percentage_spacing, config_.num_grids);
        // Kept as-is for compatibility with existing configurations; the result is
        // not a midpoint of the ladder and usually sits far below it.
        central_price_ = std::pow(config_.top * config_.bottom, config_.percentage_spacing);
        LOG_WARN("Geometric central price {:.8f} derived from (top*bottom)^percentage_spacing; "
                 "levels at or below it start as buy levels", central_price_);
    }
}

// ===== Grid Generation =====

std::vector<double> GridManager::generateArithmeticGrid(double bottom, double top, int count) {
    std::vector<double> grids;
    grids.reserve(static_cast<std::size_t>(count));

    const double step = (top - bottom) / static_cast<double>(count - 1);
    for (int i = 0; i < count - 1; ++i) {
        grids.push_back(bottom + step * static_cast<double>(i));
    }
    grids.push_back(top);  // exact upper bound, no accumulated rounding
    return grids;
}

std::vector<double> GridManager::generateGeometricGrid(double bottom, double spacing_pct, int count) {
    std::vector<double> grids;
    grids.reserve(static_cast<std::size_t>(count));

    double price = bottom;
    for (int i = 0; i < count; ++i) {
        grids.push_back(price);
        price = price * (1.0 + spacing_pct);
    }
    return grids;
}

void GridManager::initializeGridLevels() {
    sorted_buy_grids_.clear();
    sorted_sell_grids_.clear();
    grid_levels_.clear();

    for (double price : price_grids_) {
        if (price <= central_price_) {
            sorted_buy_grids_.push_back(price);
            grid_levels_.emplace(price, GridLevel(price, GridCycleState::READY_TO_BUY));
        } else {
            sorted_sell_grids_.push_back(price);
            grid_levels_.emplace(price, GridLevel(price, GridCycleState::READY_TO_SELL));
        }
    }
    std::sort(sorted_buy_grids_.begin(), sorted_buy_grids_.end());
    std::sort(sorted_sell_grids_.begin(), sorted_sell_grids_.end());

    LOG_INFO("Grid initialized: {} levels ({} buy, {} sell), central price {:.8f}, spacing {}",
             grid_levels_.size(), sorted_buy_grids_.size(), sorted_sell_grids_.size(),
             central_price_, engine::spacingTypeToString(config_.spacing));
}

// ===== Crossing Detection =====

std::optional<double> GridManager::detectCrossing(
    const std::vector<double>& sorted_grids,
    double current_price,
    double previous_price,
    OrderSide side) {
    for (double grid_price : sorted_grids) {
        if (side == OrderSide::SELL) {
            if (previous_price < grid_price && grid_price <= current_price) {
                return grid_price;
            }
        } else {
            if (previous_price >= grid_price && grid_price >= current_price) {
                return grid_price;
            }
        }
    }
    return std::nullopt;
}

std::optional<double> GridManager::detectCrossing(double current_price, double previous_price, OrderSide side) const {
    const auto& grids = (side == OrderSide::SELL) ? sorted_sell_grids_ : sorted_buy_grids_;
    return detectCrossing(grids, current_price, previous_price, side);
}

GridLevel* GridManager::getCrossedGridLevel(double current_price, double previous_price, OrderSide side) {
    const auto crossed = detectCrossing(current_price, previous_price, side);
    if (!crossed) {
        return nullptr;
    }
    return getGridLevel(*crossed);
}

GridLevel* GridManager::findLowestCompletedBuyGrid() {
    for (double price : sorted_buy_grids_) {
        auto* level = getGridLevel(price);
        if (level && level->canPlaceSellOrder()) {
            return level;
        }
    }
    return nullptr;
}

double GridManager::getOrderSizePerGrid(double total_balance_value, double price) const {
    if (grid_levels_.empty() || price <= 0.0) {
        return 0.0;
    }
    return total_balance_value / static_cast<double>(grid_levels_.size()) / price;
}

void GridManager::resetGridCycle(GridLevel& buy_grid_level) {
    buy_grid_level.resetBuyLevelCycle();
    LOG_DEBUG("Buy grid level at price {:.8f} is reset and ready for the next buy/sell cycle",
              buy_grid_level.getPrice());
}

GridLevel* GridManager::getGridLevel(double price) {
    auto it = grid_levels_.find(price);
    return (it == grid_levels_.end()) ? nullptr : &it->second;
}

const GridLevel* GridManager::getGridLevel(double price) const {
    auto it = grid_levels_.find(price);
    return (it == grid_levels_.end()) ? nullptr : &it->second;
}

} // namespace grid
} // namespace gridpilot
