#pragma once

#include <map>
#include <optional>
#include <vector>

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "grid/GridLevel.h"

namespace gridpilot {
namespace grid {

// Owns the immutable price ladder and the GridLevel table keyed by price.
// Levels are mutated only through OrderManager's finalize section.
class GridManager {
public:
    // Throws std::invalid_argument on an unusable range
    explicit GridManager(const engine::GridConfig& config);

    void initializeGridLevels();

    // Pure crossing rule over an ascending ladder:
    //   BUY:  first g with previous >= g >= current (fell through or touched)
    //   SELL: first g with previous <  g <= current (rose through or touched)
    static std::optional<double> detectCrossing(
        const std::vector<double>& sorted_grids,
        double current_price,
        double previous_price,
        OrderSide side);

    std::optional<double> detectCrossing(double current_price, double previous_price, OrderSide side) const;
    GridLevel* getCrossedGridLevel(double current_price, double previous_price, OrderSide side);

    // Lowest buy level holding an unmatched buy
    GridLevel* findLowestCompletedBuyGrid();

    double getOrderSizePerGrid(double total_balance_value, double price) const;

    void resetGridCycle(GridLevel& buy_grid_level);

    GridLevel* getGridLevel(double price);
    const GridLevel* getGridLevel(double price) const;

    const std::vector<double>& getPriceGrids() const { return price_grids_; }
    const std::vector<double>& getSortedBuyGrids() const { return sorted_buy_grids_; }
    const std::vector<double>& getSortedSellGrids() const { return sorted_sell_grids_; }
    double getCentralPrice() const { return central_price_; }
    std::size_t getLevelCount() const { return grid_levels_.size(); }
    const std::map<double, GridLevel>& getGridLevels() const { return grid_levels_; }

private:
    static std::vector<double> generateArithmeticGrid(double bottom, double top, int count);
    static std::vector<double> generateGeometricGrid(double bottom, double spacing_pct, int count);

    engine::GridConfig config_;
    std::vector<double> price_grids_;
    double central_price_ = 0.0;
    std::vector<double> sorted_buy_grids_;
    std::vector<double> sorted_sell_grids_;
    std::map<double, GridLevel> grid_levels_;
};

} // namespace grid
} // namespace gridpilot
