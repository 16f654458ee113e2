#pragma once

#include "../config/TerrainConfig.hpp"

#include <hex/HexCoord.hpp>
#include <pathfinding/HexPathfinder.hpp>

#include <optional>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Tribes {
namespace Game {

/**
 * @brief A single map tile
 */
struct HexTile {
    HexCoord coord;
    TerrainType terrain = TerrainType::Grassland;
};

/**
 * @brief Bounded hex map with terrain-derived movement costs
 *
 * Bounds are the axial rectangle 0 <= q < width, 0 <= r < height. A hex with
 * no tile, an impassable terrain, or an occupant cannot be entered.
 */
class HexMap {
public:
    HexMap(int width, int height, TerrainTable terrain = TerrainTable::Defaults());

    /**
     * @brief Map with every in-bounds hex set to one terrain
     */
    [[nodiscard]] static HexMap Filled(int width, int height, TerrainType terrain,
                                       TerrainTable table = TerrainTable::Defaults());

    [[nodiscard]] int GetWidth() const noexcept { return m_width; }
    [[nodiscard]] int GetHeight() const noexcept { return m_height; }
    [[nodiscard]] size_t GetTileCount() const noexcept { return m_tiles.size(); }
    [[nodiscard]] const TerrainTable& GetTerrainTable() const noexcept { return m_terrain; }

    [[nodiscard]] bool IsInBounds(const HexCoord& coord) const noexcept;

    // =========================================================================
    // Tiles
    // =========================================================================

    /**
     * @brief Place or replace a tile
     * @return false if coord is out of bounds
     */
    bool SetTile(const HexCoord& coord, TerrainType terrain);

    /**
     * @brief Set every in-bounds hex to one terrain
     */
    void Fill(TerrainType terrain);

    /**
     * @return Tile at coord or nullptr
     */
    [[nodiscard]] const HexTile* GetTile(const HexCoord& coord) const;

    /**
     * @brief Look a tile up by hex key
     * @return nullptr for malformed keys and empty hexes
     */
    [[nodiscard]] const HexTile* FindTile(std::string_view key) const;

    // =========================================================================
    // Occupancy
    // =========================================================================

    void SetOccupied(const HexCoord& coord, bool occupied);
    [[nodiscard]] bool IsOccupied(const HexCoord& coord) const;
    void ClearOccupied() { m_occupied.clear(); }

    // =========================================================================
    // Movement
    // =========================================================================

    /**
     * @brief Cost to enter coord, +infinity if it cannot be entered
     */
    [[nodiscard]] double MovementCost(const HexCoord& coord) const;

    /**
     * @brief Cost function bound to this map (valid while the map lives)
     */
    [[nodiscard]] HexCostFunc CostFunction() const;

    /**
     * @brief Bounds predicate bound to this map (valid while the map lives)
     */
    [[nodiscard]] HexBoundsFunc BoundsFunction() const;

    /**
     * @brief Cheapest path within an optional movement budget
     */
    [[nodiscard]] HexPathResult FindPath(const HexCoord& start, const HexCoord& goal,
                                         std::optional<double> movementBudget = std::nullopt,
                                         int maxNodesExplored = 0) const;

    /**
     * @brief Reachable hexes with remaining budget, start included
     */
    [[nodiscard]] HexReachableMap Reachable(const HexCoord& start, double budget) const;

    /**
     * @brief Reachable hexes a unit can move to, start excluded
     */
    [[nodiscard]] HexReachableMap MoveTargets(const HexCoord& start, double budget) const;

    /**
     * @brief Movement cost of a path, skipping its first hex
     */
    [[nodiscard]] double PathCost(const std::vector<HexCoord>& path) const;

private:
    int m_width;
    int m_height;
    TerrainTable m_terrain;
    std::unordered_map<HexCoord, HexTile, HexCoordHash> m_tiles;
    std::unordered_set<HexCoord, HexCoordHash> m_occupied;
};

} // namespace Game
} // namespace Tribes
