#include "HexMap.hpp"

#include <core/Logger.hpp>

#include <algorithm>
#include <utility>

namespace Tribes {
namespace Game {

HexMap::HexMap(int width, int height, TerrainTable terrain)
    : m_width(std::max(0, width))
    , m_height(std::max(0, height))
    , m_terrain(std::move(terrain)) {
    if (width < 0 || height < 0) {
        TRIBES_LOG_WARN("HexMap size {}x{} clamped to {}x{}", width, height, m_width, m_height);
    }
}

HexMap HexMap::Filled(int width, int height, TerrainType terrain, TerrainTable table) {
    HexMap map(width, height, std::move(table));
    map.Fill(terrain);
    return map;
}

bool HexMap::IsInBounds(const HexCoord& coord) const noexcept {
    return coord.q >= 0 && coord.q < m_width && coord.r >= 0 && coord.r < m_height;
}

bool HexMap::SetTile(const HexCoord& coord, TerrainType terrain) {
    if (!IsInBounds(coord)) {
        TRIBES_LOG_WARN("Tile {} is outside the {}x{} map", HexKey(coord), m_width, m_height);
        return false;
    }
    m_tiles[coord] = HexTile{coord, terrain};
    return true;
}

void HexMap::Fill(TerrainType terrain) {
    m_tiles.clear();
    m_tiles.reserve(static_cast<size_t>(m_width) * static_cast<size_t>(m_height));
    for (int q = 0; q < m_width; ++q) {
        for (int r = 0; r < m_height; ++r) {
            const HexCoord coord{q, r};
            m_tiles.emplace(coord, HexTile{coord, terrain});
        }
    }
}

const HexTile* HexMap::GetTile(const HexCoord& coord) const {
    auto it = m_tiles.find(coord);
    return it != m_tiles.end() ? &it->second : nullptr;
}

const HexTile* HexMap::FindTile(std::string_view key) const {
    auto coord = TryParseHexKey(key);
    return coord ? GetTile(*coord) : nullptr;
}

void HexMap::SetOccupied(const HexCoord& coord, bool occupied) {
    if (occupied) {
        m_occupied.insert(coord);
    } else {
        m_occupied.erase(coord);
    }
}

bool HexMap::IsOccupied(const HexCoord& coord) const {
    return m_occupied.count(coord) > 0;
}

double HexMap::MovementCost(const HexCoord& coord) const {
    if (!IsInBounds(coord) || IsOccupied(coord)) {
        return kImpassableCost;
    }
    const HexTile* tile = GetTile(coord);
    if (!tile) {
        return kImpassableCost;
    }
    return m_terrain.MovementCost(tile->terrain);
}

HexCostFunc HexMap::CostFunction() const {
    return [this](const HexCoord& coord) { return MovementCost(coord); };
}

HexBoundsFunc HexMap::BoundsFunction() const {
    return [this](const HexCoord& coord) { return IsInBounds(coord); };
}

HexPathResult HexMap::FindPath(const HexCoord& start, const HexCoord& goal,
                               std::optional<double> movementBudget,
                               int maxNodesExplored) const {
    HexPathOptions options;
    options.cost = CostFunction();
    options.isInBounds = BoundsFunction();
    options.maxCost = movementBudget;
    options.maxNodesExplored = maxNodesExplored;

    const double minCost = m_terrain.MinPassableCost();
    options.minTileCost = minCost < kImpassableCost ? minCost : 0.0;

    return HexPathfinder::FindPath(start, goal, options);
}

HexReachableMap HexMap::Reachable(const HexCoord& start, double budget) const {
    HexReachOptions options;
    options.cost = CostFunction();
    options.isInBounds = BoundsFunction();
    return HexPathfinder::Reachable(start, budget, options);
}

HexReachableMap HexMap::MoveTargets(const HexCoord& start, double budget) const {
    HexReachableMap targets = Reachable(start, budget);
    targets.erase(start);
    return targets;
}

double HexMap::PathCost(const std::vector<HexCoord>& path) const {
    return HexPathfinder::PathCost(path, CostFunction());
}

} // namespace Game
} // namespace Tribes
