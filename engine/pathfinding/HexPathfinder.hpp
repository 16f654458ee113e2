#pragma once

#include "hex/HexCoord.hpp"

#include <functional>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>

namespace Tribes {

struct PathfindingSettings;

/**
 * @brief Cost to enter a hex; +infinity marks it impassable
 */
using HexCostFunc = std::function<double(const HexCoord&)>;

/**
 * @brief Map bounds predicate; hexes outside are never expanded
 */
using HexBoundsFunc = std::function<bool(const HexCoord&)>;

/**
 * @brief Remaining movement budget per reachable hex
 */
using HexReachableMap = std::unordered_map<HexCoord, double, HexCoordHash>;

inline constexpr double kImpassableCost = std::numeric_limits<double>::infinity();

/**
 * @brief Options for HexPathfinder::FindPath
 */
struct HexPathOptions {
    HexCostFunc cost;                   // Required
    std::optional<double> maxCost;      // Total cost budget
    HexBoundsFunc isInBounds;           // Empty = unbounded grid

    /**
     * Lower bound on every finite tile cost. Scales the distance heuristic
     * and must not exceed the cheapest tile. 0 searches as plain Dijkstra.
     */
    double minTileCost = 0.0;

    int maxNodesExplored = 0;           // 0 = unlimited

    /**
     * @brief Apply search limits from configuration
     */
    void ApplySettings(const PathfindingSettings& settings);
};

/**
 * @brief Options for HexPathfinder::Reachable
 */
struct HexReachOptions {
    HexCostFunc cost;                   // Required
    HexBoundsFunc isInBounds;           // Empty = unbounded grid
    int maxNodesExplored = 0;           // 0 = unlimited; partial result when hit
};

/**
 * @brief Path result
 *
 * found == false is the "no path" result; coords is then empty.
 */
struct HexPathResult {
    std::vector<HexCoord> coords;       // Start and goal inclusive
    double totalCost = 0.0;             // Sum of entry costs after the start
    int nodesExplored = 0;
    bool found = false;

    [[nodiscard]] explicit operator bool() const noexcept { return found; }
};

/**
 * @brief Weighted search over the six-neighbor hex graph
 *
 * Edge weight is the cost of the destination hex. Stateless; every call
 * keeps its own search state.
 */
class HexPathfinder {
public:
    /**
     * @brief Minimum-cost path from start to goal (A* with hex distance heuristic)
     *
     * Returns a single-element path when start == goal. Returns no path when
     * either endpoint is out of bounds, every route is blocked, or the
     * cheapest route exceeds maxCost.
     */
    [[nodiscard]] static HexPathResult FindPath(
        const HexCoord& start,
        const HexCoord& goal,
        const HexPathOptions& options);

    /**
     * @brief Every hex reachable within budget, mapped to the best remaining budget
     *
     * The start is always present with the full budget. On an unbounded grid
     * a zero-cost hex never drains the budget, so without a node limit the
     * query is refused and only the start is returned.
     */
    [[nodiscard]] static HexReachableMap Reachable(
        const HexCoord& start,
        double budget,
        const HexReachOptions& options);

    /**
     * @brief Sum of entry costs along a path, skipping the first hex
     * @return +infinity if any step is impassable
     */
    [[nodiscard]] static double PathCost(const std::vector<HexCoord>& path, const HexCostFunc& cost);

    /**
     * @brief Whether a cost value can be entered
     */
    [[nodiscard]] static bool IsPassableCost(double cost) noexcept;
};

} // namespace Tribes
