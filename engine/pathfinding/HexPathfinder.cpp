#include "pathfinding/HexPathfinder.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <queue>
#include <set>
#include <tuple>
#include <utility>

namespace Tribes {

namespace {

/**
 * @brief Per-hex state for a single search
 */
struct NodeState {
    double gCost = std::numeric_limits<double>::infinity();
    double hCost = 0.0;
    HexCoord parent;
    bool hasParent = false;
    bool visited = false;
    bool inOpenSet = false;

    [[nodiscard]] double FCost() const { return gCost + hCost; }
};

using SearchContext = std::unordered_map<HexCoord, NodeState, HexCoordHash>;

bool InBounds(const HexBoundsFunc& isInBounds, const HexCoord& coord) {
    return !isInBounds || isInBounds(coord);
}

HexPathResult ReconstructPath(const SearchContext& context, const HexCoord& start, const HexCoord& goal) {
    HexPathResult result;
    result.found = true;
    result.totalCost = context.at(goal).gCost;

    HexCoord current = goal;
    result.coords.push_back(current);
    while (current != start) {
        const NodeState& state = context.at(current);
        if (!state.hasParent) {
            break;
        }
        current = state.parent;
        result.coords.push_back(current);
    }

    std::reverse(result.coords.begin(), result.coords.end());
    return result;
}

} // namespace

void HexPathOptions::ApplySettings(const PathfindingSettings& settings) {
    maxNodesExplored = std::max(0, settings.maxNodesExplored);
    minTileCost = std::max(0.0, settings.minTileCost);
}

bool HexPathfinder::IsPassableCost(double cost) noexcept {
    return cost >= 0.0 && cost < kImpassableCost;
}

HexPathResult HexPathfinder::FindPath(
    const HexCoord& start,
    const HexCoord& goal,
    const HexPathOptions& options) {

    if (!options.cost) {
        TRIBES_LOG_ERROR("FindPath called without a cost function");
        return HexPathResult{};
    }

    if (!InBounds(options.isInBounds, start) || !InBounds(options.isInBounds, goal)) {
        TRIBES_LOG_DEBUG("No path {} -> {}: endpoint out of bounds", HexKey(start), HexKey(goal));
        return HexPathResult{};
    }

    if (start == goal) {
        HexPathResult result;
        result.coords.push_back(start);
        result.found = true;
        return result;
    }

    const double budget = options.maxCost.value_or(std::numeric_limits<double>::infinity());
    const double heuristicScale = options.minTileCost > 0.0 ? options.minTileCost : 0.0;
    auto heuristic = [&](const HexCoord& coord) {
        return static_cast<double>(HexDistance(coord, goal)) * heuristicScale;
    };

    SearchContext context;

    // Ordered by (f-cost, h-cost, coord); lower h breaks ties toward the goal
    using OpenEntry = std::tuple<double, double, HexCoord>;
    std::set<OpenEntry> openSet;

    NodeState& startState = context[start];
    startState.gCost = 0.0;
    startState.hCost = heuristic(start);
    startState.inOpenSet = true;
    openSet.insert({startState.FCost(), startState.hCost, start});

    int nodesExplored = 0;

    while (!openSet.empty()) {
        auto it = openSet.begin();
        const HexCoord currentCoord = std::get<2>(*it);
        openSet.erase(it);

        NodeState& current = context[currentCoord];
        if (current.visited) {
            continue;
        }

        current.inOpenSet = false;
        current.visited = true;
        ++nodesExplored;

        if (currentCoord == goal) {
            HexPathResult result = ReconstructPath(context, start, goal);
            result.nodesExplored = nodesExplored;
            return result;
        }

        if (options.maxNodesExplored > 0 && nodesExplored >= options.maxNodesExplored) {
            TRIBES_LOG_DEBUG("Search {} -> {} stopped at node limit {}",
                HexKey(start), HexKey(goal), options.maxNodesExplored);
            break;
        }

        const double currentG = current.gCost;

        for (const HexCoord& neighbor : HexNeighbors(currentCoord)) {
            if (!InBounds(options.isInBounds, neighbor)) {
                continue;
            }

            auto existing = context.find(neighbor);
            if (existing != context.end() && existing->second.visited) {
                continue;
            }

            const double moveCost = options.cost(neighbor);
            if (!IsPassableCost(moveCost)) {
                continue;
            }

            const double tentativeG = currentG + moveCost;
            if (tentativeG > budget) {
                continue;
            }

            NodeState& state = existing != context.end() ? existing->second : context[neighbor];
            if (tentativeG >= state.gCost) {
                continue;
            }

            if (state.inOpenSet) {
                openSet.erase({state.FCost(), state.hCost, neighbor});
            }

            state.parent = currentCoord;
            state.hasParent = true;
            state.gCost = tentativeG;
            state.hCost = heuristic(neighbor);
            state.inOpenSet = true;
            openSet.insert({state.FCost(), state.hCost, neighbor});
        }
    }

    TRIBES_LOG_TRACE("No path {} -> {} after exploring {} hexes", HexKey(start), HexKey(goal), nodesExplored);

    HexPathResult result;
    result.nodesExplored = nodesExplored;
    return result;
}

HexReachableMap HexPathfinder::Reachable(
    const HexCoord& start,
    double budget,
    const HexReachOptions& options) {

    HexReachableMap reachable;
    reachable[start] = budget;

    if (!options.cost) {
        TRIBES_LOG_ERROR("Reachable called without a cost function");
        return reachable;
    }
    if (std::isnan(budget) || budget < 0.0) {
        return reachable;
    }
    if (std::isinf(budget) && !options.isInBounds) {
        TRIBES_LOG_WARN("Reachable from {} with unlimited budget needs bounds", HexKey(start));
        return reachable;
    }

    const bool unlimited = !options.isInBounds && options.maxNodesExplored <= 0;

    // Max-heap on remaining budget: the first pop of a hex is its best value
    using FrontierEntry = std::pair<double, HexCoord>;
    std::priority_queue<FrontierEntry> frontier;
    frontier.push({budget, start});

    int nodesExplored = 0;

    while (!frontier.empty()) {
        const auto [remaining, coord] = frontier.top();
        frontier.pop();

        // Stale entry
        if (remaining < reachable[coord]) {
            continue;
        }

        if (options.maxNodesExplored > 0 && nodesExplored >= options.maxNodesExplored) {
            TRIBES_LOG_WARN("Reachable from {} stopped at node limit {}",
                HexKey(start), options.maxNodesExplored);
            break;
        }
        ++nodesExplored;

        for (const HexCoord& neighbor : HexNeighbors(coord)) {
            if (!InBounds(options.isInBounds, neighbor)) {
                continue;
            }

            const double moveCost = options.cost(neighbor);
            if (!IsPassableCost(moveCost)) {
                continue;
            }

            if (moveCost == 0.0 && unlimited) {
                TRIBES_LOG_WARN("Reachable from {} entered zero-cost hex {} on an unbounded grid; "
                                "set bounds or a node limit", HexKey(start), HexKey(neighbor));
                HexReachableMap startOnly;
                startOnly[start] = budget;
                return startOnly;
            }

            const double left = remaining - moveCost;
            if (left < 0.0) {
                continue;
            }

            auto it = reachable.find(neighbor);
            if (it == reachable.end() || left > it->second) {
                reachable[neighbor] = left;
                frontier.push({left, neighbor});
            }
        }
    }

    return reachable;
}

double HexPathfinder::PathCost(const std::vector<HexCoord>& path, const HexCostFunc& cost) {
    double total = 0.0;
    for (size_t i = 1; i < path.size(); ++i) {
        const double stepCost = cost(path[i]);
        if (!IsPassableCost(stepCost)) {
            return kImpassableCost;
        }
        total += stepCost;
    }
    return total;
}

} // namespace Tribes
