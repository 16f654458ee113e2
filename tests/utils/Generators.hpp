/**
 * @file Generators.hpp
 * @brief Random data generators for property-based testing
 */

#pragma once

#include "hex/HexCoord.hpp"
#include "pathfinding/HexPathfinder.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <unordered_map>
#include <vector>

namespace Tribes {
namespace Test {

// =============================================================================
// Base Generator
// =============================================================================

/**
 * @brief Seeded random number generator for reproducible tests
 */
class RandomGenerator {
public:
    explicit RandomGenerator(uint64_t seed = std::random_device{}())
        : m_engine(seed), m_seed(seed) {}

    void Reset() { m_engine.seed(m_seed); }
    void SetSeed(uint64_t seed) { m_seed = seed; m_engine.seed(seed); }
    uint64_t GetSeed() const { return m_seed; }

    std::mt19937_64& Engine() { return m_engine; }

private:
    std::mt19937_64 m_engine;
    uint64_t m_seed;
};

// =============================================================================
// Primitive Generators
// =============================================================================

/**
 * @brief Generate random integers
 */
class IntGenerator {
public:
    explicit IntGenerator(int min = std::numeric_limits<int>::min(),
                         int max = std::numeric_limits<int>::max())
        : m_dist(min, max) {}

    int Generate(RandomGenerator& rng) {
        return m_dist(rng.Engine());
    }

private:
    std::uniform_int_distribution<int> m_dist;
};

/**
 * @brief Generate random doubles
 */
class DoubleGenerator {
public:
    explicit DoubleGenerator(double min = 0.0, double max = 1.0)
        : m_dist(min, max) {}

    double Generate(RandomGenerator& rng) {
        return m_dist(rng.Engine());
    }

private:
    std::uniform_real_distribution<double> m_dist;
};

// =============================================================================
// Hex Generators
// =============================================================================

/**
 * @brief Generate random axial coordinates within a square of half-width extent
 */
class HexCoordGenerator {
public:
    explicit HexCoordGenerator(int extent = 50)
        : m_dist(-extent, extent) {}

    HexCoord Generate(RandomGenerator& rng) {
        const int q = m_dist(rng.Engine());
        const int r = m_dist(rng.Engine());
        return HexCoord{q, r};
    }

    std::vector<HexCoord> GenerateMany(RandomGenerator& rng, size_t count) {
        std::vector<HexCoord> result;
        result.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            result.push_back(Generate(rng));
        }
        return result;
    }

private:
    std::uniform_int_distribution<int> m_dist;
};

/**
 * @brief Random cost field over the rectangle 0 <= q < width, 0 <= r < height
 *
 * Each hex is blocked with the given probability, otherwise it costs a whole
 * number in [1, maxCost].
 */
class CostFieldGenerator {
public:
    using CostField = std::unordered_map<HexCoord, double, HexCoordHash>;

    CostFieldGenerator(int width, int height, int maxCost = 4, double blockedProbability = 0.2)
        : m_width(width), m_height(height)
        , m_cost(1, maxCost), m_blocked(blockedProbability) {}

    std::shared_ptr<CostField> Generate(RandomGenerator& rng) {
        auto field = std::make_shared<CostField>();
        for (int q = 0; q < m_width; ++q) {
            for (int r = 0; r < m_height; ++r) {
                const bool blocked = m_blocked(rng.Engine());
                const double cost = static_cast<double>(m_cost(rng.Engine()));
                (*field)[HexCoord{q, r}] = blocked ? kImpassableCost : cost;
            }
        }
        return field;
    }

    /**
     * @brief Cost function over a generated field; hexes outside it are impassable
     */
    static HexCostFunc CostFunction(std::shared_ptr<CostField> field) {
        return [field = std::move(field)](const HexCoord& coord) {
            auto it = field->find(coord);
            return it != field->end() ? it->second : kImpassableCost;
        };
    }

    HexBoundsFunc BoundsFunction() const {
        return [w = m_width, h = m_height](const HexCoord& coord) {
            return coord.q >= 0 && coord.q < w && coord.r >= 0 && coord.r < h;
        };
    }

private:
    int m_width;
    int m_height;
    std::uniform_int_distribution<int> m_cost;
    std::bernoulli_distribution m_blocked;
};

} // namespace Test
} // namespace Tribes
