#pragma once

#include "hex/HexCoord.hpp"

#include <cstdint>
#include <vector>

namespace Tribes {

/**
 * @brief Hexes on the straight line from a to b, inclusive
 *
 * Interpolates in cube space and rounds each sample. The result has
 * HexDistance(a, b) + 1 elements and consecutive elements are adjacent.
 */
[[nodiscard]] std::vector<HexCoord> HexLine(const HexCoord& a, const HexCoord& b);

/**
 * @brief All hexes within radius of center, center included
 *
 * Contains 1 + 3k(k+1) hexes for radius k, ordered by q then r. Empty for a
 * negative radius.
 */
[[nodiscard]] std::vector<HexCoord> HexRange(const HexCoord& center, int radius);

/**
 * @brief Hexes at exactly radius from center
 *
 * Starts at center + radius * East and walks the six sides in direction
 * order. Radius 0 yields {center}; a negative radius yields nothing.
 */
[[nodiscard]] std::vector<HexCoord> HexRing(const HexCoord& center, int radius);

/**
 * @brief Rings 0..radius concatenated (same set as HexRange, ring order)
 */
[[nodiscard]] std::vector<HexCoord> HexSpiral(const HexCoord& center, int radius);

/**
 * @brief Number of hexes within radius: 1 + 3k(k+1)
 */
[[nodiscard]] constexpr std::uint64_t HexRangeCount(int radius) noexcept {
    if (radius < 0) {
        return 0;
    }
    const auto k = static_cast<std::uint64_t>(radius);
    return 1 + 3 * k * (k + 1);
}

} // namespace Tribes
