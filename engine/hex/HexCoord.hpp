#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace Tribes {

/**
 * @brief Axial hex coordinate (q, r) on an infinite pointy-top grid
 *
 * The implicit third cube component is s = -q - r.
 */
struct HexCoord {
    int q = 0;
    int r = 0;

    [[nodiscard]] constexpr int s() const noexcept { return -q - r; }

    constexpr HexCoord operator+(const HexCoord& other) const noexcept {
        return {q + other.q, r + other.r};
    }

    constexpr HexCoord operator-(const HexCoord& other) const noexcept {
        return {q - other.q, r - other.r};
    }

    constexpr HexCoord operator*(int scale) const noexcept {
        return {q * scale, r * scale};
    }

    constexpr bool operator==(const HexCoord& other) const noexcept = default;

    // Lexicographic (q, then r); used by ordered containers and queue tie-breaks
    constexpr auto operator<=>(const HexCoord& other) const noexcept = default;
};

/**
 * @brief Cube hex coordinate, invariant q + r + s == 0
 */
struct CubeCoord {
    int q = 0;
    int r = 0;
    int s = 0;

    constexpr bool operator==(const CubeCoord& other) const noexcept = default;
};

/**
 * @brief Fractional axial coordinate, input to HexRound
 */
struct FractionalHex {
    double q = 0.0;
    double r = 0.0;
};

/**
 * @brief Fractional cube coordinate, input to CubeRound
 */
struct FractionalCube {
    double q = 0.0;
    double r = 0.0;
    double s = 0.0;
};

/**
 * @brief The six neighbor directions, in stable counter-clockwise order
 */
enum class HexDirection : std::uint8_t {
    East = 0,
    NorthEast = 1,
    NorthWest = 2,
    West = 3,
    SouthWest = 4,
    SouthEast = 5
};

inline constexpr int kHexDirectionCount = 6;

inline constexpr std::array<HexDirection, kHexDirectionCount> kAllHexDirections = {
    HexDirection::East,
    HexDirection::NorthEast,
    HexDirection::NorthWest,
    HexDirection::West,
    HexDirection::SouthWest,
    HexDirection::SouthEast
};

// =============================================================================
// Construction and keys
// =============================================================================

[[nodiscard]] constexpr HexCoord Hex(int q, int r) noexcept {
    return {q, r};
}

[[nodiscard]] constexpr bool HexEquals(const HexCoord& a, const HexCoord& b) noexcept {
    return a == b;
}

/**
 * @brief Canonical "q,r" key for tile lookups
 */
[[nodiscard]] std::string HexKey(const HexCoord& coord);

/**
 * @brief Parse a key produced by HexKey
 *
 * Keys are always produced internally, so a malformed key is a programmer
 * error.
 * @throws std::invalid_argument if the key is not of the form "q,r"
 */
[[nodiscard]] HexCoord ParseHexKey(std::string_view key);

/**
 * @brief Parse a key from untrusted input
 * @return The coordinate, or std::nullopt if the key is malformed or overflows
 */
[[nodiscard]] std::optional<HexCoord> TryParseHexKey(std::string_view key) noexcept;

// =============================================================================
// Cube conversion and rounding
// =============================================================================

/**
 * @brief Axial to cube; s = -q - r must fit in an int
 */
[[nodiscard]] constexpr CubeCoord AxialToCube(const HexCoord& coord) noexcept {
    return {coord.q, coord.r, -coord.q - coord.r};
}

[[nodiscard]] constexpr HexCoord CubeToAxial(const CubeCoord& cube) noexcept {
    return {cube.q, cube.r};
}

/**
 * @brief Snap a fractional cube coordinate to the nearest valid hex
 *
 * Each component is rounded independently, then the component with the
 * largest rounding error is recomputed from the other two so that
 * q + r + s == 0 holds.
 */
[[nodiscard]] CubeCoord CubeRound(const FractionalCube& cube) noexcept;

/**
 * @brief Snap a fractional axial coordinate to the nearest hex
 */
[[nodiscard]] HexCoord HexRound(const FractionalHex& hex) noexcept;

// =============================================================================
// Neighbors and distance
// =============================================================================

[[nodiscard]] HexCoord HexDirectionOffset(HexDirection direction) noexcept;

[[nodiscard]] HexCoord HexNeighbor(const HexCoord& coord, HexDirection direction) noexcept;

/**
 * @brief All six neighbors, indexed by HexDirection
 */
[[nodiscard]] std::array<HexCoord, kHexDirectionCount> HexNeighbors(const HexCoord& coord) noexcept;

/**
 * @brief Number of hex steps between two coordinates
 *
 * max(|dq|, |dr|, |ds|). Symmetric, zero only for equal coordinates, and
 * obeys the triangle inequality. 64-bit so that any two int coordinates
 * have an exact distance.
 */
[[nodiscard]] std::int64_t HexDistance(const HexCoord& a, const HexCoord& b) noexcept;

/**
 * @brief Hash for unordered containers keyed by HexCoord
 */
struct HexCoordHash {
    [[nodiscard]] std::size_t operator()(const HexCoord& coord) const noexcept {
        const auto uq = static_cast<std::uint64_t>(static_cast<std::uint32_t>(coord.q));
        const auto ur = static_cast<std::uint64_t>(static_cast<std::uint32_t>(coord.r));
        return std::hash<std::uint64_t>{}((uq << 32) | ur);
    }
};

} // namespace Tribes

namespace std {
template<>
struct hash<Tribes::HexCoord> {
    size_t operator()(const Tribes::HexCoord& coord) const noexcept {
        return Tribes::HexCoordHash{}(coord);
    }
};
} // namespace std
