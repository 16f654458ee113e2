#pragma once

#include "hex/HexCoord.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <glm/glm.hpp>

namespace Tribes {

struct HexGridSettings;

/**
 * @brief Which way the hexes point
 */
enum class HexOrientation {
    Pointy,  // Corner at the top; rows are horizontal
    Flat     // Edge at the top; columns are vertical
};

[[nodiscard]] const char* HexOrientationToString(HexOrientation orientation);
[[nodiscard]] std::optional<HexOrientation> StringToHexOrientation(std::string_view str);

/**
 * @brief Screen layout for projecting hexes to pixels
 */
struct HexLayout {
    HexOrientation orientation = HexOrientation::Pointy;
    double size = 32.0;              // Distance from center to corner
    glm::dvec2 origin{0.0, 0.0};     // Pixel position of hex (0, 0)

    /**
     * @brief Build a layout from configuration; unknown orientations fall back to pointy
     */
    [[nodiscard]] static HexLayout FromSettings(const HexGridSettings& settings);
};

/**
 * @brief Pixel position of a hex center
 */
[[nodiscard]] glm::dvec2 HexToPixel(const HexCoord& coord, const HexLayout& layout) noexcept;

/**
 * @brief Exact inverse of HexToPixel, before rounding
 */
[[nodiscard]] FractionalHex PixelToFractionalHex(const glm::dvec2& point, const HexLayout& layout) noexcept;

/**
 * @brief Hex containing a pixel position
 *
 * PixelToHex(HexToPixel(c)) == c for every integer coordinate.
 */
[[nodiscard]] HexCoord PixelToHex(const glm::dvec2& point, const HexLayout& layout) noexcept;

/**
 * @brief The six corner positions of a hex
 */
[[nodiscard]] std::array<glm::dvec2, 6> HexCorners(const HexCoord& coord, const HexLayout& layout) noexcept;

} // namespace Tribes
