#include "hex/HexLayout.hpp"
#include "config/Config.hpp"
#include "core/Logger.hpp"

#include <cmath>
#include <glm/gtc/constants.hpp>

namespace Tribes {

namespace {

/**
 * @brief Forward and inverse 2x2 basis for an orientation, in units of size
 */
struct OrientationMatrix {
    double f0, f1, f2, f3;   // hex -> pixel
    double b0, b1, b2, b3;   // pixel -> hex
    double startAngle;       // In multiples of 60 degrees
};

const double kSqrt3 = std::sqrt(3.0);

const OrientationMatrix kPointy{
    kSqrt3, kSqrt3 / 2.0, 0.0, 3.0 / 2.0,
    kSqrt3 / 3.0, -1.0 / 3.0, 0.0, 2.0 / 3.0,
    -0.5
};

const OrientationMatrix kFlat{
    3.0 / 2.0, 0.0, kSqrt3 / 2.0, kSqrt3,
    2.0 / 3.0, 0.0, -1.0 / 3.0, kSqrt3 / 3.0,
    0.0
};

const OrientationMatrix& MatrixFor(HexOrientation orientation) {
    return orientation == HexOrientation::Flat ? kFlat : kPointy;
}

} // namespace

const char* HexOrientationToString(HexOrientation orientation) {
    return orientation == HexOrientation::Flat ? "flat" : "pointy";
}

std::optional<HexOrientation> StringToHexOrientation(std::string_view str) {
    if (str == "pointy") return HexOrientation::Pointy;
    if (str == "flat") return HexOrientation::Flat;
    return std::nullopt;
}

HexLayout HexLayout::FromSettings(const HexGridSettings& settings) {
    HexLayout layout;
    if (auto orientation = StringToHexOrientation(settings.orientation)) {
        layout.orientation = *orientation;
    } else {
        TRIBES_LOG_WARN("Unknown hex orientation '{}', using pointy", settings.orientation);
    }
    if (settings.size > 0.0) {
        layout.size = settings.size;
    } else {
        TRIBES_LOG_WARN("Hex size must be positive (got {}), using {}", settings.size, layout.size);
    }
    layout.origin = settings.origin;
    return layout;
}

glm::dvec2 HexToPixel(const HexCoord& coord, const HexLayout& layout) noexcept {
    const OrientationMatrix& m = MatrixFor(layout.orientation);
    const double x = (m.f0 * coord.q + m.f1 * coord.r) * layout.size;
    const double y = (m.f2 * coord.q + m.f3 * coord.r) * layout.size;
    return glm::dvec2(x, y) + layout.origin;
}

FractionalHex PixelToFractionalHex(const glm::dvec2& point, const HexLayout& layout) noexcept {
    const OrientationMatrix& m = MatrixFor(layout.orientation);
    const glm::dvec2 p = (point - layout.origin) / layout.size;
    return {m.b0 * p.x + m.b1 * p.y, m.b2 * p.x + m.b3 * p.y};
}

HexCoord PixelToHex(const glm::dvec2& point, const HexLayout& layout) noexcept {
    return HexRound(PixelToFractionalHex(point, layout));
}

std::array<glm::dvec2, 6> HexCorners(const HexCoord& coord, const HexLayout& layout) noexcept {
    const OrientationMatrix& m = MatrixFor(layout.orientation);
    const glm::dvec2 center = HexToPixel(coord, layout);

    std::array<glm::dvec2, 6> corners;
    for (int i = 0; i < 6; ++i) {
        const double angle = 2.0 * glm::pi<double>() * (m.startAngle + i) / 6.0;
        corners[i] = center + glm::dvec2(layout.size * std::cos(angle),
                                         layout.size * std::sin(angle));
    }
    return corners;
}

} // namespace Tribes
