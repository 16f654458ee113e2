/**
 * @file test_hex_layout.cpp
 * @brief Unit tests for hex to pixel conversion and layout settings
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "hex/HexLayout.hpp"
#include "config/Config.hpp"

#include "utils/TestHelpers.hpp"
#include "utils/Generators.hpp"

#include <cmath>

using namespace Tribes;
using namespace Tribes::Test;

namespace {
const double kSqrt3 = std::sqrt(3.0);
}

// =============================================================================
// Layout Fixture
// =============================================================================

class HexLayoutTest : public ::testing::Test {
protected:
    HexLayout pointy{HexOrientation::Pointy, 32.0, glm::dvec2(0.0)};
    HexLayout flat{HexOrientation::Flat, 10.0, glm::dvec2(0.0)};
    HexLayout offset{HexOrientation::Pointy, 16.0, glm::dvec2(100.0, -50.0)};
};

TEST_F(HexLayoutTest, OriginMapsToOriginPixel) {
    EXPECT_DVEC2_EQ(glm::dvec2(0.0), HexToPixel(Hex(0, 0), pointy));
    EXPECT_DVEC2_EQ(glm::dvec2(100.0, -50.0), HexToPixel(Hex(0, 0), offset));
}

TEST_F(HexLayoutTest, PointyHexToPixel) {
    EXPECT_DVEC2_NEAR(glm::dvec2(kSqrt3 * 32.0, 0.0), HexToPixel(Hex(1, 0), pointy), 1e-9);
    EXPECT_DVEC2_NEAR(glm::dvec2(kSqrt3 * 16.0, 48.0), HexToPixel(Hex(0, 1), pointy), 1e-9);
}

TEST_F(HexLayoutTest, FlatHexToPixel) {
    EXPECT_DVEC2_NEAR(glm::dvec2(15.0, kSqrt3 * 5.0), HexToPixel(Hex(1, 0), flat), 1e-9);
    EXPECT_DVEC2_NEAR(glm::dvec2(0.0, kSqrt3 * 10.0), HexToPixel(Hex(0, 1), flat), 1e-9);
}

TEST_F(HexLayoutTest, PixelToHexInvertsHexToPixel) {
    RandomGenerator rng(2024);
    HexCoordGenerator gen(200);

    for (const auto& coord : gen.GenerateMany(rng, 200)) {
        EXPECT_EQ(coord, PixelToHex(HexToPixel(coord, pointy), pointy));
        EXPECT_EQ(coord, PixelToHex(HexToPixel(coord, flat), flat));
        EXPECT_EQ(coord, PixelToHex(HexToPixel(coord, offset), offset));
    }
}

TEST_F(HexLayoutTest, PixelToFractionalHexIsExactAtCenters) {
    const FractionalHex f = PixelToFractionalHex(HexToPixel(Hex(3, -2), pointy), pointy);
    EXPECT_NEAR(3.0, f.q, 1e-9);
    EXPECT_NEAR(-2.0, f.r, 1e-9);
}

TEST_F(HexLayoutTest, PixelNearCenterRoundsToHex) {
    const glm::dvec2 center = HexToPixel(Hex(2, 1), pointy);
    EXPECT_EQ(Hex(2, 1), PixelToHex(center + glm::dvec2(5.0, -7.0), pointy));
}

TEST_F(HexLayoutTest, PointyCornersStartAtMinusThirty) {
    const auto corners = HexCorners(Hex(0, 0), pointy);

    EXPECT_DVEC2_NEAR(glm::dvec2(kSqrt3 * 16.0, -16.0), corners[0], 1e-9);
    EXPECT_DVEC2_NEAR(glm::dvec2(0.0, 32.0), corners[2], 1e-9);
}

TEST_F(HexLayoutTest, FlatCornersStartAtZero) {
    const auto corners = HexCorners(Hex(0, 0), flat);

    EXPECT_DVEC2_NEAR(glm::dvec2(10.0, 0.0), corners[0], 1e-9);
    EXPECT_DVEC2_NEAR(glm::dvec2(-10.0, 0.0), corners[3], 1e-9);
}

TEST_F(HexLayoutTest, CornersAreSizeFromCenter) {
    const HexCoord coord = Hex(-4, 9);
    const glm::dvec2 center = HexToPixel(coord, offset);
    for (const auto& corner : HexCorners(coord, offset)) {
        EXPECT_NEAR(offset.size, glm::length(corner - center), 1e-9);
    }
}

// =============================================================================
// Orientation and Settings
// =============================================================================

TEST(HexOrientationTest, StringConversion) {
    EXPECT_STREQ("pointy", HexOrientationToString(HexOrientation::Pointy));
    EXPECT_STREQ("flat", HexOrientationToString(HexOrientation::Flat));
    EXPECT_EQ(HexOrientation::Flat, StringToHexOrientation("flat").value());
    EXPECT_FALSE(StringToHexOrientation("round").has_value());
}

TEST(HexLayoutSettingsTest, FromSettingsCopiesValues) {
    HexGridSettings settings;
    settings.orientation = "flat";
    settings.size = 12.5;
    settings.origin = glm::dvec2(3.0, 4.0);

    const HexLayout layout = HexLayout::FromSettings(settings);
    EXPECT_EQ(HexOrientation::Flat, layout.orientation);
    EXPECT_DOUBLE_EQ(12.5, layout.size);
    EXPECT_DVEC2_EQ(glm::dvec2(3.0, 4.0), layout.origin);
}

TEST(HexLayoutSettingsTest, FromSettingsFallsBackOnBadValues) {
    HexGridSettings settings;
    settings.orientation = "sideways";
    settings.size = -1.0;

    const HexLayout layout = HexLayout::FromSettings(settings);
    EXPECT_EQ(HexOrientation::Pointy, layout.orientation);
    EXPECT_DOUBLE_EQ(32.0, layout.size);
}
