/**
 * @file test_hex_shapes.cpp
 * @brief Unit tests for hex lines, ranges, rings and spirals
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "hex/HexShapes.hpp"

#include "utils/TestHelpers.hpp"
#include "utils/Generators.hpp"

#include <limits>
#include <vector>

using namespace Tribes;
using namespace Tribes::Test;
using ::testing::ElementsAre;

// =============================================================================
// Line Tests
// =============================================================================

TEST(HexLineTest, SameHexIsSingleElement) {
    EXPECT_THAT(HexLine(Hex(2, 3), Hex(2, 3)), ElementsAre(Hex(2, 3)));
}

TEST(HexLineTest, StraightLineAlongAxis) {
    EXPECT_THAT(HexLine(Hex(0, 0), Hex(3, 0)),
        ElementsAre(Hex(0, 0), Hex(1, 0), Hex(2, 0), Hex(3, 0)));
}

TEST(HexLineTest, NudgeBreaksEdgeTies) {
    // The midpoint lies on the edge between (1,0) and (1,-1)
    EXPECT_THAT(HexLine(Hex(0, 0), Hex(2, -1)),
        ElementsAre(Hex(0, 0), Hex(1, 0), Hex(2, -1)));
}

TEST(HexLineTest, LengthAndContiguity) {
    RandomGenerator rng(99);
    HexCoordGenerator gen(30);

    for (int i = 0; i < 100; ++i) {
        const HexCoord a = gen.Generate(rng);
        const HexCoord b = gen.Generate(rng);
        const auto line = HexLine(a, b);

        ASSERT_EQ(static_cast<size_t>(HexDistance(a, b)) + 1, line.size());
        EXPECT_EQ(a, line.front());
        EXPECT_EQ(b, line.back());
        EXPECT_TRUE(IsContiguous(line));
    }
}

// =============================================================================
// Range Tests
// =============================================================================

TEST(HexRangeTest, RadiusZeroIsCenter) {
    EXPECT_THAT(HexRange(Hex(4, -4), 0), ElementsAre(Hex(4, -4)));
}

TEST(HexRangeTest, NegativeRadiusIsEmpty) {
    EXPECT_TRUE(HexRange(Hex(0, 0), -1).empty());
    EXPECT_EQ(0u, HexRangeCount(-1));
}

TEST(HexRangeTest, CountMatchesFormula) {
    static_assert(HexRangeCount(1) == 7);
    static_assert(HexRangeCount(2) == 19);
    static_assert(HexRangeCount(30000) == 2700090001u);
    static_assert(HexRangeCount(std::numeric_limits<int>::max()) > HexRangeCount(30000));

    for (int radius = 0; radius <= 8; ++radius) {
        const auto range = HexRange(Hex(1, 1), radius);
        EXPECT_EQ(static_cast<size_t>(1 + 3 * radius * (radius + 1)), range.size());
        EXPECT_TRUE(AllDistinct(range));
    }
}

TEST(HexRangeTest, EveryHexWithinRadius) {
    const HexCoord center = Hex(-3, 7);
    for (const auto& coord : HexRange(center, 4)) {
        EXPECT_LE(HexDistance(center, coord), 4);
    }
}

TEST(HexRangeTest, OrderedByQThenR) {
    const auto range = HexRange(Hex(0, 0), 1);
    EXPECT_THAT(range, ElementsAre(
        Hex(-1, 0), Hex(-1, 1),
        Hex(0, -1), Hex(0, 0), Hex(0, 1),
        Hex(1, -1), Hex(1, 0)));
}

// =============================================================================
// Ring and Spiral Tests
// =============================================================================

TEST(HexRingTest, RadiusZeroIsCenter) {
    EXPECT_THAT(HexRing(Hex(5, 5), 0), ElementsAre(Hex(5, 5)));
    EXPECT_TRUE(HexRing(Hex(5, 5), -2).empty());
}

TEST(HexRingTest, RadiusOneWalkOrder) {
    EXPECT_THAT(HexRing(Hex(0, 0), 1), ElementsAre(
        Hex(1, 0), Hex(1, -1), Hex(0, -1), Hex(-1, 0), Hex(-1, 1), Hex(0, 1)));
}

TEST(HexRingTest, RingHexesAtExactDistance) {
    const HexCoord center = Hex(2, -6);
    for (int radius = 1; radius <= 6; ++radius) {
        const auto ring = HexRing(center, radius);
        ASSERT_EQ(static_cast<size_t>(6 * radius), ring.size());
        EXPECT_EQ(center + Hex(radius, 0), ring.front());
        EXPECT_TRUE(AllDistinct(ring));
        EXPECT_TRUE(IsContiguous(ring));
        for (const auto& coord : ring) {
            EXPECT_EQ(radius, HexDistance(center, coord));
        }
    }
}

TEST(HexSpiralTest, ConcatenatesRingsOutward) {
    const HexCoord center = Hex(0, 0);
    const auto spiral = HexSpiral(center, 3);

    ASSERT_EQ(static_cast<size_t>(HexRangeCount(3)), spiral.size());
    EXPECT_EQ(center, spiral.front());
    EXPECT_TRUE(SameElements(spiral, HexRange(center, 3)));

    for (size_t i = 1; i < spiral.size(); ++i) {
        EXPECT_LE(HexDistance(center, spiral[i - 1]), HexDistance(center, spiral[i]));
    }
}

TEST(HexSpiralTest, NegativeRadiusIsEmpty) {
    EXPECT_TRUE(HexSpiral(Hex(0, 0), -1).empty());
}
