#include "hex/HexShapes.hpp"

#include <algorithm>

namespace Tribes {

namespace {

// Keeps interpolated samples off hex edges so ties round consistently
constexpr FractionalCube kLineNudge{1e-6, 2e-6, -3e-6};

FractionalCube CubeLerp(const FractionalCube& a, const FractionalCube& b, double t) {
    return {
        a.q + (b.q - a.q) * t,
        a.r + (b.r - a.r) * t,
        a.s + (b.s - a.s) * t
    };
}

FractionalCube Nudged(const HexCoord& coord) {
    const double q = coord.q;
    const double r = coord.r;
    return {
        q + kLineNudge.q,
        r + kLineNudge.r,
        -q - r + kLineNudge.s
    };
}

} // namespace

std::vector<HexCoord> HexLine(const HexCoord& a, const HexCoord& b) {
    const std::int64_t n = HexDistance(a, b);
    if (n == 0) {
        return {a};
    }

    const FractionalCube ac = Nudged(a);
    const FractionalCube bc = Nudged(b);

    std::vector<HexCoord> results;
    results.reserve(static_cast<size_t>(n) + 1);

    const double step = 1.0 / static_cast<double>(n);
    for (std::int64_t i = 0; i <= n; ++i) {
        results.push_back(CubeToAxial(CubeRound(CubeLerp(ac, bc, step * static_cast<double>(i)))));
    }

    return results;
}

std::vector<HexCoord> HexRange(const HexCoord& center, int radius) {
    std::vector<HexCoord> results;
    if (radius < 0) {
        return results;
    }

    results.reserve(static_cast<size_t>(HexRangeCount(radius)));
    for (int dq = -radius; dq <= radius; ++dq) {
        const int rMin = std::max(-radius, -dq - radius);
        const int rMax = std::min(radius, -dq + radius);
        for (int dr = rMin; dr <= rMax; ++dr) {
            results.push_back({center.q + dq, center.r + dr});
        }
    }

    return results;
}

std::vector<HexCoord> HexRing(const HexCoord& center, int radius) {
    if (radius < 0) {
        return {};
    }
    if (radius == 0) {
        return {center};
    }

    std::vector<HexCoord> results;
    results.reserve(static_cast<size_t>(kHexDirectionCount) * radius);

    HexCoord current = center + HexDirectionOffset(HexDirection::East) * radius;
    for (int side = 0; side < kHexDirectionCount; ++side) {
        const auto direction = static_cast<HexDirection>((side + 2) % kHexDirectionCount);
        for (int step = 0; step < radius; ++step) {
            results.push_back(current);
            current = HexNeighbor(current, direction);
        }
    }

    return results;
}

std::vector<HexCoord> HexSpiral(const HexCoord& center, int radius) {
    std::vector<HexCoord> results;
    if (radius < 0) {
        return results;
    }

    results.reserve(static_cast<size_t>(HexRangeCount(radius)));
    for (int k = 0; k <= radius; ++k) {
        auto ring = HexRing(center, k);
        results.insert(results.end(), ring.begin(), ring.end());
    }

    return results;
}

} // namespace Tribes
