#include "hex/HexCoord.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace Tribes {

namespace {

// Pointy-top offsets, indexed by HexDirection
constexpr std::array<HexCoord, kHexDirectionCount> kDirectionOffsets = {{
    {1, 0},   // East
    {1, -1},  // NorthEast
    {0, -1},  // NorthWest
    {-1, 0},  // West
    {-1, 1},  // SouthWest
    {0, 1}    // SouthEast
}};

bool ParseInt(std::string_view text, int& out) noexcept {
    if (text.empty()) {
        return false;
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, out);
    return ec == std::errc{} && ptr == end;
}

} // namespace

std::string HexKey(const HexCoord& coord) {
    return std::to_string(coord.q) + "," + std::to_string(coord.r);
}

HexCoord ParseHexKey(std::string_view key) {
    auto coord = TryParseHexKey(key);
    if (!coord) {
        throw std::invalid_argument("Invalid hex key: '" + std::string(key) + "'");
    }
    return *coord;
}

std::optional<HexCoord> TryParseHexKey(std::string_view key) noexcept {
    const auto comma = key.find(',');
    if (comma == std::string_view::npos) {
        return std::nullopt;
    }

    HexCoord coord;
    if (!ParseInt(key.substr(0, comma), coord.q) ||
        !ParseInt(key.substr(comma + 1), coord.r)) {
        return std::nullopt;
    }
    return coord;
}

CubeCoord CubeRound(const FractionalCube& cube) noexcept {
    double q = std::round(cube.q);
    double r = std::round(cube.r);
    double s = std::round(cube.s);

    const double qDiff = std::abs(q - cube.q);
    const double rDiff = std::abs(r - cube.r);
    const double sDiff = std::abs(s - cube.s);

    if (qDiff > rDiff && qDiff > sDiff) {
        q = -r - s;
    } else if (rDiff > sDiff) {
        r = -q - s;
    } else {
        s = -q - r;
    }

    return {static_cast<int>(q), static_cast<int>(r), static_cast<int>(s)};
}

HexCoord HexRound(const FractionalHex& hex) noexcept {
    return CubeToAxial(CubeRound({hex.q, hex.r, -hex.q - hex.r}));
}

HexCoord HexDirectionOffset(HexDirection direction) noexcept {
    return kDirectionOffsets[static_cast<std::size_t>(direction) % kHexDirectionCount];
}

HexCoord HexNeighbor(const HexCoord& coord, HexDirection direction) noexcept {
    return coord + HexDirectionOffset(direction);
}

std::array<HexCoord, kHexDirectionCount> HexNeighbors(const HexCoord& coord) noexcept {
    std::array<HexCoord, kHexDirectionCount> neighbors;
    for (std::size_t i = 0; i < neighbors.size(); ++i) {
        neighbors[i] = coord + kDirectionOffsets[i];
    }
    return neighbors;
}

std::int64_t HexDistance(const HexCoord& a, const HexCoord& b) noexcept {
    const std::int64_t dq = static_cast<std::int64_t>(a.q) - b.q;
    const std::int64_t dr = static_cast<std::int64_t>(a.r) - b.r;
    const std::int64_t ds = -dq - dr;
    return std::max({std::abs(dq), std::abs(dr), std::abs(ds)});
}

} // namespace Tribes
