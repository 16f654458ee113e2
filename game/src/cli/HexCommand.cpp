#include "HexCommand.hpp"
#include "../map/HexMap.hpp"

#include <config/Config.hpp>
#include <core/Logger.hpp>
#include <hex/HexLayout.hpp>
#include <hex/HexShapes.hpp>
#include <pathfinding/HexPathfinder.hpp>

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <limits>
#include <ostream>
#include <string_view>

namespace Tribes {
namespace Game {

namespace {

// Search limit for path and reach queries on the unbounded grid
constexpr int kUnboundedNodeLimit = 100000;

// Largest line, range, ring or spiral printed
constexpr std::uint64_t kMaxShapeHexes = 1000000;

// Whether every hex within radius of coord has q, r and s inside int range
bool FitsGrid(const HexCoord& coord, std::int64_t radius) {
    constexpr std::int64_t kMin = std::numeric_limits<int>::min();
    constexpr std::int64_t kMax = std::numeric_limits<int>::max();
    const std::int64_t q = coord.q;
    const std::int64_t r = coord.r;
    for (const std::int64_t v : {q, r, -q - r}) {
        if (v - radius < kMin || v + radius > kMax) {
            return false;
        }
    }
    return true;
}

// Unbounded grid, minus the outermost hexes whose neighbors would leave int range
bool InUnboundedGrid(const HexCoord& coord) {
    return FitsGrid(coord, 1);
}

// Entry cost on the unbounded grid: 1, or impassable when occupied
HexCostFunc UnitCost(const std::vector<HexCoord>& occupied) {
    return [&occupied](const HexCoord& coord) {
        return std::find(occupied.begin(), occupied.end(), coord) != occupied.end()
            ? kImpassableCost : 1.0;
    };
}

template<typename T>
std::optional<T> ParseNumber(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    T value{};
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::pair<int, int>> ParseMapSize(std::string_view text) {
    const auto x = text.find_first_of("xX");
    if (x == std::string_view::npos) {
        return std::nullopt;
    }
    auto width = ParseNumber<int>(text.substr(0, x));
    auto height = ParseNumber<int>(text.substr(x + 1));
    if (!width || !height || *width <= 0 || *height <= 0) {
        return std::nullopt;
    }
    return std::make_pair(*width, *height);
}

void PrintCoords(std::ostream& out, const std::vector<HexCoord>& coords) {
    for (const auto& coord : coords) {
        out << HexKey(coord) << '\n';
    }
}

} // namespace

// ============================================================================
// CommandLineArgs
// ============================================================================

CommandLineArgs CommandLineArgs::Parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return Parse(args);
}

CommandLineArgs CommandLineArgs::Parse(const std::vector<std::string>& argv) {
    CommandLineArgs args;

    auto needValue = [&](size_t& i, std::string_view flag) -> const std::string* {
        if (i + 1 >= argv.size()) {
            args.error = "missing value for " + std::string(flag);
            return nullptr;
        }
        return &argv[++i];
    };

    for (size_t i = 0; i < argv.size() && args.error.empty(); ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.showHelp = true;
        } else if (arg == "-v" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-c" || arg == "--config") {
            if (const auto* value = needValue(i, arg)) {
                args.configPath = *value;
            }
        } else if (arg == "-m" || arg == "--map") {
            if (const auto* value = needValue(i, arg)) {
                args.mapSize = ParseMapSize(*value);
                if (!args.mapSize) {
                    args.error = "invalid map size '" + *value + "' (expected WxH)";
                }
            }
        } else if (arg == "-t" || arg == "--terrain") {
            if (const auto* value = needValue(i, arg)) {
                const auto eq = value->find('=');
                auto coord = TryParseHexKey(std::string_view(*value).substr(0, eq));
                auto type = eq == std::string::npos
                    ? std::nullopt
                    : StringToTerrainType(std::string_view(*value).substr(eq + 1));
                if (!coord || !type) {
                    args.error = "invalid terrain override '" + *value + "' (expected q,r=type)";
                } else {
                    args.terrain.emplace_back(*coord, *type);
                }
            }
        } else if (arg == "-o" || arg == "--occupied") {
            if (const auto* value = needValue(i, arg)) {
                if (auto coord = TryParseHexKey(*value)) {
                    args.occupied.push_back(*coord);
                } else {
                    args.error = "invalid hex key '" + *value + "'";
                }
            }
        } else if (arg == "-b" || arg == "--budget") {
            if (const auto* value = needValue(i, arg)) {
                args.budget = ParseNumber<double>(*value);
                if (!args.budget || *args.budget < 0.0) {
                    args.error = "invalid budget '" + *value + "'";
                }
            }
        } else if (args.command.empty()) {
            args.command = std::string(arg);
        } else {
            args.operands.emplace_back(arg);
        }
    }

    if (args.error.empty() && !args.terrain.empty() && !args.mapSize) {
        args.error = "--terrain needs --map";
    }

    if (args.error.empty() && !args.showHelp && args.command.empty()) {
        args.error = "no command given";
    }

    return args;
}

void CommandLineArgs::PrintHelp(std::ostream& out) {
    out << "tribes_hex - hex grid queries\n";
    out << "=============================\n\n";
    out << "Usage: tribes_hex [options] <command> [args]\n\n";
    out << "Commands (coordinates are hex keys, e.g. 3,-2):\n";
    out << "  distance A B        Hex steps between A and B\n";
    out << "  line A B            Hexes on the line from A to B\n";
    out << "  range C N           Hexes within N of C\n";
    out << "  ring C N            Hexes exactly N from C\n";
    out << "  spiral C N          Rings 0..N around C\n";
    out << "  neighbors C         The six neighbors of C\n";
    out << "  path A B            Cheapest path from A to B\n";
    out << "  reach C BUDGET      Hexes reachable from C and remaining budget\n";
    out << "  pixel C             Pixel center of C\n";
    out << "  hex X Y             Hex containing pixel (X, Y)\n\n";
    out << "Options:\n";
    out << "  -h, --help              Show this help message\n";
    out << "  -c, --config PATH       Configuration file\n";
    out << "  -m, --map WxH           Bounded map filled with grassland\n";
    out << "  -t, --terrain KEY=TYPE  Terrain override (repeatable, needs --map)\n";
    out << "  -o, --occupied KEY      Block a hex (repeatable)\n";
    out << "  -b, --budget N          Movement budget for path\n";
    out << "  -v, --verbose           Debug logging\n";
}

// ============================================================================
// HexCommandRunner
// ============================================================================

HexCommandRunner::HexCommandRunner(const CommandLineArgs& args, const Tribes::Config& config)
    : m_args(args)
    , m_config(config) {
}

int HexCommandRunner::Run(std::ostream& out) const {
    const std::string& cmd = m_args.command;

    if (cmd == "distance") return RunDistance(out);
    if (cmd == "line" || cmd == "range" || cmd == "ring" || cmd == "spiral") return RunShape(out);
    if (cmd == "neighbors") return RunNeighbors(out);
    if (cmd == "path") return RunPath(out);
    if (cmd == "reach") return RunReach(out);
    if (cmd == "pixel") return RunPixel(out);
    if (cmd == "hex") return RunHex(out);

    APP_LOG_ERROR("Unknown command '{}'", cmd);
    return kExitUsage;
}

bool HexCommandRunner::ExpectOperands(size_t count) const {
    if (m_args.operands.size() != count) {
        APP_LOG_ERROR("'{}' takes {} argument(s), got {}", m_args.command, count, m_args.operands.size());
        return false;
    }
    return true;
}

std::optional<HexCoord> HexCommandRunner::Operand(size_t index) const {
    auto coord = TryParseHexKey(m_args.operands[index]);
    if (!coord) {
        APP_LOG_ERROR("Invalid hex key '{}'", m_args.operands[index]);
    }
    return coord;
}

int HexCommandRunner::RunDistance(std::ostream& out) const {
    if (!ExpectOperands(2)) return kExitUsage;
    auto a = Operand(0);
    auto b = Operand(1);
    if (!a || !b) return kExitUsage;

    out << HexDistance(*a, *b) << '\n';
    return kExitSuccess;
}

int HexCommandRunner::RunShape(std::ostream& out) const {
    if (!ExpectOperands(2)) return kExitUsage;
    auto first = Operand(0);
    if (!first) return kExitUsage;

    const std::string& cmd = m_args.command;
    if (cmd == "line") {
        auto b = Operand(1);
        if (!b) return kExitUsage;
        if (!FitsGrid(*first, 0) || !FitsGrid(*b, 0)) {
            APP_LOG_ERROR("Line endpoints {} and {} are outside the grid", HexKey(*first), HexKey(*b));
            return kExitUsage;
        }
        const auto count = static_cast<std::uint64_t>(HexDistance(*first, *b)) + 1;
        if (count > kMaxShapeHexes) {
            APP_LOG_ERROR("Line of {} hexes exceeds the limit of {}", count, kMaxShapeHexes);
            return kExitUsage;
        }
        PrintCoords(out, HexLine(*first, *b));
        return kExitSuccess;
    }

    auto radius = ParseNumber<int>(m_args.operands[1]);
    if (!radius || *radius < 0) {
        APP_LOG_ERROR("Invalid radius '{}'", m_args.operands[1]);
        return kExitUsage;
    }

    const std::uint64_t count = cmd == "ring"
        ? std::max<std::uint64_t>(1, 6 * static_cast<std::uint64_t>(*radius))
        : HexRangeCount(*radius);
    if (count > kMaxShapeHexes) {
        APP_LOG_ERROR("'{}' of radius {} has {} hexes, over the limit of {}", cmd, *radius, count, kMaxShapeHexes);
        return kExitUsage;
    }
    if (!FitsGrid(*first, *radius)) {
        APP_LOG_ERROR("Radius {} around {} leaves the grid", *radius, HexKey(*first));
        return kExitUsage;
    }

    if (cmd == "range") {
        PrintCoords(out, HexRange(*first, *radius));
    } else if (cmd == "ring") {
        PrintCoords(out, HexRing(*first, *radius));
    } else {
        PrintCoords(out, HexSpiral(*first, *radius));
    }
    return kExitSuccess;
}

int HexCommandRunner::RunNeighbors(std::ostream& out) const {
    if (!ExpectOperands(1)) return kExitUsage;
    auto center = Operand(0);
    if (!center) return kExitUsage;
    if (!InUnboundedGrid(*center)) {
        APP_LOG_ERROR("Neighbors of {} leave the grid", HexKey(*center));
        return kExitUsage;
    }

    const auto neighbors = HexNeighbors(*center);
    PrintCoords(out, std::vector<HexCoord>(neighbors.begin(), neighbors.end()));
    return kExitSuccess;
}

int HexCommandRunner::RunPath(std::ostream& out) const {
    if (!ExpectOperands(2)) return kExitUsage;
    auto start = Operand(0);
    auto goal = Operand(1);
    if (!start || !goal) return kExitUsage;

    const auto settings = PathfindingSettings::FromConfig(m_config);
    HexPathResult result;

    if (m_args.mapSize) {
        TerrainTable table;
        table.LoadFromJson(m_config.GetSection("terrain"));

        HexMap map = HexMap::Filled(m_args.mapSize->first, m_args.mapSize->second,
                                    TerrainType::Grassland, table);
        for (const auto& [coord, terrain] : m_args.terrain) {
            map.SetTile(coord, terrain);
        }
        for (const auto& coord : m_args.occupied) {
            map.SetOccupied(coord, true);
        }
        result = map.FindPath(*start, *goal, m_args.budget, settings.maxNodesExplored);
    } else {
        HexPathOptions options;
        options.ApplySettings(settings);
        options.cost = UnitCost(m_args.occupied);
        options.isInBounds = InUnboundedGrid;
        // Every passable hex costs exactly 1
        options.minTileCost = 1.0;
        options.maxCost = m_args.budget;
        if (options.maxNodesExplored == 0) {
            options.maxNodesExplored = kUnboundedNodeLimit;
        }
        result = HexPathfinder::FindPath(*start, *goal, options);
    }

    APP_LOG_DEBUG("Explored {} hexes", result.nodesExplored);

    if (!result) {
        out << "no path\n";
        return kExitNoPath;
    }

    PrintCoords(out, result.coords);
    out << "cost: " << result.totalCost << '\n';
    return kExitSuccess;
}

int HexCommandRunner::RunReach(std::ostream& out) const {
    if (!ExpectOperands(2)) return kExitUsage;
    auto start = Operand(0);
    if (!start) return kExitUsage;

    auto budget = ParseNumber<double>(m_args.operands[1]);
    if (!budget || *budget < 0.0) {
        APP_LOG_ERROR("Invalid budget '{}'", m_args.operands[1]);
        return kExitUsage;
    }

    if (!InUnboundedGrid(*start)) {
        APP_LOG_ERROR("Start {} is at the edge of the grid", HexKey(*start));
        return kExitUsage;
    }

    HexReachableMap reachable;
    if (m_args.mapSize) {
        TerrainTable table;
        table.LoadFromJson(m_config.GetSection("terrain"));

        HexMap map = HexMap::Filled(m_args.mapSize->first, m_args.mapSize->second,
                                    TerrainType::Grassland, table);
        for (const auto& [coord, terrain] : m_args.terrain) {
            map.SetTile(coord, terrain);
        }
        for (const auto& coord : m_args.occupied) {
            map.SetOccupied(coord, true);
        }
        reachable = map.Reachable(*start, *budget);
    } else {
        const auto settings = PathfindingSettings::FromConfig(m_config);
        HexReachOptions options;
        options.cost = UnitCost(m_args.occupied);
        options.isInBounds = InUnboundedGrid;
        options.maxNodesExplored = settings.maxNodesExplored > 0
            ? settings.maxNodesExplored : kUnboundedNodeLimit;
        reachable = HexPathfinder::Reachable(*start, *budget, options);
    }

    std::vector<std::pair<HexCoord, double>> sorted(reachable.begin(), reachable.end());
    std::sort(sorted.begin(), sorted.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    for (const auto& [coord, remaining] : sorted) {
        out << HexKey(coord) << ' ' << remaining << '\n';
    }
    return kExitSuccess;
}

int HexCommandRunner::RunPixel(std::ostream& out) const {
    if (!ExpectOperands(1)) return kExitUsage;
    auto coord = Operand(0);
    if (!coord) return kExitUsage;

    const HexLayout layout = HexLayout::FromSettings(HexGridSettings::FromConfig(m_config));
    const glm::dvec2 pixel = HexToPixel(*coord, layout);
    out << pixel.x << ' ' << pixel.y << '\n';
    return kExitSuccess;
}

int HexCommandRunner::RunHex(std::ostream& out) const {
    if (!ExpectOperands(2)) return kExitUsage;

    auto x = ParseNumber<double>(m_args.operands[0]);
    auto y = ParseNumber<double>(m_args.operands[1]);
    if (!x || !y) {
        APP_LOG_ERROR("Invalid pixel position '{} {}'", m_args.operands[0], m_args.operands[1]);
        return kExitUsage;
    }

    const HexLayout layout = HexLayout::FromSettings(HexGridSettings::FromConfig(m_config));
    out << HexKey(PixelToHex({*x, *y}, layout)) << '\n';
    return kExitSuccess;
}

} // namespace Game
} // namespace Tribes
