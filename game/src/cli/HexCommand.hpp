#pragma once

#include "../config/TerrainConfig.hpp"

#include <hex/HexCoord.hpp>

#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Tribes {

class Config;

namespace Game {

/**
 * @brief Parsed tribes_hex command line
 */
struct CommandLineArgs {
    std::string configPath;
    std::optional<std::pair<int, int>> mapSize;                  // --map WxH
    std::vector<std::pair<HexCoord, TerrainType>> terrain;       // --terrain KEY=TYPE
    std::vector<HexCoord> occupied;                              // --occupied KEY
    std::optional<double> budget;                                // --budget N
    bool verbose = false;
    bool showHelp = false;

    std::string command;
    std::vector<std::string> operands;

    std::string error;  // Non-empty when parsing failed

    [[nodiscard]] bool IsValid() const { return error.empty(); }

    static CommandLineArgs Parse(const std::vector<std::string>& argv);
    static CommandLineArgs Parse(int argc, char* argv[]);
    static void PrintHelp(std::ostream& out);
};

/**
 * @brief Exit codes of tribes_hex
 */
enum ExitCode : int {
    kExitSuccess = 0,
    kExitUsage = 1,
    kExitNoPath = 2
};

/**
 * @brief Runs one hex query and prints the result, one hex key per line
 */
class HexCommandRunner {
public:
    HexCommandRunner(const CommandLineArgs& args, const Tribes::Config& config);

    /**
     * @return Process exit code
     */
    int Run(std::ostream& out) const;

private:
    const CommandLineArgs& m_args;
    const Tribes::Config& m_config;

    int RunDistance(std::ostream& out) const;
    int RunShape(std::ostream& out) const;
    int RunNeighbors(std::ostream& out) const;
    int RunPath(std::ostream& out) const;
    int RunReach(std::ostream& out) const;
    int RunPixel(std::ostream& out) const;
    int RunHex(std::ostream& out) const;

    bool ExpectOperands(size_t count) const;
    std::optional<HexCoord> Operand(size_t index) const;
};

} // namespace Game
} // namespace Tribes
