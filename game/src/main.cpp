#include <cstdlib>
#include <iostream>

#include <config/Config.hpp>
#include <core/Logger.hpp>

#include "cli/HexCommand.hpp"

/**
 * @brief Main entry point for tribes_hex
 */
int main(int argc, char* argv[]) {
    using namespace Tribes;

    // Parse command line arguments
    auto args = Game::CommandLineArgs::Parse(argc, argv);

    if (args.showHelp) {
        Game::CommandLineArgs::PrintHelp(std::cout);
        return Game::kExitSuccess;
    }

    // Console logging goes to stderr so stdout carries only results
    Logger::Initialize();

    auto& config = Config::Instance();
    if (!args.configPath.empty() && !config.Load(args.configPath)) {
        APP_LOG_ERROR("Failed to load configuration from {}", args.configPath);
        return Game::kExitUsage;
    }

    const auto logging = LoggingSettings::FromConfig(config);
    if (!logging.file.empty()) {
        Logger::Shutdown();
        Logger::Initialize(logging.file);
    }

    auto level = Logger::ParseLevel(logging.level);
    if (!level) {
        APP_LOG_WARN("Unknown log level '{}', using info", logging.level);
        level = spdlog::level::info;
    }
    Logger::SetLevel(args.verbose ? spdlog::level::debug : *level);

    if (!args.IsValid()) {
        APP_LOG_ERROR("{}", args.error);
        Game::CommandLineArgs::PrintHelp(std::cerr);
        return Game::kExitUsage;
    }

    Game::HexCommandRunner runner(args, config);
    const int exitCode = runner.Run(std::cout);

    Logger::Shutdown();
    return exitCode;
}
