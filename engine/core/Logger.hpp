#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace Tribes {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Provides convenient logging macros and initialization. Accessing a logger
 * before Initialize() initializes with console output only.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
     */
    static std::optional<spdlog::level::level_enum> ParseLevel(std::string_view name);

    static bool IsInitialized() { return s_initialized; }

    /**
     * @brief Get the library logger
     */
    static std::shared_ptr<spdlog::logger>& GetEngineLogger();

    /**
     * @brief Get the application logger
     */
    static std::shared_ptr<spdlog::logger>& GetAppLogger();

private:
    static std::shared_ptr<spdlog::logger> s_engineLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static bool s_initialized;
};

} // namespace Tribes

// Convenience macros for library logging
#define TRIBES_LOG_TRACE(...)    ::Tribes::Logger::GetEngineLogger()->trace(__VA_ARGS__)
#define TRIBES_LOG_DEBUG(...)    ::Tribes::Logger::GetEngineLogger()->debug(__VA_ARGS__)
#define TRIBES_LOG_INFO(...)     ::Tribes::Logger::GetEngineLogger()->info(__VA_ARGS__)
#define TRIBES_LOG_WARN(...)     ::Tribes::Logger::GetEngineLogger()->warn(__VA_ARGS__)
#define TRIBES_LOG_ERROR(...)    ::Tribes::Logger::GetEngineLogger()->error(__VA_ARGS__)
#define TRIBES_LOG_CRITICAL(...) ::Tribes::Logger::GetEngineLogger()->critical(__VA_ARGS__)

// Convenience macros for application logging
#define APP_LOG_TRACE(...)    ::Tribes::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::Tribes::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::Tribes::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::Tribes::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::Tribes::Logger::GetAppLogger()->error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::Tribes::Logger::GetAppLogger()->critical(__VA_ARGS__)
