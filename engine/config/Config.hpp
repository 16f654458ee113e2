#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <nlohmann/json.hpp>
#include <glm/glm.hpp>

namespace Tribes {

/**
 * @brief JSON-based configuration for hex grid, pathfinding and logging settings
 *
 * Keys are dot-separated paths into the document (e.g. "hex.size").
 */
class Config {
public:
    static Config& Instance();

    // Delete copy/move for singleton
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from JSON file
     *
     * A missing file is created with default values first.
     * @param filepath Path to configuration file
     * @return true if loaded successfully
     */
    bool Load(const std::filesystem::path& filepath);

    /**
     * @brief Replace the document with parsed JSON text
     * @return false if the text is not valid JSON (document unchanged)
     */
    bool LoadFromString(std::string_view text);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     * @return true if saved successfully
     */
    bool Save(const std::filesystem::path& filepath = "");

    /**
     * @brief Reload configuration from disk
     * @return true if reloaded successfully
     */
    bool Reload();

    /**
     * @brief Reset to the default document
     */
    void ResetToDefaults();

    /**
     * @brief Get a configuration value with type safety
     * @tparam T The expected type
     * @param key Dot-separated key path (e.g., "hex.size")
     * @param defaultValue Value to return if key not found or mistyped
     */
    template<typename T>
    T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    /**
     * @brief Check if a key exists
     */
    bool Has(std::string_view key) const;

    /**
     * @brief Copy of the sub-document at key (null if missing)
     */
    nlohmann::json GetSection(std::string_view key) const;

    /**
     * @brief The default configuration document
     */
    static nlohmann::json DefaultDocument();

    /**
     * @brief Create default configuration file
     */
    static bool CreateDefault(const std::filesystem::path& filepath);

private:
    Config();
    ~Config() = default;

    nlohmann::json m_data;
    std::filesystem::path m_filepath;
    mutable std::shared_mutex m_mutex;

    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    std::shared_lock lock(m_mutex);
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        if constexpr (std::is_same_v<T, glm::dvec2>) {
            if (node->is_array() && node->size() >= 2) {
                return glm::dvec2((*node)[0].get<double>(), (*node)[1].get<double>());
            }
        } else {
            return node->get<T>();
        }
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
    return defaultValue;
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    std::unique_lock lock(m_mutex);
    auto* node = NavigateToKey(key, true);
    if (node) {
        if constexpr (std::is_same_v<T, glm::dvec2>) {
            *node = nlohmann::json::array({value.x, value.y});
        } else {
            *node = value;
        }
    }
}

/**
 * @brief Hex grid layout defaults
 */
struct HexGridSettings {
    std::string orientation = "pointy";  // "pointy" or "flat"
    double size = 32.0;                  // Center to corner, in pixels
    glm::dvec2 origin{0.0, 0.0};

    static HexGridSettings FromConfig(const Config& config);
};

/**
 * @brief Pathfinding search defaults
 */
struct PathfindingSettings {
    int maxNodesExplored = 0;   // 0 = unlimited
    double minTileCost = 0.0;   // Heuristic scale, must not exceed any tile cost

    static PathfindingSettings FromConfig(const Config& config);
};

/**
 * @brief Logging defaults
 */
struct LoggingSettings {
    std::string level = "info";
    std::string file;

    static LoggingSettings FromConfig(const Config& config);
};

} // namespace Tribes
