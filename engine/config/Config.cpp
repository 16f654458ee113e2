#include "config/Config.hpp"
#include <spdlog/spdlog.h>
#include <iomanip>
#include <vector>

namespace Tribes {

namespace {

std::vector<std::string> SplitKey(std::string_view key) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t end = 0;
    while ((end = key.find('.', start)) != std::string_view::npos) {
        parts.emplace_back(key.substr(start, end - start));
        start = end + 1;
    }
    parts.emplace_back(key.substr(start));
    return parts;
}

} // namespace

Config& Config::Instance() {
    static Config instance;
    return instance;
}

Config::Config()
    : m_data(DefaultDocument()) {
}

bool Config::Load(const std::filesystem::path& filepath) {
    std::unique_lock lock(m_mutex);
    m_filepath = filepath;

    if (!std::filesystem::exists(filepath)) {
        spdlog::warn("Config file not found: {}. Creating default.", filepath.string());
        if (!CreateDefault(filepath)) {
            return false;
        }
    }

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            spdlog::error("Failed to open config file: {}", filepath.string());
            return false;
        }

        m_data = nlohmann::json::parse(file);
        spdlog::info("Loaded configuration from: {}", filepath.string());
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse config file: {}", e.what());
        return false;
    }
}

bool Config::LoadFromString(std::string_view text) {
    try {
        auto parsed = nlohmann::json::parse(text);
        std::unique_lock lock(m_mutex);
        m_data = std::move(parsed);
        return true;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to parse config text: {}", e.what());
        return false;
    }
}

bool Config::Save(const std::filesystem::path& filepath) {
    std::shared_lock lock(m_mutex);
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        spdlog::warn("No config file path set, cannot save");
        return false;
    }

    try {
        // Create parent directories if they don't exist
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            spdlog::error("Failed to open config file for writing: {}", path.string());
            return false;
        }

        file << std::setw(4) << m_data << std::endl;
        spdlog::info("Saved configuration to: {}", path.string());
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config file: {}", e.what());
        return false;
    }
}

bool Config::Reload() {
    std::filesystem::path path;
    {
        std::shared_lock lock(m_mutex);
        path = m_filepath;
    }
    if (path.empty()) {
        spdlog::warn("No config file path set, cannot reload");
        return false;
    }
    return Load(path);
}

void Config::ResetToDefaults() {
    std::unique_lock lock(m_mutex);
    m_data = DefaultDocument();
    m_filepath.clear();
}

bool Config::Has(std::string_view key) const {
    std::shared_lock lock(m_mutex);
    return NavigateToKey(key) != nullptr;
}

nlohmann::json Config::GetSection(std::string_view key) const {
    std::shared_lock lock(m_mutex);
    const auto* node = NavigateToKey(key);
    return node ? *node : nlohmann::json();
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(p)) {
            if (!create) {
                return nullptr;
            }
            (*current)[p] = nlohmann::json::object();
        }
        current = &(*current)[p];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& p : SplitKey(key)) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(p);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

nlohmann::json Config::DefaultDocument() {
    nlohmann::json config;

    // Hex grid layout
    config["hex"]["orientation"] = "pointy";
    config["hex"]["size"] = 32.0;
    config["hex"]["origin"] = {0.0, 0.0};

    // Pathfinding settings
    config["pathfinding"]["max_nodes_explored"] = 0;
    config["pathfinding"]["min_tile_cost"] = 0.0;

    // Logging
    config["logging"]["level"] = "info";
    config["logging"]["file"] = "";

    // Terrain overrides, e.g. {"forest": {"movement_cost": 3}}
    config["terrain"] = nlohmann::json::object();

    return config;
}

bool Config::CreateDefault(const std::filesystem::path& filepath) {
    try {
        // Create parent directories if needed
        if (filepath.has_parent_path()) {
            std::filesystem::create_directories(filepath.parent_path());
        }

        std::ofstream file(filepath);
        if (!file.is_open()) {
            spdlog::error("Failed to create default configuration file: {}", filepath.string());
            return false;
        }
        file << std::setw(4) << DefaultDocument() << std::endl;
        spdlog::info("Created default configuration file: {}", filepath.string());
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Failed to create default configuration file: {}", e.what());
        return false;
    }
}

// =============================================================================
// Typed settings
// =============================================================================

HexGridSettings HexGridSettings::FromConfig(const Config& config) {
    HexGridSettings settings;
    settings.orientation = config.Get<std::string>("hex.orientation", settings.orientation);
    settings.size = config.Get<double>("hex.size", settings.size);
    settings.origin = config.Get<glm::dvec2>("hex.origin", settings.origin);
    return settings;
}

PathfindingSettings PathfindingSettings::FromConfig(const Config& config) {
    PathfindingSettings settings;
    settings.maxNodesExplored = config.Get<int>("pathfinding.max_nodes_explored", settings.maxNodesExplored);
    settings.minTileCost = config.Get<double>("pathfinding.min_tile_cost", settings.minTileCost);
    return settings;
}

LoggingSettings LoggingSettings::FromConfig(const Config& config) {
    LoggingSettings settings;
    settings.level = config.Get<std::string>("logging.level", settings.level);
    settings.file = config.Get<std::string>("logging.file", settings.file);
    return settings;
}

} // namespace Tribes
