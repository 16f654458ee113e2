#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace Tribes {
namespace Game {

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Result of loading or validating a config section
 */
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void AddError(const std::string& path, const std::string& message) {
        valid = false;
        errors.push_back("[" + path + "] " + message);
    }

    void AddWarning(const std::string& path, const std::string& message) {
        warnings.push_back("[" + path + "] " + message);
    }
};

// ============================================================================
// Terrain
// ============================================================================

enum class TerrainType {
    Grassland,
    Plains,
    Forest,
    Hills,
    Mountain,
    Water,
    Desert,
    Jungle,
    Marsh
};

inline constexpr size_t kTerrainTypeCount = 9;

inline constexpr std::array<TerrainType, kTerrainTypeCount> kAllTerrainTypes = {
    TerrainType::Grassland, TerrainType::Plains, TerrainType::Forest,
    TerrainType::Hills, TerrainType::Mountain, TerrainType::Water,
    TerrainType::Desert, TerrainType::Jungle, TerrainType::Marsh
};

const char* TerrainTypeToString(TerrainType type);
std::optional<TerrainType> StringToTerrainType(std::string_view str);

/**
 * @brief Movement rules for one terrain type
 */
struct TerrainDefinition {
    TerrainType type = TerrainType::Grassland;
    double movementCost = 1.0;       // Points to enter; ignored when impassable
    bool passable = true;

    /**
     * @brief Cost to enter, +infinity when impassable
     */
    [[nodiscard]] double EffectiveCost() const;
};

/**
 * @brief Terrain definitions indexed by TerrainType
 *
 * Defaults: grassland/plains/desert cost 1, forest/hills/jungle/marsh cost 2,
 * mountain and water are impassable.
 */
class TerrainTable {
public:
    TerrainTable();

    [[nodiscard]] static TerrainTable Defaults() { return TerrainTable(); }

    [[nodiscard]] const TerrainDefinition& Get(TerrainType type) const;
    void Set(const TerrainDefinition& definition);

    /**
     * @brief Effective movement cost for a terrain type
     */
    [[nodiscard]] double MovementCost(TerrainType type) const { return Get(type).EffectiveCost(); }

    /**
     * @brief Cheapest cost among passable terrains (+infinity if none)
     */
    [[nodiscard]] double MinPassableCost() const;

    /**
     * @brief Override entries from {"<terrain>": {"movement_cost": n, "passable": b}}
     *
     * Invalid entries are reported and skipped; valid ones still apply.
     */
    ValidationResult LoadFromJson(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json ToJson() const;

private:
    std::array<TerrainDefinition, kTerrainTypeCount> m_definitions;
};

} // namespace Game
} // namespace Tribes
