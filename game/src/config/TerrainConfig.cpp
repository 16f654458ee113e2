#include "TerrainConfig.hpp"

#include <core/Logger.hpp>
#include <pathfinding/HexPathfinder.hpp>

#include <algorithm>
#include <cmath>

namespace Tribes {
namespace Game {

using json = nlohmann::json;

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

TerrainDefinition MakeDefinition(TerrainType type, double cost, bool passable) {
    TerrainDefinition def;
    def.type = type;
    def.movementCost = cost;
    def.passable = passable;
    return def;
}

void ParseDefinition(const std::string& path, const json& j, TerrainDefinition& def,
                     ValidationResult& result) {
    if (!j.is_object()) {
        result.AddError(path, "expected an object");
        return;
    }

    TerrainDefinition parsed = def;

    if (j.contains("passable")) {
        if (!j["passable"].is_boolean()) {
            result.AddError(path + ".passable", "expected a boolean");
            return;
        }
        parsed.passable = j["passable"].get<bool>();
    }

    if (j.contains("movement_cost")) {
        const auto& cost = j["movement_cost"];
        if (cost.is_null()) {
            // JSON has no infinity; null marks impassable
            parsed.passable = false;
        } else if (!cost.is_number()) {
            result.AddError(path + ".movement_cost", "expected a number or null");
            return;
        } else {
            const double value = cost.get<double>();
            if (!(value > 0.0) || !std::isfinite(value)) {
                result.AddError(path + ".movement_cost", "must be a positive finite number");
                return;
            }
            parsed.movementCost = value;
        }
    }

    for (const auto& [key, value] : j.items()) {
        if (key != "movement_cost" && key != "passable") {
            result.AddWarning(path + "." + key, "unknown field ignored");
        }
    }

    def = parsed;
}

} // namespace

// ============================================================================
// Conversions
// ============================================================================

const char* TerrainTypeToString(TerrainType type) {
    switch (type) {
        case TerrainType::Grassland: return "grassland";
        case TerrainType::Plains:    return "plains";
        case TerrainType::Forest:    return "forest";
        case TerrainType::Hills:     return "hills";
        case TerrainType::Mountain:  return "mountain";
        case TerrainType::Water:     return "water";
        case TerrainType::Desert:    return "desert";
        case TerrainType::Jungle:    return "jungle";
        case TerrainType::Marsh:     return "marsh";
    }
    return "grassland";
}

std::optional<TerrainType> StringToTerrainType(std::string_view str) {
    for (TerrainType type : kAllTerrainTypes) {
        if (str == TerrainTypeToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

// ============================================================================
// TerrainDefinition / TerrainTable
// ============================================================================

double TerrainDefinition::EffectiveCost() const {
    return passable ? movementCost : kImpassableCost;
}

TerrainTable::TerrainTable() {
    Set(MakeDefinition(TerrainType::Grassland, 1.0, true));
    Set(MakeDefinition(TerrainType::Plains, 1.0, true));
    Set(MakeDefinition(TerrainType::Forest, 2.0, true));
    Set(MakeDefinition(TerrainType::Hills, 2.0, true));
    Set(MakeDefinition(TerrainType::Mountain, 1.0, false));
    Set(MakeDefinition(TerrainType::Water, 1.0, false));
    Set(MakeDefinition(TerrainType::Desert, 1.0, true));
    Set(MakeDefinition(TerrainType::Jungle, 2.0, true));
    Set(MakeDefinition(TerrainType::Marsh, 2.0, true));
}

const TerrainDefinition& TerrainTable::Get(TerrainType type) const {
    return m_definitions[static_cast<size_t>(type)];
}

void TerrainTable::Set(const TerrainDefinition& definition) {
    m_definitions[static_cast<size_t>(definition.type)] = definition;
}

double TerrainTable::MinPassableCost() const {
    double best = kImpassableCost;
    for (const auto& def : m_definitions) {
        if (def.passable) {
            best = std::min(best, def.movementCost);
        }
    }
    return best;
}

ValidationResult TerrainTable::LoadFromJson(const json& j) {
    ValidationResult result;

    if (j.is_null()) {
        return result;
    }
    if (!j.is_object()) {
        result.AddError("terrain", "expected an object keyed by terrain name");
        return result;
    }

    for (const auto& [name, entry] : j.items()) {
        const std::string path = "terrain." + name;
        auto type = StringToTerrainType(name);
        if (!type) {
            result.AddError(path, "unknown terrain type");
            continue;
        }

        TerrainDefinition def = Get(*type);
        ParseDefinition(path, entry, def, result);
        Set(def);
    }

    for (const auto& error : result.errors) {
        TRIBES_LOG_WARN("Terrain config: {}", error);
    }

    return result;
}

json TerrainTable::ToJson() const {
    json j = json::object();
    for (const auto& def : m_definitions) {
        json entry;
        entry["movement_cost"] = def.passable ? json(def.movementCost) : json(nullptr);
        entry["passable"] = def.passable;
        j[TerrainTypeToString(def.type)] = entry;
    }
    return j;
}

} // namespace Game
} // namespace Tribes
