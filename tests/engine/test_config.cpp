/**
 * @file test_config.cpp
 * @brief Unit tests for the JSON configuration store and typed settings
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "config/Config.hpp"

#include "utils/TestHelpers.hpp"

#include <filesystem>
#include <fstream>

using namespace Tribes;
using namespace Tribes::Test;

namespace {

std::filesystem::path TestDataPath(const std::string& name) {
#ifdef TRIBES_TEST_DATA_DIR
    std::filesystem::path dir(TRIBES_TEST_DATA_DIR);
#else
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "tribes_tests";
#endif
    std::filesystem::create_directories(dir);
    return dir / name;
}

} // namespace

// =============================================================================
// Config Fixture
// =============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::Instance().ResetToDefaults();
    }

    void TearDown() override {
        Config::Instance().ResetToDefaults();
    }

    Config& config = Config::Instance();
};

TEST_F(ConfigTest, DefaultsArePresent) {
    EXPECT_EQ("pointy", config.Get<std::string>("hex.orientation"));
    EXPECT_DOUBLE_EQ(32.0, config.Get<double>("hex.size"));
    EXPECT_EQ(0, config.Get<int>("pathfinding.max_nodes_explored", -1));
    EXPECT_DOUBLE_EQ(0.0, config.Get<double>("pathfinding.min_tile_cost"));
    EXPECT_EQ("info", config.Get<std::string>("logging.level"));
    EXPECT_TRUE(config.Has("terrain"));
}

TEST_F(ConfigTest, GetMissingKeyReturnsDefault) {
    EXPECT_FALSE(config.Has("hex.missing"));
    EXPECT_EQ(7, config.Get<int>("hex.missing", 7));
    EXPECT_EQ("x", config.Get<std::string>("no.such.path", "x"));
}

TEST_F(ConfigTest, GetWrongTypeReturnsDefault) {
    EXPECT_EQ(5, config.Get<int>("hex.orientation", 5));
}

TEST_F(ConfigTest, SetCreatesIntermediateObjects) {
    config.Set("custom.nested.value", 42);
    EXPECT_TRUE(config.Has("custom.nested"));
    EXPECT_EQ(42, config.Get<int>("custom.nested.value"));
}

TEST_F(ConfigTest, Dvec2RoundTrip) {
    config.Set("hex.origin", glm::dvec2(12.5, -3.0));
    EXPECT_DVEC2_EQ(glm::dvec2(12.5, -3.0), config.Get<glm::dvec2>("hex.origin"));
}

TEST_F(ConfigTest, LoadFromString) {
    ASSERT_TRUE(config.LoadFromString(R"({"hex": {"orientation": "flat", "size": 8}})"));
    EXPECT_EQ("flat", config.Get<std::string>("hex.orientation"));
    EXPECT_DOUBLE_EQ(8.0, config.Get<double>("hex.size"));
}

TEST_F(ConfigTest, LoadFromStringRejectsInvalidJson) {
    EXPECT_FALSE(config.LoadFromString("{ not json"));
    EXPECT_EQ("pointy", config.Get<std::string>("hex.orientation"));
}

TEST_F(ConfigTest, GetSection) {
    config.Set("terrain.forest.movement_cost", 3);
    const auto section = config.GetSection("terrain");

    ASSERT_TRUE(section.is_object());
    EXPECT_EQ(3, section["forest"]["movement_cost"].get<int>());
    EXPECT_TRUE(config.GetSection("nothing").is_null());
}

TEST_F(ConfigTest, SaveAndLoadFile) {
    const auto path = TestDataPath("config_roundtrip.json");
    std::filesystem::remove(path);

    config.Set("hex.size", 20.0);
    ASSERT_TRUE(config.Save(path));

    config.ResetToDefaults();
    EXPECT_DOUBLE_EQ(32.0, config.Get<double>("hex.size"));

    ASSERT_TRUE(config.Load(path));
    EXPECT_DOUBLE_EQ(20.0, config.Get<double>("hex.size"));

    config.Set("hex.size", 1.0);
    ASSERT_TRUE(config.Reload());
    EXPECT_DOUBLE_EQ(20.0, config.Get<double>("hex.size"));
}

TEST_F(ConfigTest, LoadMissingFileCreatesDefault) {
    const auto path = TestDataPath("created_default.json");
    std::filesystem::remove(path);

    ASSERT_TRUE(config.Load(path));
    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ("pointy", config.Get<std::string>("hex.orientation"));
}

TEST_F(ConfigTest, LoadMalformedFileFails) {
    const auto path = TestDataPath("malformed.json");
    {
        std::ofstream file(path);
        file << "{ \"hex\": ";
    }
    EXPECT_FALSE(config.Load(path));
}

TEST_F(ConfigTest, SaveWithoutPathFails) {
    EXPECT_FALSE(config.Save());
    EXPECT_FALSE(config.Reload());
}

// =============================================================================
// Typed Settings
// =============================================================================

TEST_F(ConfigTest, HexGridSettingsFromConfig) {
    config.Set("hex.orientation", std::string("flat"));
    config.Set("hex.size", 24.0);
    config.Set("hex.origin", glm::dvec2(1.0, 2.0));

    const auto settings = HexGridSettings::FromConfig(config);
    EXPECT_EQ("flat", settings.orientation);
    EXPECT_DOUBLE_EQ(24.0, settings.size);
    EXPECT_DVEC2_EQ(glm::dvec2(1.0, 2.0), settings.origin);
}

TEST_F(ConfigTest, PathfindingSettingsFromConfig) {
    config.Set("pathfinding.max_nodes_explored", 500);
    config.Set("pathfinding.min_tile_cost", 0.5);

    const auto settings = PathfindingSettings::FromConfig(config);
    EXPECT_EQ(500, settings.maxNodesExplored);
    EXPECT_DOUBLE_EQ(0.5, settings.minTileCost);
}

TEST_F(ConfigTest, LoggingSettingsFallBackOnMissingKeys) {
    ASSERT_TRUE(config.LoadFromString("{}"));

    const auto settings = LoggingSettings::FromConfig(config);
    EXPECT_EQ("info", settings.level);
    EXPECT_TRUE(settings.file.empty());
}
