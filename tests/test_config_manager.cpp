#include "config_manager.h"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace
{

class ConfigManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        directory = std::filesystem::temp_directory_path() /
                    ("bigpicture_config_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + "_" +
                     ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(directory);
        configPath = (directory / "bigpicture_input.json").string();
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(directory, ec);
    }

    void writeFile(const std::string& contents)
    {
        std::filesystem::create_directories(directory);
        std::ofstream file(configPath);
        file << contents;
    }

    std::filesystem::path directory;
    std::string configPath;
    ConfigManager manager;
};

} // namespace

TEST_F(ConfigManagerTest, MissingFileYieldsDefaults)
{
    BigPictureConfig config = manager.loadConfig(configPath);
    BigPictureConfig defaults;

    EXPECT_FLOAT_EQ(config.deadzones.stick, 0.3f);
    EXPECT_FLOAT_EQ(config.deadzones.trigger, 0.1f);
    EXPECT_FLOAT_EQ(config.deadzones.pointer, 0.15f);
    EXPECT_FLOAT_EQ(config.deadzones.scroll, 0.25f);
    EXPECT_FLOAT_EQ(config.directionTolerance, 10.0f);
    EXPECT_FLOAT_EQ(config.cursorMargin, 10.0f);
    EXPECT_FLOAT_EQ(config.scrollStep, 20.0f);
    EXPECT_EQ(config.cursorSpeed, PointerSpeed::Normal);
    EXPECT_TRUE(config.navSoundEnabled);
    EXPECT_EQ(config.searchUrlPrefix, defaults.searchUrlPrefix);
}

TEST_F(ConfigManagerTest, SaveThenLoadKeepsValues)
{
    BigPictureConfig config;
    config.deadzones.stick = 0.4f;
    config.directionTolerance = 25.0f;
    config.cursorSpeed = PointerSpeed::Fast;
    config.navSoundEnabled = false;
    config.searchUrlPrefix = "https://duckduckgo.com/?q=";
    config.fontPath = "/tmp/fonts/My \"Font\".ttf";
    config.fontSize = 28;

    ASSERT_TRUE(manager.saveConfig(config, configPath));
    BigPictureConfig loaded = manager.loadConfig(configPath);

    EXPECT_FLOAT_EQ(loaded.deadzones.stick, 0.4f);
    EXPECT_FLOAT_EQ(loaded.directionTolerance, 25.0f);
    EXPECT_EQ(loaded.cursorSpeed, PointerSpeed::Fast);
    EXPECT_FALSE(loaded.navSoundEnabled);
    EXPECT_EQ(loaded.searchUrlPrefix, "https://duckduckgo.com/?q=");
    EXPECT_EQ(loaded.fontPath, "/tmp/fonts/My \"Font\".ttf");
    EXPECT_EQ(loaded.fontSize, 28);
}

TEST_F(ConfigManagerTest, OutOfRangeValuesAreClamped)
{
    writeFile(R"({
  "stickDeadzone": 3.5,
  "triggerDeadzone": -1,
  "directionTolerance": 1000,
  "cursorMargin": -4,
  "scrollStep": 0,
  "fontSize": 500
})");

    BigPictureConfig config = manager.loadConfig(configPath);
    EXPECT_FLOAT_EQ(config.deadzones.stick, 0.95f);
    EXPECT_FLOAT_EQ(config.deadzones.trigger, 0.0f);
    EXPECT_FLOAT_EQ(config.directionTolerance, 200.0f);
    EXPECT_FLOAT_EQ(config.cursorMargin, 0.0f);
    EXPECT_FLOAT_EQ(config.scrollStep, 1.0f);
    EXPECT_EQ(config.fontSize, 72);
}

TEST_F(ConfigManagerTest, InvalidValuesFallBackToDefaults)
{
    BigPictureConfig config = ConfigManager::fromJson(R"({
  "stickDeadzone": "loose",
  "cursorSpeed": "warp",
  "navSoundEnabled": maybe,
  "searchUrlPrefix": ""
})");

    BigPictureConfig defaults;
    EXPECT_FLOAT_EQ(config.deadzones.stick, defaults.deadzones.stick);
    EXPECT_EQ(config.cursorSpeed, PointerSpeed::Normal);
    EXPECT_TRUE(config.navSoundEnabled);
    EXPECT_EQ(config.searchUrlPrefix, defaults.searchUrlPrefix);
}

TEST_F(ConfigManagerTest, SanitizeReplacesNaN)
{
    BigPictureConfig config;
    config.deadzones.pointer = std::nanf("");
    config.scrollStep = std::nanf("");
    ConfigManager::sanitize(config);

    EXPECT_FLOAT_EQ(config.deadzones.pointer, 0.15f);
    EXPECT_FLOAT_EQ(config.scrollStep, 20.0f);
}

TEST_F(ConfigManagerTest, HugeOrNaNFontSizeIsSafe)
{
    BigPictureConfig huge = ConfigManager::fromJson("{\"fontSize\": 1e20}");
    EXPECT_EQ(huge.fontSize, 72);

    BigPictureConfig negative = ConfigManager::fromJson("{\"fontSize\": -1e20}");
    EXPECT_EQ(negative.fontSize, 8);

    BigPictureConfig notANumber = ConfigManager::fromJson("{\"fontSize\": nan}");
    EXPECT_EQ(notANumber.fontSize, BigPictureConfig().fontSize);
}

TEST_F(ConfigManagerTest, JsonNamesCursorSpeed)
{
    BigPictureConfig config;
    config.cursorSpeed = PointerSpeed::Slow;
    std::string json = ConfigManager::toJson(config);
    EXPECT_NE(json.find("\"cursorSpeed\": \"slow\""), std::string::npos);
    EXPECT_NE(json.find("\"navSoundEnabled\": true"), std::string::npos);
}

TEST(PathUtilsTest, StateDirectoryFollowsEnvironment)
{
    const char* previous = std::getenv("BIGPICTURE_STATE_DIR");
    std::string saved = previous ? previous : "";

    setenv("BIGPICTURE_STATE_DIR", "/tmp/bigpicture_state", 1);
    EXPECT_EQ(getStateDirectory(), std::filesystem::path("/tmp/bigpicture_state"));
    EXPECT_EQ(getDefaultConfigPath(), std::filesystem::path("/tmp/bigpicture_state") / "bigpicture_input.json");

    if (previous)
        setenv("BIGPICTURE_STATE_DIR", saved.c_str(), 1);
    else
        unsetenv("BIGPICTURE_STATE_DIR");
}

TEST(PathUtilsTest, StateDirectoryFallsBackToXdgConfigHome)
{
    const char* previousState = std::getenv("BIGPICTURE_STATE_DIR");
    const char* previousXdg = std::getenv("XDG_CONFIG_HOME");
    std::string savedState = previousState ? previousState : "";
    std::string savedXdg = previousXdg ? previousXdg : "";

    // An empty override counts as unset
    setenv("BIGPICTURE_STATE_DIR", "", 1);
    setenv("XDG_CONFIG_HOME", "/tmp/bigpicture_xdg", 1);
    EXPECT_EQ(getStateDirectory(), std::filesystem::path("/tmp/bigpicture_xdg") / "bigpicture");
    EXPECT_TRUE(std::filesystem::is_directory("/tmp/bigpicture_xdg/bigpicture"));

    if (previousState)
        setenv("BIGPICTURE_STATE_DIR", savedState.c_str(), 1);
    else
        unsetenv("BIGPICTURE_STATE_DIR");
    if (previousXdg)
        setenv("XDG_CONFIG_HOME", savedXdg.c_str(), 1);
    else
        unsetenv("XDG_CONFIG_HOME");
}
