#include <gtest/gtest.h>
#include "../Configuration/GameConfiguration.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

TEST(GameConfigurationTest, EmptyObjectKeepsDefaults) {
    auto config = grape::GameConfiguration::parse("{}");
    EXPECT_EQ(config.window.title, "Grape");
    EXPECT_EQ(config.window.width, 800);
    EXPECT_EQ(config.window.height, 600);
    EXPECT_FALSE(config.window.fullScreen);
    EXPECT_EQ(config.window.background.g, 20);
    EXPECT_EQ(config.rocket.image, "rocket.png");
    EXPECT_FLOAT_EQ(config.rocket.scale, 0.2f);
    EXPECT_TRUE(config.rocket.transparentFromCorner);
    EXPECT_EQ(config.updatePeriodMs, 4);
    EXPECT_TRUE(config.debugOverlay);
}

TEST(GameConfigurationTest, ReadsAllMembers) {
    auto config = grape::GameConfiguration::parse(R"({
        "window": { "title": "Rocket", "width": 1024, "height": 768, "fullScreen": true, "background": [1, 2, 3, 4] },
        "rocket": { "image": "ship.png", "icon": "ship.bmp", "scale": 0.5, "spin": 90, "speed": 120.5,
                    "heading": 45, "transparentFromCorner": false },
        "updatePeriodMs": 16,
        "debugOverlay": false
    })");
    EXPECT_EQ(config.window.title, "Rocket");
    EXPECT_EQ(config.window.width, 1024);
    EXPECT_EQ(config.window.height, 768);
    EXPECT_TRUE(config.window.fullScreen);
    EXPECT_EQ(config.window.background.r, 1);
    EXPECT_EQ(config.window.background.a, 4);
    EXPECT_EQ(config.rocket.image, "ship.png");
    EXPECT_EQ(config.rocket.icon, "ship.bmp");
    EXPECT_FLOAT_EQ(config.rocket.scale, 0.5f);
    EXPECT_FLOAT_EQ(config.rocket.spin, 90);
    EXPECT_FLOAT_EQ(config.rocket.speed, 120.5f);
    EXPECT_FLOAT_EQ(config.rocket.heading, 45);
    EXPECT_FALSE(config.rocket.transparentFromCorner);
    EXPECT_EQ(config.updatePeriodMs, 16);
    EXPECT_FALSE(config.debugOverlay);
}

TEST(GameConfigurationTest, PartialBackgroundKeepsMissingComponents) {
    auto config = grape::GameConfiguration::parse(R"({ "window": { "background": [300, -5] } })");
    EXPECT_EQ(config.window.background.r, 255);
    EXPECT_EQ(config.window.background.g, 0);
    EXPECT_EQ(config.window.background.b, 0);
    EXPECT_EQ(config.window.background.a, 255);
}

TEST(GameConfigurationTest, NonPositivePeriodIsClamped) {
    auto config = grape::GameConfiguration::parse(R"({ "updatePeriodMs": 0 })");
    EXPECT_EQ(config.updatePeriodMs, 1);
}

TEST(GameConfigurationTest, MalformedJsonThrows) {
    EXPECT_THROW(grape::GameConfiguration::parse("{ \"window\": "), std::runtime_error);
    EXPECT_THROW(grape::GameConfiguration::parse("[1, 2]"), std::runtime_error);
}

TEST(GameConfigurationTest, LoadFromFile) {
    auto path = fs::temp_directory_path() / "grape-config-test.json";
    {
        std::ofstream ofs(path);
        ofs << R"({ "window": { "title": "From file" } })";
    }
    auto config = grape::GameConfiguration::load(path);
    EXPECT_EQ(config.window.title, "From file");
    fs::remove(path);

    EXPECT_THROW(grape::GameConfiguration::load(fs::temp_directory_path() / "grape-missing.json"), std::runtime_error);
}
