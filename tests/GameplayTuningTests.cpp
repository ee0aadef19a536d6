#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "game/gameplay/GameplayTuning.hpp"

using game::gameplay::AssetPaths;
using game::gameplay::GameplayTuning;
using json = nlohmann::json;

TEST(GameplayTuning, DefaultsMatchClassicGame)
{
    const GameplayTuning tuning;
    EXPECT_EQ(tuning.fieldWidth, 600);
    EXPECT_EQ(tuning.fieldHeight, 800);
    EXPECT_EQ(tuning.playerSpeed, 7);
    EXPECT_EQ(tuning.itemSpeedMin, 3);
    EXPECT_EQ(tuning.itemSpeedMax, 7);
    EXPECT_EQ(tuning.spawnIntervalMs, 1000);
    EXPECT_EQ(tuning.winThreshold, 25);
    EXPECT_EQ(tuning.contactMargin, 20);
}

TEST(GameplayTuning, ReadsKnownKeys)
{
    const json root = json::parse(R"({"win_threshold": 10, "spawn_interval_ms": 500, "player_speed": 9})");
    const GameplayTuning tuning = game::gameplay::TuningFromJson(root);
    EXPECT_EQ(tuning.winThreshold, 10);
    EXPECT_EQ(tuning.spawnIntervalMs, 500);
    EXPECT_EQ(tuning.playerSpeed, 9);
    EXPECT_EQ(tuning.fieldWidth, 600);
}

TEST(GameplayTuning, IgnoresMistypedValues)
{
    const json root = json::parse(R"({"player_speed": "fast", "win_threshold": 12.5, "unknown": 3})");
    const GameplayTuning tuning = game::gameplay::TuningFromJson(root);
    EXPECT_EQ(tuning.playerSpeed, 7);
    EXPECT_EQ(tuning.winThreshold, 25);
}

TEST(GameplayTuning, NonObjectGivesDefaults)
{
    const GameplayTuning tuning = game::gameplay::TuningFromJson(json::array({1, 2, 3}));
    EXPECT_EQ(tuning.winThreshold, 25);
}

TEST(GameplayTuning, ClampsInconsistentValues)
{
    const json root = json::parse(R"({
        "item_speed_min": 9,
        "item_speed_max": 2,
        "win_threshold": 0,
        "spawn_interval_ms": -5,
        "player_size": 5000,
        "contact_margin": -3
    })");
    const GameplayTuning tuning = game::gameplay::TuningFromJson(root);
    EXPECT_EQ(tuning.itemSpeedMin, 9);
    EXPECT_EQ(tuning.itemSpeedMax, 9);
    EXPECT_EQ(tuning.winThreshold, 1);
    EXPECT_EQ(tuning.spawnIntervalMs, 1);
    EXPECT_EQ(tuning.playerSize, 600);
    EXPECT_EQ(tuning.playerBottomMargin, 20);
    EXPECT_EQ(tuning.contactMargin, 0);
}

TEST(GameplayTuning, WritesEveryField)
{
    GameplayTuning tuning;
    tuning.winThreshold = 40;
    tuning.messageDurationMs = 1500;
    const json root = game::gameplay::TuningToJson(tuning);
    EXPECT_EQ(root.at("win_threshold").get<int>(), 40);
    EXPECT_EQ(root.at("message_duration_ms").get<int>(), 1500);
    EXPECT_EQ(root.at("field_height").get<int>(), 800);
    EXPECT_EQ(game::gameplay::TuningFromJson(root).winThreshold, 40);
}

TEST(AssetPaths, ReadsOverridesAndKeepsDefaults)
{
    const json root = json::parse(R"({"font": "fonts/arcade.ttf", "item_sprite": 12})");
    const AssetPaths paths = game::gameplay::AssetPathsFromJson(root);
    EXPECT_EQ(paths.fontPath, "fonts/arcade.ttf");
    EXPECT_EQ(paths.itemSprite, "sprites/heart.png");
    EXPECT_EQ(paths.endingAnimation, "sprites/dog.gif");
}
