#pragma once

#include <string>

#include <nlohmann/json_fwd.hpp>

namespace game::gameplay
{
/// Gameplay constants, loaded from config/gameplay.json.
/// Lengths are play-field pixels, speeds are pixels per fixed tick, times are milliseconds.
struct GameplayTuning
{
    int assetVersion = 1;

    int fieldWidth = 600;
    int fieldHeight = 800;

    int playerSize = 80;
    int playerSpeed = 7;
    int playerBottomMargin = 20;
    int reactionDurationMs = 1000;

    int itemSize = 50;
    int itemSpeedMin = 3;
    int itemSpeedMax = 7;
    int spawnIntervalMs = 1000;

    int contactMargin = 20;
    int winThreshold = 25;

    int messageDurationMs = 1000;
    int messageRisePx = 30;
    int messageBottomInset = 50;

    int endAnimationSize = 200;
};

/// Sprite and font sources. Missing files fall back to placeholders.
struct AssetPaths
{
    std::string catcherSprite = "sprites/default.png";
    std::string reactingSprite = "sprites/noms.png";
    std::string itemSprite = "sprites/heart.png";
    std::string endingAnimation = "sprites/dog.gif";
    std::string finalAnimation = "sprites/final.gif";
    std::string fontPath;
};

/// Reads known keys, ignoring missing or mistyped ones, then clamps to sane ranges.
[[nodiscard]] GameplayTuning TuningFromJson(const nlohmann::json& root);
[[nodiscard]] nlohmann::json TuningToJson(const GameplayTuning& tuning);

[[nodiscard]] AssetPaths AssetPathsFromJson(const nlohmann::json& root);
[[nodiscard]] nlohmann::json AssetPathsToJson(const AssetPaths& paths);

/// Enforces the invariants the simulation relies on (positive sizes, min <= max speed, ...).
void SanitizeTuning(GameplayTuning& tuning);
} // namespace game::gameplay
