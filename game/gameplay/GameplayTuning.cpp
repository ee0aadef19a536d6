#include "game/gameplay/GameplayTuning.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace game::gameplay
{
namespace
{
using json = nlohmann::json;

void ReadInt(const json& root, const char* key, int& out)
{
    if (root.contains(key) && root[key].is_number_integer())
    {
        out = root[key].get<int>();
    }
}

void ReadString(const json& root, const char* key, std::string& out)
{
    if (root.contains(key) && root[key].is_string())
    {
        out = root[key].get<std::string>();
    }
}
} // namespace

void SanitizeTuning(GameplayTuning& tuning)
{
    tuning.fieldWidth = std::max(100, tuning.fieldWidth);
    tuning.fieldHeight = std::max(100, tuning.fieldHeight);
    tuning.playerSize = std::clamp(tuning.playerSize, 1, std::min(tuning.fieldWidth, tuning.fieldHeight));
    tuning.playerSpeed = std::max(0, tuning.playerSpeed);
    tuning.playerBottomMargin = std::clamp(tuning.playerBottomMargin, 0, tuning.fieldHeight - tuning.playerSize);
    tuning.reactionDurationMs = std::max(0, tuning.reactionDurationMs);
    tuning.itemSize = std::clamp(tuning.itemSize, 1, tuning.fieldWidth);
    tuning.itemSpeedMin = std::max(0, tuning.itemSpeedMin);
    tuning.itemSpeedMax = std::max(tuning.itemSpeedMin, tuning.itemSpeedMax);
    tuning.spawnIntervalMs = std::max(1, tuning.spawnIntervalMs);
    tuning.contactMargin = std::max(0, tuning.contactMargin);
    tuning.winThreshold = std::max(1, tuning.winThreshold);
    tuning.messageDurationMs = std::max(1, tuning.messageDurationMs);
    tuning.messageRisePx = std::max(0, tuning.messageRisePx);
    tuning.messageBottomInset = std::clamp(tuning.messageBottomInset, 0, tuning.fieldHeight);
    tuning.endAnimationSize = std::max(1, tuning.endAnimationSize);
}

GameplayTuning TuningFromJson(const json& root)
{
    GameplayTuning tuning;
    if (!root.is_object())
    {
        return tuning;
    }

    ReadInt(root, "asset_version", tuning.assetVersion);
    ReadInt(root, "field_width", tuning.fieldWidth);
    ReadInt(root, "field_height", tuning.fieldHeight);
    ReadInt(root, "player_size", tuning.playerSize);
    ReadInt(root, "player_speed", tuning.playerSpeed);
    ReadInt(root, "player_bottom_margin", tuning.playerBottomMargin);
    ReadInt(root, "reaction_duration_ms", tuning.reactionDurationMs);
    ReadInt(root, "item_size", tuning.itemSize);
    ReadInt(root, "item_speed_min", tuning.itemSpeedMin);
    ReadInt(root, "item_speed_max", tuning.itemSpeedMax);
    ReadInt(root, "spawn_interval_ms", tuning.spawnIntervalMs);
    ReadInt(root, "contact_margin", tuning.contactMargin);
    ReadInt(root, "win_threshold", tuning.winThreshold);
    ReadInt(root, "message_duration_ms", tuning.messageDurationMs);
    ReadInt(root, "message_rise_px", tuning.messageRisePx);
    ReadInt(root, "message_bottom_inset", tuning.messageBottomInset);
    ReadInt(root, "end_animation_size", tuning.endAnimationSize);

    SanitizeTuning(tuning);
    return tuning;
}

json TuningToJson(const GameplayTuning& tuning)
{
    json root;
    root["asset_version"] = tuning.assetVersion;
    root["field_width"] = tuning.fieldWidth;
    root["field_height"] = tuning.fieldHeight;
    root["player_size"] = tuning.playerSize;
    root["player_speed"] = tuning.playerSpeed;
    root["player_bottom_margin"] = tuning.playerBottomMargin;
    root["reaction_duration_ms"] = tuning.reactionDurationMs;
    root["item_size"] = tuning.itemSize;
    root["item_speed_min"] = tuning.itemSpeedMin;
    root["item_speed_max"] = tuning.itemSpeedMax;
    root["spawn_interval_ms"] = tuning.spawnIntervalMs;
    root["contact_margin"] = tuning.contactMargin;
    root["win_threshold"] = tuning.winThreshold;
    root["message_duration_ms"] = tuning.messageDurationMs;
    root["message_rise_px"] = tuning.messageRisePx;
    root["message_bottom_inset"] = tuning.messageBottomInset;
    root["end_animation_size"] = tuning.endAnimationSize;
    return root;
}

AssetPaths AssetPathsFromJson(const json& root)
{
    AssetPaths paths;
    if (!root.is_object())
    {
        return paths;
    }
    ReadString(root, "catcher_sprite", paths.catcherSprite);
    ReadString(root, "reacting_sprite", paths.reactingSprite);
    ReadString(root, "item_sprite", paths.itemSprite);
    ReadString(root, "ending_animation", paths.endingAnimation);
    ReadString(root, "final_animation", paths.finalAnimation);
    ReadString(root, "font", paths.fontPath);
    return paths;
}

json AssetPathsToJson(const AssetPaths& paths)
{
    json root;
    root["catcher_sprite"] = paths.catcherSprite;
    root["reacting_sprite"] = paths.reactingSprite;
    root["item_sprite"] = paths.itemSprite;
    root["ending_animation"] = paths.endingAnimation;
    root["final_animation"] = paths.finalAnimation;
    root["font"] = paths.fontPath;
    return root;
}
} // namespace game::gameplay
