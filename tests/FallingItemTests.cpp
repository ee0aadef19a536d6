#include <gtest/gtest.h>

#include <optional>
#include <random>

#include "game/gameplay/FallingItem.hpp"

using game::gameplay::FallingItem;
using game::gameplay::GameplayTuning;
using game::gameplay::MissedSignal;

TEST(FallingItem, FallsBySpeedEachTick)
{
    FallingItem item(1, nullptr, engine::core::Rect{100, -50, 50, 50}, 4);
    EXPECT_FALSE(item.Update(800).has_value());
    EXPECT_EQ(item.Bounds().y, -46);
    EXPECT_FALSE(item.Update(800).has_value());
    EXPECT_EQ(item.Bounds().y, -42);
}

TEST(FallingItem, SignalsMissedExactlyOnce)
{
    FallingItem item(7, nullptr, engine::core::Rect{0, 790, 50, 50}, 5);
    EXPECT_FALSE(item.Update(800).has_value());   // 795
    EXPECT_FALSE(item.Update(800).has_value());   // 800, still on the edge

    const std::optional<MissedSignal> missed = item.Update(800);
    ASSERT_TRUE(missed.has_value());
    EXPECT_EQ(missed->itemId, 7U);
    EXPECT_EQ(missed->position, glm::ivec2(25, 830));
    EXPECT_TRUE(item.IsRemoved());

    for (int i = 0; i < 10; ++i)
    {
        EXPECT_FALSE(item.Update(800).has_value());
    }
    EXPECT_EQ(item.Bounds().y, 805);
}

TEST(FallingItem, RemovedItemNeverSignals)
{
    FallingItem item(2, nullptr, engine::core::Rect{0, 900, 50, 50}, 5);
    item.MarkRemoved();
    EXPECT_FALSE(item.Update(800).has_value());
}

TEST(FallingItem, RandomSpawnStaysInConfiguredRanges)
{
    const GameplayTuning tuning;
    std::mt19937 rng(1234U);
    bool sawMinSpeed = false;
    bool sawMaxSpeed = false;
    for (std::uint32_t id = 0; id < 2000; ++id)
    {
        const FallingItem item(id, nullptr, tuning, rng);
        EXPECT_GE(item.Bounds().x, 0);
        EXPECT_LE(item.Bounds().x, tuning.fieldWidth - tuning.itemSize);
        EXPECT_EQ(item.Bounds().y, -tuning.itemSize);
        EXPECT_EQ(item.Bounds().w, tuning.itemSize);
        EXPECT_GE(item.Speed(), tuning.itemSpeedMin);
        EXPECT_LE(item.Speed(), tuning.itemSpeedMax);
        sawMinSpeed = sawMinSpeed || item.Speed() == tuning.itemSpeedMin;
        sawMaxSpeed = sawMaxSpeed || item.Speed() == tuning.itemSpeedMax;
    }
    EXPECT_TRUE(sawMinSpeed);
    EXPECT_TRUE(sawMaxSpeed);
}
