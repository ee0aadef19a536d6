#include <gtest/gtest.h>

#include <memory>
#include <utility>
#include <vector>

#include "game/gameplay/CatcherGame.hpp"

using engine::core::Rect;
using engine::core::TimeMs;
using engine::platform::InputEvent;
using engine::render::BakedGlyph;
using engine::render::DrawList;
using engine::render::GlyphAtlas;
using game::gameplay::CatcherAssets;
using game::gameplay::CatcherGame;
using game::gameplay::CatcherInput;
using game::gameplay::GamePhase;
using game::gameplay::GameplayTuning;

namespace
{
// Every printable glyph is a 1x1 cell advancing 5 px.
std::shared_ptr<const GlyphAtlas> MakeAtlas()
{
    std::vector<BakedGlyph> glyphs;
    for (int code = GlyphAtlas::kFirstCodepoint; code <= GlyphAtlas::kLastCodepoint; ++code)
    {
        glyphs.push_back(BakedGlyph{code, 0, 0, 1, 1, 0.0F, -8.0F, 5.0F});
    }
    return std::make_shared<const GlyphAtlas>(engine::render::MakeSolidImage(4, 4, glm::vec4{1.0F}), std::move(glyphs), 8.0F, 10.0F);
}

class CatcherGameTest : public ::testing::Test
{
protected:
    CatcherGameTest()
    {
        // Keep random spawns out of the way; tests place items explicitly.
        tuning.spawnIntervalMs = 1000000;

        assets.catcherImage = engine::render::MakeSolidImage(80, 80, glm::vec4{0.0F, 1.0F, 0.0F, 1.0F});
        assets.reactingImage = engine::render::MakeSolidImage(80, 80, glm::vec4{1.0F, 1.0F, 0.0F, 1.0F});
        assets.itemImage = engine::render::MakeSolidImage(50, 50, glm::vec4{1.0F, 0.0F, 0.0F, 1.0F});
        assets.endingClip = std::make_shared<const engine::animation::AnimationClip>(
            engine::animation::AnimationClip::FromStill("ending", engine::render::MakeSolidImage(200, 200, glm::vec4{0.0F, 0.0F, 1.0F, 1.0F}))
        );
        assets.finalClip = assets.endingClip;
        assets.largeFont = MakeAtlas();
        assets.smallFont = MakeAtlas();
    }

    std::unique_ptr<CatcherGame> MakeGame()
    {
        auto game = std::make_unique<CatcherGame>(tuning, assets, 42U);
        game->Start(0);
        return game;
    }

    // One capture per tick with an item dropped on top of the catcher.
    TimeMs CaptureUntil(CatcherGame& game, int score, TimeMs now)
    {
        while (game.Score() < score && game.Phase() == GamePhase::Playing)
        {
            game.AddItem(Rect{270, 710, 50, 50}, 0);
            now += 16;
            game.FixedUpdate(CatcherInput{}, now);
        }
        return now;
    }

    GameplayTuning tuning;
    CatcherAssets assets;
};
} // namespace

TEST_F(CatcherGameTest, StartsPlayingWithZeroScore)
{
    const auto game = MakeGame();
    EXPECT_EQ(game->Phase(), GamePhase::Playing);
    EXPECT_EQ(game->Score(), 0);
    EXPECT_FALSE(game->QuitRequested());
    EXPECT_TRUE(game->GetSpawnScheduler().IsRunning());
}

TEST_F(CatcherGameTest, SchedulerSpawnsOneItemPerPeriod)
{
    tuning.spawnIntervalMs = 1000;
    const auto game = MakeGame();
    game->FixedUpdate(CatcherInput{}, 999);
    EXPECT_TRUE(game->Session().items.empty());
    game->FixedUpdate(CatcherInput{}, 1000);
    ASSERT_EQ(game->Session().items.size(), 1U);
    game->FixedUpdate(CatcherInput{}, 1016);
    EXPECT_EQ(game->Session().items.size(), 1U);
    game->FixedUpdate(CatcherInput{}, 2016);
    EXPECT_EQ(game->Session().items.size(), 2U);
}

TEST_F(CatcherGameTest, HeldInputMovesCatcher)
{
    const auto game = MakeGame();
    CatcherInput left;
    left.moveLeft = true;
    game->FixedUpdate(left, 16);
    EXPECT_EQ(game->GetCatcher().Bounds().x, 253);
}

TEST_F(CatcherGameTest, MissedItemLeavesFadingMessage)
{
    const auto game = MakeGame();
    game->AddItem(Rect{0, 795, 50, 50}, 10);
    game->FixedUpdate(CatcherInput{}, 100);

    EXPECT_TRUE(game->Session().items.empty());
    ASSERT_EQ(game->Session().messages.size(), 1U);
    const auto& message = game->Session().messages.front();
    EXPECT_EQ(message.Text(), "you hate me :(");
    EXPECT_EQ(message.CreatedAt(), 100);
    EXPECT_EQ(message.Anchor(), glm::ivec2(25, 750));
    EXPECT_EQ(game->Score(), 0);

    game->FixedUpdate(CatcherInput{}, 1099);
    EXPECT_EQ(game->Session().messages.size(), 1U);
    game->FixedUpdate(CatcherInput{}, 1100);
    EXPECT_TRUE(game->Session().messages.empty());
}

TEST_F(CatcherGameTest, CaptureScoresAndReacts)
{
    const auto game = MakeGame();
    game->AddItem(Rect{270, 710, 50, 50}, 0);
    game->FixedUpdate(CatcherInput{}, 16);
    EXPECT_EQ(game->Score(), 1);
    EXPECT_TRUE(game->Session().items.empty());
    EXPECT_TRUE(game->GetCatcher().IsReacting(16));
    EXPECT_EQ(game->LastCatchResult().captured, 1);
}

TEST_F(CatcherGameTest, WinThresholdEndsSessionOnce)
{
    const auto game = MakeGame();
    TimeMs now = CaptureUntil(*game, 24, 0);
    ASSERT_EQ(game->Score(), 24);
    EXPECT_EQ(game->Phase(), GamePhase::Playing);

    // Leave an unrelated item and a live message behind when the last catch lands
    game->AddItem(Rect{500, 0, 50, 50}, 0);
    game->AddItem(Rect{0, 795, 50, 50}, 10);
    game->AddItem(Rect{270, 710, 50, 50}, 0);
    now += 16;
    game->FixedUpdate(CatcherInput{}, now);

    EXPECT_EQ(game->Score(), 25);
    EXPECT_EQ(game->Phase(), GamePhase::Ended);
    EXPECT_EQ(game->Session().phaseEnteredMs, now);
    EXPECT_TRUE(game->Session().items.empty());
    EXPECT_TRUE(game->Session().messages.empty());
    EXPECT_FALSE(game->GetSpawnScheduler().IsRunning());

    const TimeMs endedAt = now;
    game->AddItem(Rect{270, 710, 50, 50}, 0);
    for (int i = 0; i < 10; ++i)
    {
        now += 16;
        game->FixedUpdate(CatcherInput{}, now);
    }
    EXPECT_EQ(game->Phase(), GamePhase::Ended);
    EXPECT_EQ(game->Session().phaseEnteredMs, endedAt);
    EXPECT_EQ(game->Score(), 25);
}

TEST_F(CatcherGameTest, ConfigurableWinThreshold)
{
    tuning.winThreshold = 3;
    const auto game = MakeGame();
    CaptureUntil(*game, 3, 0);
    EXPECT_EQ(game->Phase(), GamePhase::Ended);
}

TEST_F(CatcherGameTest, ContinueButtonLeadsToFinal)
{
    tuning.winThreshold = 1;
    const auto game = MakeGame();
    CaptureUntil(*game, 1, 0);
    ASSERT_EQ(game->Phase(), GamePhase::Ended);

    const Rect button = game->ContinueButtonBounds();
    EXPECT_EQ(button, (Rect{220, 478, 160, 44}));

    game->HandleEvent(InputEvent::MouseDown(0, glm::vec2{10.0F, 10.0F}), 100);
    EXPECT_EQ(game->Phase(), GamePhase::Ended);
    game->HandleEvent(InputEvent::KeyDown(32), 100);
    EXPECT_EQ(game->Phase(), GamePhase::Ended);
    EXPECT_FALSE(game->QuitRequested());

    game->HandleEvent(InputEvent::MouseDown(0, glm::vec2{300.0F, 500.0F}), 200);
    EXPECT_EQ(game->Phase(), GamePhase::Final);
    EXPECT_EQ(game->Session().phaseEnteredMs, 200);
}

TEST_F(CatcherGameTest, AnyKeyInFinalRequestsQuit)
{
    tuning.winThreshold = 1;
    const auto game = MakeGame();
    CaptureUntil(*game, 1, 0);
    game->HandleEvent(InputEvent::MouseDown(0, glm::vec2{300.0F, 500.0F}), 100);
    ASSERT_EQ(game->Phase(), GamePhase::Final);

    game->HandleEvent(InputEvent::MouseDown(0, glm::vec2{300.0F, 500.0F}), 150);
    EXPECT_FALSE(game->QuitRequested());
    EXPECT_EQ(game->Phase(), GamePhase::Final);

    game->HandleEvent(InputEvent::KeyDown(65), 200);
    EXPECT_TRUE(game->QuitRequested());
    EXPECT_EQ(game->Phase(), GamePhase::Final);
}

TEST_F(CatcherGameTest, ClickWhilePlayingDoesNothing)
{
    const auto game = MakeGame();
    game->HandleEvent(InputEvent::MouseDown(0, glm::vec2{300.0F, 500.0F}), 10);
    game->HandleEvent(InputEvent::KeyDown(65), 10);
    EXPECT_EQ(game->Phase(), GamePhase::Playing);
    EXPECT_FALSE(game->QuitRequested());
}

TEST_F(CatcherGameTest, QuitWorksInEveryPhase)
{
    {
        const auto game = MakeGame();
        game->HandleEvent(InputEvent::Quit(), 0);
        EXPECT_TRUE(game->QuitRequested());
    }
    {
        tuning.winThreshold = 1;
        const auto game = MakeGame();
        CaptureUntil(*game, 1, 0);
        ASSERT_EQ(game->Phase(), GamePhase::Ended);
        game->HandleEvent(InputEvent::Quit(), 100);
        EXPECT_TRUE(game->QuitRequested());
    }
}

TEST_F(CatcherGameTest, PlayingDrawOrder)
{
    assets.largeFont = MakeAtlas();
    const auto game = MakeGame();
    game->AddItem(Rect{0, 100, 50, 50}, 0);
    game->AddItem(Rect{0, 795, 50, 50}, 10);
    game->FixedUpdate(CatcherInput{}, 10);
    ASSERT_EQ(game->Session().messages.size(), 1U);

    DrawList list;
    game->Render(10, list);

    // catcher, item, 14 message glyphs, 8 score glyphs
    ASSERT_EQ(list.Size(), 24U);
    const auto& commands = list.Commands();
    EXPECT_EQ(commands[0].image, assets.catcherImage.get());
    EXPECT_EQ(commands[0].destination, (Rect{260, 700, 80, 80}));
    EXPECT_EQ(commands[1].image, assets.itemImage.get());
    for (std::size_t i = 2; i < 16; ++i)
    {
        EXPECT_EQ(commands[i].image, assets.smallFont->AtlasImage());
    }
    for (std::size_t i = 16; i < 24; ++i)
    {
        EXPECT_EQ(commands[i].image, assets.largeFont->AtlasImage());
    }
    EXPECT_EQ(commands[16].destination.x, 10);
}

TEST_F(CatcherGameTest, EndedScreenShowsAnimationAndButton)
{
    tuning.winThreshold = 1;
    const auto game = MakeGame();
    const TimeMs now = CaptureUntil(*game, 1, 0);
    ASSERT_EQ(game->Phase(), GamePhase::Ended);

    DrawList list;
    game->Render(now, list);
    ASSERT_FALSE(list.Empty());
    EXPECT_EQ(list.Commands()[0].image, assets.endingClip->frames[0].image.get());
    EXPECT_EQ(list.Commands()[0].destination, (Rect{200, 150, 200, 200}));

    bool sawButton = false;
    for (const auto& command : list.Commands())
    {
        sawButton = sawButton || command.destination == game->ContinueButtonBounds();
    }
    EXPECT_TRUE(sawButton);
}

TEST_F(CatcherGameTest, MissingAssetsStillRun)
{
    CatcherGame game(tuning, CatcherAssets{}, 7U);
    game.Start(0);
    game.AddItem(Rect{270, 710, 50, 50}, 0);
    game.FixedUpdate(CatcherInput{}, 16);
    EXPECT_EQ(game.Score(), 1);

    DrawList list;
    game.Render(16, list);
    EXPECT_TRUE(list.Empty());
}
