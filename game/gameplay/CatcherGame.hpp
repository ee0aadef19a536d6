#pragma once

#include <cstdint>
#include <memory>
#include <random>
#include <vector>

#include "engine/animation/AnimationPlayer.hpp"
#include "engine/core/Rect.hpp"
#include "engine/core/Time.hpp"
#include "engine/platform/InputEvent.hpp"
#include "engine/render/DrawList.hpp"
#include "engine/render/GlyphAtlas.hpp"
#include "game/gameplay/CatchResolver.hpp"
#include "game/gameplay/Catcher.hpp"
#include "game/gameplay/GameplayTuning.hpp"
#include "game/gameplay/SessionState.hpp"
#include "game/gameplay/SpawnScheduler.hpp"

namespace game::gameplay
{

/// Already-decoded resources the session draws with. Any of them may be empty.
struct CatcherAssets
{
    engine::render::ImageHandle catcherImage;
    engine::render::ImageHandle reactingImage;
    engine::render::ImageHandle itemImage;
    std::shared_ptr<const engine::animation::AnimationClip> endingClip;
    std::shared_ptr<const engine::animation::AnimationClip> finalClip;
    std::shared_ptr<const engine::render::GlyphAtlas> largeFont;
    std::shared_ptr<const engine::render::GlyphAtlas> smallFont;
};

/// Session state machine: Playing -> Ended -> Final.
///
/// Per fixed tick while Playing: catcher movement, spawning, item fall, contact/capture,
/// missed-message creation, message fade, win check. Ended and Final only react to events.
class CatcherGame
{
public:
    CatcherGame(const GameplayTuning& tuning, CatcherAssets assets, unsigned int seed);

    /// Arms the spawn scheduler. Call once before the first tick.
    void Start(engine::core::TimeMs nowMs);

    void HandleEvent(const engine::platform::InputEvent& event, engine::core::TimeMs nowMs);
    void FixedUpdate(const CatcherInput& input, engine::core::TimeMs nowMs);

    /// Emits this frame's blits: sprites first, then messages, then status text.
    void Render(engine::core::TimeMs nowMs, engine::render::DrawList& out) const;

    /// Adds an item at an explicit position (the scheduler uses random placement).
    void AddItem(const engine::core::Rect& bounds, int speed);

    [[nodiscard]] GamePhase Phase() const { return m_session.phase; }
    [[nodiscard]] int Score() const { return m_session.score; }
    [[nodiscard]] bool QuitRequested() const { return m_session.quitRequested; }
    [[nodiscard]] const SessionState& Session() const { return m_session; }
    [[nodiscard]] const Catcher& GetCatcher() const { return m_catcher; }
    [[nodiscard]] Catcher& GetCatcher() { return m_catcher; }
    [[nodiscard]] const SpawnScheduler& GetSpawnScheduler() const { return m_spawner; }
    [[nodiscard]] const GameplayTuning& Tuning() const { return m_tuning; }
    [[nodiscard]] const engine::core::Rect& ContinueButtonBounds() const { return m_continueButton; }
    [[nodiscard]] const CatchResult& LastCatchResult() const { return m_lastCatch; }

private:
    void SpawnItem();
    void UpdateItems();
    void DrainMissedSignals(engine::core::TimeMs nowMs);
    void UpdateMessages(engine::core::TimeMs nowMs);
    void CheckWinCondition(engine::core::TimeMs nowMs);

    void RenderPlaying(engine::core::TimeMs nowMs, engine::render::DrawList& out) const;
    void RenderEnded(engine::core::TimeMs nowMs, engine::render::DrawList& out) const;
    void RenderFinal(engine::core::TimeMs nowMs, engine::render::DrawList& out) const;
    void RenderAnimationFrame(const engine::animation::AnimationPlayer& player, engine::core::TimeMs nowMs, engine::render::DrawList& out) const;
    void RenderTextCentered(const engine::render::GlyphAtlas* font, const std::string& text, int centerY, engine::render::DrawList& out) const;

    GameplayTuning m_tuning;
    CatcherAssets m_assets;
    std::mt19937 m_rng;

    SessionState m_session;
    Catcher m_catcher;
    SpawnScheduler m_spawner;
    CatchResolver m_resolver;
    CatchResult m_lastCatch;
    std::vector<MissedSignal> m_missedOutbox;
    std::uint32_t m_nextItemId = 1;

    engine::animation::AnimationPlayer m_endingPlayer;
    engine::animation::AnimationPlayer m_finalPlayer;
    engine::core::Rect m_continueButton;
    engine::render::ImageHandle m_buttonFill;
};

} // namespace game::gameplay
