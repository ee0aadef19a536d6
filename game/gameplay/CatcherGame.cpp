#include "game/gameplay/CatcherGame.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <utility>

namespace game::gameplay
{
namespace
{
constexpr const char* kMissedText = "you hate me :(";
constexpr const char* kWinText = "Game Over! You Win!";
constexpr const char* kContinueText = "Continue";
constexpr const char* kClosingText = "Thank you for playing!";
constexpr const char* kExitPromptText = "Press any key to exit";

constexpr int kButtonWidth = 160;
constexpr int kButtonHeight = 44;

const glm::vec4 kTextColor{0.0F, 0.0F, 0.0F, 1.0F};
const glm::vec4 kButtonColor{0.0F, 200.0F / 255.0F, 0.0F, 1.0F};
const glm::vec4 kButtonTextColor{1.0F, 1.0F, 1.0F, 1.0F};

GameplayTuning Sanitized(GameplayTuning tuning)
{
    SanitizeTuning(tuning);
    return tuning;
}
} // namespace

const char* GamePhaseToString(GamePhase phase)
{
    switch (phase)
    {
        case GamePhase::Playing: return "Playing";
        case GamePhase::Ended: return "Ended";
        case GamePhase::Final: return "Final";
    }
    return "Unknown";
}

CatcherGame::CatcherGame(const GameplayTuning& tuning, CatcherAssets assets, unsigned int seed)
    : m_tuning(Sanitized(tuning))
    , m_assets(std::move(assets))
    , m_rng(seed)
    , m_catcher(m_tuning, m_assets.catcherImage, m_assets.reactingImage)
    , m_spawner(static_cast<engine::core::TimeMs>(m_tuning.spawnIntervalMs))
    , m_resolver(m_tuning.contactMargin)
    , m_endingPlayer(m_assets.endingClip, 0)
    , m_finalPlayer(m_assets.finalClip, 0)
    , m_continueButton(engine::core::Rect::CenteredAt(
          m_tuning.fieldWidth / 2,
          m_tuning.fieldHeight / 2 + 100,
          kButtonWidth,
          kButtonHeight
      ))
    , m_buttonFill(engine::render::MakeSolidImage(1, 1, kButtonColor))
{
}

void CatcherGame::Start(engine::core::TimeMs nowMs)
{
    m_session.phaseEnteredMs = nowMs;
    if (m_session.phase == GamePhase::Playing)
    {
        m_spawner.Start(nowMs);
    }
}

void CatcherGame::HandleEvent(const engine::platform::InputEvent& event, engine::core::TimeMs nowMs)
{
    using Type = engine::platform::InputEvent::Type;

    if (event.type == Type::Quit)
    {
        m_session.quitRequested = true;
        return;
    }

    switch (m_session.phase)
    {
        case GamePhase::Playing:
            break;
        case GamePhase::Ended:
            if (event.type == Type::MouseButtonDown && m_continueButton.Contains(event.position.x, event.position.y))
            {
                if (m_session.AdvancePhase(GamePhase::Final, nowMs))
                {
                    m_finalPlayer.Restart(nowMs);
                }
            }
            break;
        case GamePhase::Final:
            if (event.type == Type::KeyDown)
            {
                m_session.quitRequested = true;
            }
            break;
    }
}

void CatcherGame::FixedUpdate(const CatcherInput& input, engine::core::TimeMs nowMs)
{
    if (m_session.phase == GamePhase::Playing)
    {
        m_catcher.Update(input, nowMs);

        if (m_spawner.Poll(nowMs))
        {
            SpawnItem();
        }

        UpdateItems();
        m_lastCatch = m_resolver.Resolve(m_session, m_catcher, nowMs);
        DrainMissedSignals(nowMs);
    }

    UpdateMessages(nowMs);

    if (m_session.phase == GamePhase::Playing)
    {
        CheckWinCondition(nowMs);
    }
}

void CatcherGame::AddItem(const engine::core::Rect& bounds, int speed)
{
    m_session.items.emplace_back(m_nextItemId++, m_assets.itemImage, bounds, speed);
}

void CatcherGame::SpawnItem()
{
    m_session.items.emplace_back(m_nextItemId++, m_assets.itemImage, m_tuning, m_rng);
}

void CatcherGame::UpdateItems()
{
    for (FallingItem& item : m_session.items)
    {
        if (std::optional<MissedSignal> missed = item.Update(m_tuning.fieldHeight))
        {
            m_missedOutbox.push_back(*missed);
        }
    }
    m_session.items.erase(
        std::remove_if(m_session.items.begin(), m_session.items.end(), [](const FallingItem& item) { return item.IsRemoved(); }),
        m_session.items.end()
    );
}

void CatcherGame::DrainMissedSignals(engine::core::TimeMs nowMs)
{
    for (const MissedSignal& missed : m_missedOutbox)
    {
        // Exit position is below the field; pull the message back on screen
        glm::ivec2 anchor = missed.position;
        anchor.y = std::min(anchor.y, m_tuning.fieldHeight - m_tuning.messageBottomInset);
        m_session.messages.emplace_back(
            kMissedText,
            anchor,
            nowMs,
            static_cast<engine::core::TimeMs>(m_tuning.messageDurationMs),
            m_tuning.messageRisePx
        );
    }
    m_missedOutbox.clear();
}

void CatcherGame::UpdateMessages(engine::core::TimeMs nowMs)
{
    for (FloatingText& message : m_session.messages)
    {
        message.Update(nowMs);
    }
    m_session.messages.erase(
        std::remove_if(m_session.messages.begin(), m_session.messages.end(), [](const FloatingText& message) { return message.IsDead(); }),
        m_session.messages.end()
    );
}

void CatcherGame::CheckWinCondition(engine::core::TimeMs nowMs)
{
    if (m_session.score < m_tuning.winThreshold)
    {
        return;
    }
    if (m_session.AdvancePhase(GamePhase::Ended, nowMs))
    {
        m_spawner.Stop();
        m_session.ClearActive();
        m_missedOutbox.clear();
        m_endingPlayer.Restart(nowMs);
    }
}

void CatcherGame::Render(engine::core::TimeMs nowMs, engine::render::DrawList& out) const
{
    switch (m_session.phase)
    {
        case GamePhase::Playing:
            RenderPlaying(nowMs, out);
            break;
        case GamePhase::Ended:
            RenderEnded(nowMs, out);
            break;
        case GamePhase::Final:
            RenderFinal(nowMs, out);
            break;
    }
}

void CatcherGame::RenderPlaying(engine::core::TimeMs nowMs, engine::render::DrawList& out) const
{
    out.DrawImage(m_catcher.ImageAt(nowMs), m_catcher.Bounds());
    for (const FallingItem& item : m_session.items)
    {
        out.DrawImage(item.GetImage(), item.Bounds());
    }

    if (m_assets.smallFont != nullptr)
    {
        for (const FloatingText& message : m_session.messages)
        {
            glm::vec4 color = kTextColor;
            color.a = message.Opacity01();
            m_assets.smallFont->AppendTextCentered(out, message.Text(), message.Position().x, message.Position().y, color);
        }
    }

    if (m_assets.largeFont != nullptr)
    {
        m_assets.largeFont->AppendText(out, "Score: " + std::to_string(m_session.score), 10, 10, kTextColor);
    }
}

void CatcherGame::RenderEnded(engine::core::TimeMs nowMs, engine::render::DrawList& out) const
{
    const int centerY = m_tuning.fieldHeight / 2;

    RenderAnimationFrame(m_endingPlayer, nowMs, out);
    RenderTextCentered(m_assets.largeFont.get(), kWinText, centerY, out);
    RenderTextCentered(m_assets.largeFont.get(), "Final Score: " + std::to_string(m_session.score), centerY + 40, out);

    out.DrawImage(m_buttonFill.get(), m_continueButton);
    if (m_assets.smallFont != nullptr)
    {
        const glm::ivec2 center = m_continueButton.Center();
        m_assets.smallFont->AppendTextCentered(out, kContinueText, center.x, center.y, kButtonTextColor);
    }
}

void CatcherGame::RenderFinal(engine::core::TimeMs nowMs, engine::render::DrawList& out) const
{
    const int centerY = m_tuning.fieldHeight / 2;

    RenderAnimationFrame(m_finalPlayer, nowMs, out);
    RenderTextCentered(m_assets.largeFont.get(), kClosingText, centerY, out);
    RenderTextCentered(m_assets.smallFont.get(), kExitPromptText, centerY + 40, out);
}

void CatcherGame::RenderAnimationFrame(const engine::animation::AnimationPlayer& player, engine::core::TimeMs nowMs, engine::render::DrawList& out) const
{
    const engine::render::Image* frame = player.CurrentFrame(nowMs);
    if (frame == nullptr || frame->Empty())
    {
        return;
    }
    const engine::core::Rect destination = engine::core::Rect::CenteredAt(
        m_tuning.fieldWidth / 2,
        m_tuning.fieldHeight / 2 - 150,
        frame->width,
        frame->height
    );
    out.DrawImage(frame, destination);
}

void CatcherGame::RenderTextCentered(const engine::render::GlyphAtlas* font, const std::string& text, int centerY, engine::render::DrawList& out) const
{
    if (font == nullptr)
    {
        return;
    }
    font->AppendTextCentered(out, text, m_tuning.fieldWidth / 2, centerY, kTextColor);
}

} // namespace game::gameplay
