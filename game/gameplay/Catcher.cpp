#include "game/gameplay/Catcher.hpp"

#include <utility>

namespace game::gameplay
{

Catcher::Catcher(const GameplayTuning& tuning, engine::render::ImageHandle normalImage, engine::render::ImageHandle reactingImage)
    : m_bounds{}
    , m_speed(tuning.playerSpeed)
    , m_fieldWidth(tuning.fieldWidth)
    , m_reaction(static_cast<engine::core::TimeMs>(tuning.reactionDurationMs))
    , m_normalImage(std::move(normalImage))
    , m_reactingImage(std::move(reactingImage))
{
    // Mid-bottom anchored above the bottom margin
    m_bounds.w = tuning.playerSize;
    m_bounds.h = tuning.playerSize;
    m_bounds.x = tuning.fieldWidth / 2 - tuning.playerSize / 2;
    m_bounds.y = tuning.fieldHeight - tuning.playerBottomMargin - tuning.playerSize;
    ClampToField();
}

void Catcher::Update(const CatcherInput& input, engine::core::TimeMs nowMs)
{
    (void)nowMs;
    if (input.moveLeft)
    {
        m_bounds.x -= m_speed;
    }
    if (input.moveRight)
    {
        m_bounds.x += m_speed;
    }
    ClampToField();
}

void Catcher::TriggerReaction(engine::core::TimeMs nowMs)
{
    m_reaction.Restart(nowMs);
}

CatcherPose Catcher::PoseAt(engine::core::TimeMs nowMs) const
{
    return m_reaction.IsActive(nowMs) ? CatcherPose::Reacting : CatcherPose::Normal;
}

const engine::render::Image* Catcher::ImageAt(engine::core::TimeMs nowMs) const
{
    if (PoseAt(nowMs) == CatcherPose::Reacting && m_reactingImage != nullptr)
    {
        return m_reactingImage.get();
    }
    return m_normalImage.get();
}

void Catcher::SetX(int x)
{
    m_bounds.x = x;
    ClampToField();
}

void Catcher::ClampToField()
{
    if (m_bounds.Left() < 0)
    {
        m_bounds.x = 0;
    }
    if (m_bounds.Right() > m_fieldWidth)
    {
        m_bounds.x = m_fieldWidth - m_bounds.w;
    }
}

} // namespace game::gameplay
