#include "game/gameplay/CatchResolver.hpp"

#include <algorithm>

namespace game::gameplay
{

CatchResolver::CatchResolver(int contactMargin)
    : m_contactMargin(std::max(0, contactMargin))
{
}

bool CatchResolver::IsInContact(const engine::core::Rect& catcher, const engine::core::Rect& item) const
{
    return catcher.Intersects(item.Inflated(m_contactMargin, m_contactMargin));
}

bool CatchResolver::IsCaptured(const engine::core::Rect& catcher, const engine::core::Rect& item)
{
    return catcher.Intersects(item);
}

CatchResult CatchResolver::Resolve(SessionState& session, Catcher& catcher, engine::core::TimeMs nowMs) const
{
    CatchResult result;
    const engine::core::Rect& catcherBounds = catcher.Bounds();

    for (const FallingItem& item : session.items)
    {
        if (!item.IsRemoved() && IsInContact(catcherBounds, item.Bounds()))
        {
            catcher.TriggerReaction(nowMs);
            result.contact = true;
            break;
        }
    }

    for (FallingItem& item : session.items)
    {
        if (!item.IsRemoved() && IsCaptured(catcherBounds, item.Bounds()))
        {
            item.MarkRemoved();
            result.capturedIds.push_back(item.Id());
        }
    }

    if (!result.capturedIds.empty())
    {
        session.items.erase(
            std::remove_if(session.items.begin(), session.items.end(), [](const FallingItem& item) { return item.IsRemoved(); }),
            session.items.end()
        );
        result.captured = static_cast<int>(result.capturedIds.size());
        session.score += result.captured;
    }
    return result;
}

} // namespace game::gameplay
