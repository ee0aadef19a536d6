#pragma once

#include <cstdint>
#include <vector>

#include "engine/core/Time.hpp"
#include "game/gameplay/Catcher.hpp"
#include "game/gameplay/SessionState.hpp"

namespace game::gameplay
{

struct CatchResult
{
    bool contact = false;                       ///< Reaction was triggered this frame
    int captured = 0;
    std::vector<std::uint32_t> capturedIds;
};

/// Per-frame contact and capture pass between the catcher and the active items.
///
/// Soft contact: catcher rect vs. item rect inflated by the contact margin. The first hit
/// triggers the reacting pose once and stops the scan.
/// Hard capture: exact rect overlap. Every captured item is removed and scored.
class CatchResolver
{
public:
    explicit CatchResolver(int contactMargin = 20);

    CatchResult Resolve(SessionState& session, Catcher& catcher, engine::core::TimeMs nowMs) const;

    [[nodiscard]] bool IsInContact(const engine::core::Rect& catcher, const engine::core::Rect& item) const;
    [[nodiscard]] static bool IsCaptured(const engine::core::Rect& catcher, const engine::core::Rect& item);

    [[nodiscard]] int ContactMargin() const { return m_contactMargin; }

private:
    int m_contactMargin;
};

} // namespace game::gameplay
