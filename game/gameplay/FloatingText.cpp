#include "game/gameplay/FloatingText.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace game::gameplay
{

FloatingText::FloatingText(
    std::string text,
    const glm::ivec2& anchor,
    engine::core::TimeMs createdMs,
    engine::core::TimeMs durationMs,
    int totalRisePx
)
    : m_text(std::move(text))
    , m_anchor(anchor)
    , m_window(createdMs, durationMs)
    , m_totalRisePx(std::max(0, totalRisePx))
    , m_position(anchor)
{
    Update(createdMs);
}

void FloatingText::Update(engine::core::TimeMs nowMs)
{
    const double progress = m_window.Progress01(nowMs);

    if (m_window.IsExpired(nowMs))
    {
        m_alpha = 0;
    }
    else
    {
        // Rounding alone would hit 0 a few ms early; keep it visible until the window closes.
        const long faded = std::lround(255.0 * (1.0 - progress));
        m_alpha = std::clamp(static_cast<int>(faded), 1, 255);
    }

    const int rise = static_cast<int>(std::floor(progress * static_cast<double>(m_totalRisePx)));
    m_position = glm::ivec2{m_anchor.x, m_anchor.y - std::min(rise, m_totalRisePx)};
}

} // namespace game::gameplay
