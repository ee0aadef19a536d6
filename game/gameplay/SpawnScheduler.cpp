#include "game/gameplay/SpawnScheduler.hpp"

#include <algorithm>

namespace game::gameplay
{

SpawnScheduler::SpawnScheduler(engine::core::TimeMs periodMs)
    : m_periodMs(std::max<engine::core::TimeMs>(1, periodMs))
{
}

void SpawnScheduler::Start(engine::core::TimeMs nowMs)
{
    m_nextFireMs = nowMs + m_periodMs;
    m_running = true;
}

bool SpawnScheduler::Poll(engine::core::TimeMs nowMs)
{
    if (!m_running || nowMs < m_nextFireMs)
    {
        return false;
    }
    m_nextFireMs = nowMs + m_periodMs;
    return true;
}

} // namespace game::gameplay
