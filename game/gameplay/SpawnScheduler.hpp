#pragma once

#include "engine/core/Time.hpp"

namespace game::gameplay
{

/// Fixed-period trigger for item spawns.
/// Fires at most once per poll and re-arms from the poll time, so a gap in polling
/// never turns into a burst of catch-up spawns.
class SpawnScheduler
{
public:
    explicit SpawnScheduler(engine::core::TimeMs periodMs = 1000);

    void Start(engine::core::TimeMs nowMs);
    void Stop() { m_running = false; }

    [[nodiscard]] bool Poll(engine::core::TimeMs nowMs);

    [[nodiscard]] bool IsRunning() const { return m_running; }
    [[nodiscard]] engine::core::TimeMs PeriodMs() const { return m_periodMs; }
    [[nodiscard]] engine::core::TimeMs NextFireMs() const { return m_nextFireMs; }

private:
    engine::core::TimeMs m_periodMs;
    engine::core::TimeMs m_nextFireMs = 0;
    bool m_running = false;
};

} // namespace game::gameplay
