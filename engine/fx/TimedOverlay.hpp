#pragma once

#include <algorithm>

#include "engine/core/Time.hpp"

namespace engine::fx
{

/// Time window anchored at an absolute start time.
/// Presentation derived from it (pose overrides, fades, drifts) is a function of `now` only.
struct TimedOverlay
{
    core::TimeMs startMs = 0;
    core::TimeMs durationMs = 0;
    bool started = false;

    TimedOverlay() = default;
    explicit TimedOverlay(core::TimeMs duration)
        : durationMs(duration)
    {
    }
    TimedOverlay(core::TimeMs start, core::TimeMs duration)
        : startMs(start)
        , durationMs(duration)
        , started(true)
    {
    }

    /// Re-anchor the window at `now`. Repeated calls extend from the latest one, they never stack.
    void Restart(core::TimeMs nowMs)
    {
        startMs = nowMs;
        started = true;
    }

    void Cancel() { started = false; }

    [[nodiscard]] core::TimeMs ExpiresAt() const { return startMs + durationMs; }

    [[nodiscard]] bool IsActive(core::TimeMs nowMs) const
    {
        return started && nowMs >= startMs && nowMs < ExpiresAt();
    }

    [[nodiscard]] bool IsExpired(core::TimeMs nowMs) const
    {
        return !started || nowMs >= ExpiresAt();
    }

    /// Elapsed time clamped to [0, duration].
    [[nodiscard]] core::TimeMs Elapsed(core::TimeMs nowMs) const
    {
        return std::clamp<core::TimeMs>(nowMs - startMs, 0, std::max<core::TimeMs>(0, durationMs));
    }

    /// 0 at start, 1 at and after expiry.
    [[nodiscard]] double Progress01(core::TimeMs nowMs) const
    {
        if (durationMs <= 0)
        {
            return 1.0;
        }
        return static_cast<double>(Elapsed(nowMs)) / static_cast<double>(durationMs);
    }
};

} // namespace engine::fx
