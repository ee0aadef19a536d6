#pragma once

#include "engine/animation/AnimationClip.hpp"

#include <memory>

namespace engine::animation
{

// Plays a flipbook clip as a pure function of absolute time.
// There is no per-tick state: the same `now` always yields the same frame.
class AnimationPlayer
{
public:
    AnimationPlayer() = default;
    AnimationPlayer(std::shared_ptr<const AnimationClip> clip, core::TimeMs startMs);

    // Re-anchor phase 0 of the loop
    void Restart(core::TimeMs startMs) { m_startMs = startMs; }

    // Frame shown at `now`, or nullptr when the clip has no frames
    [[nodiscard]] const render::Image* CurrentFrame(core::TimeMs nowMs) const;
    [[nodiscard]] std::size_t CurrentFrameIndex(core::TimeMs nowMs) const;

    // Position inside the loop, in [0, total duration)
    [[nodiscard]] core::TimeMs CycleTime(core::TimeMs nowMs) const;

    [[nodiscard]] core::TimeMs StartTime() const { return m_startMs; }
    [[nodiscard]] core::TimeMs Duration() const { return m_clip ? m_clip->totalDurationMs : 0; }
    [[nodiscard]] const AnimationClip* GetClip() const { return m_clip.get(); }
    [[nodiscard]] bool HasFrames() const { return m_clip != nullptr && !m_clip->Empty(); }

private:
    std::shared_ptr<const AnimationClip> m_clip;
    core::TimeMs m_startMs = 0;
};

} // namespace engine::animation
