#include "engine/animation/AnimationPlayer.hpp"

#include <utility>

namespace engine::animation
{

AnimationPlayer::AnimationPlayer(std::shared_ptr<const AnimationClip> clip, core::TimeMs startMs)
    : m_clip(std::move(clip))
    , m_startMs(startMs)
{
}

core::TimeMs AnimationPlayer::CycleTime(core::TimeMs nowMs) const
{
    if (m_clip == nullptr || m_clip->totalDurationMs <= 0)
    {
        return 0;
    }

    // Wrap around, also for times before the start
    const core::TimeMs total = m_clip->totalDurationMs;
    const core::TimeMs elapsed = (nowMs - m_startMs) % total;
    return elapsed < 0 ? elapsed + total : elapsed;
}

std::size_t AnimationPlayer::CurrentFrameIndex(core::TimeMs nowMs) const
{
    if (m_clip == nullptr || m_clip->Empty())
    {
        return 0;
    }
    if (m_clip->totalDurationMs <= 0)
    {
        return m_clip->FrameCount() - 1;
    }
    return m_clip->FrameIndexAt(CycleTime(nowMs));
}

const render::Image* AnimationPlayer::CurrentFrame(core::TimeMs nowMs) const
{
    if (m_clip == nullptr || m_clip->Empty())
    {
        return nullptr;
    }
    return m_clip->frames[CurrentFrameIndex(nowMs)].image.get();
}

} // namespace engine::animation
