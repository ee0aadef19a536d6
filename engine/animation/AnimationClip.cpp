#include "engine/animation/AnimationClip.hpp"

#include <algorithm>
#include <utility>

namespace engine::animation
{

AnimationClip AnimationClip::FromFrames(std::string name, std::vector<AnimationFrame> frames)
{
    AnimationClip clip;
    clip.name = std::move(name);
    clip.frames = std::move(frames);
    clip.cumulativeMs.reserve(clip.frames.size());

    core::TimeMs total = 0;
    for (AnimationFrame& frame : clip.frames)
    {
        frame.durationMs = std::max<core::TimeMs>(0, frame.durationMs);
        total += frame.durationMs;
        clip.cumulativeMs.push_back(total);
    }
    clip.totalDurationMs = total;
    return clip;
}

AnimationClip AnimationClip::FromStill(std::string name, render::ImageHandle image)
{
    std::vector<AnimationFrame> frames;
    frames.push_back(AnimationFrame{std::move(image), kDefaultFrameDurationMs});
    return FromFrames(std::move(name), std::move(frames));
}

std::size_t AnimationClip::FrameIndexAt(core::TimeMs cycleTimeMs) const
{
    if (frames.empty())
    {
        return 0;
    }

    // First frame whose cumulative end lies strictly after the cycle time
    const auto it = std::upper_bound(cumulativeMs.begin(), cumulativeMs.end(), cycleTimeMs);
    if (it == cumulativeMs.end())
    {
        return frames.size() - 1;
    }
    return static_cast<std::size_t>(std::distance(cumulativeMs.begin(), it));
}

} // namespace engine::animation
