#pragma once

#include <string>
#include <vector>

#include "engine/core/Time.hpp"
#include "engine/render/Image.hpp"

namespace engine::animation
{

// Display duration used when the decoder reports none
constexpr core::TimeMs kDefaultFrameDurationMs = 100;

// One frame of a flipbook animation
struct AnimationFrame
{
    render::ImageHandle image;
    core::TimeMs durationMs = kDefaultFrameDurationMs;
};

// Immutable flipbook clip with its cumulative-duration table
struct AnimationClip
{
    std::string name;
    std::vector<AnimationFrame> frames;
    std::vector<core::TimeMs> cumulativeMs;   // cumulativeMs[i] = end of frame i
    core::TimeMs totalDurationMs = 0;

    // Builds the cumulative table; negative durations count as zero
    [[nodiscard]] static AnimationClip FromFrames(std::string name, std::vector<AnimationFrame> frames);

    // Single still image presented as a one-frame clip
    [[nodiscard]] static AnimationClip FromStill(std::string name, render::ImageHandle image);

    [[nodiscard]] bool Empty() const { return frames.empty(); }
    [[nodiscard]] std::size_t FrameCount() const { return frames.size(); }

    // Index of the frame shown at a time inside [0, totalDurationMs)
    [[nodiscard]] std::size_t FrameIndexAt(core::TimeMs cycleTimeMs) const;
};

} // namespace engine::animation
