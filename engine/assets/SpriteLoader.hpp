#pragma once

#include <memory>
#include <string>

#include <glm/vec4.hpp>

#include "engine/animation/AnimationClip.hpp"
#include "engine/render/Image.hpp"

namespace engine::assets
{
// Decodes sprites from disk and scales them to their on-screen size. A file that
// cannot be read never fails the caller: a solid placeholder of the requested size
// and colour is returned instead and a warning is logged.
class SpriteLoader
{
public:
    [[nodiscard]] static render::ImageHandle LoadImage(
        const std::string& path,
        int width,
        int height,
        const glm::vec4& fallbackColor
    );

    // Animated GIFs keep their per-frame delays; frames without a delay show for
    // kDefaultFrameDurationMs. Still images load as a one-frame clip.
    [[nodiscard]] static std::shared_ptr<const animation::AnimationClip> LoadAnimation(
        const std::string& path,
        int width,
        int height,
        const glm::vec4& fallbackColor
    );

private:
    [[nodiscard]] static bool DecodeStill(const std::string& path, render::Image& outImage, std::string& outError);
};
} // namespace engine::assets
