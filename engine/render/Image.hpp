#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include <glm/vec4.hpp>

namespace engine::render
{
// Decoded RGBA8 pixels, row-major, top row first.
struct Image
{
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;

    [[nodiscard]] bool Empty() const { return width <= 0 || height <= 0 || pixels.empty(); }
};

using ImageHandle = std::shared_ptr<const Image>;

// Solid colour image, used for placeholders and flat UI fills.
[[nodiscard]] ImageHandle MakeSolidImage(int width, int height, const glm::vec4& color);

// Nearest-neighbour resample to the target size.
[[nodiscard]] Image ScaleNearest(const Image& source, int width, int height);
} // namespace engine::render
