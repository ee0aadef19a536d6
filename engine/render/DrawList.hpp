#pragma once

#include <vector>

#include <glm/vec4.hpp>

#include "engine/core/Rect.hpp"
#include "engine/render/Image.hpp"

namespace engine::render
{
struct DrawCommand
{
    const Image* image = nullptr;
    core::Rect source{};        // Pixel region of the image; empty = whole image
    core::Rect destination{};
    glm::vec4 tint{1.0F};
};

// Ordered blit list produced once per frame. Commands are drawn in insertion order.
class DrawList
{
public:
    void Clear() { m_commands.clear(); }

    // Null or empty images are skipped, never an error.
    void DrawImage(const Image* image, const core::Rect& destination, float alpha = 1.0F);
    void DrawImageRegion(const Image* image, const core::Rect& source, const core::Rect& destination, const glm::vec4& tint);

    [[nodiscard]] const std::vector<DrawCommand>& Commands() const { return m_commands; }
    [[nodiscard]] std::size_t Size() const { return m_commands.size(); }
    [[nodiscard]] bool Empty() const { return m_commands.empty(); }

private:
    std::vector<DrawCommand> m_commands;
};
} // namespace engine::render
