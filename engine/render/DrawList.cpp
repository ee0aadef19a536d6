#include "engine/render/DrawList.hpp"

namespace engine::render
{
void DrawList::DrawImage(const Image* image, const core::Rect& destination, float alpha)
{
    DrawImageRegion(image, core::Rect{}, destination, glm::vec4{1.0F, 1.0F, 1.0F, alpha});
}

void DrawList::DrawImageRegion(const Image* image, const core::Rect& source, const core::Rect& destination, const glm::vec4& tint)
{
    if (image == nullptr || image->Empty() || destination.Empty() || tint.a <= 0.0F)
    {
        return;
    }
    m_commands.push_back(DrawCommand{image, source, destination, tint});
}
} // namespace engine::render
