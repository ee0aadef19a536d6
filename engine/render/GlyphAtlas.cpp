#include "engine/render/GlyphAtlas.hpp"

#include <cmath>
#include <utility>

namespace engine::render
{
namespace
{
constexpr float kMissingGlyphAdvance = 6.0F;
}

GlyphAtlas::GlyphAtlas(ImageHandle image, std::vector<BakedGlyph> glyphs, float baseline, float lineHeight)
    : m_image(std::move(image))
    , m_glyphs(std::move(glyphs))
    , m_baseline(baseline)
    , m_lineHeight(lineHeight)
{
}

const BakedGlyph* GlyphAtlas::Find(char ch) const
{
    const int code = static_cast<unsigned char>(ch);
    if (code < kFirstCodepoint || code > kLastCodepoint)
    {
        return nullptr;
    }
    const std::size_t index = static_cast<std::size_t>(code - kFirstCodepoint);
    if (index >= m_glyphs.size())
    {
        return nullptr;
    }
    return &m_glyphs[index];
}

int GlyphAtlas::MeasureWidth(std::string_view text) const
{
    if (Empty())
    {
        return 0;
    }
    float width = 0.0F;
    for (char ch : text)
    {
        const BakedGlyph* glyph = Find(ch);
        width += glyph != nullptr ? glyph->xadvance : kMissingGlyphAdvance;
    }
    return static_cast<int>(std::lround(width));
}

void GlyphAtlas::AppendText(DrawList& out, std::string_view text, int x, int y, const glm::vec4& color) const
{
    if (Empty())
    {
        return;
    }
    float penX = static_cast<float>(x);
    const float penY = static_cast<float>(y) + m_baseline;
    for (char ch : text)
    {
        const BakedGlyph* glyph = Find(ch);
        if (glyph == nullptr)
        {
            penX += kMissingGlyphAdvance;
            continue;
        }
        const int width = glyph->x1 - glyph->x0;
        const int height = glyph->y1 - glyph->y0;
        if (width > 0 && height > 0)
        {
            const core::Rect source{glyph->x0, glyph->y0, width, height};
            const core::Rect destination{
                static_cast<int>(std::lround(penX + glyph->xoff)),
                static_cast<int>(std::lround(penY + glyph->yoff)),
                width,
                height,
            };
            out.DrawImageRegion(m_image.get(), source, destination, color);
        }
        penX += glyph->xadvance;
    }
}

void GlyphAtlas::AppendTextCentered(DrawList& out, std::string_view text, int centerX, int centerY, const glm::vec4& color) const
{
    const int width = MeasureWidth(text);
    const int height = static_cast<int>(std::lround(m_lineHeight));
    AppendText(out, text, centerX - width / 2, centerY - height / 2, color);
}
} // namespace engine::render
