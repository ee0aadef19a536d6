#pragma once

#include <string_view>
#include <vector>

#include <glm/vec4.hpp>

#include "engine/render/DrawList.hpp"
#include "engine/render/Image.hpp"

namespace engine::render
{
struct BakedGlyph
{
    int codepoint = 0;
    int x0 = 0;
    int y0 = 0;
    int x1 = 0;
    int y1 = 0;
    float xoff = 0.0F;
    float yoff = 0.0F;
    float xadvance = 0.0F;
};

// Pre-rendered ASCII glyphs (32..126) packed into one white-on-transparent image.
// Text is drawn as one image region per glyph, tinted by the requested colour.
class GlyphAtlas
{
public:
    static constexpr int kFirstCodepoint = 32;
    static constexpr int kLastCodepoint = 126;

    GlyphAtlas() = default;
    GlyphAtlas(ImageHandle image, std::vector<BakedGlyph> glyphs, float baseline, float lineHeight);

    [[nodiscard]] bool Empty() const { return m_image == nullptr || m_image->Empty() || m_glyphs.empty(); }
    [[nodiscard]] const BakedGlyph* Find(char ch) const;
    [[nodiscard]] float Baseline() const { return m_baseline; }
    [[nodiscard]] float LineHeight() const { return m_lineHeight; }
    [[nodiscard]] const Image* AtlasImage() const { return m_image.get(); }

    [[nodiscard]] int MeasureWidth(std::string_view text) const;

    // x/y is the top-left of the line box.
    void AppendText(DrawList& out, std::string_view text, int x, int y, const glm::vec4& color) const;
    void AppendTextCentered(DrawList& out, std::string_view text, int centerX, int centerY, const glm::vec4& color) const;

private:
    ImageHandle m_image;
    std::vector<BakedGlyph> m_glyphs;
    float m_baseline = 0.0F;
    float m_lineHeight = 0.0F;
};
} // namespace engine::render
