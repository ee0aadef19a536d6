#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "engine/render/DrawList.hpp"
#include "engine/render/GlyphAtlas.hpp"

using engine::core::Rect;
using engine::render::BakedGlyph;
using engine::render::DrawList;
using engine::render::GlyphAtlas;
using engine::render::Image;

namespace
{
GlyphAtlas MakeAtlas()
{
    // 'A' is 4x6 advancing 5, 'B' has no pixels, everything else is missing.
    std::vector<BakedGlyph> glyphs(GlyphAtlas::kLastCodepoint - GlyphAtlas::kFirstCodepoint + 1);
    for (int code = GlyphAtlas::kFirstCodepoint; code <= GlyphAtlas::kLastCodepoint; ++code)
    {
        glyphs[static_cast<std::size_t>(code - GlyphAtlas::kFirstCodepoint)].codepoint = code;
    }
    glyphs['A' - GlyphAtlas::kFirstCodepoint] = BakedGlyph{'A', 0, 0, 4, 6, 1.0F, -6.0F, 5.0F};
    glyphs['B' - GlyphAtlas::kFirstCodepoint] = BakedGlyph{'B', 0, 0, 0, 0, 0.0F, 0.0F, 3.0F};
    return GlyphAtlas(engine::render::MakeSolidImage(8, 8, glm::vec4{1.0F}), std::move(glyphs), 8.0F, 10.0F);
}
} // namespace

TEST(DrawList, KeepsInsertionOrder)
{
    const auto first = engine::render::MakeSolidImage(2, 2, glm::vec4{1.0F});
    const auto second = engine::render::MakeSolidImage(2, 2, glm::vec4{0.5F});
    DrawList list;
    list.DrawImage(first.get(), Rect{0, 0, 2, 2});
    list.DrawImage(second.get(), Rect{1, 1, 2, 2}, 0.5F);
    ASSERT_EQ(list.Size(), 2U);
    EXPECT_EQ(list.Commands()[0].image, first.get());
    EXPECT_EQ(list.Commands()[1].image, second.get());
    EXPECT_FLOAT_EQ(list.Commands()[1].tint.a, 0.5F);
    EXPECT_TRUE(list.Commands()[0].source.Empty());

    list.Clear();
    EXPECT_TRUE(list.Empty());
}

TEST(DrawList, SkipsNothingToDraw)
{
    const Image empty;
    const auto image = engine::render::MakeSolidImage(2, 2, glm::vec4{1.0F});
    DrawList list;
    list.DrawImage(nullptr, Rect{0, 0, 2, 2});
    list.DrawImage(&empty, Rect{0, 0, 2, 2});
    list.DrawImage(image.get(), Rect{0, 0, 0, 2});
    list.DrawImage(image.get(), Rect{0, 0, 2, 2}, 0.0F);
    EXPECT_TRUE(list.Empty());
}

TEST(GlyphAtlas, MeasuresAdvances)
{
    const GlyphAtlas atlas = MakeAtlas();
    EXPECT_EQ(atlas.MeasureWidth("AAB"), 13);
    EXPECT_EQ(atlas.MeasureWidth(""), 0);
    // Outside 32..126 falls back to a fixed advance
    EXPECT_EQ(atlas.MeasureWidth("\t"), 6);
}

TEST(GlyphAtlas, PlacesGlyphsOnBaseline)
{
    const GlyphAtlas atlas = MakeAtlas();
    DrawList list;
    atlas.AppendText(list, "ABA", 10, 20, glm::vec4{0.0F, 0.0F, 0.0F, 1.0F});
    ASSERT_EQ(list.Size(), 2U);
    EXPECT_EQ(list.Commands()[0].destination, (Rect{11, 22, 4, 6}));
    EXPECT_EQ(list.Commands()[0].source, (Rect{0, 0, 4, 6}));
    EXPECT_EQ(list.Commands()[1].destination, (Rect{19, 22, 4, 6}));
    EXPECT_EQ(list.Commands()[1].image, atlas.AtlasImage());
}

TEST(GlyphAtlas, CentersOnPoint)
{
    const GlyphAtlas atlas = MakeAtlas();
    DrawList list;
    atlas.AppendTextCentered(list, "AA", 100, 50, glm::vec4{1.0F});
    ASSERT_EQ(list.Size(), 2U);
    // width 10, line height 10: box starts at (95, 45)
    EXPECT_EQ(list.Commands()[0].destination.x, 96);
    EXPECT_EQ(list.Commands()[0].destination.y, 47);
}

TEST(GlyphAtlas, EmptyAtlasDrawsNothing)
{
    const GlyphAtlas atlas;
    DrawList list;
    atlas.AppendText(list, "Score: 3", 10, 10, glm::vec4{1.0F});
    EXPECT_TRUE(atlas.Empty());
    EXPECT_TRUE(list.Empty());
    EXPECT_EQ(atlas.MeasureWidth("Score"), 0);
}
