#include "engine/assets/FontLoader.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <utility>

#define STB_TRUETYPE_IMPLEMENTATION
#include <stb_truetype.h>

namespace engine::assets
{
std::vector<std::string> FontLoader::CandidateFontPaths(const std::string& requested)
{
    std::vector<std::string> paths;
    if (!requested.empty())
    {
        paths.push_back(requested);
    }
#ifdef _WIN32
    paths.emplace_back("C:/Windows/Fonts/segoeui.ttf");
    paths.emplace_back("C:/Windows/Fonts/arial.ttf");
#else
    paths.emplace_back("/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf");
    paths.emplace_back("/usr/share/fonts/dejavu/DejaVuSans.ttf");
    paths.emplace_back("/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf");
    paths.emplace_back("/usr/share/fonts/truetype/freefont/FreeSans.ttf");
#endif
    return paths;
}

bool FontLoader::BakeFromFile(const std::string& path, float pixelHeight, render::GlyphAtlas& outAtlas)
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open())
    {
        return false;
    }
    const std::vector<unsigned char> fontData{std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>()};
    if (fontData.empty())
    {
        return false;
    }

    std::vector<unsigned char> bitmap(static_cast<std::size_t>(kAtlasWidth) * kAtlasHeight);
    std::vector<stbtt_bakedchar> baked(kGlyphCount);
    const int result = stbtt_BakeFontBitmap(
        fontData.data(),
        0,
        pixelHeight,
        bitmap.data(),
        kAtlasWidth,
        kAtlasHeight,
        render::GlyphAtlas::kFirstCodepoint,
        kGlyphCount,
        baked.data()
    );
    if (result <= 0)
    {
        return false;
    }

    std::vector<render::BakedGlyph> glyphs;
    glyphs.reserve(kGlyphCount);
    float minYoff = 0.0F;
    float maxY = 0.0F;
    for (int i = 0; i < kGlyphCount; ++i)
    {
        const stbtt_bakedchar& src = baked[static_cast<std::size_t>(i)];
        const float bottom = src.yoff + static_cast<float>(src.y1 - src.y0);
        if (i == 0)
        {
            minYoff = src.yoff;
            maxY = bottom;
        }
        else
        {
            minYoff = std::min(minYoff, src.yoff);
            maxY = std::max(maxY, bottom);
        }
        glyphs.push_back(render::BakedGlyph{
            render::GlyphAtlas::kFirstCodepoint + i,
            src.x0,
            src.y0,
            src.x1,
            src.y1,
            src.xoff,
            src.yoff,
            src.xadvance,
        });
    }

    // Coverage goes to alpha so the draw tint picks the text colour.
    auto image = std::make_shared<render::Image>();
    image->width = kAtlasWidth;
    image->height = kAtlasHeight;
    image->pixels.resize(bitmap.size() * 4);
    for (std::size_t i = 0; i < bitmap.size(); ++i)
    {
        image->pixels[i * 4 + 0] = 255;
        image->pixels[i * 4 + 1] = 255;
        image->pixels[i * 4 + 2] = 255;
        image->pixels[i * 4 + 3] = bitmap[i];
    }

    outAtlas = render::GlyphAtlas(std::move(image), std::move(glyphs), -minYoff, std::max(1.0F, maxY - minYoff));
    return true;
}

std::shared_ptr<const render::GlyphAtlas> FontLoader::BakeAtlas(const std::vector<std::string>& candidatePaths, float pixelHeight)
{
    for (const std::string& path : candidatePaths)
    {
        render::GlyphAtlas atlas;
        if (BakeFromFile(path, pixelHeight, atlas))
        {
            std::cout << "[Assets] Baked " << pixelHeight << "px font from " << path << "\n";
            return std::make_shared<const render::GlyphAtlas>(std::move(atlas));
        }
    }
    std::cerr << "[Assets] No usable font found; text will not be drawn.\n";
    return std::make_shared<const render::GlyphAtlas>();
}
} // namespace engine::assets
