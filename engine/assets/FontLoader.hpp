#pragma once

#include <memory>
#include <string>
#include <vector>

#include "engine/render/GlyphAtlas.hpp"

namespace engine::assets
{
class FontLoader
{
public:
    // Requested path first, then common system fonts.
    [[nodiscard]] static std::vector<std::string> CandidateFontPaths(const std::string& requested);

    // Bakes the first font that loads. Returns an empty atlas when none does; text is
    // then skipped at draw time rather than failing startup.
    [[nodiscard]] static std::shared_ptr<const render::GlyphAtlas> BakeAtlas(
        const std::vector<std::string>& candidatePaths,
        float pixelHeight
    );

    [[nodiscard]] static bool BakeFromFile(const std::string& path, float pixelHeight, render::GlyphAtlas& outAtlas);

private:
    static constexpr int kAtlasWidth = 512;
    static constexpr int kAtlasHeight = 512;
    static constexpr int kGlyphCount = 96;
};
} // namespace engine::assets
