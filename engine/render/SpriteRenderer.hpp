#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include <glm/vec3.hpp>

#include "engine/render/DrawList.hpp"
#include "engine/render/Image.hpp"

namespace engine::render
{
// Blits a DrawList with alpha blending. Draw-list coordinates are logical play-field
// pixels and are stretched over the whole framebuffer.
class SpriteRenderer
{
public:
    bool Initialize(int logicalWidth, int logicalHeight, int framebufferWidth, int framebufferHeight);
    void Shutdown();

    void SetViewport(int framebufferWidth, int framebufferHeight) const;

    void BeginFrame(const glm::vec3& clearColor) const;
    void Submit(const DrawList& drawList);

    [[nodiscard]] std::size_t CachedTextureCount() const { return m_textures.size(); }

private:
    struct QuadVertex
    {
        float x = 0.0F;
        float y = 0.0F;
        float u = 0.0F;
        float v = 0.0F;
        float r = 1.0F;
        float g = 1.0F;
        float b = 1.0F;
        float a = 1.0F;
    };

    struct DrawBatch
    {
        unsigned int texture = 0;
        int firstVertex = 0;
        int vertexCount = 0;
    };

    // Images are immutable and outlive the session, so their address is a stable cache key.
    unsigned int TextureFor(const Image& image);
    void AppendQuad(const DrawCommand& command, const Image& image);

    unsigned int m_program = 0;
    unsigned int m_vao = 0;
    unsigned int m_vbo = 0;
    int m_uniformScreenSize = -1;
    int m_uniformTexture = -1;

    int m_logicalWidth = 600;
    int m_logicalHeight = 800;

    std::unordered_map<const Image*, unsigned int> m_textures;
    std::vector<QuadVertex> m_vertices;
    std::vector<DrawBatch> m_batches;
};
} // namespace engine::render
