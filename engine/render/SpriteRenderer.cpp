#include "engine/render/SpriteRenderer.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdio>

#include <glad/glad.h>

namespace engine::render
{
namespace
{
constexpr const char* kSpriteVertexShader = R"(
#version 450 core
layout(location = 0) in vec2 aPos;
layout(location = 1) in vec2 aUv;
layout(location = 2) in vec4 aColor;
uniform vec2 uScreenSize;
out vec2 vUv;
out vec4 vColor;
void main() {
    vec2 ndc = vec2((aPos.x / uScreenSize.x) * 2.0 - 1.0, 1.0 - (aPos.y / uScreenSize.y) * 2.0);
    gl_Position = vec4(ndc, 0.0, 1.0);
    vUv = aUv;
    vColor = aColor;
}
)";

constexpr const char* kSpriteFragmentShader = R"(
#version 450 core
in vec2 vUv;
in vec4 vColor;
uniform sampler2D uTexture;
out vec4 FragColor;
void main() {
    FragColor = texture(uTexture, vUv) * vColor;
}
)";

unsigned int Compile(unsigned int type, const char* source)
{
    const unsigned int shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);
    int ok = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    if (ok == GL_TRUE)
    {
        return shader;
    }
    char log[1024]{};
    glGetShaderInfoLog(shader, static_cast<int>(sizeof(log)), nullptr, log);
    std::fprintf(stderr, "Sprite shader compile failed: %s\n", log);
    glDeleteShader(shader);
    return 0;
}

unsigned int CreateProgram(const char* vsSource, const char* fsSource)
{
    const unsigned int vs = Compile(GL_VERTEX_SHADER, vsSource);
    const unsigned int fs = Compile(GL_FRAGMENT_SHADER, fsSource);
    if (vs == 0 || fs == 0)
    {
        if (vs != 0)
        {
            glDeleteShader(vs);
        }
        if (fs != 0)
        {
            glDeleteShader(fs);
        }
        return 0;
    }
    const unsigned int program = glCreateProgram();
    glAttachShader(program, vs);
    glAttachShader(program, fs);
    glLinkProgram(program);
    glDeleteShader(vs);
    glDeleteShader(fs);
    int ok = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &ok);
    if (ok == GL_TRUE)
    {
        return program;
    }
    char log[1024]{};
    glGetProgramInfoLog(program, static_cast<int>(sizeof(log)), nullptr, log);
    std::fprintf(stderr, "Sprite program link failed: %s\n", log);
    glDeleteProgram(program);
    return 0;
}
} // namespace

bool SpriteRenderer::Initialize(int logicalWidth, int logicalHeight, int framebufferWidth, int framebufferHeight)
{
    m_logicalWidth = std::max(1, logicalWidth);
    m_logicalHeight = std::max(1, logicalHeight);

    m_program = CreateProgram(kSpriteVertexShader, kSpriteFragmentShader);
    if (m_program == 0)
    {
        return false;
    }
    glGenVertexArrays(1, &m_vao);
    glGenBuffers(1, &m_vbo);
    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    glBufferData(GL_ARRAY_BUFFER, 256 * 1024, nullptr, GL_DYNAMIC_DRAW);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(QuadVertex), reinterpret_cast<void*>(offsetof(QuadVertex, x)));
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, sizeof(QuadVertex), reinterpret_cast<void*>(offsetof(QuadVertex, u)));
    glEnableVertexAttribArray(1);
    glVertexAttribPointer(2, 4, GL_FLOAT, GL_FALSE, sizeof(QuadVertex), reinterpret_cast<void*>(offsetof(QuadVertex, r)));
    glEnableVertexAttribArray(2);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);
    m_uniformScreenSize = glGetUniformLocation(m_program, "uScreenSize");
    m_uniformTexture = glGetUniformLocation(m_program, "uTexture");

    SetViewport(framebufferWidth, framebufferHeight);
    return true;
}

void SpriteRenderer::Shutdown()
{
    for (const auto& entry : m_textures)
    {
        glDeleteTextures(1, &entry.second);
    }
    m_textures.clear();
    if (m_vbo != 0)
    {
        glDeleteBuffers(1, &m_vbo);
        m_vbo = 0;
    }
    if (m_vao != 0)
    {
        glDeleteVertexArrays(1, &m_vao);
        m_vao = 0;
    }
    if (m_program != 0)
    {
        glDeleteProgram(m_program);
        m_program = 0;
    }
}

void SpriteRenderer::SetViewport(int framebufferWidth, int framebufferHeight) const
{
    glViewport(0, 0, std::max(1, framebufferWidth), std::max(1, framebufferHeight));
}

void SpriteRenderer::BeginFrame(const glm::vec3& clearColor) const
{
    glClearColor(clearColor.r, clearColor.g, clearColor.b, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT);
}

unsigned int SpriteRenderer::TextureFor(const Image& image)
{
    const auto it = m_textures.find(&image);
    if (it != m_textures.end())
    {
        return it->second;
    }

    unsigned int texture = 0;
    glGenTextures(1, &texture);
    glBindTexture(GL_TEXTURE_2D, texture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, image.width, image.height, 0, GL_RGBA, GL_UNSIGNED_BYTE, image.pixels.data());
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glBindTexture(GL_TEXTURE_2D, 0);

    m_textures.emplace(&image, texture);
    return texture;
}

void SpriteRenderer::AppendQuad(const DrawCommand& command, const Image& image)
{
    const core::Rect source = command.source.Empty() ? core::Rect{0, 0, image.width, image.height} : command.source;
    const float invW = 1.0F / static_cast<float>(image.width);
    const float invH = 1.0F / static_cast<float>(image.height);
    const float u0 = static_cast<float>(source.x) * invW;
    const float v0 = static_cast<float>(source.y) * invH;
    const float u1 = static_cast<float>(source.x + source.w) * invW;
    const float v1 = static_cast<float>(source.y + source.h) * invH;

    const float x0 = static_cast<float>(command.destination.Left());
    const float y0 = static_cast<float>(command.destination.Top());
    const float x1 = static_cast<float>(command.destination.Right());
    const float y1 = static_cast<float>(command.destination.Bottom());
    const glm::vec4& c = command.tint;

    const QuadVertex topLeft{x0, y0, u0, v0, c.r, c.g, c.b, c.a};
    const QuadVertex topRight{x1, y0, u1, v0, c.r, c.g, c.b, c.a};
    const QuadVertex bottomRight{x1, y1, u1, v1, c.r, c.g, c.b, c.a};
    const QuadVertex bottomLeft{x0, y1, u0, v1, c.r, c.g, c.b, c.a};
    m_vertices.push_back(topLeft);
    m_vertices.push_back(topRight);
    m_vertices.push_back(bottomRight);
    m_vertices.push_back(topLeft);
    m_vertices.push_back(bottomRight);
    m_vertices.push_back(bottomLeft);
}

void SpriteRenderer::Submit(const DrawList& drawList)
{
    m_vertices.clear();
    m_batches.clear();

    for (const DrawCommand& command : drawList.Commands())
    {
        if (command.image == nullptr || command.image->Empty())
        {
            continue;
        }
        const unsigned int texture = TextureFor(*command.image);
        if (m_batches.empty() || m_batches.back().texture != texture)
        {
            m_batches.push_back(DrawBatch{texture, static_cast<int>(m_vertices.size()), 0});
        }
        AppendQuad(command, *command.image);
        m_batches.back().vertexCount += 6;
    }

    if (m_vertices.empty())
    {
        return;
    }

    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
    glDisable(GL_DEPTH_TEST);

    glUseProgram(m_program);
    glUniform2f(m_uniformScreenSize, static_cast<float>(m_logicalWidth), static_cast<float>(m_logicalHeight));
    glUniform1i(m_uniformTexture, 0);
    glActiveTexture(GL_TEXTURE0);
    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(m_vertices.size() * sizeof(QuadVertex)), m_vertices.data(), GL_DYNAMIC_DRAW);

    // Batches preserve submission order, so later commands land on top.
    for (const DrawBatch& batch : m_batches)
    {
        glBindTexture(GL_TEXTURE_2D, batch.texture);
        glDrawArrays(GL_TRIANGLES, batch.firstVertex, batch.vertexCount);
    }

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);
    glBindTexture(GL_TEXTURE_2D, 0);
    glUseProgram(0);
}
} // namespace engine::render
