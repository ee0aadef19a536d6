#pragma once

#include <glm/vec2.hpp>

namespace engine::core
{
// Integer screen rectangle, y grows downward.
struct Rect
{
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;

    [[nodiscard]] int Left() const { return x; }
    [[nodiscard]] int Right() const { return x + w; }
    [[nodiscard]] int Top() const { return y; }
    [[nodiscard]] int Bottom() const { return y + h; }
    [[nodiscard]] bool Empty() const { return w <= 0 || h <= 0; }

    [[nodiscard]] glm::ivec2 Center() const { return glm::ivec2{x + w / 2, y + h / 2}; }

    // Grows by dx/dy in total, keeping the center fixed.
    [[nodiscard]] Rect Inflated(int dx, int dy) const
    {
        return Rect{x - dx / 2, y - dy / 2, w + dx, h + dy};
    }

    // Edge contact does not count as overlap.
    [[nodiscard]] bool Intersects(const Rect& other) const
    {
        return x < other.x + other.w && other.x < x + w && y < other.y + other.h && other.y < y + h;
    }

    [[nodiscard]] bool Contains(float px, float py) const
    {
        return px >= static_cast<float>(x) && py >= static_cast<float>(y)
            && px < static_cast<float>(x + w) && py < static_cast<float>(y + h);
    }

    [[nodiscard]] static Rect CenteredAt(int cx, int cy, int width, int height)
    {
        return Rect{cx - width / 2, cy - height / 2, width, height};
    }

    bool operator==(const Rect& other) const
    {
        return x == other.x && y == other.y && w == other.w && h == other.h;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};
} // namespace engine::core
