#include "engine/render/Image.hpp"

#include <algorithm>
#include <cmath>

namespace engine::render
{
namespace
{
std::uint8_t ToByte(float channel)
{
    return static_cast<std::uint8_t>(std::lround(std::clamp(channel, 0.0F, 1.0F) * 255.0F));
}
} // namespace

ImageHandle MakeSolidImage(int width, int height, const glm::vec4& color)
{
    auto image = std::make_shared<Image>();
    image->width = std::max(0, width);
    image->height = std::max(0, height);
    const std::size_t count = static_cast<std::size_t>(image->width) * static_cast<std::size_t>(image->height);
    image->pixels.resize(count * 4);
    const std::uint8_t r = ToByte(color.r);
    const std::uint8_t g = ToByte(color.g);
    const std::uint8_t b = ToByte(color.b);
    const std::uint8_t a = ToByte(color.a);
    for (std::size_t i = 0; i < count; ++i)
    {
        image->pixels[i * 4 + 0] = r;
        image->pixels[i * 4 + 1] = g;
        image->pixels[i * 4 + 2] = b;
        image->pixels[i * 4 + 3] = a;
    }
    return image;
}

Image ScaleNearest(const Image& source, int width, int height)
{
    Image result;
    if (source.Empty() || width <= 0 || height <= 0)
    {
        return result;
    }
    if (source.width == width && source.height == height)
    {
        return source;
    }

    result.width = width;
    result.height = height;
    result.pixels.resize(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4);
    for (int y = 0; y < height; ++y)
    {
        const int sy = std::min(source.height - 1, (y * source.height) / height);
        for (int x = 0; x < width; ++x)
        {
            const int sx = std::min(source.width - 1, (x * source.width) / width);
            const std::size_t src = (static_cast<std::size_t>(sy) * static_cast<std::size_t>(source.width) + static_cast<std::size_t>(sx)) * 4;
            const std::size_t dst = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) * 4;
            std::copy_n(source.pixels.begin() + static_cast<std::ptrdiff_t>(src), 4, result.pixels.begin() + static_cast<std::ptrdiff_t>(dst));
        }
    }
    return result;
}
} // namespace engine::render
