#include "engine/assets/SpriteLoader.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <utility>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace engine::assets
{
namespace
{
bool ReadFileBytes(const std::string& path, std::vector<unsigned char>& outBytes)
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream.is_open())
    {
        return false;
    }
    outBytes.assign(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
    return !outBytes.empty();
}

bool LooksLikeGif(const std::vector<unsigned char>& bytes)
{
    return bytes.size() >= 6 && std::memcmp(bytes.data(), "GIF8", 4) == 0;
}

render::ImageHandle Finish(render::Image decoded, int width, int height)
{
    return std::make_shared<const render::Image>(render::ScaleNearest(decoded, width, height));
}

std::shared_ptr<const animation::AnimationClip> PlaceholderClip(const std::string& path, int width, int height, const glm::vec4& color)
{
    return std::make_shared<const animation::AnimationClip>(
        animation::AnimationClip::FromStill(path, render::MakeSolidImage(width, height, color))
    );
}
} // namespace

bool SpriteLoader::DecodeStill(const std::string& path, render::Image& outImage, std::string& outError)
{
    int width = 0;
    int height = 0;
    int channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, 4);
    if (data == nullptr)
    {
        const char* reason = stbi_failure_reason();
        outError = reason != nullptr ? reason : "unknown error";
        return false;
    }
    outImage.width = width;
    outImage.height = height;
    outImage.pixels.assign(data, data + static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4);
    stbi_image_free(data);
    return true;
}

render::ImageHandle SpriteLoader::LoadImage(const std::string& path, int width, int height, const glm::vec4& fallbackColor)
{
    render::Image decoded;
    std::string error;
    if (path.empty() || !DecodeStill(path, decoded, error))
    {
        std::cerr << "[Assets] Could not load image '" << path << "'"
                  << (error.empty() ? std::string{} : ": " + error) << ". Using placeholder.\n";
        return render::MakeSolidImage(width, height, fallbackColor);
    }
    return Finish(std::move(decoded), width, height);
}

std::shared_ptr<const animation::AnimationClip> SpriteLoader::LoadAnimation(
    const std::string& path,
    int width,
    int height,
    const glm::vec4& fallbackColor
)
{
    std::vector<unsigned char> bytes;
    if (path.empty() || !ReadFileBytes(path, bytes))
    {
        std::cerr << "[Assets] Could not read animation '" << path << "'. Using placeholder.\n";
        return PlaceholderClip(path, width, height, fallbackColor);
    }

    if (!LooksLikeGif(bytes))
    {
        render::Image decoded;
        std::string error;
        if (!DecodeStill(path, decoded, error))
        {
            std::cerr << "[Assets] Could not decode '" << path << "': " << error << ". Using placeholder.\n";
            return PlaceholderClip(path, width, height, fallbackColor);
        }
        return std::make_shared<const animation::AnimationClip>(
            animation::AnimationClip::FromStill(path, Finish(std::move(decoded), width, height))
        );
    }

    int* delays = nullptr;
    int frameWidth = 0;
    int frameHeight = 0;
    int frameCount = 0;
    int channels = 0;
    unsigned char* data = stbi_load_gif_from_memory(
        bytes.data(),
        static_cast<int>(bytes.size()),
        &delays,
        &frameWidth,
        &frameHeight,
        &frameCount,
        &channels,
        4
    );
    if (data == nullptr || frameCount <= 0)
    {
        const char* reason = stbi_failure_reason();
        std::cerr << "[Assets] Could not decode GIF '" << path << "': " << (reason != nullptr ? reason : "no frames")
                  << ". Using placeholder.\n";
        stbi_image_free(data);
        stbi_image_free(delays);
        return PlaceholderClip(path, width, height, fallbackColor);
    }

    const std::size_t frameBytes = static_cast<std::size_t>(frameWidth) * static_cast<std::size_t>(frameHeight) * 4;
    std::vector<animation::AnimationFrame> frames;
    frames.reserve(static_cast<std::size_t>(frameCount));
    for (int i = 0; i < frameCount; ++i)
    {
        render::Image frame;
        frame.width = frameWidth;
        frame.height = frameHeight;
        const unsigned char* begin = data + frameBytes * static_cast<std::size_t>(i);
        frame.pixels.assign(begin, begin + frameBytes);

        animation::AnimationFrame entry;
        entry.image = Finish(std::move(frame), width, height);
        const int delay = delays != nullptr ? delays[i] : 0;
        entry.durationMs = delay > 0 ? static_cast<core::TimeMs>(delay) : animation::kDefaultFrameDurationMs;
        frames.push_back(std::move(entry));
    }
    stbi_image_free(data);
    stbi_image_free(delays);

    std::cout << "[Assets] Loaded " << frameCount << " frame(s) from " << path << "\n";
    return std::make_shared<const animation::AnimationClip>(animation::AnimationClip::FromFrames(path, std::move(frames)));
}
} // namespace engine::assets
