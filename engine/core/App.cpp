#include "engine/core/App.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <thread>
#include <utility>
#include <vector>

#include <glad/glad.h>
#include <GLFW/glfw3.h>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>
#include <nlohmann/json.hpp>

#include "engine/assets/FontLoader.hpp"
#include "engine/assets/SpriteLoader.hpp"

namespace engine::core
{
namespace
{
using json = nlohmann::json;

#ifndef CATCHER_BUILD_ID
#define CATCHER_BUILD_ID "unknown"
#endif
constexpr const char* kBuildId = CATCHER_BUILD_ID;

constexpr float kLargeFontPx = 36.0F;
constexpr float kSmallFontPx = 24.0F;

const glm::vec4 kPlayerPlaceholder{0.0F, 1.0F, 0.0F, 1.0F};
const glm::vec4 kItemPlaceholder{1.0F, 0.0F, 0.0F, 1.0F};
const glm::vec4 kAnimationPlaceholder{0.0F, 0.0F, 1.0F, 1.0F};
const glm::vec3 kClearColor{1.0F, 1.0F, 1.0F};
} // namespace

bool App::Run()
{
    std::cout << "[Catcher] Build: " << kBuildId << "\n";

    (void)LoadGraphicsConfig();
    (void)LoadGameplayConfig();

    m_windowSettings.width = m_tuning.fieldWidth;
    m_windowSettings.height = m_tuning.fieldHeight;
    m_windowSettings.windowScale = m_graphics.windowScale;
    m_windowSettings.vsync = m_graphics.vsync;
    m_windowSettings.title = "Catcher";

    if (!m_window.Initialize(m_windowSettings))
    {
        return false;
    }

    if (!gladLoadGL(reinterpret_cast<GLADloadfunc>(glfwGetProcAddress)))
    {
        std::cerr << "Failed to initialize GLAD.\n";
        return false;
    }

    const unsigned char* glVersion = glGetString(GL_VERSION);
    std::cout << "OpenGL version: " << (glVersion != nullptr ? reinterpret_cast<const char*>(glVersion) : "unknown") << "\n";

    if (!m_renderer.Initialize(m_tuning.fieldWidth, m_tuning.fieldHeight, m_window.FramebufferWidth(), m_window.FramebufferHeight()))
    {
        std::cerr << "Failed to initialize sprite renderer.\n";
        return false;
    }
    m_window.SetResizeCallback([this](int width, int height) {
        m_renderer.SetViewport(width, height);
    });
    m_input.Watch({GLFW_KEY_LEFT, GLFW_KEY_A, GLFW_KEY_RIGHT, GLFW_KEY_D});

    std::random_device seedSource;
    m_game = std::make_unique<game::gameplay::CatcherGame>(m_tuning, LoadAssets(), seedSource());

    m_time.BeginFrame(glfwGetTime());
    m_game->Start(m_time.SimulationMilliseconds());
    std::cout << "[Catcher] Session started, reach " << m_tuning.winThreshold << " to win.\n";

    bool running = true;
    while (running)
    {
        const double frameStart = glfwGetTime();
        m_time.BeginFrame(frameStart);

        const std::vector<platform::InputEvent> events = m_window.PollEvents();
        m_input.Update(m_window.NativeHandle());

        const game::gameplay::GamePhase phaseBefore = m_game->Phase();
        for (const platform::InputEvent& event : events)
        {
            m_game->HandleEvent(event, m_time.SimulationMilliseconds());
        }

        const game::gameplay::CatcherInput held = SampleHeldInput();
        while (m_time.ShouldRunFixedStep())
        {
            m_time.ConsumeFixedStep();
            m_game->FixedUpdate(held, m_time.SimulationMilliseconds());
        }

        if (m_game->Phase() != phaseBefore)
        {
            std::cout << "[Catcher] Phase " << game::gameplay::GamePhaseToString(phaseBefore) << " -> "
                      << game::gameplay::GamePhaseToString(m_game->Phase()) << " (score " << m_game->Score() << ")\n";
        }

        if (m_game->QuitRequested())
        {
            running = false;
            continue;
        }

        m_renderer.BeginFrame(kClearColor);
        m_drawList.Clear();
        m_game->Render(m_time.SimulationMilliseconds(), m_drawList);
        m_renderer.Submit(m_drawList);
        m_window.SwapBuffers();

        LimitFrameRate(frameStart);
    }

    std::cout << "[Catcher] Exiting with score " << m_game->Score() << "\n";
    m_game.reset();
    m_renderer.Shutdown();
    m_window.Shutdown();
    return true;
}

game::gameplay::CatcherAssets App::LoadAssets() const
{
    using assets::SpriteLoader;

    game::gameplay::CatcherAssets loaded;
    const int playerSize = m_tuning.playerSize;
    const int itemSize = m_tuning.itemSize;
    const int animationSize = m_tuning.endAnimationSize;

    loaded.catcherImage = SpriteLoader::LoadImage(m_assetPaths.catcherSprite, playerSize, playerSize, kPlayerPlaceholder);
    loaded.reactingImage = SpriteLoader::LoadImage(m_assetPaths.reactingSprite, playerSize, playerSize, kPlayerPlaceholder);
    loaded.itemImage = SpriteLoader::LoadImage(m_assetPaths.itemSprite, itemSize, itemSize, kItemPlaceholder);
    loaded.endingClip = SpriteLoader::LoadAnimation(m_assetPaths.endingAnimation, animationSize, animationSize, kAnimationPlaceholder);
    loaded.finalClip = SpriteLoader::LoadAnimation(m_assetPaths.finalAnimation, animationSize, animationSize, kAnimationPlaceholder);

    const std::vector<std::string> fonts = assets::FontLoader::CandidateFontPaths(m_assetPaths.fontPath);
    loaded.largeFont = assets::FontLoader::BakeAtlas(fonts, kLargeFontPx);
    loaded.smallFont = assets::FontLoader::BakeAtlas(fonts, kSmallFontPx);
    return loaded;
}

game::gameplay::CatcherInput App::SampleHeldInput() const
{
    game::gameplay::CatcherInput input;
    input.moveLeft = m_input.IsAnyKeyDown({GLFW_KEY_LEFT, GLFW_KEY_A});
    input.moveRight = m_input.IsAnyKeyDown({GLFW_KEY_RIGHT, GLFW_KEY_D});
    return input;
}

void App::LimitFrameRate(double frameStart) const
{
    if (m_graphics.vsync)
    {
        return;
    }

    double remaining = 0.0;
    if (m_graphics.fpsLimit > 0)
    {
        const double targetSeconds = 1.0 / static_cast<double>(m_graphics.fpsLimit);
        remaining = targetSeconds - (glfwGetTime() - frameStart);
    }
    else
    {
        remaining = m_time.SecondsUntilNextTick(glfwGetTime());
    }
    if (remaining <= 0.0)
    {
        return;
    }

    const double deadline = glfwGetTime() + remaining;
    const double sleepThreshold = 0.002;
    if (remaining > sleepThreshold)
    {
        std::this_thread::sleep_for(std::chrono::duration<double>(remaining - sleepThreshold));
    }
    while (glfwGetTime() < deadline)
    {
    }
}

bool App::LoadGameplayConfig()
{
    m_tuning = game::gameplay::GameplayTuning{};
    m_assetPaths = game::gameplay::AssetPaths{};

    std::filesystem::create_directories("config");
    const std::filesystem::path path = std::filesystem::path("config") / "gameplay.json";
    if (!std::filesystem::exists(path))
    {
        return SaveGameplayConfig();
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        std::cerr << "[Config] Failed to open gameplay config.\n";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& exception)
    {
        std::cerr << "[Config] Invalid gameplay JSON (" << exception.what() << "). Using defaults.\n";
        return SaveGameplayConfig();
    }

    m_tuning = game::gameplay::TuningFromJson(root);
    if (root.contains("assets") && root["assets"].is_object())
    {
        m_assetPaths = game::gameplay::AssetPathsFromJson(root["assets"]);
    }
    return true;
}

bool App::SaveGameplayConfig() const
{
    std::filesystem::create_directories("config");
    const std::filesystem::path path = std::filesystem::path("config") / "gameplay.json";

    json root = game::gameplay::TuningToJson(m_tuning);
    root["assets"] = game::gameplay::AssetPathsToJson(m_assetPaths);

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        return false;
    }
    stream << root.dump(2) << "\n";
    return true;
}

bool App::LoadGraphicsConfig()
{
    m_graphics = GraphicsSettings{};

    std::filesystem::create_directories("config");
    const std::filesystem::path path = std::filesystem::path("config") / "graphics.json";
    if (!std::filesystem::exists(path))
    {
        return SaveGraphicsConfig();
    }

    std::ifstream stream(path);
    if (!stream.is_open())
    {
        std::cerr << "[Config] Failed to open graphics config.\n";
        return false;
    }

    json root;
    try
    {
        stream >> root;
    }
    catch (const std::exception& exception)
    {
        std::cerr << "[Config] Invalid graphics JSON (" << exception.what() << "). Using defaults.\n";
        return SaveGraphicsConfig();
    }

    if (root.contains("asset_version") && root["asset_version"].is_number_integer())
    {
        m_graphics.assetVersion = root["asset_version"].get<int>();
    }
    if (root.contains("window_scale") && root["window_scale"].is_number())
    {
        m_graphics.windowScale = root["window_scale"].get<float>();
    }
    if (root.contains("vsync") && root["vsync"].is_boolean())
    {
        m_graphics.vsync = root["vsync"].get<bool>();
    }
    if (root.contains("fps_limit") && root["fps_limit"].is_number_integer())
    {
        m_graphics.fpsLimit = root["fps_limit"].get<int>();
    }

    m_graphics.windowScale = std::clamp(m_graphics.windowScale, 0.5F, 4.0F);
    m_graphics.fpsLimit = std::max(0, m_graphics.fpsLimit);
    return true;
}

bool App::SaveGraphicsConfig() const
{
    std::filesystem::create_directories("config");
    const std::filesystem::path path = std::filesystem::path("config") / "graphics.json";

    json root;
    root["asset_version"] = m_graphics.assetVersion;
    root["window_scale"] = m_graphics.windowScale;
    root["vsync"] = m_graphics.vsync;
    root["fps_limit"] = m_graphics.fpsLimit;

    std::ofstream stream(path);
    if (!stream.is_open())
    {
        return false;
    }
    stream << root.dump(2) << "\n";
    return true;
}
} // namespace engine::core
