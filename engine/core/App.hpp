#pragma once

#include <memory>
#include <string>

#include "engine/core/Time.hpp"
#include "engine/platform/Input.hpp"
#include "engine/platform/Window.hpp"
#include "engine/render/DrawList.hpp"
#include "engine/render/SpriteRenderer.hpp"
#include "game/gameplay/CatcherGame.hpp"
#include "game/gameplay/GameplayTuning.hpp"

namespace engine::core
{
class App
{
public:
    bool Run();

    struct GraphicsSettings
    {
        int assetVersion = 1;
        float windowScale = 1.0F;
        bool vsync = true;
        int fpsLimit = 60;
    };

private:
    static constexpr int kFixedTickHz = 60;

    bool LoadGameplayConfig();
    bool SaveGameplayConfig() const;
    bool LoadGraphicsConfig();
    bool SaveGraphicsConfig() const;

    [[nodiscard]] game::gameplay::CatcherAssets LoadAssets() const;
    [[nodiscard]] game::gameplay::CatcherInput SampleHeldInput() const;
    void LimitFrameRate(double frameStart) const;

    platform::Window m_window;
    platform::Input m_input;
    render::SpriteRenderer m_renderer;
    render::DrawList m_drawList;
    Time m_time{1.0 / static_cast<double>(kFixedTickHz)};

    platform::WindowSettings m_windowSettings;
    GraphicsSettings m_graphics;
    game::gameplay::GameplayTuning m_tuning;
    game::gameplay::AssetPaths m_assetPaths;

    std::unique_ptr<game::gameplay::CatcherGame> m_game;
};
} // namespace engine::core
