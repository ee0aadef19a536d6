#pragma once

#include <functional>
#include <string>
#include <vector>

#include <glm/vec2.hpp>

#include "engine/platform/InputEvent.hpp"

struct GLFWwindow;

namespace engine::platform
{
struct WindowSettings
{
    int width = 600;            // Logical size; the OS window is this times windowScale
    int height = 800;
    float windowScale = 1.0F;
    bool vsync = true;
    std::string title = "Catcher";
};

class Window
{
public:
    Window() = default;
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool Initialize(const WindowSettings& settings);
    void Shutdown();

    // Pumps the OS queue and hands over everything queued since the last call.
    // A close request arrives as a Quit event; mouse positions are logical.
    [[nodiscard]] std::vector<InputEvent> PollEvents();
    void SwapBuffers() const;

    [[nodiscard]] GLFWwindow* NativeHandle() const { return m_window; }
    [[nodiscard]] int FramebufferWidth() const { return m_fbWidth; }
    [[nodiscard]] int FramebufferHeight() const { return m_fbHeight; }

    [[nodiscard]] glm::vec2 ToLogical(double windowX, double windowY) const;

    void SetResizeCallback(std::function<void(int, int)> callback);

private:
    static Window* FromHandle(GLFWwindow* window);
    static void OnFramebufferResize(GLFWwindow* window, int width, int height);
    static void OnKey(GLFWwindow* window, int key, int scancode, int action, int mods);
    static void OnMouseButton(GLFWwindow* window, int button, int action, int mods);
    static void OnClose(GLFWwindow* window);

    GLFWwindow* m_window = nullptr;
    std::function<void(int, int)> m_resizeCallback;
    std::vector<InputEvent> m_queued;

    int m_logicalWidth = 600;
    int m_logicalHeight = 800;
    int m_windowWidth = 600;
    int m_windowHeight = 800;
    int m_fbWidth = 600;
    int m_fbHeight = 800;
};
} // namespace engine::platform
