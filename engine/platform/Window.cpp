#include "engine/platform/Window.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

#include <GLFW/glfw3.h>

namespace engine::platform
{
Window::~Window()
{
    Shutdown();
}

bool Window::Initialize(const WindowSettings& settings)
{
    if (glfwInit() != GLFW_TRUE)
    {
        std::cerr << "Failed to initialize GLFW.\n";
        return false;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 5);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);
#if defined(__APPLE__)
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    m_logicalWidth = std::max(1, settings.width);
    m_logicalHeight = std::max(1, settings.height);
    m_windowWidth = static_cast<int>(std::lround(static_cast<float>(m_logicalWidth) * settings.windowScale));
    m_windowHeight = static_cast<int>(std::lround(static_cast<float>(m_logicalHeight) * settings.windowScale));

    m_window = glfwCreateWindow(m_windowWidth, m_windowHeight, settings.title.c_str(), nullptr, nullptr);
    if (m_window == nullptr)
    {
        std::cerr << "Failed to create GLFW window.\n";
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(m_window);
    glfwSetWindowUserPointer(m_window, this);
    glfwSetFramebufferSizeCallback(m_window, OnFramebufferResize);
    glfwSetKeyCallback(m_window, OnKey);
    glfwSetMouseButtonCallback(m_window, OnMouseButton);
    glfwSetWindowCloseCallback(m_window, OnClose);
    glfwGetFramebufferSize(m_window, &m_fbWidth, &m_fbHeight);
    glfwGetWindowSize(m_window, &m_windowWidth, &m_windowHeight);

    glfwSwapInterval(settings.vsync ? 1 : 0);
    return true;
}

void Window::Shutdown()
{
    if (m_window == nullptr)
    {
        return;
    }
    glfwDestroyWindow(m_window);
    m_window = nullptr;
    glfwTerminate();
}

std::vector<InputEvent> Window::PollEvents()
{
    glfwPollEvents();
    std::vector<InputEvent> events;
    events.swap(m_queued);
    return events;
}

void Window::SwapBuffers() const
{
    if (m_window != nullptr)
    {
        glfwSwapBuffers(m_window);
    }
}

glm::vec2 Window::ToLogical(double windowX, double windowY) const
{
    const double scaleX = static_cast<double>(m_logicalWidth) / static_cast<double>(std::max(1, m_windowWidth));
    const double scaleY = static_cast<double>(m_logicalHeight) / static_cast<double>(std::max(1, m_windowHeight));
    return glm::vec2{static_cast<float>(windowX * scaleX), static_cast<float>(windowY * scaleY)};
}

void Window::SetResizeCallback(std::function<void(int, int)> callback)
{
    m_resizeCallback = std::move(callback);
}

Window* Window::FromHandle(GLFWwindow* window)
{
    return static_cast<Window*>(glfwGetWindowUserPointer(window));
}

void Window::OnFramebufferResize(GLFWwindow* window, int width, int height)
{
    Window* self = FromHandle(window);
    if (self == nullptr)
    {
        return;
    }
    self->m_fbWidth = width;
    self->m_fbHeight = height;
    glfwGetWindowSize(window, &self->m_windowWidth, &self->m_windowHeight);
    if (self->m_resizeCallback)
    {
        self->m_resizeCallback(width, height);
    }
}

void Window::OnKey(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/)
{
    Window* self = FromHandle(window);
    if (self != nullptr && action == GLFW_PRESS)
    {
        self->m_queued.push_back(InputEvent::KeyDown(key));
    }
}

void Window::OnMouseButton(GLFWwindow* window, int button, int action, int /*mods*/)
{
    Window* self = FromHandle(window);
    if (self == nullptr || action != GLFW_PRESS)
    {
        return;
    }
    double cursorX = 0.0;
    double cursorY = 0.0;
    glfwGetCursorPos(window, &cursorX, &cursorY);
    self->m_queued.push_back(InputEvent::MouseDown(button, self->ToLogical(cursorX, cursorY)));
}

void Window::OnClose(GLFWwindow* window)
{
    Window* self = FromHandle(window);
    if (self != nullptr)
    {
        // Exit goes through the session's Quit handling
        glfwSetWindowShouldClose(window, GLFW_FALSE);
        self->m_queued.push_back(InputEvent::Quit());
    }
}
} // namespace engine::platform
