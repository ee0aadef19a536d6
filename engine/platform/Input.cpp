#include "engine/platform/Input.hpp"

#include <algorithm>

#include <GLFW/glfw3.h>

namespace engine::platform
{
void Input::Watch(std::initializer_list<int> keys)
{
    for (int key : keys)
    {
        const bool known = std::any_of(m_watched.begin(), m_watched.end(), [key](const WatchedKey& watched) {
            return watched.key == key;
        });
        if (!known && key >= GLFW_KEY_SPACE && key <= GLFW_KEY_LAST)
        {
            m_watched.push_back(WatchedKey{key, false});
        }
    }
}

void Input::Update(GLFWwindow* window)
{
    for (WatchedKey& watched : m_watched)
    {
        watched.down = window != nullptr && glfwGetKey(window, watched.key) == GLFW_PRESS;
    }
}

bool Input::IsKeyDown(int key) const
{
    const auto it = std::find_if(m_watched.begin(), m_watched.end(), [key](const WatchedKey& watched) {
        return watched.key == key;
    });
    return it != m_watched.end() && it->down;
}

bool Input::IsAnyKeyDown(std::initializer_list<int> keys) const
{
    return std::any_of(keys.begin(), keys.end(), [this](int key) { return IsKeyDown(key); });
}
} // namespace engine::platform
