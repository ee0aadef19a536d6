#pragma once

#include <initializer_list>
#include <vector>

struct GLFWwindow;

namespace engine::platform
{
// Held state of a registered set of keys, sampled once per frame.
// Unregistered keys always read as released.
class Input
{
public:
    void Watch(std::initializer_list<int> keys);
    void Update(GLFWwindow* window);

    [[nodiscard]] bool IsKeyDown(int key) const;
    [[nodiscard]] bool IsAnyKeyDown(std::initializer_list<int> keys) const;

private:
    struct WatchedKey
    {
        int key = 0;
        bool down = false;
    };

    std::vector<WatchedKey> m_watched;
};
} // namespace engine::platform
