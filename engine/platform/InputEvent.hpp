#pragma once

#include <glm/vec2.hpp>

namespace engine::platform
{
// Discrete event drained once per frame, in arrival order.
struct InputEvent
{
    enum class Type
    {
        Quit,
        KeyDown,
        MouseButtonDown
    };

    Type type = Type::Quit;
    int code = 0;                       // Key or mouse button code
    glm::vec2 position{0.0F, 0.0F};     // Cursor position for mouse events, play-field coordinates

    [[nodiscard]] static InputEvent Quit() { return InputEvent{Type::Quit, 0, glm::vec2{0.0F}}; }
    [[nodiscard]] static InputEvent KeyDown(int key) { return InputEvent{Type::KeyDown, key, glm::vec2{0.0F}}; }
    [[nodiscard]] static InputEvent MouseDown(int button, const glm::vec2& position)
    {
        return InputEvent{Type::MouseButtonDown, button, position};
    }
};
} // namespace engine::platform
