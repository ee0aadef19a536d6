#pragma once

#include <string>

#include <glm/vec2.hpp>

#include "engine/core/Time.hpp"
#include "engine/fx/TimedOverlay.hpp"

namespace game::gameplay
{

/// Short-lived text that fades out while drifting upward, then reports itself dead.
class FloatingText
{
public:
    static constexpr engine::core::TimeMs kDefaultDurationMs = 1000;
    static constexpr int kDefaultRisePx = 30;

    FloatingText(
        std::string text,
        const glm::ivec2& anchor,
        engine::core::TimeMs createdMs,
        engine::core::TimeMs durationMs = kDefaultDurationMs,
        int totalRisePx = kDefaultRisePx
    );

    /// Recomputes opacity and position for `now`.
    void Update(engine::core::TimeMs nowMs);

    [[nodiscard]] bool IsDead() const { return m_alpha <= 0; }

    /// 0..255, non-increasing over the lifetime, exactly 0 from created + duration on.
    [[nodiscard]] int Alpha() const { return m_alpha; }
    [[nodiscard]] float Opacity01() const { return static_cast<float>(m_alpha) / 255.0F; }

    /// Current centre of the text.
    [[nodiscard]] const glm::ivec2& Position() const { return m_position; }
    [[nodiscard]] const glm::ivec2& Anchor() const { return m_anchor; }
    [[nodiscard]] const std::string& Text() const { return m_text; }
    [[nodiscard]] engine::core::TimeMs CreatedAt() const { return m_window.startMs; }
    [[nodiscard]] engine::core::TimeMs ExpiresAt() const { return m_window.ExpiresAt(); }

private:
    std::string m_text;
    glm::ivec2 m_anchor;
    engine::fx::TimedOverlay m_window;
    int m_totalRisePx;

    int m_alpha = 255;
    glm::ivec2 m_position;
};

} // namespace game::gameplay
