#pragma once

#include "engine/core/Rect.hpp"
#include "engine/core/Time.hpp"
#include "engine/fx/TimedOverlay.hpp"
#include "engine/render/Image.hpp"
#include "game/gameplay/GameplayTuning.hpp"

namespace game::gameplay
{

/// Directional keys held during the current frame.
struct CatcherInput
{
    bool moveLeft = false;
    bool moveRight = false;
};

enum class CatcherPose
{
    Normal,
    Reacting
};

/// The player-controlled catcher at the bottom of the field.
class Catcher
{
public:
    Catcher(const GameplayTuning& tuning, engine::render::ImageHandle normalImage, engine::render::ImageHandle reactingImage);

    /// Applies held movement, then clamps inside [0, field width].
    void Update(const CatcherInput& input, engine::core::TimeMs nowMs);

    /// Shows the reacting pose until now + reaction duration. Re-triggering restarts the window.
    void TriggerReaction(engine::core::TimeMs nowMs);

    [[nodiscard]] CatcherPose PoseAt(engine::core::TimeMs nowMs) const;
    [[nodiscard]] const engine::render::Image* ImageAt(engine::core::TimeMs nowMs) const;

    [[nodiscard]] const engine::core::Rect& Bounds() const { return m_bounds; }
    [[nodiscard]] int Speed() const { return m_speed; }
    [[nodiscard]] engine::core::TimeMs ReactionExpiresAt() const { return m_reaction.ExpiresAt(); }
    [[nodiscard]] bool IsReacting(engine::core::TimeMs nowMs) const { return m_reaction.IsActive(nowMs); }

    /// Moves horizontally to `x`, clamped like regular movement.
    void SetX(int x);

private:
    void ClampToField();

    engine::core::Rect m_bounds;
    int m_speed;
    int m_fieldWidth;
    engine::fx::TimedOverlay m_reaction;
    engine::render::ImageHandle m_normalImage;
    engine::render::ImageHandle m_reactingImage;
};

} // namespace game::gameplay
