#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include <glm/vec2.hpp>

#include "engine/core/Rect.hpp"
#include "engine/render/Image.hpp"
#include "game/gameplay/GameplayTuning.hpp"

namespace game::gameplay
{

/// Reported by an item the tick it leaves the bottom of the field.
struct MissedSignal
{
    std::uint32_t itemId = 0;
    glm::ivec2 position{0, 0};     // Item centre at exit
};

/// Object falling at a constant speed from above the top edge.
class FallingItem
{
public:
    /// Random spawn: x in [0, field width - item size], y just above the top edge,
    /// speed uniform in [item speed min, item speed max].
    FallingItem(std::uint32_t id, engine::render::ImageHandle image, const GameplayTuning& tuning, std::mt19937& rng);

    /// Explicit placement.
    FallingItem(std::uint32_t id, engine::render::ImageHandle image, const engine::core::Rect& bounds, int speed);

    /// Advances one tick. Returns the missed signal exactly once, on the tick the top edge
    /// passes the field bottom; the item is marked removed at the same time.
    [[nodiscard]] std::optional<MissedSignal> Update(int fieldHeight);

    void MarkRemoved() { m_removed = true; }
    [[nodiscard]] bool IsRemoved() const { return m_removed; }

    [[nodiscard]] std::uint32_t Id() const { return m_id; }
    [[nodiscard]] const engine::core::Rect& Bounds() const { return m_bounds; }
    [[nodiscard]] int Speed() const { return m_speed; }
    [[nodiscard]] const engine::render::Image* GetImage() const { return m_image.get(); }

private:
    std::uint32_t m_id;
    engine::render::ImageHandle m_image;
    engine::core::Rect m_bounds;
    int m_speed;
    bool m_removed = false;
};

} // namespace game::gameplay
