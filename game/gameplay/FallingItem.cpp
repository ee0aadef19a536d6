#include "game/gameplay/FallingItem.hpp"

#include <algorithm>
#include <utility>

namespace game::gameplay
{

FallingItem::FallingItem(std::uint32_t id, engine::render::ImageHandle image, const GameplayTuning& tuning, std::mt19937& rng)
    : m_id(id)
    , m_image(std::move(image))
    , m_bounds{0, -tuning.itemSize, tuning.itemSize, tuning.itemSize}
    , m_speed(tuning.itemSpeedMin)
{
    std::uniform_int_distribution<int> spawnX(0, std::max(0, tuning.fieldWidth - tuning.itemSize));
    std::uniform_int_distribution<int> speed(tuning.itemSpeedMin, std::max(tuning.itemSpeedMin, tuning.itemSpeedMax));
    m_bounds.x = spawnX(rng);
    m_speed = speed(rng);
}

FallingItem::FallingItem(std::uint32_t id, engine::render::ImageHandle image, const engine::core::Rect& bounds, int speed)
    : m_id(id)
    , m_image(std::move(image))
    , m_bounds(bounds)
    , m_speed(speed)
{
}

std::optional<MissedSignal> FallingItem::Update(int fieldHeight)
{
    if (m_removed)
    {
        return std::nullopt;
    }

    m_bounds.y += m_speed;
    if (m_bounds.Top() > fieldHeight)
    {
        m_removed = true;
        return MissedSignal{m_id, m_bounds.Center()};
    }
    return std::nullopt;
}

} // namespace game::gameplay
