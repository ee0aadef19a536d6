#pragma once

#include <cstdint>
#include <vector>

#include "engine/core/Time.hpp"
#include "game/gameplay/FallingItem.hpp"
#include "game/gameplay/FloatingText.hpp"

namespace game::gameplay
{

/// Session phases, in the only order they can be entered.
enum class GamePhase : std::uint8_t
{
    Playing = 0,   ///< Spawning, movement and catching run
    Ended,         ///< Win screen with the continue button
    Final          ///< Closing screen, any key exits
};

[[nodiscard]] const char* GamePhaseToString(GamePhase phase);

/// All mutable state of one session, owned by the frame loop and handed to each system.
struct SessionState
{
    GamePhase phase = GamePhase::Playing;
    engine::core::TimeMs phaseEnteredMs = 0;
    int score = 0;
    std::vector<FallingItem> items;
    std::vector<FloatingText> messages;
    bool quitRequested = false;

    /// Moves to the next phase only; any other target is refused.
    bool AdvancePhase(GamePhase next, engine::core::TimeMs nowMs)
    {
        if (static_cast<int>(next) != static_cast<int>(phase) + 1)
        {
            return false;
        }
        phase = next;
        phaseEnteredMs = nowMs;
        return true;
    }

    void ClearActive()
    {
        items.clear();
        messages.clear();
    }
};

} // namespace game::gameplay
