/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_BASE_HPP
#define CONTROLLER_BASE_HPP

/**
 * @file ControllerBase.hpp
 * @brief Base class for the gameplay controllers
 *
 * Controllers hold the rules of the game. Each one reacts to the
 * GameEvents dispatched on a world tick and edits the GameWorld it is
 * handed. They do NOT own world data and should NOT contain UI logic.
 *
 * Key characteristics:
 * - Owned by the GameSession's ControllerRegistry (not singletons)
 * - Suspended together while the game is paused
 * - Minimal state (timers and AI memory only)
 *
 * Controllers that act every tick, not just on events, also implement
 * IUpdatable.
 */

#include "events/GameEvent.hpp"
#include <string_view>

namespace Spacegame {
struct GameWorld;
}

class ControllerBase
{
public:
    virtual ~ControllerBase() = default;

    // Non-copyable
    ControllerBase(const ControllerBase&) = delete;
    ControllerBase& operator=(const ControllerBase&) = delete;

    /**
     * @brief React to one validated event
     * @param event The event being dispatched this tick
     * @param world The world the event applies to
     */
    virtual void handleEvent(const Spacegame::GameEvent& event, Spacegame::GameWorld& world)
    {
        (void)event;
        (void)world;
    }

    /**
     * @brief Get controller name for debugging
     */
    [[nodiscard]] virtual std::string_view getName() const = 0;

    void suspend() { m_suspended = true; }
    void resume() { m_suspended = false; }
    [[nodiscard]] bool isSuspended() const { return m_suspended; }

protected:
    ControllerBase() = default;

private:
    bool m_suspended{false};
};

#endif // CONTROLLER_BASE_HPP
