/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef IUPDATABLE_HPP
#define IUPDATABLE_HPP

/**
 * @file IUpdatable.hpp
 * @brief Interface for controllers that act on every world tick
 *
 * Controllers implement this interface when they need update() called
 * each tick. Event-only controllers (like DoorController) do NOT
 * implement this - they react purely to dispatched GameEvents.
 *
 * Usage:
 * - Tick-updatable: class MyController : public ControllerBase, public IUpdatable
 * - Event-only:     class MyController : public ControllerBase
 *
 * The ControllerRegistry auto-detects IUpdatable at compile time via
 * std::is_base_of_v and only calls update() on controllers that implement it.
 */

namespace Spacegame {
struct GameWorld;
}

class IUpdatable
{
public:
    virtual ~IUpdatable() = default;

    /**
     * @brief Per-tick update for the controller
     * @param deltaTime Game time covered by this tick in seconds
     * @param world The world being advanced
     *
     * Called by ControllerRegistry::updateAll() for all IUpdatable controllers.
     * Not called when controller is suspended (while the game is paused).
     */
    virtual void update(float deltaTime, Spacegame::GameWorld& world) = 0;
};

#endif // IUPDATABLE_HPP
