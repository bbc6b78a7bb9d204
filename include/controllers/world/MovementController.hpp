/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOVEMENT_CONTROLLER_HPP
#define MOVEMENT_CONTROLLER_HPP

/**
 * @file MovementController.hpp
 * @brief Moves actors across the map in response to MoveTo actions
 *
 * MovementController handles:
 * - Single-step moves in the eight compass directions
 * - Stair travel between decks through the model's portals
 * - Blocked-move feedback for the player
 * - Listing what the player finds on the new tile
 *
 * Ownership: ControllerRegistry owns the controller instance.
 */

#include "controllers/ControllerBase.hpp"
#include "entities/EntityID.hpp"
#include "utils/Position.hpp"
#include <string>

class MovementController : public ControllerBase {
public:
    MovementController() = default;
    ~MovementController() override = default;

    void handleEvent(const Spacegame::GameEvent& event, Spacegame::GameWorld& world) override;

    [[nodiscard]] std::string_view getName() const override { return "MovementController"; }

    /**
     * @brief Attempt to move an actor one step
     * @param subject The moving entity
     * @param dir Direction of travel
     * @param world World to move in
     * @return true if the actor moved
     */
    bool tryMove(Spacegame::EntityID subject, Spacegame::Direction dir, Spacegame::GameWorld& world);

private:
    bool hasObstructionAt(Spacegame::EntityID subject, const Spacegame::Position& posn,
                          const Spacegame::GameWorld& world) const;
    std::string describeBlockage(Spacegame::EntityID subject, Spacegame::Direction dir,
                                 const Spacegame::Position& target,
                                 const Spacegame::GameWorld& world) const;
    void describeTile(Spacegame::EntityID subject, const Spacegame::Position& posn,
                      Spacegame::GameWorld& world) const;
};

#endif // MOVEMENT_CONTROLLER_HPP
