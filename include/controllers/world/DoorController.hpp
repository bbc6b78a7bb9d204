/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DOOR_CONTROLLER_HPP
#define DOOR_CONTROLLER_HPP

/**
 * @file DoorController.hpp
 * @brief Opens and closes Openable entities
 *
 * An open door loses its Obstructive tag and stops blocking sight; a
 * closed one gets both back. Every viewshed is marked dirty after a
 * change so that sight lines through the doorway are recomputed.
 */

#include "controllers/ControllerBase.hpp"
#include "entities/EntityID.hpp"

class DoorController : public ControllerBase {
public:
    DoorController() = default;
    ~DoorController() override = default;

    void handleEvent(const Spacegame::GameEvent& event, Spacegame::GameWorld& world) override;

    [[nodiscard]] std::string_view getName() const override { return "DoorController"; }

    bool openDoor(Spacegame::EntityID subject, Spacegame::EntityID door, Spacegame::GameWorld& world);
    bool closeDoor(Spacegame::EntityID subject, Spacegame::EntityID door, Spacegame::GameWorld& world);
};

#endif // DOOR_CONTROLLER_HPP
