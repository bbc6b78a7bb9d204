/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/DoorController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"
#include <format>

using namespace Spacegame;

namespace {

void markViewsheds(GameWorld& world) {
    for (auto& [id, record] : world.registry.entities()) {
        if (record.viewshed) {
            record.viewshed->dirty = true;
        }
    }
}

} // namespace

void DoorController::handleEvent(const GameEvent& event, GameWorld& world) {
    if (event.isAction(ActionType::Kind::OpenItem)) {
        openDoor(event.getSubject(), event.getObject(), world);
    } else if (event.isAction(ActionType::Kind::CloseItem)) {
        closeDoor(event.getSubject(), event.getObject(), world);
    }
}

bool DoorController::openDoor(EntityID subject, EntityID door, GameWorld& world) {
    EntityRecord* target = world.registry.tryGet(door);
    if (!target || !target->openable) {
        CONTROLLER_WARN(std::format("Entity {} cannot be opened", door));
        return false;
    }

    const bool byPlayer = subject == world.player();
    const std::string& name = target->name();
    if (target->lockable && target->lockable->isLocked) {
        world.log.tellPlayer(std::format("The {} is locked.", name));
        return false;
    }
    if (target->openable->isStuck) {
        world.log.tellPlayer(std::format("The {} is stuck.", name));
        return false;
    }
    if (target->openable->isOpen) {
        world.log.tellPlayer(std::format("The {} is already open.", name));
        return false;
    }

    target->openable->isOpen = true;
    if (target->body) {
        target->body->setGlyph(target->openable->openGlyph);
    }
    target->obstructive = false;
    if (target->opaque) {
        target->opaque->opaque = false;
    }
    markViewsheds(world);

    if (byPlayer) {
        world.log.tellPlayer(std::format("You open the {}.", name));
    } else {
        world.log.tellPlayer(std::format("The {} opens the {}.", world.registry.nameOf(subject), name));
    }
    return true;
}

bool DoorController::closeDoor(EntityID subject, EntityID door, GameWorld& world) {
    EntityRecord* target = world.registry.tryGet(door);
    if (!target || !target->openable) {
        CONTROLLER_WARN(std::format("Entity {} cannot be closed", door));
        return false;
    }

    const bool byPlayer = subject == world.player();
    const std::string& name = target->name();
    if (!target->openable->isOpen) {
        world.log.tellPlayer(std::format("The {} is already closed.", name));
        return false;
    }
    if (target->openable->isStuck) {
        world.log.tellPlayer(std::format("The {} is stuck.", name));
        return false;
    }
    if (target->body) {
        for (const auto& posn : target->body->posns()) {
            for (EntityID id : world.registry.entitiesAt(posn)) {
                if (id == door) {
                    continue;
                }
                const EntityRecord& other = world.registry.get(id);
                if (other.obstructive || other.mobile) {
                    world.log.tellPlayer("Something is in the way.");
                    return false;
                }
            }
        }
    }

    target->openable->isOpen = false;
    if (target->body) {
        target->body->setGlyph(target->openable->closedGlyph);
    }
    target->obstructive = true;
    if (target->opaque) {
        target->opaque->opaque = true;
    }
    markViewsheds(world);

    if (byPlayer) {
        world.log.tellPlayer(std::format("You close the {}.", name));
    } else {
        world.log.tellPlayer(std::format("The {} closes the {}.", world.registry.nameOf(subject), name));
    }
    return true;
}
