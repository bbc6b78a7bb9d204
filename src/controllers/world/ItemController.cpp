/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/ItemController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"
#include <format>

using namespace Spacegame;

void ItemController::handleEvent(const GameEvent& event, GameWorld& world) {
    if (event.isAction(ActionType::Kind::MoveItem)) {
        pickUp(event.getSubject(), event.getObject(), world);
    } else if (event.isAction(ActionType::Kind::DropItem)) {
        drop(event.getSubject(), event.getObject(), world);
    } else if (event.isAction(ActionType::Kind::KillItem)) {
        destroy(event.getObject(), world);
    }
}

bool ItemController::pickUp(EntityID subject, EntityID item, GameWorld& world) {
    EntityRecord* record = world.registry.tryGet(item);
    if (!record || !record->portable) {
        CONTROLLER_WARN(std::format("Entity {} is not portable", item));
        return false;
    }
    if (!world.registry.exists(subject)) {
        CONTROLLER_WARN(std::format("Pickup by unknown entity {}", subject));
        return false;
    }

    if (record->body && !record->isCarried) {
        world.model.removeContents(record->body->posns(), item);
    }
    record->portable->carrier = subject;
    record->isCarried = true;

    if (subject == world.player()) {
        world.log.tellPlayer(std::format("Obtained a {}.", record->name()));
    } else {
        world.log.tellPlayer(std::format("The {} takes a {}.", world.registry.nameOf(subject), record->name()));
    }
    return true;
}

bool ItemController::drop(EntityID subject, EntityID item, GameWorld& world) {
    EntityRecord* record = world.registry.tryGet(item);
    if (!record || !record->portable) {
        CONTROLLER_WARN(std::format("Entity {} is not portable", item));
        return false;
    }
    auto location = world.positionOf(subject);
    if (!location) {
        CONTROLLER_WARN(std::format("Drop by entity {} with no position", subject));
        return false;
    }

    record->portable->carrier = INVALID_ENTITY;
    record->isCarried = false;
    if (record->body) {
        record->body->moveTo(*location);
        world.model.addContents(record->body->posns(), record->obstructive ? 20 : 10, item);
    }

    if (subject == world.player()) {
        world.log.tellPlayer(std::format("Dropped a {}.", record->name()));
    } else {
        world.log.tellPlayer(std::format("The {} drops a {}.", world.registry.nameOf(subject), record->name()));
    }
    return true;
}

bool ItemController::destroy(EntityID item, GameWorld& world) {
    EntityRecord* record = world.registry.tryGet(item);
    if (!record) {
        CONTROLLER_WARN(std::format("Cannot destroy unknown entity {}", item));
        return false;
    }
    if (record->body && !record->isCarried) {
        world.model.removeContents(record->body->posns(), item);
    }
    if (world.planq.jackCnxn == item) {
        world.planq.jackCnxn = INVALID_ENTITY;
    }
    return world.registry.destroy(item);
}
