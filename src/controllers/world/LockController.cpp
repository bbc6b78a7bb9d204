/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/LockController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"
#include <format>

using namespace Spacegame;

void LockController::handleEvent(const GameEvent& event, GameWorld& world) {
    if (event.isAction(ActionType::Kind::LockItem)) {
        setLocked(event.getSubject(), event.getObject(), true, world);
    } else if (event.isAction(ActionType::Kind::UnlockItem)) {
        setLocked(event.getSubject(), event.getObject(), false, world);
    }
}

bool LockController::hasKeyFor(EntityID subject, int keyId, const GameWorld& world) {
    if (keyId == 0) {
        return true;
    }
    for (EntityID id : world.registry.carriedBy(subject)) {
        const EntityRecord& item = world.registry.get(id);
        if (item.key && item.key->keyId == keyId) {
            return true;
        }
    }
    return false;
}

bool LockController::setLocked(EntityID subject, EntityID target, bool lock, GameWorld& world) {
    EntityRecord* record = world.registry.tryGet(target);
    if (!record || !record->lockable) {
        CONTROLLER_WARN(std::format("Entity {} has no lock", target));
        return false;
    }

    const std::string& name = record->name();
    if (record->lockable->isLocked == lock) {
        world.log.tellPlayer(std::format("The {} is already {}.", name, lock ? "locked" : "unlocked"));
        return false;
    }
    if (lock && record->openable && record->openable->isOpen) {
        world.log.tellPlayer(std::format("You need to close the {} first.", name));
        return false;
    }
    if (!hasKeyFor(subject, record->lockable->keyId, world)) {
        world.log.tellPlayer(std::format("You don't have the key for the {}.", name));
        return false;
    }

    record->lockable->isLocked = lock;
    if (subject == world.player()) {
        world.log.tellPlayer(std::format("You {} the {}.", lock ? "lock" : "unlock", name));
    } else {
        world.log.tellPlayer(std::format("The {} {} the {}.", world.registry.nameOf(subject),
                                         lock ? "locks" : "unlocks", name));
    }
    return true;
}
