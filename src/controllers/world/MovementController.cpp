/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/MovementController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"
#include <format>
#include <vector>

using namespace Spacegame;

void MovementController::handleEvent(const GameEvent& event, GameWorld& world) {
    if (!event.isAction(ActionType::Kind::MoveTo)) {
        return;
    }
    tryMove(event.getSubject(), event.getType().action.dir, world);
}

bool MovementController::tryMove(EntityID subject, Direction dir, GameWorld& world) {
    EntityRecord* actor = world.registry.tryGet(subject);
    if (!actor || !actor->body) {
        CONTROLLER_WARN(std::format("Move requested for entity {} with no body", subject));
        return false;
    }

    const bool isPlayer = actor->player;
    const Position origin = actor->body->refPosn;
    Position target = origin + directionDelta(dir);

    if (dir == Direction::UP || dir == Direction::DOWN) {
        if (!world.model.hasLevel(target.z)) {
            return false;
        }
        if (world.model.getTiletypeAt(origin) != TileType::Stairway) {
            if (isPlayer) {
                world.log.tellPlayer(dir == Direction::UP ? "There is nothing here to ascend."
                                                          : "There is nothing here to descend.");
            }
            return false;
        }
        if (auto exit = world.model.getExit(origin)) {
            target = *exit;
        }
    }

    if (!world.model.inBounds(target) || world.model.isBlockedAt(target) ||
        hasObstructionAt(subject, target, world)) {
        if (isPlayer) {
            world.log.tellPlayer(describeBlockage(subject, dir, target, world));
        }
        return false;
    }

    const int priority = actor->obstructive ? 20 : 10;
    const std::vector<Position> vacated = actor->body->posns();
    world.model.removeContents(vacated, subject);
    actor->body->moveTo(target);
    world.model.addContents(actor->body->posns(), priority, subject);

    // Later moves in the same tick run before the next reindex
    if (actor->obstructive) {
        for (const Position& posn : vacated) {
            if (!hasObstructionAt(subject, posn, world)) {
                world.model.setBlockedState(posn, false);
            }
        }
        for (const Position& posn : actor->body->posns()) {
            world.model.setBlockedState(posn, true);
        }
    }

    if (actor->viewshed) {
        actor->viewshed->dirty = true;
    }
    if (actor->description) {
        if (auto room = world.model.getRoomName(target)) {
            actor->description->locn = *room;
        }
    }

    if (isPlayer) {
        describeTile(subject, target, world);
    }
    return true;
}

bool MovementController::hasObstructionAt(EntityID subject, const Position& posn,
                                          const GameWorld& world) const {
    for (EntityID id : world.model.getContentsAt(posn)) {
        if (id == subject) {
            continue;
        }
        const EntityRecord* other = world.registry.tryGet(id);
        if (other && other->obstructive) {
            return true;
        }
    }
    return false;
}

std::string MovementController::describeBlockage(EntityID subject, Direction dir,
                                                 const Position& target,
                                                 const GameWorld& world) const {
    for (EntityID id : world.model.getContentsAt(target)) {
        if (id == subject) {
            continue;
        }
        const EntityRecord* blocker = world.registry.tryGet(id);
        if (blocker && blocker->obstructive) {
            return std::format("The way {} is blocked by a {}.", directionName(dir), blocker->name());
        }
    }
    return std::format("The way {} is blocked by the {}.", directionName(dir),
                       tileTypeName(world.model.getTiletypeAt(target)));
}

void MovementController::describeTile(EntityID subject, const Position& posn, GameWorld& world) const {
    std::vector<std::string> names;
    for (EntityID id : world.registry.entitiesAt(posn)) {
        if (id != subject) {
            names.push_back(world.registry.nameOf(id));
        }
    }
    if (names.empty()) {
        return;
    }
    if (names.size() > 3) {
        world.log.tellPlayer("There's some stuff here on the ground.");
        return;
    }

    // Newest arrivals first
    std::string text = "There's a ";
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        if (it != names.rbegin()) {
            text += ", and a ";
        }
        text += *it;
    }
    text += " here.";
    world.log.tellPlayer(text);
}
