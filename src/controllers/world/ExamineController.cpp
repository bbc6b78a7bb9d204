/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/ExamineController.hpp"
#include "world/GameWorld.hpp"
#include <cctype>
#include <format>

using namespace Spacegame;

void ExamineController::handleEvent(const GameEvent& event, GameWorld& world) {
    if (!event.isAction(ActionType::Kind::Examine)) {
        return;
    }
    world.log.tellPlayer(describe(event.getObject(), world));
}

std::string ExamineController::describe(EntityID target, const GameWorld& world) {
    const EntityRecord* record = world.registry.tryGet(target);
    if (!record || !record->description || record->description->desc.empty()) {
        return std::format("It's a {}.", world.registry.nameOf(target));
    }
    std::string name = record->description->name;
    if (!name.empty()) {
        name[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(name[0])));
    }
    return std::format("{}: {}", name, record->description->desc);
}
