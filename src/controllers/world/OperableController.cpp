/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/OperableController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"
#include <algorithm>
#include <format>

using namespace Spacegame;

void OperableController::handleEvent(const GameEvent& event, GameWorld& world) {
    if (event.isAction(ActionType::Kind::UseItem)) {
        toggle(event.getSubject(), event.getObject(), world);
    }
}

bool OperableController::toggle(EntityID subject, EntityID device, GameWorld& world) {
    EntityRecord* record = world.registry.tryGet(device);
    if (!record || !record->device) {
        CONTROLLER_WARN(std::format("Entity {} is not a device", device));
        return false;
    }

    record->device->pwSwitch = !record->device->pwSwitch;
    if (!record->planq && subject == world.player()) {
        world.log.tellPlayer(std::format("You switch the {} {}.", record->name(),
                                         record->device->pwSwitch ? "on" : "off"));
    }
    return true;
}

void OperableController::update(float /*deltaTime*/, GameWorld& world) {
    for (auto& [id, record] : world.registry.entities()) {
        if (!record.device || !record.device->pwSwitch) {
            continue;
        }
        Device& device = *record.device;
        device.battVoltage = std::max(0.0f, device.battVoltage - device.battDischarge);
        if (device.battVoltage <= 0.0f) {
            device.pwSwitch = false;
            CONTROLLER_DEBUG(std::format("{} ({}) ran out of power", record.name(), id));
        }
    }
}
