/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/VictoryController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"

using namespace Spacegame;

void VictoryController::update(float /*deltaTime*/, GameWorld& world) {
    if (world.requestedMode || !isVictorious(world)) {
        return;
    }
    GAMEPLAY_INFO("Player reached the victory point with the PLANQ");
    world.requestMode(EngineMode::GoodEnd);
}

bool VictoryController::isVictorious(const GameWorld& world) {
    const EntityID player = world.player();
    const auto posn = world.positionOf(player);
    if (!posn || *posn != world.victoryPoint) {
        return false;
    }
    const EntityRecord* planq = world.registry.tryGet(world.registry.findPlanq());
    return planq && planq->portable && planq->portable->carrier == player;
}
