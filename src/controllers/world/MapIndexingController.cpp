/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/MapIndexingController.hpp"
#include "world/GameWorld.hpp"

using namespace Spacegame;

void MapIndexingController::update(float /*deltaTime*/, GameWorld& world) {
    reindex(world);
}

void MapIndexingController::reindex(GameWorld& world) {
    for (auto& deck : world.model.levels) {
        deck.updateTilemaps();
    }

    for (const auto& [id, record] : world.registry.entities()) {
        if (!record.body || record.isCarried) {
            continue;
        }
        const bool opaque = record.opaque && record.opaque->opaque;
        if (!record.obstructive && !opaque) {
            continue;
        }
        for (const Position& posn : record.body->posns()) {
            if (!world.model.inBounds(posn)) {
                continue;
            }
            WorldMap& deck = world.model.level(posn.z);
            if (record.obstructive) {
                deck.setBlocked(posn, true);
            }
            if (opaque) {
                deck.setOpaque(posn, true);
            }
        }
    }
}
