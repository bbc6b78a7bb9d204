/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/VisibilityController.hpp"
#include "world/FieldOfView.hpp"
#include "world/GameWorld.hpp"
#include <algorithm>

using namespace Spacegame;

void VisibilityController::update(float /*deltaTime*/, GameWorld& world) {
    std::vector<EntityID> dirty;
    for (const auto& [id, record] : world.registry.entities()) {
        if (record.viewshed && record.viewshed->dirty && record.body) {
            dirty.push_back(id);
        }
    }
    for (EntityID id : dirty) {
        refresh(id, world);
    }
}

void VisibilityController::refresh(EntityID id, GameWorld& world) {
    EntityRecord* record = world.registry.tryGet(id);
    if (!record || !record->viewshed || !record->body) {
        return;
    }
    Viewshed& viewshed = *record->viewshed;
    const Position origin = record->body->refPosn;
    viewshed.visibleTiles.clear();
    viewshed.dirty = false;
    if (!world.model.hasLevel(origin.z)) {
        return;
    }

    WorldMap& deck = world.model.level(origin.z);
    for (const Position& posn : fieldOfView(origin, viewshed.range, deck)) {
        if (deck.inBounds(posn)) {
            viewshed.visibleTiles.push_back(posn);
        }
    }
    std::sort(viewshed.visibleTiles.begin(), viewshed.visibleTiles.end());

    if (!record->player) {
        return;
    }

    deck.clearVisible();
    if (!record->memory) {
        record->memory.emplace();
    }
    for (const Position& posn : viewshed.visibleTiles) {
        deck.setVisible(posn, true);
        deck.setRevealed(posn, true);

        ScreenCell seen = deck.getTile(posn).cell;
        if (auto top = deck.getVisibleEntityAt(posn)) {
            if (const EntityRecord* occupant = world.registry.tryGet(*top)) {
                if (occupant->body) {
                    if (auto glyph = occupant->body->glyphAt(posn)) {
                        seen = *glyph;
                    }
                }
            }
        }
        record->memory->cells[posn] = seen;
    }
}
