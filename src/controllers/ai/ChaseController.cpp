/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/ai/ChaseController.hpp"
#include "ai/pathfinding/PathfindingGrid.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"
#include <format>
#include <vector>

using namespace Spacegame;

ChaseController::ChaseController(int chaseInterval, int maxTicksWithoutSight)
    : m_chaseInterval(chaseInterval > 0 ? chaseInterval : 1),
      m_maxTicksWithoutSight(maxTicksWithoutSight) {}

std::optional<Direction> ChaseController::stepDirection(const Position& from, const Position& to) {
    const int dx = to.x - from.x;
    const int dy = to.y - from.y;
    if (from.z != to.z || dx < -1 || dx > 1 || dy < -1 || dy > 1 || (dx == 0 && dy == 0)) {
        return std::nullopt;
    }
    for (Direction dir : {Direction::N, Direction::NW, Direction::W, Direction::SW,
                          Direction::S, Direction::SE, Direction::E, Direction::NE}) {
        const Position delta = directionDelta(dir);
        if (delta.x == dx && delta.y == dy) {
            return dir;
        }
    }
    return std::nullopt;
}

void ChaseController::update(float /*deltaTime*/, GameWorld& world) {
    if (++m_tickCounter < m_chaseInterval) {
        return;
    }
    m_tickCounter = 0;
    think(world);
}

void ChaseController::think(GameWorld& world) {
    const EntityID lmrId = world.registry.findLMR();
    const EntityID playerId = world.player();
    EntityRecord* lmr = world.registry.tryGet(lmrId);
    const EntityRecord* player = world.registry.tryGet(playerId);
    if (!lmr || !lmr->body || !player || !player->body) {
        return;
    }
    if (!lmr->pursuit) {
        lmr->pursuit.emplace();
    }
    Pursuit& pursuit = *lmr->pursuit;

    const Position self = lmr->body->refPosn;
    const Position target = player->body->refPosn;

    pursuit.lineOfSight = target.z == self.z && lmr->viewshed && lmr->viewshed->canSee(target);
    if (pursuit.lineOfSight) {
        pursuit.lastKnownTarget = target;
        pursuit.chasing = true;
        pursuit.ticksWithoutSight = 0;
    } else if (pursuit.chasing) {
        if (++pursuit.ticksWithoutSight > m_maxTicksWithoutSight) {
            AI_DEBUG("LMR lost the player");
            pursuit.chasing = false;
            pursuit.lastKnownTarget.reset();
            pursuit.ticksWithoutSight = 0;
        }
    }

    if (!pursuit.chasing || !pursuit.lastKnownTarget) {
        return;
    }

    const Position goal = *pursuit.lastKnownTarget;
    // Minimum range: stay put once adjacent to a visible player
    if (goal.z != self.z || (pursuit.lineOfSight && self.distanceTo(goal) <= 1) || self == goal) {
        return;
    }
    if (!world.model.hasLevel(self.z)) {
        return;
    }

    const WorldMap& deck = world.model.level(self.z);
    PathfindingGrid grid(deck.getWidth(), deck.getHeight(), self.z);
    grid.setAllowDiagonal(true);
    grid.rebuildFromMap(deck);

    std::vector<Position> path;
    const PathfindingResult result = grid.findPath(self, goal, path);
    if (result != PathfindingResult::SUCCESS || path.size() < 2) {
        PATHFIND_DEBUG(std::format("LMR has no path to {}: {}", goal.toString(),
                                   static_cast<int>(result)));
        return;
    }

    // The goal cell may hold the player; walking into it would just be blocked
    if (path[1] == target) {
        return;
    }

    if (auto dir = stepDirection(self, path[1])) {
        world.queueEvent(GameEvent::create(GameEventType::actorAction(ActionType::moveTo(*dir)), lmrId));
    }
}
