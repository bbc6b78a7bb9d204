/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ChaseControllerTests
#include <boost/test/unit_test.hpp>

#include "ai/pathfinding/PathfindingGrid.hpp"
#include "controllers/ai/ChaseController.hpp"
#include "controllers/world/MapIndexingController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"

#include <vector>

using namespace Spacegame;

namespace {

// Walls around the edge, floor inside
WorldMap makeDeck(int width, int height) {
    WorldMap deck(width, height);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const bool edge = x == 0 || y == 0 || x == width - 1 || y == height - 1;
            deck.setTile(Position(x, y, 0), edge ? Tile::wall() : Tile::floor());
        }
    }
    deck.updateTilemaps();
    return deck;
}

} // namespace

struct PathfindingGridFixture {
    WorldMap deck{makeDeck(12, 8)};
    PathfindingGrid grid{12, 8, 0};

    PathfindingGridFixture() {
        SPACE_ENABLE_BENCHMARK_MODE();
        // Partition at x=6 with a gap at y=6
        for (int y = 1; y < 6; ++y) {
            deck.setTile(Position(6, y, 0), Tile::wall());
        }
        deck.updateTilemaps();
        grid.setAllowDiagonal(true);
        grid.rebuildFromMap(deck);
    }

    ~PathfindingGridFixture() {
        SPACE_DISABLE_BENCHMARK_MODE();
    }
};

BOOST_FIXTURE_TEST_SUITE(PathfindingGridTests, PathfindingGridFixture)

BOOST_AUTO_TEST_CASE(TestGridMirrorsBlockedMap) {
    BOOST_CHECK_EQUAL(grid.getWidth(), 12);
    BOOST_CHECK_EQUAL(grid.getHeight(), 8);
    BOOST_CHECK(grid.isBlocked(0, 0));
    BOOST_CHECK(grid.isBlocked(6, 3));
    BOOST_CHECK(!grid.isBlocked(6, 6));
    BOOST_CHECK(!grid.isBlocked(3, 3));
}

BOOST_AUTO_TEST_CASE(TestPathGoesAroundPartition) {
    std::vector<Position> path;
    const PathfindingResult result = grid.findPath(Position(3, 2, 0), Position(9, 2, 0), path);
    BOOST_REQUIRE_EQUAL(result, PathfindingResult::SUCCESS);
    BOOST_REQUIRE_GE(path.size(), 2u);
    BOOST_CHECK_EQUAL(path.front(), Position(3, 2, 0));
    BOOST_CHECK_EQUAL(path.back(), Position(9, 2, 0));

    bool usedGap = false;
    for (size_t i = 0; i < path.size(); ++i) {
        BOOST_CHECK(!deck.isBlocked(path[i]));
        if (path[i] == Position(6, 6, 0)) {
            usedGap = true;
        }
        if (i > 0) {
            BOOST_CHECK_LE(path[i].distanceTo(path[i - 1]), 1);
        }
    }
    BOOST_CHECK(usedGap);
}

BOOST_AUTO_TEST_CASE(TestStartEqualsGoal) {
    std::vector<Position> path;
    BOOST_CHECK_EQUAL(grid.findPath(Position(2, 2, 0), Position(2, 2, 0), path), PathfindingResult::SUCCESS);
    BOOST_REQUIRE_EQUAL(path.size(), 1u);
    BOOST_CHECK_EQUAL(path.front(), Position(2, 2, 0));
}

BOOST_AUTO_TEST_CASE(TestInvalidEndpoints) {
    std::vector<Position> path;
    BOOST_CHECK_EQUAL(grid.findPath(Position(20, 2, 0), Position(2, 2, 0), path),
                      PathfindingResult::INVALID_START);
    BOOST_CHECK_EQUAL(grid.findPath(Position(2, 2, 1), Position(2, 2, 0), path),
                      PathfindingResult::INVALID_START);
    BOOST_CHECK_EQUAL(grid.findPath(Position(2, 2, 0), Position(2, -1, 0), path),
                      PathfindingResult::INVALID_GOAL);
    BOOST_CHECK(path.empty());
}

BOOST_AUTO_TEST_CASE(TestSealedGoalHasNoPath) {
    grid.setBlocked(6, 6, true);
    std::vector<Position> path;
    BOOST_CHECK_EQUAL(grid.findPath(Position(3, 2, 0), Position(9, 2, 0), path),
                      PathfindingResult::NO_PATH_FOUND);
}

BOOST_AUTO_TEST_CASE(TestNoCornerCutting) {
    PathfindingGrid open(5, 5, 0);
    open.setAllowDiagonal(true);
    open.setBlocked(2, 1, true);

    std::vector<Position> path;
    BOOST_REQUIRE_EQUAL(open.findPath(Position(1, 1, 0), Position(2, 2, 0), path), PathfindingResult::SUCCESS);
    // (1,1) -> (2,2) would squeeze past the blocked (2,1)
    BOOST_CHECK_EQUAL(path.size(), 3u);
}

BOOST_AUTO_TEST_SUITE_END()

struct ChaseFixture {
    GameWorld world;
    EntityID player{INVALID_ENTITY};
    EntityID lmr{INVALID_ENTITY};

    ChaseFixture() {
        SPACE_ENABLE_BENCHMARK_MODE();
        world.log = MessageLog({"world", "planq", "debug"});
        world.model.levels.push_back(makeDeck(12, 7));

        EntityRecord hero;
        hero.body = Body(Position(6, 3, 0), ScreenCell("@", 15));
        hero.player = true;
        hero.mobile = true;
        hero.obstructive = true;
        player = place(std::move(hero));

        EntityRecord robot;
        robot.body = Body(Position(2, 3, 0), ScreenCell("l", 14));
        robot.description = Description{"LMR", "", ""};
        robot.lmr = true;
        robot.mobile = true;
        robot.obstructive = true;
        robot.viewshed = Viewshed{};
        lmr = place(std::move(robot));

        MapIndexingController::reindex(world);
    }

    ~ChaseFixture() {
        SPACE_DISABLE_BENCHMARK_MODE();
    }

    EntityID place(EntityRecord rec) {
        const std::vector<Position> posns = rec.body->posns();
        const EntityID id = world.registry.create(std::move(rec));
        world.model.addContents(posns, 20, id);
        return id;
    }

    void lmrSees(bool visible) {
        auto& viewshed = *world.registry.get(lmr).viewshed;
        viewshed.visibleTiles.clear();
        if (visible) {
            viewshed.visibleTiles.push_back(*world.positionOf(player));
        }
    }

    Pursuit pursuit() const {
        const EntityRecord& rec = world.registry.get(lmr);
        return rec.pursuit ? *rec.pursuit : Pursuit{};
    }

    void moveLmrTo(const Position& posn) {
        EntityRecord& rec = world.registry.get(lmr);
        world.model.removeContents(rec.body->posns(), lmr);
        rec.body->moveTo(posn);
        world.model.addContents(rec.body->posns(), 20, lmr);
        MapIndexingController::reindex(world);
    }
};

BOOST_FIXTURE_TEST_SUITE(ChaseTests, ChaseFixture)

BOOST_AUTO_TEST_CASE(TestStepDirection) {
    BOOST_CHECK(ChaseController::stepDirection(Position(2, 2, 0), Position(3, 2, 0)) == Direction::E);
    BOOST_CHECK(ChaseController::stepDirection(Position(2, 2, 0), Position(1, 1, 0)) == Direction::NW);
    BOOST_CHECK(ChaseController::stepDirection(Position(2, 2, 0), Position(2, 3, 0)) == Direction::S);
    BOOST_CHECK(!ChaseController::stepDirection(Position(2, 2, 0), Position(2, 2, 0)));
    BOOST_CHECK(!ChaseController::stepDirection(Position(2, 2, 0), Position(4, 2, 0)));
    BOOST_CHECK(!ChaseController::stepDirection(Position(2, 2, 0), Position(2, 2, 1)));
}

BOOST_AUTO_TEST_CASE(TestChasesVisiblePlayer) {
    lmrSees(true);
    ChaseController chase(1, 5);
    chase.update(0.25f, world);

    BOOST_CHECK(pursuit().chasing);
    BOOST_CHECK(pursuit().lineOfSight);
    BOOST_REQUIRE(pursuit().lastKnownTarget);
    BOOST_CHECK_EQUAL(*pursuit().lastKnownTarget, Position(6, 3, 0));

    BOOST_REQUIRE_EQUAL(world.pendingEvents.size(), 1u);
    const GameEvent& step = world.pendingEvents.front();
    BOOST_CHECK(step.getType().kind == GameEventType::Kind::ActorAction);
    BOOST_CHECK(step.isAction(ActionType::Kind::MoveTo));
    BOOST_CHECK(step.getType().action.dir == Direction::E);
    BOOST_CHECK_EQUAL(step.getSubject(), lmr);
}

BOOST_AUTO_TEST_CASE(TestDecidesOnInterval) {
    lmrSees(true);
    ChaseController chase(2, 5);
    chase.update(0.25f, world);
    BOOST_CHECK(world.pendingEvents.empty());
    chase.update(0.25f, world);
    BOOST_CHECK_EQUAL(world.pendingEvents.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestIdleWithoutSight) {
    lmrSees(false);
    ChaseController chase(1, 5);
    chase.update(0.25f, world);
    BOOST_CHECK(!pursuit().chasing);
    BOOST_CHECK(world.pendingEvents.empty());
}

BOOST_AUTO_TEST_CASE(TestHoldsPositionWhenAdjacent) {
    moveLmrTo(Position(5, 3, 0));
    lmrSees(true);
    ChaseController chase(1, 5);
    chase.update(0.25f, world);
    BOOST_CHECK(pursuit().chasing);
    BOOST_CHECK(world.pendingEvents.empty());
}

BOOST_AUTO_TEST_CASE(TestSearchesThenGivesUp) {
    lmrSees(true);
    ChaseController chase(1, 2);
    chase.update(0.25f, world);
    world.pendingEvents.clear();

    lmrSees(false);
    chase.update(0.25f, world);
    BOOST_CHECK(pursuit().chasing);
    BOOST_CHECK(!pursuit().lineOfSight);
    // Still heading for the last known position
    BOOST_CHECK_EQUAL(world.pendingEvents.size(), 1u);

    chase.update(0.25f, world);
    BOOST_CHECK(pursuit().chasing);
    chase.update(0.25f, world);
    BOOST_CHECK(!pursuit().chasing);
    BOOST_CHECK(!pursuit().lastKnownTarget);
}

BOOST_AUTO_TEST_CASE(TestNoRobotNoEvents) {
    world.registry.destroy(lmr);
    ChaseController chase(1, 5);
    chase.update(0.25f, world);
    BOOST_CHECK(world.pendingEvents.empty());
}

BOOST_AUTO_TEST_CASE(TestChaseResumesFromPursuitComponent) {
    // A chase in progress, as restored from a save
    Pursuit restored;
    restored.chasing = true;
    restored.lastKnownTarget = Position(6, 3, 0);
    restored.ticksWithoutSight = 1;
    world.registry.get(lmr).pursuit = restored;
    lmrSees(false);

    ChaseController chase(1, 5);
    chase.update(0.25f, world);
    BOOST_CHECK(pursuit().chasing);
    BOOST_CHECK_EQUAL(pursuit().ticksWithoutSight, 2);
    BOOST_REQUIRE_EQUAL(world.pendingEvents.size(), 1u);
    BOOST_CHECK(world.pendingEvents.front().getType().action.dir == Direction::E);
}

BOOST_AUTO_TEST_SUITE_END()
