/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE WorldControllerTests
#include <boost/test/unit_test.hpp>

#include "controllers/world/DoorController.hpp"
#include "controllers/world/ExamineController.hpp"
#include "controllers/world/ItemController.hpp"
#include "controllers/world/LockController.hpp"
#include "controllers/world/MapIndexingController.hpp"
#include "controllers/world/MovementController.hpp"
#include "controllers/world/OperableController.hpp"
#include "controllers/world/VictoryController.hpp"
#include "controllers/world/VisibilityController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"

#include <algorithm>
#include <string>

using namespace Spacegame;

namespace {

// 10x6 deck: walls around the edge, floor inside
WorldMap makeDeck() {
    WorldMap deck(10, 6);
    for (int y = 0; y < 6; ++y) {
        for (int x = 0; x < 10; ++x) {
            const bool edge = x == 0 || y == 0 || x == 9 || y == 5;
            deck.setTile(Position(x, y, 0), edge ? Tile::wall() : Tile::floor());
        }
    }
    deck.updateTilemaps();
    return deck;
}

EntityRecord makeThing(const std::string& name, const Position& posn, const std::string& glyph) {
    EntityRecord rec;
    rec.body = Body(posn, ScreenCell(glyph, 7));
    rec.description = Description{name, "", ""};
    return rec;
}

} // namespace

struct WorldFixture {
    GameWorld world;
    EntityID player{INVALID_ENTITY};

    WorldFixture() {
        SPACE_ENABLE_BENCHMARK_MODE();
        world.log = MessageLog({"world", "planq", "debug"});
        world.model.levels.push_back(makeDeck());
        world.model.levels.push_back(makeDeck());
        world.model.level(0).setTile(Position(8, 4, 0), Tile::stairway());
        world.model.level(0).updateTilemaps();
        world.model.addPortal(Position(8, 4, 0), Position(8, 4, 1), true);

        EntityRecord rec = makeThing("player", Position(2, 2, 0), "@");
        rec.player = true;
        rec.mobile = true;
        rec.obstructive = true;
        rec.viewshed = Viewshed{};
        player = spawn(std::move(rec));
    }

    ~WorldFixture() {
        SPACE_DISABLE_BENCHMARK_MODE();
    }

    EntityID spawn(EntityRecord rec) {
        const int priority = rec.obstructive ? 20 : 10;
        const std::vector<Position> posns = rec.body->posns();
        const EntityID id = world.registry.create(std::move(rec));
        world.model.addContents(posns, priority, id);
        return id;
    }

    EntityID spawnDoor(const Position& posn) {
        EntityRecord rec = makeThing("door", posn, "█");
        rec.openable = Openable{false, false, "▒", "█"};
        rec.opaque = Opaque{};
        rec.obstructive = true;
        return spawn(std::move(rec));
    }

    EntityID spawnPortable(const std::string& name, const Position& posn) {
        EntityRecord rec = makeThing(name, posn, "%");
        rec.portable = Portable{};
        return spawn(std::move(rec));
    }

    std::string lastMessage() const {
        const auto lines = world.log.getLogAsLines("world", 1);
        return lines.empty() ? std::string() : lines.back();
    }

    Position playerPosn() const {
        return *world.positionOf(player);
    }
};

BOOST_FIXTURE_TEST_SUITE(MovementTests, WorldFixture)

BOOST_AUTO_TEST_CASE(TestMoveOntoFloor) {
    MovementController movement;
    BOOST_CHECK(movement.tryMove(player, Direction::E, world));
    BOOST_CHECK_EQUAL(playerPosn(), Position(3, 2, 0));

    const auto here = world.model.getContentsAt(Position(3, 2, 0));
    BOOST_REQUIRE_EQUAL(here.size(), 1u);
    BOOST_CHECK_EQUAL(here.front(), player);
    BOOST_CHECK(world.model.getContentsAt(Position(2, 2, 0)).empty());
    BOOST_CHECK(world.registry.get(player).viewshed->dirty);
}

BOOST_AUTO_TEST_CASE(TestMoveEventIsHandled) {
    MovementController movement;
    movement.handleEvent(GameEvent::create(GameEventType::playerAction(ActionType::moveTo(Direction::SE)), player),
                         world);
    BOOST_CHECK_EQUAL(playerPosn(), Position(3, 3, 0));

    // Other actions are ignored
    movement.handleEvent(GameEvent::create(GameEventType::playerAction(ActionType::Kind::Examine), player, player),
                         world);
    BOOST_CHECK_EQUAL(playerPosn(), Position(3, 3, 0));
}

BOOST_AUTO_TEST_CASE(TestWallBlocksMovement) {
    MovementController movement;
    movement.tryMove(player, Direction::N, world);
    BOOST_CHECK(!movement.tryMove(player, Direction::N, world));
    BOOST_CHECK_EQUAL(playerPosn(), Position(2, 1, 0));
    BOOST_CHECK_EQUAL(lastMessage(), "The way north is blocked by the wall.");
}

BOOST_AUTO_TEST_CASE(TestObstructiveEntityBlocksMovement) {
    EntityRecord rec = makeThing("locker", Position(3, 2, 0), "▯");
    rec.obstructive = true;
    spawn(std::move(rec));
    MapIndexingController::reindex(world);

    MovementController movement;
    BOOST_CHECK(!movement.tryMove(player, Direction::E, world));
    BOOST_CHECK_EQUAL(lastMessage(), "The way east is blocked by a locker.");
}

BOOST_AUTO_TEST_CASE(TestMovesInOneTickDoNotStack) {
    EntityRecord rec = makeThing("LMR", Position(4, 2, 0), "R");
    rec.mobile = true;
    rec.obstructive = true;
    const EntityID lmr = spawn(std::move(rec));
    MapIndexingController::reindex(world);

    // Both moves land before the next reindex
    MovementController movement;
    BOOST_CHECK(movement.tryMove(lmr, Direction::W, world));
    BOOST_CHECK(!movement.tryMove(player, Direction::E, world));
    BOOST_CHECK_EQUAL(playerPosn(), Position(2, 2, 0));
    BOOST_CHECK_EQUAL(*world.positionOf(lmr), Position(3, 2, 0));
    BOOST_CHECK_EQUAL(lastMessage(), "The way east is blocked by a LMR.");

    BOOST_CHECK(world.model.isBlockedAt(Position(3, 2, 0)));
    BOOST_CHECK(!world.model.isBlockedAt(Position(4, 2, 0)));
}

BOOST_AUTO_TEST_CASE(TestUnindexedObstructionBlocksMovement) {
    EntityRecord rec = makeThing("locker", Position(3, 2, 0), "▯");
    rec.obstructive = true;
    spawn(std::move(rec));

    MovementController movement;
    BOOST_CHECK(!movement.tryMove(player, Direction::E, world));
    BOOST_CHECK_EQUAL(playerPosn(), Position(2, 2, 0));
}

BOOST_AUTO_TEST_CASE(TestClimbingNeedsStairway) {
    MovementController movement;
    BOOST_CHECK(!movement.tryMove(player, Direction::UP, world));
    BOOST_CHECK_EQUAL(lastMessage(), "There is nothing here to ascend.");
    BOOST_CHECK_EQUAL(playerPosn(), Position(2, 2, 0));
}

BOOST_AUTO_TEST_CASE(TestClimbingStairway) {
    world.registry.get(player).body->moveTo(Position(8, 4, 0));
    MovementController movement;

    // No deck below the lowest one
    BOOST_CHECK(!movement.tryMove(player, Direction::DOWN, world));
    BOOST_CHECK(movement.tryMove(player, Direction::UP, world));
    BOOST_CHECK_EQUAL(playerPosn(), Position(8, 4, 1));

    BOOST_CHECK(!movement.tryMove(player, Direction::DOWN, world));
    BOOST_CHECK_EQUAL(lastMessage(), "There is nothing here to descend.");
}

BOOST_AUTO_TEST_CASE(TestArrivalDescribesItems) {
    spawnPortable("crate", Position(3, 2, 0));
    spawnPortable("keycard", Position(3, 2, 0));

    MovementController movement;
    movement.tryMove(player, Direction::E, world);
    BOOST_CHECK_EQUAL(lastMessage(), "There's a keycard, and a crate here.");
}

BOOST_AUTO_TEST_CASE(TestArrivalSummarizesClutter) {
    for (int i = 0; i < 4; ++i) {
        spawnPortable("crate", Position(3, 2, 0));
    }
    MovementController movement;
    movement.tryMove(player, Direction::E, world);
    BOOST_CHECK_EQUAL(lastMessage(), "There's some stuff here on the ground.");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DoorAndLockTests, WorldFixture)

BOOST_AUTO_TEST_CASE(TestOpenAndCloseDoor) {
    const EntityID door = spawnDoor(Position(4, 2, 0));
    DoorController doors;

    BOOST_CHECK(doors.openDoor(player, door, world));
    const EntityRecord& rec = world.registry.get(door);
    BOOST_CHECK(rec.openable->isOpen);
    BOOST_CHECK(!rec.obstructive);
    BOOST_CHECK(!rec.opaque->opaque);
    BOOST_CHECK_EQUAL(rec.body->mainCell().glyph, "▒");
    BOOST_CHECK_EQUAL(lastMessage(), "You open the door.");

    BOOST_CHECK(!doors.openDoor(player, door, world));
    BOOST_CHECK_EQUAL(lastMessage(), "The door is already open.");

    doors.handleEvent(GameEvent::create(GameEventType::playerAction(ActionType::Kind::CloseItem), player, door),
                      world);
    BOOST_CHECK(!rec.openable->isOpen);
    BOOST_CHECK(rec.obstructive);
    BOOST_CHECK_EQUAL(rec.body->mainCell().glyph, "█");
    BOOST_CHECK_EQUAL(lastMessage(), "You close the door.");
}

BOOST_AUTO_TEST_CASE(TestDoorCannotCloseOnSomething) {
    const EntityID door = spawnDoor(Position(3, 2, 0));
    DoorController doors;
    doors.openDoor(player, door, world);

    MovementController movement;
    BOOST_REQUIRE(movement.tryMove(player, Direction::E, world));
    BOOST_CHECK(!doors.closeDoor(player, door, world));
    BOOST_CHECK_EQUAL(lastMessage(), "Something is in the way.");
    BOOST_CHECK(world.registry.get(door).openable->isOpen);
}

BOOST_AUTO_TEST_CASE(TestStuckAndLockedDoors) {
    const EntityID stuck = spawnDoor(Position(4, 2, 0));
    world.registry.get(stuck).openable->isStuck = true;
    const EntityID locked = spawnDoor(Position(5, 2, 0));
    world.registry.get(locked).lockable = Lockable{true, 3};

    DoorController doors;
    BOOST_CHECK(!doors.openDoor(player, stuck, world));
    BOOST_CHECK_EQUAL(lastMessage(), "The door is stuck.");
    BOOST_CHECK(!doors.openDoor(player, locked, world));
    BOOST_CHECK_EQUAL(lastMessage(), "The door is locked.");
}

BOOST_AUTO_TEST_CASE(TestOpeningDoorDirtiesViewsheds) {
    const EntityID door = spawnDoor(Position(4, 2, 0));
    world.registry.get(player).viewshed->dirty = false;

    DoorController doors;
    doors.openDoor(player, door, world);
    BOOST_CHECK(world.registry.get(player).viewshed->dirty);
}

BOOST_AUTO_TEST_CASE(TestUnlockNeedsMatchingKey) {
    const EntityID door = spawnDoor(Position(4, 2, 0));
    world.registry.get(door).lockable = Lockable{true, 7};
    LockController locks;

    BOOST_CHECK(!locks.setLocked(player, door, false, world));
    BOOST_CHECK_EQUAL(lastMessage(), "You don't have the key for the door.");

    EntityRecord card = makeThing("keycard", Position(2, 2, 0), "⊟");
    card.key = Key{7};
    card.portable = Portable{player};
    card.isCarried = true;
    world.registry.create(std::move(card));

    BOOST_CHECK(LockController::hasKeyFor(player, 7, world));
    BOOST_CHECK(!LockController::hasKeyFor(player, 8, world));
    BOOST_CHECK(locks.setLocked(player, door, false, world));
    BOOST_CHECK_EQUAL(lastMessage(), "You unlock the door.");
    BOOST_CHECK(!world.registry.get(door).lockable->isLocked);

    BOOST_CHECK(!locks.setLocked(player, door, false, world));
    BOOST_CHECK_EQUAL(lastMessage(), "The door is already unlocked.");
}

BOOST_AUTO_TEST_CASE(TestKeyZeroNeedsNoKey) {
    const EntityID door = spawnDoor(Position(4, 2, 0));
    world.registry.get(door).lockable = Lockable{false, 0};
    LockController locks;

    locks.handleEvent(GameEvent::create(GameEventType::playerAction(ActionType::Kind::LockItem), player, door),
                      world);
    BOOST_CHECK(world.registry.get(door).lockable->isLocked);
    BOOST_CHECK_EQUAL(lastMessage(), "You lock the door.");
}

BOOST_AUTO_TEST_CASE(TestCannotLockOpenDoor) {
    const EntityID door = spawnDoor(Position(4, 2, 0));
    world.registry.get(door).lockable = Lockable{false, 0};
    DoorController doors;
    doors.openDoor(player, door, world);

    LockController locks;
    BOOST_CHECK(!locks.setLocked(player, door, true, world));
    BOOST_CHECK_EQUAL(lastMessage(), "You need to close the door first.");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ItemTests, WorldFixture)

BOOST_AUTO_TEST_CASE(TestPickUpAndDrop) {
    const EntityID crate = spawnPortable("crate", Position(2, 2, 0));
    ItemController items;

    BOOST_CHECK(items.pickUp(player, crate, world));
    BOOST_CHECK_EQUAL(lastMessage(), "Obtained a crate.");
    BOOST_CHECK(world.registry.get(crate).isCarried);
    BOOST_CHECK_EQUAL(world.registry.carriedBy(player).size(), 1u);
    const auto here = world.model.getContentsAt(Position(2, 2, 0));
    BOOST_CHECK(std::find(here.begin(), here.end(), crate) == here.end());

    MovementController movement;
    movement.tryMove(player, Direction::S, world);
    BOOST_CHECK(items.drop(player, crate, world));
    BOOST_CHECK_EQUAL(lastMessage(), "Dropped a crate.");
    BOOST_CHECK(!world.registry.get(crate).isCarried);
    BOOST_CHECK_EQUAL(*world.positionOf(crate), Position(2, 3, 0));
    BOOST_CHECK(world.registry.carriedBy(player).empty());
}

BOOST_AUTO_TEST_CASE(TestFixturesCannotBePickedUp) {
    const EntityID door = spawnDoor(Position(3, 2, 0));
    ItemController items;
    BOOST_CHECK(!items.pickUp(player, door, world));
    BOOST_CHECK(!world.registry.get(door).isCarried);
}

BOOST_AUTO_TEST_CASE(TestDestroyRemovesItem) {
    const EntityID crate = spawnPortable("crate", Position(3, 2, 0));
    world.planq.jackCnxn = crate;

    ItemController items;
    items.handleEvent(GameEvent::create(GameEventType::playerAction(ActionType::Kind::KillItem), player, crate),
                      world);
    BOOST_CHECK(!world.registry.exists(crate));
    BOOST_CHECK(world.model.getContentsAt(Position(3, 2, 0)).empty());
    BOOST_CHECK_EQUAL(world.planq.jackCnxn, INVALID_ENTITY);
    BOOST_CHECK(!items.destroy(crate, world));
}

BOOST_AUTO_TEST_CASE(TestExamine) {
    EntityRecord rec = makeThing("terminal", Position(3, 2, 0), "◘");
    rec.description->desc = "A dusty access terminal.";
    const EntityID terminal = spawn(std::move(rec));
    const EntityID crate = spawnPortable("crate", Position(4, 2, 0));

    BOOST_CHECK_EQUAL(ExamineController::describe(terminal, world), "Terminal: A dusty access terminal.");
    BOOST_CHECK_EQUAL(ExamineController::describe(crate, world), "It's a crate.");
    BOOST_CHECK_EQUAL(ExamineController::describe(999, world), "It's a nothing.");

    ExamineController examine;
    examine.handleEvent(GameEvent::create(GameEventType::playerAction(ActionType::Kind::Examine), player, terminal),
                        world);
    BOOST_CHECK_EQUAL(lastMessage(), "Terminal: A dusty access terminal.");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SystemTests, WorldFixture)

BOOST_AUTO_TEST_CASE(TestToggleDevice) {
    EntityRecord rec = makeThing("terminal", Position(3, 2, 0), "◘");
    rec.device = Device{false, 1.0f, 0.4f};
    const EntityID terminal = spawn(std::move(rec));

    OperableController operable;
    BOOST_CHECK(operable.toggle(player, terminal, world));
    BOOST_CHECK_EQUAL(lastMessage(), "You switch the terminal on.");

    operable.update(0.25f, world);
    operable.update(0.25f, world);
    BOOST_CHECK(world.registry.get(terminal).device->pwSwitch);
    operable.update(0.25f, world);
    BOOST_CHECK(!world.registry.get(terminal).device->pwSwitch);
    BOOST_CHECK_EQUAL(world.registry.get(terminal).device->battVoltage, 0.0f);

    BOOST_CHECK(!operable.toggle(player, player, world));
}

BOOST_AUTO_TEST_CASE(TestTogglePlanqIsQuiet) {
    EntityRecord rec = makeThing("planq", Position(3, 2, 0), "¶");
    rec.planq = true;
    rec.device = Device{};
    const EntityID planq = spawn(std::move(rec));
    const size_t before = world.log.channelLen("world");

    OperableController operable;
    BOOST_CHECK(operable.toggle(player, planq, world));
    BOOST_CHECK(world.registry.get(planq).device->pwSwitch);
    BOOST_CHECK_EQUAL(world.log.channelLen("world"), before);
}

BOOST_AUTO_TEST_CASE(TestMapIndexingMarksEntities) {
    const EntityID door = spawnDoor(Position(4, 2, 0));
    MapIndexingController indexing;
    indexing.update(0.25f, world);

    const WorldMap& deck = world.model.level(0);
    BOOST_CHECK(deck.isBlocked(Position(4, 2, 0)));
    BOOST_CHECK(deck.isOpaque(Position(4, 2, 0)));
    BOOST_CHECK(deck.isBlocked(Position(2, 2, 0)));
    BOOST_CHECK(!deck.isOpaque(Position(2, 2, 0)));
    BOOST_CHECK(!deck.isBlocked(Position(5, 2, 0)));

    DoorController doors;
    doors.openDoor(player, door, world);
    indexing.update(0.25f, world);
    BOOST_CHECK(!deck.isBlocked(Position(4, 2, 0)));
    BOOST_CHECK(!deck.isOpaque(Position(4, 2, 0)));
}

BOOST_AUTO_TEST_CASE(TestVisibilityUpdatesPlayerMemory) {
    spawnDoor(Position(4, 2, 0));
    MapIndexingController::reindex(world);
    world.registry.get(player).viewshed->range = 6;

    VisibilityController visibility;
    visibility.update(0.25f, world);

    const EntityRecord& rec = world.registry.get(player);
    BOOST_CHECK(!rec.viewshed->dirty);
    BOOST_CHECK(rec.viewshed->canSee(Position(3, 2, 0)));
    BOOST_CHECK(rec.viewshed->canSee(Position(4, 2, 0)));
    BOOST_CHECK(!rec.viewshed->canSee(Position(5, 2, 0)));

    const WorldMap& deck = world.model.level(0);
    BOOST_CHECK(deck.isVisible(Position(3, 2, 0)));
    BOOST_CHECK(deck.isRevealed(Position(3, 2, 0)));
    BOOST_CHECK(!deck.isVisible(Position(5, 2, 0)));

    BOOST_REQUIRE(rec.memory);
    BOOST_CHECK_EQUAL(rec.memory->cells.at(Position(4, 2, 0)).glyph, "█");
    BOOST_CHECK_EQUAL(rec.memory->cells.at(Position(3, 2, 0)).glyph, ".");
}

BOOST_AUTO_TEST_CASE(TestRevealedTilesOutliveVisibility) {
    VisibilityController visibility;
    visibility.update(0.25f, world);
    BOOST_CHECK(world.model.level(0).isVisible(Position(1, 1, 0)));

    world.registry.get(player).viewshed->range = 0;
    world.registry.get(player).viewshed->dirty = true;
    visibility.update(0.25f, world);

    const WorldMap& deck = world.model.level(0);
    BOOST_CHECK(!deck.isVisible(Position(1, 1, 0)));
    BOOST_CHECK(deck.isRevealed(Position(1, 1, 0)));
    BOOST_CHECK(deck.isVisible(Position(2, 2, 0)));
}

BOOST_AUTO_TEST_CASE(TestVictoryNeedsPlanqAtVictoryPoint) {
    world.victoryPoint = Position(3, 2, 0);
    EntityRecord rec = makeThing("planq", Position(2, 2, 0), "¶");
    rec.planq = true;
    rec.portable = Portable{};
    const EntityID planq = spawn(std::move(rec));

    VictoryController victory;
    MovementController movement;
    movement.tryMove(player, Direction::E, world);
    victory.update(0.25f, world);
    BOOST_CHECK(!world.requestedMode);

    movement.tryMove(player, Direction::W, world);
    ItemController items;
    items.pickUp(player, planq, world);
    movement.tryMove(player, Direction::E, world);
    BOOST_CHECK(VictoryController::isVictorious(world));

    victory.update(0.25f, world);
    BOOST_REQUIRE(world.requestedMode);
    BOOST_CHECK(*world.requestedMode == EngineMode::GoodEnd);
}

BOOST_AUTO_TEST_SUITE_END()
