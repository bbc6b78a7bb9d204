/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

/**
 * @file GameEventTests.cpp
 * @brief Validity rules and display strings for game events
 */

#define BOOST_TEST_MODULE GameEventTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "events/GameEvent.hpp"

using namespace Spacegame;
using A = ActionType::Kind;

struct GameEventFixture {
    GameEventFixture() { SPACE_ENABLE_BENCHMARK_MODE(); }
    ~GameEventFixture() { SPACE_DISABLE_BENCHMARK_MODE(); }

    static constexpr EntityID player = 1;
    static constexpr EntityID door = 7;
};

BOOST_FIXTURE_TEST_SUITE(GameEventValidityTests, GameEventFixture)

BOOST_AUTO_TEST_CASE(TestNullEventNeverValid) {
    BOOST_CHECK(!GameEvent().isValid());
    BOOST_CHECK(!GameEvent::create(GameEventType::nullEvent(), player, door).isValid());
}

BOOST_AUTO_TEST_CASE(TestSessionEventsAlwaysValid) {
    BOOST_CHECK(GameEvent::create(GameEventType::pauseToggle()).isValid());
    BOOST_CHECK(GameEvent::create(GameEventType::modeSwitch(EngineMode::Running)).isValid());
    BOOST_CHECK(GameEvent::create(GameEventType::saveRequest()).isValid());
    BOOST_CHECK(GameEvent::create(GameEventType::loadRequest()).isValid());
}

BOOST_AUTO_TEST_CASE(TestMoveNeedsOnlySubject) {
    const auto move = GameEventType::playerAction(ActionType::moveTo(Direction::E));
    BOOST_CHECK(GameEvent::create(move, player).isValid());
    BOOST_CHECK(!GameEvent::create(move).isValid());
    BOOST_CHECK(!GameEvent::create(move, INVALID_ENTITY, door).isValid());
}

BOOST_AUTO_TEST_CASE(TestObjectActionsNeedBothSides) {
    for (A kind : {A::Examine, A::UseItem, A::MoveItem, A::DropItem, A::KillItem, A::OpenItem,
                   A::CloseItem, A::LockItem, A::UnlockItem}) {
        const auto type = GameEventType::playerAction(kind);
        BOOST_CHECK_MESSAGE(GameEvent::create(type, player, door).isValid(), ActionType(kind).toString());
        BOOST_CHECK(!GameEvent::create(type, player).isValid());
        BOOST_CHECK(!GameEvent::create(type, INVALID_ENTITY, door).isValid());
        BOOST_CHECK(GameEvent::create(GameEventType::actorAction(kind), door, player).isValid());
    }
}

BOOST_AUTO_TEST_CASE(TestInventoryValidOnlyWithoutContext) {
    const auto inventory = GameEventType::playerAction(A::Inventory);
    BOOST_CHECK(GameEvent::create(inventory).isValid());
    BOOST_CHECK(!GameEvent::create(inventory, player, door).isValid());
    BOOST_CHECK(!GameEvent::create(GameEventType::playerAction(A::NoAction), player, door).isValid());
}

BOOST_AUTO_TEST_CASE(TestPlanqConnect) {
    BOOST_CHECK(GameEvent::create(GameEventType::planqConnect(door), player, 3).isValid());
    BOOST_CHECK(!GameEvent::create(GameEventType::planqConnect(door)).isValid());
    BOOST_CHECK(!GameEvent::create(GameEventType::planqConnect(INVALID_ENTITY), player, 3).isValid());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(GameEventContextTests, GameEventFixture)

BOOST_AUTO_TEST_CASE(TestBlankContextIsNotStored) {
    const GameEvent event = GameEvent::create(GameEventType::pauseToggle());
    BOOST_CHECK(!event.getContext().has_value());
    BOOST_CHECK_EQUAL(event.getSubject(), INVALID_ENTITY);
}

BOOST_AUTO_TEST_CASE(TestPartialContext) {
    GameEventContext context{player, INVALID_ENTITY};
    BOOST_CHECK(context.isPartial());
    BOOST_CHECK(!context.isBlank());
    const GameEventContext complete{player, door};
    BOOST_CHECK(!complete.isPartial());
    BOOST_CHECK(!complete.isBlank());
    BOOST_CHECK(GameEventContext{}.isBlank());
}

BOOST_AUTO_TEST_CASE(TestIsActionMatchesKind) {
    const GameEvent open = GameEvent::create(GameEventType::actorAction(A::OpenItem), player, door);
    BOOST_CHECK(open.isAction(A::OpenItem));
    BOOST_CHECK(!open.isAction(A::CloseItem));
    BOOST_CHECK(!GameEvent::create(GameEventType::pauseToggle()).isAction(A::NoAction));
}

BOOST_AUTO_TEST_CASE(TestDisplayStrings) {
    BOOST_CHECK_EQUAL(ActionType(A::MoveItem).toString(), "Move");
    BOOST_CHECK_EQUAL(ActionType::moveTo(Direction::NW).toString(), "MoveTo(northwest)");
    BOOST_CHECK_EQUAL(GameEvent::create(GameEventType::playerAction(A::OpenItem), player, door).toString(),
                      "PlayerAction(Open) [1 -> 7]");
    BOOST_CHECK_EQUAL(GameEventType::saveRequest().toString(), "SaveRequest");
}

BOOST_AUTO_TEST_CASE(TestActionOrdering) {
    BOOST_CHECK(ActionType(A::Examine) < ActionType(A::OpenItem));
    BOOST_CHECK(ActionType::moveTo(Direction::N) != ActionType::moveTo(Direction::S));
}

BOOST_AUTO_TEST_SUITE_END()
