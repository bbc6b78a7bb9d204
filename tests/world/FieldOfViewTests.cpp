/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE FieldOfViewTests
#include <boost/test/unit_test.hpp>

#include "world/FieldOfView.hpp"

using namespace Spacegame;

namespace {

// 11x11 floor deck with a wall column at x=7 from y=0 to y=10
WorldMap makeDeck() {
    WorldMap deck(11, 11);
    for (int y = 0; y < 11; ++y) {
        for (int x = 0; x < 11; ++x) {
            deck.setTile(Position(x, y, 0), x == 7 ? Tile::wall() : Tile::floor());
        }
    }
    deck.updateTilemaps();
    return deck;
}

} // namespace

struct FieldOfViewFixture {
    WorldMap deck{makeDeck()};
};

BOOST_FIXTURE_TEST_SUITE(FieldOfViewTestSuite, FieldOfViewFixture)

BOOST_AUTO_TEST_CASE(TestOriginAlwaysVisible) {
    const auto seen = fieldOfView(Position(3, 5, 0), 0, deck);
    BOOST_CHECK_EQUAL(seen.size(), 1u);
    BOOST_CHECK(seen.count(Position(3, 5, 0)) == 1);
}

BOOST_AUTO_TEST_CASE(TestWallIsSeenButNotBeyond) {
    const auto seen = fieldOfView(Position(5, 5, 0), 5, deck);

    BOOST_CHECK(seen.count(Position(6, 5, 0)) == 1);
    // The first wall is included
    BOOST_CHECK(seen.count(Position(7, 5, 0)) == 1);
    BOOST_CHECK(seen.count(Position(8, 5, 0)) == 0);
    BOOST_CHECK(seen.count(Position(10, 5, 0)) == 0);
}

BOOST_AUTO_TEST_CASE(TestRangeLimitsView) {
    const auto seen = fieldOfView(Position(2, 5, 0), 2, deck);

    BOOST_CHECK(seen.count(Position(4, 5, 0)) == 1);
    BOOST_CHECK(seen.count(Position(2, 3, 0)) == 1);
    BOOST_CHECK(seen.count(Position(5, 5, 0)) == 0);
    BOOST_CHECK(seen.count(Position(2, 0, 0)) == 0);
}

BOOST_AUTO_TEST_CASE(TestViewClippedToMap) {
    const auto seen = fieldOfView(Position(0, 0, 0), 4, deck);
    for (const auto &p : seen) {
        BOOST_CHECK(deck.inBounds(p));
        BOOST_CHECK_EQUAL(p.z, 0);
    }
    BOOST_CHECK(seen.count(Position(4, 4, 0)) == 1);
}

BOOST_AUTO_TEST_CASE(TestOriginOutsideMapSeesNothing) {
    BOOST_CHECK(fieldOfView(Position(20, 20, 0), 5, deck).empty());
}

BOOST_AUTO_TEST_SUITE_END()
