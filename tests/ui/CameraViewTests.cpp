/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE CameraViewTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "ui/CameraView.hpp"
#include "ui/Console.hpp"
#include "world/GameWorld.hpp"

using namespace Spacegame;

struct CameraFixture {
    GameWorld world;
    CameraView camera{5, 5};
    EntityID player{INVALID_ENTITY};

    CameraFixture() {
        SPACE_ENABLE_BENCHMARK_MODE();
        WorldMap deck(8, 6);
        for (int y = 0; y < 6; ++y) {
            for (int x = 0; x < 8; ++x) {
                deck.setTile(Position(x, y, 0), y == 0 ? Tile::wall() : Tile::floor());
            }
        }
        deck.updateTilemaps();
        world.model.levels.push_back(deck);

        EntityRecord hero;
        hero.body = Body(Position(3, 3, 0), ScreenCell("@", 15));
        hero.player = true;
        hero.memory = Memory{};
        player = world.registry.create(std::move(hero));
        world.model.addContents({Position(3, 3, 0)}, 20, player);
    }

    ~CameraFixture() {
        SPACE_DISABLE_BENCHMARK_MODE();
    }

    WorldMap& deck() { return world.model.level(0); }
};

BOOST_FIXTURE_TEST_SUITE(CameraViewTests, CameraFixture)

BOOST_AUTO_TEST_CASE(TestDimensions) {
    BOOST_CHECK_EQUAL(camera.getWidth(), 5);
    BOOST_CHECK_EQUAL(camera.getHeight(), 5);
    BOOST_CHECK_EQUAL(camera.cells().size(), 25u);

    camera.setDims(7, 3);
    BOOST_CHECK_EQUAL(camera.cells().size(), 21u);
    camera.setDims(-1, 3);
    BOOST_CHECK(camera.cells().empty());
    BOOST_CHECK(!camera.update(world));

    BOOST_CHECK_EQUAL(camera.at(9, 9), ScreenCell::outOfBounds());
}

BOOST_AUTO_TEST_CASE(TestCentersOnPlayer) {
    BOOST_REQUIRE(camera.update(world));
    BOOST_CHECK_EQUAL(camera.frameOrigin(), Position(1, 1, 0));
    BOOST_CHECK_EQUAL(camera.at(2, 2).glyph, "@");
}

BOOST_AUTO_TEST_CASE(TestUnseenTilesAreFogged) {
    camera.update(world);
    BOOST_CHECK_EQUAL(camera.at(0, 0), ScreenCell::fogOfWar());
    BOOST_CHECK_EQUAL(camera.at(4, 4), ScreenCell::fogOfWar());
}

BOOST_AUTO_TEST_CASE(TestVisibleTilesShowTopEntity) {
    EntityRecord crate;
    crate.body = Body(Position(4, 3, 0), ScreenCell("%", 3));
    const EntityID crateId = world.registry.create(std::move(crate));
    world.model.addContents({Position(4, 3, 0)}, 10, crateId);

    deck().setVisible(Position(4, 3, 0), true);
    deck().setVisible(Position(3, 2, 0), true);
    deck().setVisible(Position(3, 0, 0), true);
    camera.update(world);

    BOOST_CHECK_EQUAL(camera.at(3, 2), ScreenCell("%", 3));
    BOOST_CHECK_EQUAL(camera.at(2, 1), Tile::floor().cell);
}

BOOST_AUTO_TEST_CASE(TestRememberedTilesAreDimmed) {
    deck().setRevealed(Position(2, 2, 0), true);
    deck().setRevealed(Position(4, 4, 0), true);
    world.registry.get(player).memory->cells[Position(2, 2, 0)] = ScreenCell("▤", 14);
    camera.update(world);

    BOOST_CHECK_EQUAL(camera.at(1, 1).glyph, "▤");
    BOOST_CHECK_EQUAL(camera.at(1, 1).fg, CameraView::MEMORY_FG);
    // Revealed but never memorized: the bare tile
    BOOST_CHECK_EQUAL(camera.at(3, 3).glyph, Tile::floor().cell.glyph);
    BOOST_CHECK_EQUAL(camera.at(3, 3).fg, CameraView::MEMORY_FG);
}

BOOST_AUTO_TEST_CASE(TestOffMapIsOutOfBounds) {
    EntityRecord& hero = world.registry.get(player);
    hero.body->moveTo(Position(0, 1, 0));
    camera.update(world);

    BOOST_CHECK_EQUAL(camera.frameOrigin(), Position(-2, -1, 0));
    BOOST_CHECK_EQUAL(camera.at(0, 0), ScreenCell::outOfBounds());
    BOOST_CHECK_EQUAL(camera.at(1, 2), ScreenCell::outOfBounds());
    BOOST_CHECK_EQUAL(camera.at(2, 2).glyph, "@");
}

BOOST_AUTO_TEST_CASE(TestReticleFramesTarget) {
    camera.setReticle(Position(3, 3, 0));
    camera.update(world);

    BOOST_CHECK_EQUAL(camera.at(1, 1).glyph, "⌟");
    BOOST_CHECK_EQUAL(camera.at(3, 1).glyph, "⌞");
    BOOST_CHECK_EQUAL(camera.at(1, 3).glyph, "⌝");
    BOOST_CHECK_EQUAL(camera.at(3, 3).glyph, "⌜");
    BOOST_CHECK_EQUAL(camera.at(3, 3).fg, CameraView::RETICLE_FG);
    BOOST_CHECK_EQUAL(camera.at(3, 3).bg, CameraView::RETICLE_BG);
    BOOST_CHECK_EQUAL(camera.at(2, 2).glyph, "@");

    camera.setReticle(std::nullopt);
    camera.update(world);
    BOOST_CHECK_EQUAL(camera.at(1, 1), ScreenCell::fogOfWar());
}

BOOST_AUTO_TEST_CASE(TestReticleNeedsFourGlyphs) {
    camera.setReticle(Position(3, 3, 0));
    camera.setReticleGlyphs("<>");
    camera.update(world);
    BOOST_CHECK_EQUAL(camera.at(1, 1), ScreenCell::fogOfWar());

    camera.setReticleGlyphs("abcd");
    camera.update(world);
    BOOST_CHECK_EQUAL(camera.at(3, 3).glyph, "d");
}

BOOST_AUTO_TEST_CASE(TestNoPlayerNoUpdate) {
    world.registry.destroy(player);
    BOOST_CHECK(!camera.update(world));
}

BOOST_AUTO_TEST_CASE(TestBlitClipsToRect) {
    camera.update(world);
    Console console(10, 10);
    camera.blit(console, {4, 4, 3, 3});

    BOOST_CHECK_EQUAL(console.get(6, 6).glyph, "@");
    // Outside the rect nothing was written
    BOOST_CHECK_EQUAL(console.get(8, 8), ScreenCell::empty());
    BOOST_CHECK_EQUAL(console.get(3, 3), ScreenCell::empty());
}

BOOST_AUTO_TEST_SUITE_END()
