/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

/**
 * @file WorldBuilderTests.cpp
 * @brief Builds tests/resources/test_layout.json and checks the resulting model
 *
 * Test layout, deck 0 (deck 1 is just the hallway row):
 *   ##########
 *   #,,,,,,,,#   hallway, ladder at (8,1)
 *   ####=#####   door at (4,2)
 *      #...#     lab
 */

#define BOOST_TEST_MODULE WorldBuilderTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include "world/WorldBuilder.hpp"

#include <algorithm>
#include <memory>

using namespace Spacegame;

struct WorldBuilderFixture {
    WorldBuilderFixture() {
        SPACE_ENABLE_BENCHMARK_MODE();
        builder = std::make_unique<JsonWorldBuilder>();
    }
    ~WorldBuilderFixture() { SPACE_DISABLE_BENCHMARK_MODE(); }

    std::unique_ptr<WorldBuilder> builder;
    const std::string layoutFile{"tests/resources/test_layout.json"};
};

BOOST_FIXTURE_TEST_SUITE(WorldBuilderTestSuite, WorldBuilderFixture)

BOOST_AUTO_TEST_CASE(TestBuildsAllDecks) {
    BOOST_REQUIRE(builder->buildWorld(layoutFile));
    const WorldModel &model = builder->getModel();

    BOOST_REQUIRE_EQUAL(model.levels.size(), 2u);
    BOOST_CHECK_EQUAL(model.level(0).getWidth(), 10);
    BOOST_CHECK_EQUAL(model.level(1).getHeight(), 8);
}

BOOST_AUTO_TEST_CASE(TestTileGlyphs) {
    BOOST_REQUIRE(builder->buildWorld(layoutFile));
    const WorldModel &model = builder->getModel();

    BOOST_CHECK_EQUAL(model.getTiletypeAt(Position(0, 0, 0)), TileType::Wall);
    BOOST_CHECK_EQUAL(model.getTiletypeAt(Position(5, 4, 0)), TileType::Floor);
    BOOST_CHECK_EQUAL(model.getTiletypeAt(Position(0, 4, 0)), TileType::Vacuum);
    // Hallway floor is drawn differently from room floor
    BOOST_CHECK_EQUAL(model.getTiletypeAt(Position(2, 1, 0)), TileType::Floor);
    BOOST_CHECK_EQUAL(model.level(0).getTile(Position(2, 1, 0)).cell.glyph, "x");
    // Doors sit on floor
    BOOST_CHECK_EQUAL(model.getTiletypeAt(Position(4, 2, 0)), TileType::Floor);
    BOOST_CHECK(!model.isBlockedAt(Position(4, 2, 0)));
    BOOST_CHECK(model.isBlockedAt(Position(3, 2, 0)));
}

BOOST_AUTO_TEST_CASE(TestDoorRequestsAreEssential) {
    BOOST_REQUIRE(builder->buildWorld(layoutFile));
    const auto essentials = builder->getEssentialItemRequests();

    BOOST_REQUIRE_EQUAL(essentials.size(), 1u);
    BOOST_CHECK_EQUAL(essentials[0].first, "door");
    BOOST_CHECK_EQUAL(essentials[0].second, Position(4, 2, 0));
}

BOOST_AUTO_TEST_CASE(TestRoomContentsExpandByQuantity) {
    BOOST_REQUIRE(builder->buildWorld(layoutFile));
    const auto extras = builder->getAdditionalItemRequests();

    BOOST_REQUIRE_EQUAL(extras.size(), 2u);
    for (const auto &[room, item] : extras) {
        BOOST_CHECK_EQUAL(room, "lab");
        BOOST_CHECK_EQUAL(item, "crate");
    }
}

BOOST_AUTO_TEST_CASE(TestHallwayRoomBuiltFromTiles) {
    BOOST_REQUIRE(builder->buildWorld(layoutFile));
    const ShipGraph &layout = builder->getModel().layout;

    auto hall = layout.contains("lower_hallway");
    BOOST_REQUIRE(hall.has_value());
    BOOST_CHECK_EQUAL(layout.rooms()[*hall].cells().size(), 8u);
    BOOST_CHECK_EQUAL(builder->getModel().getRoomName(Position(3, 1, 0)).value(), "lower_hallway");

    // Both rooms list each other, so the edge runs both ways
    auto lab = layout.contains("lab");
    BOOST_REQUIRE(lab.has_value());
    const auto fromLab = layout.successors(*lab);
    const auto fromHall = layout.successors(*hall);
    BOOST_CHECK(std::find(fromLab.begin(), fromLab.end(), *hall) != fromLab.end());
    BOOST_CHECK(std::find(fromHall.begin(), fromHall.end(), *lab) != fromHall.end());
}

BOOST_AUTO_TEST_CASE(TestDoorCellClosedInRoom) {
    BOOST_REQUIRE(builder->buildWorld(layoutFile));
    const ShipGraph &layout = builder->getModel().layout;
    const GraphRoom &lab = layout.rooms()[layout.contains("lab").value()];

    BOOST_CHECK(lab.cellAt(Position(4, 2, 0)) == CellType::Closed);
    // Centerpoint (5,4) towards the door nudged to (3,2)
    BOOST_CHECK(lab.cellAt(Position(5, 4, 0)) == CellType::Margin);
    BOOST_CHECK(lab.cellAt(Position(4, 3, 0)) == CellType::Margin);
}

BOOST_AUTO_TEST_CASE(TestLadderBecomesPortal) {
    BOOST_REQUIRE(builder->buildWorld(layoutFile));
    const WorldModel &model = builder->getModel();

    BOOST_CHECK_EQUAL(model.getTiletypeAt(Position(8, 1, 0)), TileType::Stairway);
    BOOST_CHECK_EQUAL(model.getTiletypeAt(Position(8, 1, 1)), TileType::Stairway);
    BOOST_CHECK_EQUAL(model.getExit(Position(8, 1, 0)).value(), Position(8, 1, 1));
    BOOST_CHECK_EQUAL(model.getExit(Position(8, 1, 1)).value(), Position(8, 1, 0));

    const GraphRoom &hall = model.layout.rooms()[model.layout.contains("lower_hallway").value()];
    BOOST_CHECK(hall.cellAt(Position(8, 1, 0)) == CellType::Closed);
    BOOST_CHECK(hall.cellAt(Position(7, 1, 0)) == CellType::Margin);
}

BOOST_AUTO_TEST_CASE(TestMissingAndMalformedFiles) {
    BOOST_CHECK(!builder->buildWorld("tests/resources/no_such_layout.json"));
    BOOST_CHECK(!builder->buildWorld("tests/resources/malformed.json"));
}

BOOST_AUTO_TEST_CASE(TestBuildFromJsonWithoutMaps) {
    JsonReader reader;
    BOOST_REQUIRE(reader.parse(R"({"room_list": []})"));
    JsonWorldBuilder mason;
    BOOST_CHECK(!mason.buildFromJson(reader.getRoot()));
}

BOOST_AUTO_TEST_CASE(TestRejectsBadDeckSizes) {
    JsonWorldBuilder mason;
    JsonReader reader;

    BOOST_REQUIRE(reader.parse(R"({"map_list": [{"width": -1, "height": 20, "tilemap": ["#"]}],
                                   "room_list": [], "ladder_list": []})"));
    BOOST_CHECK(!mason.buildFromJson(reader.getRoot()));
    BOOST_CHECK(mason.getModel().levels.empty());

    BOOST_REQUIRE(reader.parse(R"({"map_list": [{"width": 4, "height": 0, "tilemap": []}]})"));
    BOOST_CHECK(!mason.buildFromJson(reader.getRoot()));

    BOOST_REQUIRE(reader.parse(R"({"map_list": [{"width": 100000, "height": 2, "tilemap": ["#", "#"]}]})"));
    BOOST_CHECK(!mason.buildFromJson(reader.getRoot()));
}

BOOST_AUTO_TEST_CASE(TestRejectsRaggedTilemaps) {
    JsonWorldBuilder mason;
    JsonReader reader;

    // Too few rows
    BOOST_REQUIRE(reader.parse(R"({"map_list": [{"width": 3, "height": 3, "tilemap": ["###", "#.#"]}]})"));
    BOOST_CHECK(!mason.buildFromJson(reader.getRoot()));

    // Short row
    BOOST_REQUIRE(reader.parse(R"({"map_list": [{"width": 3, "height": 2, "tilemap": ["###", "#."]}]})"));
    BOOST_CHECK(!mason.buildFromJson(reader.getRoot()));

    BOOST_REQUIRE(reader.parse(R"({"map_list": [{"width": 3, "height": 2, "tilemap": ["###", "#.#"]}]})"));
    BOOST_CHECK(mason.buildFromJson(reader.getRoot()));
    BOOST_CHECK_EQUAL(mason.getModel().levels.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestTakeModelMovesLevels) {
    BOOST_REQUIRE(builder->buildWorld(layoutFile));
    WorldModel model = builder->takeModel();
    BOOST_CHECK_EQUAL(model.levels.size(), 2u);
    BOOST_CHECK(model.layout.contains("lab").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
