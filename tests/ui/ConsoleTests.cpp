/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE ConsoleTests
#include <boost/test/unit_test.hpp>

#include "ui/Console.hpp"
#include "ui/ScreenCell.hpp"
#include "ui/UIGrid.hpp"

using namespace Spacegame;

BOOST_AUTO_TEST_SUITE(ScreenCellTests)

BOOST_AUTO_TEST_CASE(TestParseColorNames) {
    BOOST_CHECK_EQUAL(*parseColor("black"), 0);
    BOOST_CHECK_EQUAL(*parseColor("orange"), static_cast<uint8_t>(Color::Yellow));
    BOOST_CHECK_EQUAL(*parseColor("yellow"), static_cast<uint8_t>(Color::LightYellow));
    BOOST_CHECK_EQUAL(*parseColor("ltcyan"), static_cast<uint8_t>(Color::LightCyan));
    BOOST_CHECK_EQUAL(*parseColor("grey"), *parseColor("gray"));
    BOOST_CHECK_EQUAL(*parseColor("12"), 12);
    BOOST_CHECK(!parseColor("256"));
    BOOST_CHECK(!parseColor("chartreuse"));
    BOOST_CHECK(!parseColor(""));
}

BOOST_AUTO_TEST_CASE(TestParseMods) {
    BOOST_CHECK_EQUAL(parseMods("bold"), Mods::BOLD);
    BOOST_CHECK_EQUAL(parseMods("bold|dim"), Mods::BOLD | Mods::DIM);
    BOOST_CHECK_EQUAL(parseMods("reverse underline"), Mods::REVERSED | Mods::UNDERLINED);
    BOOST_CHECK_EQUAL(parseMods("sparkly"), Mods::NONE);
    BOOST_CHECK_EQUAL(parseMods("bright 256"), Mods::BOLD | Mods::CROSSED_OUT);
    BOOST_CHECK_EQUAL(parseMods(""), Mods::NONE);
}

BOOST_AUTO_TEST_CASE(TestCellFromString) {
    auto cell = ScreenCell::fromString("@ yellow black bold underline");
    BOOST_REQUIRE(cell);
    BOOST_CHECK_EQUAL(cell->glyph, "@");
    BOOST_CHECK_EQUAL(cell->fg, static_cast<uint8_t>(Color::LightYellow));
    BOOST_CHECK_EQUAL(cell->bg, 0);
    BOOST_CHECK_EQUAL(cell->mods, Mods::BOLD | Mods::UNDERLINED);

    cell = ScreenCell::fromString("▒ 3 4");
    BOOST_REQUIRE(cell);
    BOOST_CHECK_EQUAL(cell->glyph, "▒");
    BOOST_CHECK_EQUAL(cell->fg, 3);
    BOOST_CHECK_EQUAL(cell->bg, 4);
    BOOST_CHECK_EQUAL(cell->mods, Mods::NONE);
}

BOOST_AUTO_TEST_CASE(TestCellFromStringRejectsShortOrBadInput) {
    BOOST_CHECK(!ScreenCell::fromString("@ red"));
    BOOST_CHECK(!ScreenCell::fromString(""));
    BOOST_CHECK(!ScreenCell::fromString("@ nocolor black"));
    BOOST_CHECK(!ScreenCell::fromString("@ red nocolor"));
}

BOOST_AUTO_TEST_CASE(TestSpecialCells) {
    BOOST_CHECK(ScreenCell::blank().isBlank());
    BOOST_CHECK(!ScreenCell::empty().isBlank());
    BOOST_CHECK_EQUAL(ScreenCell::placeholder(), ScreenCell("%", 5, 8));
    BOOST_CHECK_EQUAL(ScreenCell::outOfBounds().glyph, "*");
    BOOST_CHECK(ScreenCell("x", 1) != ScreenCell("x", 2));
}

BOOST_AUTO_TEST_SUITE_END()

struct ConsoleFixture {
    Console console{10, 4};
};

BOOST_FIXTURE_TEST_SUITE(ConsoleDrawingTests, ConsoleFixture)

BOOST_AUTO_TEST_CASE(TestNewConsoleIsEmpty) {
    BOOST_CHECK_EQUAL(console.getWidth(), 10);
    BOOST_CHECK_EQUAL(console.getHeight(), 4);
    BOOST_CHECK_EQUAL(console.cells().size(), 40u);
    BOOST_CHECK_EQUAL(console.get(3, 2), ScreenCell::empty());
    BOOST_CHECK_EQUAL(console.rowText(0), "          ");
}

BOOST_AUTO_TEST_CASE(TestPutAndGet) {
    console.put(2, 1, ScreenCell("@", 15));
    BOOST_CHECK_EQUAL(console.get(2, 1).glyph, "@");

    // Out-of-range writes are dropped and reads return a blank
    console.put(10, 0, ScreenCell("!", 1));
    console.put(-1, 0, ScreenCell("!", 1));
    BOOST_CHECK(console.get(10, 0).isBlank());
    BOOST_CHECK_EQUAL(console.rowText(0), "          ");
}

BOOST_AUTO_TEST_CASE(TestPrintClipsToEdgeAndWidth) {
    BOOST_CHECK_EQUAL(console.print(6, 0, "planq¶"), 4);
    BOOST_CHECK_EQUAL(console.rowText(0), "      plan");

    BOOST_CHECK_EQUAL(console.print(0, 1, "¶│Ready", 11, 0, Mods::NONE, 3), 3);
    BOOST_CHECK_EQUAL(console.rowText(1), "¶│R       ");
    BOOST_CHECK_EQUAL(console.get(1, 1).fg, 11);
}

BOOST_AUTO_TEST_CASE(TestDrawBoxWithTitle) {
    console.drawBox(console.area(), 7, "LOG");
    BOOST_CHECK_EQUAL(console.rowText(0), "┌LOG─────┐");
    BOOST_CHECK_EQUAL(console.rowText(1), "│        │");
    BOOST_CHECK_EQUAL(console.rowText(3), "└────────┘");

    // Too small to draw
    Console tiny(1, 1);
    tiny.drawBox(tiny.area());
    BOOST_CHECK_EQUAL(tiny.rowText(0), " ");
}

BOOST_AUTO_TEST_CASE(TestFillAndClear) {
    console.fill({1, 1, 3, 2}, ScreenCell("#", 7));
    BOOST_CHECK_EQUAL(console.rowText(1), " ###      ");
    BOOST_CHECK_EQUAL(console.rowText(2), " ###      ");
    BOOST_CHECK_EQUAL(console.rowText(3), "          ");

    console.clear();
    BOOST_CHECK_EQUAL(console.rowText(1), "          ");
}

BOOST_AUTO_TEST_CASE(TestResize) {
    console.put(0, 0, ScreenCell("@", 15));
    console.resize(10, 4);
    BOOST_CHECK_EQUAL(console.get(0, 0).glyph, "@");

    console.resize(5, 2);
    BOOST_CHECK_EQUAL(console.cells().size(), 10u);
    BOOST_CHECK_EQUAL(console.get(0, 0), ScreenCell::empty());

    console.resize(-3, 2);
    BOOST_CHECK_EQUAL(console.getWidth(), 0);
    BOOST_CHECK(console.cells().empty());
}

BOOST_AUTO_TEST_CASE(TestGlyphHelpers) {
    const auto glyphs = Console::splitGlyphs("a¶█🚀");
    BOOST_REQUIRE_EQUAL(glyphs.size(), 4u);
    BOOST_CHECK_EQUAL(glyphs[1], "¶");
    BOOST_CHECK_EQUAL(glyphs[3], "🚀");
    BOOST_CHECK_EQUAL(Console::glyphCount("a¶█🚀"), 4u);
    BOOST_CHECK_EQUAL(Console::glyphCount(""), 0u);
}

BOOST_AUTO_TEST_CASE(TestRectHelpers) {
    const UIRect rect{2, 3, 4, 5};
    BOOST_CHECK(rect.contains(2, 3));
    BOOST_CHECK(rect.contains(5, 7));
    BOOST_CHECK(!rect.contains(6, 7));
    BOOST_CHECK(!rect.isEmpty());
    BOOST_CHECK((UIRect{0, 0, 0, 4}).isEmpty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(UIGridTests)

BOOST_AUTO_TEST_CASE(TestFits) {
    BOOST_CHECK(UIGrid::fits(80, 40));
    BOOST_CHECK(!UIGrid::fits(79, 40));
    BOOST_CHECK(!UIGrid::fits(80, 39));
}

BOOST_AUTO_TEST_CASE(TestFullSizeLayout) {
    UIGrid grid;
    grid.calcLayout({0, 0, 100, 50});

    BOOST_CHECK((grid.planqSidebar == UIRect{68, 0, 32, 50}));
    BOOST_CHECK((grid.camera == UIRect{0, 0, 68, 38}));
    BOOST_CHECK((grid.messageLog == UIRect{0, 38, 68, 12}));
}

BOOST_AUTO_TEST_CASE(TestCrampedLayoutShrinksSidebarAndLog) {
    UIGrid grid;
    grid.calcLayout({0, 0, 50, 35});

    BOOST_CHECK_EQUAL(grid.planqSidebar.width, 20);
    BOOST_CHECK_EQUAL(grid.camera.width, UIGrid::MIN_LEFT_WIDTH);
    BOOST_CHECK_EQUAL(grid.camera.height, UIGrid::MIN_CAMERA_HEIGHT);
    BOOST_CHECK_EQUAL(grid.messageLog.height, 5);
}

BOOST_AUTO_TEST_CASE(TestPlanqSidebarLayout) {
    UIGrid grid;
    grid.calcLayout({0, 0, 100, 50});
    grid.calcPlanqLayout(4, false);

    BOOST_CHECK((grid.planqStatus == UIRect{68, 0, 32, 6}));
    BOOST_CHECK((grid.planqScreen == UIRect{68, 6, 32, 44}));
    BOOST_CHECK_EQUAL(grid.planqStdout.height, 44);
    BOOST_CHECK(grid.planqStdin.isEmpty());

    grid.calcPlanqLayout(4, true);
    BOOST_CHECK_EQUAL(grid.planqStdout.height, 43);
    BOOST_CHECK((grid.planqStdin == UIRect{68, 49, 32, 1}));
}

BOOST_AUTO_TEST_SUITE_END()
