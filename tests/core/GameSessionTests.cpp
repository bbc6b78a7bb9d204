/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE GameSessionTests
#include <boost/test/unit_test.hpp>

#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "managers/SaveGameManager.hpp"
#include "managers/SettingsManager.hpp"
#include "ui/Console.hpp"

#include <filesystem>
#include <memory>
#include <string>

using namespace Spacegame;

struct SessionFixture {
    const std::string saveDir = "tests/test_session_saves";
    std::unique_ptr<GameSession> session;

    SessionFixture() {
        SPACE_ENABLE_BENCHMARK_MODE();
        auto& settings = SettingsManager::Instance();
        settings.clearAll();
        settings.applyDefaults();
        settings.set("game", "rng_seed", 1234);
        settings.set("save", "directory", saveDir);
        session = std::make_unique<GameSession>();
    }

    ~SessionFixture() {
        session.reset();
        std::error_code ec;
        std::filesystem::remove_all(saveDir, ec);
        SPACE_DISABLE_BENCHMARK_MODE();
    }

    void press(char32_t ch) { session->handleKey(KeyEvent::character(ch)); }
    void press(KeyEvent::Code code) { session->handleKey(KeyEvent::key(code)); }

    void startGame() {
        BOOST_REQUIRE(session->newGame());
        BOOST_REQUIRE(session->getWorld());
    }

    // One full world tick while Running
    void tickOnce() { session->update(session->getTickInterval()); }

    GameWorld& world() { return *session->getWorld(); }

    std::string lastMessage() {
        const auto lines = world().log.getLogAsLines("world", 1);
        return lines.empty() ? std::string{} : lines.front();
    }

    std::vector<std::string> mainMenuNames() {
        std::vector<std::string> names;
        for (const auto& item : session->getMainMenu().items()) {
            names.push_back(item.name());
        }
        return names;
    }
};

BOOST_FIXTURE_TEST_SUITE(SessionLifecycleTests, SessionFixture)

BOOST_AUTO_TEST_CASE(TestStartsInStandby) {
    BOOST_CHECK(session->getMode() == EngineMode::Standby);
    BOOST_CHECK(session->isStandby());
    BOOST_CHECK(session->isRunning());
    BOOST_CHECK(!session->isOffline());
    BOOST_CHECK(session->getWorld() == nullptr);
    BOOST_CHECK_CLOSE(session->getTickInterval(), 0.25f, 0.001f);
    BOOST_CHECK_EQUAL(session->getSaveFileName(), "demo_game.dat");
}

BOOST_AUTO_TEST_CASE(TestTickIntervalMustBePositive) {
    session->setTickInterval(0.5f);
    BOOST_CHECK_CLOSE(session->getTickInterval(), 0.5f, 0.001f);
    session->setTickInterval(0.0f);
    session->setTickInterval(-1.0f);
    BOOST_CHECK_CLOSE(session->getTickInterval(), 0.5f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestStandbyMainMenuEntries) {
    session->setMenu(MenuType::Main, GameSession::MAIN_MENU_X, GameSession::MAIN_MENU_Y);
    BOOST_CHECK(session->getVisibleMenu() == MenuType::Main);
    const auto names = mainMenuNames();
    BOOST_REQUIRE_EQUAL(names.size(), 2u);
    BOOST_CHECK_EQUAL(names[0], "New Game");
    BOOST_CHECK_EQUAL(names[1], "Quit");
}

BOOST_AUTO_TEST_CASE(TestNewGameFromMenu) {
    session->setMenu(MenuType::Main, GameSession::MAIN_MENU_X, GameSession::MAIN_MENU_Y);
    press(KeyEvent::Code::Enter);
    // The selection is handled on the next tick
    BOOST_CHECK(session->isStandby());

    session->update(0.0f);
    BOOST_CHECK(!session->isStandby());
    BOOST_CHECK(session->getMode() == EngineMode::Running);
    BOOST_REQUIRE(session->getWorld());

    GameWorld& w = world();
    BOOST_CHECK(w.player() != INVALID_ENTITY);
    BOOST_CHECK(w.registry.findLMR() != INVALID_ENTITY);
    BOOST_CHECK(w.registry.findPlanq() != INVALID_ENTITY);
    BOOST_REQUIRE(w.positionOf(w.player()));
    BOOST_CHECK_EQUAL(*w.positionOf(w.player()), Position(4, 14, 1));
    BOOST_CHECK_EQUAL(w.victoryPoint, Position(28, 1, 1));
    BOOST_CHECK(!w.model.levels.empty());
    BOOST_CHECK_EQUAL(w.log.getLogAsLines("world").front(), "WELCOME TO SPACEGAME");
    // newGame runs one world update before handing over
    BOOST_CHECK_EQUAL(w.tickCount, 1u);
}

BOOST_AUTO_TEST_CASE(TestQuitFromMenu) {
    session->setMenu(MenuType::Main, GameSession::MAIN_MENU_X, GameSession::MAIN_MENU_Y);
    press(U'j');
    press(KeyEvent::Code::Enter);
    session->update(0.0f);

    BOOST_CHECK(session->isOffline());
    BOOST_CHECK(!session->isRunning());
}

BOOST_AUTO_TEST_CASE(TestCtrlCQuits) {
    startGame();
    session->handleKey(KeyEvent::character(U'c', true));
    BOOST_CHECK(session->isOffline());
    BOOST_CHECK(!session->isRunning());
}

BOOST_AUTO_TEST_CASE(TestHaltReturnsToStandby) {
    startGame();
    session->haltGame();
    BOOST_CHECK(session->isStandby());
    BOOST_CHECK(session->getMode() == EngineMode::Standby);
    BOOST_CHECK(session->getWorld() == nullptr);
    BOOST_CHECK(session->getControllers().empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SessionPlayTests, SessionFixture)

BOOST_AUTO_TEST_CASE(TestKeysQueueEventsForNextTick) {
    startGame();
    const uint64_t ticks = world().tickCount;

    press(U'l');
    BOOST_REQUIRE_EQUAL(world().pendingEvents.size(), 1u);
    BOOST_CHECK(world().pendingEvents[0].getType().kind == GameEventType::Kind::PlayerAction);

    // Less than a tick interval does nothing
    session->update(session->getTickInterval() / 2.0f);
    BOOST_CHECK_EQUAL(world().pendingEvents.size(), 1u);

    session->update(session->getTickInterval() / 2.0f);
    BOOST_CHECK(world().pendingEvents.empty());
    BOOST_CHECK_EQUAL(world().tickCount, ticks + 1);
}

BOOST_AUTO_TEST_CASE(TestLongFrameRunsSeveralTicks) {
    startGame();
    const uint64_t ticks = world().tickCount;
    session->update(session->getTickInterval() * 3.0f);
    BOOST_CHECK_EQUAL(world().tickCount, ticks + 3);
}

BOOST_AUTO_TEST_CASE(TestPauseToggle) {
    startGame();
    press(U'p');
    BOOST_CHECK(session->getMode() == EngineMode::Paused);

    const uint64_t ticks = world().tickCount;
    session->update(1.0f);
    BOOST_CHECK_EQUAL(world().tickCount, ticks);

    press(U'p');
    BOOST_CHECK(session->getMode() == EngineMode::Running);
}

BOOST_AUTO_TEST_CASE(TestUnpauseOnlyFromPaused) {
    startGame();
    session->unpauseGame();
    BOOST_CHECK(session->getMode() == EngineMode::Running);

    session->setMode(EngineMode::GoodEnd);
    session->unpauseGame();
    BOOST_CHECK(session->getMode() == EngineMode::GoodEnd);
}

BOOST_AUTO_TEST_CASE(TestEscapeOpensInGameMenu) {
    startGame();
    press(KeyEvent::Code::Escape);
    BOOST_CHECK(session->getVisibleMenu() == MenuType::Main);
    BOOST_CHECK(session->getMode() == EngineMode::Paused);

    const auto names = mainMenuNames();
    BOOST_REQUIRE_EQUAL(names.size(), 4u);
    BOOST_CHECK_EQUAL(names[1], "Save Game");
    BOOST_CHECK_EQUAL(names[2], "Abandon Game");

    press(KeyEvent::Code::Escape);
    BOOST_CHECK(session->getVisibleMenu() == MenuType::None);
    BOOST_CHECK(session->getMode() == EngineMode::Running);
}

BOOST_AUTO_TEST_CASE(TestEmptyContextMenusExplainThemselves) {
    startGame();
    press(U'i');
    BOOST_CHECK_EQUAL(lastMessage(), "You are not carrying anything.");
    BOOST_CHECK(session->getVisibleMenu() == MenuType::None);

    press(U'd');
    BOOST_CHECK_EQUAL(lastMessage(), "You have nothing to drop.");

    press(U'D');
    BOOST_CHECK_EQUAL(lastMessage(), "There's nothing connected to your PLANQ.");
}

BOOST_AUTO_TEST_CASE(TestVictoryEndsTheGame) {
    startGame();
    GameWorld& w = world();
    const EntityID player = w.player();
    EntityRecord& planq = w.registry.get(w.registry.findPlanq());
    BOOST_REQUIRE(planq.portable);
    planq.portable->carrier = player;
    planq.isCarried = true;
    w.registry.get(player).body->moveTo(w.victoryPoint);

    tickOnce();
    BOOST_CHECK(session->getMode() == EngineMode::GoodEnd);

    // The end is announced on the following tick and the world stays frozen
    const uint64_t ticks = w.tickCount;
    tickOnce();
    tickOnce();
    BOOST_CHECK(!session->isRunning());
    BOOST_CHECK_EQUAL(lastMessage(), "Victory");
    BOOST_CHECK_EQUAL(w.tickCount, ticks);
    BOOST_CHECK(!session->isOffline());
}

BOOST_AUTO_TEST_CASE(TestVictoryNeedsThePlanq) {
    startGame();
    GameWorld& w = world();
    w.registry.get(w.player()).body->moveTo(w.victoryPoint);
    tickOnce();
    BOOST_CHECK(session->getMode() == EngineMode::Running);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SessionSaveTests, SessionFixture)

BOOST_AUTO_TEST_CASE(TestSaveWithoutGameFails) {
    BOOST_CHECK(!session->saveGame());
}

BOOST_AUTO_TEST_CASE(TestLoadWithoutSaveFails) {
    BOOST_CHECK(!session->loadGame());
    BOOST_CHECK(session->isStandby());
    BOOST_CHECK(session->getWorld() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestSaveAndLoadRoundTrip) {
    startGame();
    tickOnce();
    tickOnce();
    const uint64_t ticks = world().tickCount;
    const Position where = *world().positionOf(world().player());
    const size_t entities = world().registry.size();

    BOOST_REQUIRE(session->saveGame());
    BOOST_CHECK(SaveGameManager::Instance().saveExists(session->getSaveFileName()));

    session->haltGame();
    session->setMenu(MenuType::Main, GameSession::MAIN_MENU_X, GameSession::MAIN_MENU_Y);
    const auto names = mainMenuNames();
    BOOST_REQUIRE_EQUAL(names.size(), 3u);
    BOOST_CHECK_EQUAL(names[1], "Load Game");

    BOOST_REQUIRE(session->loadGame());
    // Loaded games wait for the player to unpause
    BOOST_CHECK(session->getMode() == EngineMode::Paused);
    BOOST_CHECK(!session->isStandby());
    BOOST_CHECK_EQUAL(world().tickCount, ticks);
    BOOST_CHECK_EQUAL(world().registry.size(), entities);
    BOOST_CHECK_EQUAL(*world().positionOf(world().player()), where);
    BOOST_CHECK(!session->getControllers().empty());

    session->unpauseGame();
    tickOnce();
    BOOST_CHECK_EQUAL(world().tickCount, ticks + 1);
}

BOOST_AUTO_TEST_CASE(TestSaveFromMenuShutsDown) {
    startGame();
    press(KeyEvent::Code::Escape);
    press(U'j');
    press(KeyEvent::Code::Enter);
    tickOnce();

    BOOST_CHECK(session->isOffline());
    BOOST_CHECK(SaveGameManager::Instance().saveExists(session->getSaveFileName()));
}

BOOST_AUTO_TEST_CASE(TestAbandonDeletesSave) {
    startGame();
    BOOST_REQUIRE(session->saveGame());

    press(KeyEvent::Code::Escape);
    // New Game, Save Game, Load Game, Abandon Game, Quit
    press(U'j');
    press(U'j');
    press(U'j');
    BOOST_REQUIRE(session->getMainMenu().highlight());
    BOOST_CHECK_EQUAL(session->getMainMenu().highlight()->name(), "Abandon Game");
    press(KeyEvent::Code::Enter);
    tickOnce();

    BOOST_CHECK(session->isOffline());
    BOOST_CHECK(!SaveGameManager::Instance().saveExists(session->getSaveFileName()));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(SessionRenderTests, SessionFixture)

BOOST_AUTO_TEST_CASE(TestStandbyDrawsMainMenu) {
    Console console(100, 48);
    session->setMenu(MenuType::Main, GameSession::MAIN_MENU_X, GameSession::MAIN_MENU_Y);
    session->render(console);

    BOOST_CHECK_NE(console.rowText(GameSession::MAIN_MENU_Y - 1).find("MAIN"), std::string::npos);
    BOOST_CHECK_NE(console.rowText(GameSession::MAIN_MENU_Y).find("New Game"), std::string::npos);
    BOOST_CHECK((session->getGrid().camera == UIRect{0, 0, 68, 36}));
}

BOOST_AUTO_TEST_CASE(TestRunningDrawsCameraAndLog) {
    startGame();
    Console console(100, 48);
    session->render(console);

    BOOST_CHECK_EQUAL(console.get(0, 0).glyph, "┌");
    BOOST_CHECK_EQUAL(session->getCamera().getWidth(), 66);

    // The player sits in the middle of the camera view
    const auto& camera = session->getCamera();
    BOOST_CHECK_EQUAL(camera.at(camera.getWidth() / 2, camera.getHeight() / 2).glyph, "@");
}

BOOST_AUTO_TEST_CASE(TestPauseBanner) {
    startGame();
    press(U'p');
    Console console(100, 48);
    session->render(console);

    bool found = false;
    for (int y = 0; y < 48 && !found; ++y) {
        found = console.rowText(y).find("*** PAUSED ***") != std::string::npos;
    }
    BOOST_CHECK(found);
}

BOOST_AUTO_TEST_SUITE_END()
