/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE PlanqTests
#include <boost/test/unit_test.hpp>

#include "controllers/planq/PlanqController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"

#include <string>
#include <vector>

using namespace Spacegame;

using Mode = PlanqCPUMode::Kind;

BOOST_AUTO_TEST_SUITE(PlanqParserTests)

BOOST_AUTO_TEST_CASE(TestKnownCommands) {
    BOOST_CHECK_EQUAL(planqParser("help"), (PlanqCmd{PlanqCmd::Kind::Help, ""}));
    BOOST_CHECK_EQUAL(planqParser("shutdown"), (PlanqCmd{PlanqCmd::Kind::Shutdown, ""}));
    BOOST_CHECK_EQUAL(planqParser("reboot"), (PlanqCmd{PlanqCmd::Kind::Reboot, ""}));
    BOOST_CHECK_EQUAL(planqParser("disconnect"), (PlanqCmd{PlanqCmd::Kind::Disconnect, ""}));
}

BOOST_AUTO_TEST_CASE(TestConnectTakesTarget) {
    BOOST_CHECK_EQUAL(planqParser("connect terminal"), (PlanqCmd{PlanqCmd::Kind::Connect, "terminal"}));
    BOOST_CHECK_EQUAL(planqParser("connect"), (PlanqCmd{PlanqCmd::Kind::Connect, ""}));
}

BOOST_AUTO_TEST_CASE(TestPromptMarksAndWhitespaceAreStripped) {
    BOOST_CHECK_EQUAL(planqParser("¶ help"), (PlanqCmd{PlanqCmd::Kind::Help, ""}));
    BOOST_CHECK_EQUAL(planqParser(">  reboot  "), (PlanqCmd{PlanqCmd::Kind::Reboot, ""}));
    BOOST_CHECK_EQUAL(planqParser("help¶"), (PlanqCmd{PlanqCmd::Kind::Help, ""}));
}

BOOST_AUTO_TEST_CASE(TestEmptyInputIsNoOperation) {
    BOOST_CHECK_EQUAL(planqParser(""), PlanqCmd{});
    BOOST_CHECK_EQUAL(planqParser("   "), PlanqCmd{});
    BOOST_CHECK_EQUAL(planqParser("¶"), PlanqCmd{});
}

BOOST_AUTO_TEST_CASE(TestUnknownCommand) {
    const PlanqCmd cmd = planqParser("dance wildly");
    BOOST_CHECK(cmd.kind == PlanqCmd::Kind::Error);
    BOOST_CHECK_EQUAL(cmd.arg, "Unknown command: dance");
}

BOOST_AUTO_TEST_CASE(TestCommandList) {
    const auto& list = planqCommandList();
    BOOST_REQUIRE_EQUAL(list.size(), 5u);
    BOOST_CHECK(list.front() == PlanqCmd::Kind::Help);
    BOOST_CHECK(list.back() == PlanqCmd::Kind::Disconnect);
    BOOST_CHECK_EQUAL(PlanqCmd{PlanqCmd::Kind::Connect}.toString(), "connect");
}

BOOST_AUTO_TEST_CASE(TestModeNames) {
    BOOST_CHECK_EQUAL(std::string(PlanqCPUMode{Mode::Idle}.toString()), "IDLE");
    BOOST_CHECK_EQUAL(std::string(PlanqCPUMode::error(3).toString()), "ERROR");
    BOOST_CHECK_EQUAL(std::string(PlanqCPUMode{}.toString()), "OFFLINE");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(PlanqTimerTests)

BOOST_AUTO_TEST_CASE(TestOneShotTimer) {
    PlanqTimer timer(1.0f, false);
    timer.tick(0.5f);
    BOOST_CHECK(!timer.justFinished);
    timer.tick(0.5f);
    BOOST_CHECK(timer.justFinished);
    BOOST_CHECK(timer.finished);
    timer.tick(0.5f);
    BOOST_CHECK(!timer.justFinished);
    BOOST_CHECK(timer.finished);

    timer.reset();
    BOOST_CHECK(!timer.finished);
    BOOST_CHECK_EQUAL(timer.elapsed, 0.0f);
}

BOOST_AUTO_TEST_CASE(TestRepeatingTimer) {
    PlanqTimer timer(1.0f, true);
    timer.tick(1.25f);
    BOOST_CHECK(timer.justFinished);
    BOOST_CHECK(!timer.finished);
    BOOST_CHECK_CLOSE(timer.elapsed, 0.25f, 0.001f);
    timer.tick(0.25f);
    BOOST_CHECK(!timer.justFinished);
    timer.tick(0.5f);
    BOOST_CHECK(timer.justFinished);
}

BOOST_AUTO_TEST_SUITE_END()

struct PlanqFixture {
    GameWorld world;
    PlanqController controller;
    EntityID player{INVALID_ENTITY};
    EntityID planqId{INVALID_ENTITY};
    EntityID terminal{INVALID_ENTITY};

    PlanqFixture() {
        SPACE_ENABLE_BENCHMARK_MODE();
        world.log = MessageLog({"world", "planq", "debug"});

        EntityRecord hero;
        hero.body = Body(Position(1, 1, 0), ScreenCell("@", 15));
        hero.player = true;
        player = world.registry.create(std::move(hero));

        EntityRecord planq;
        planq.body = Body(Position(1, 1, 0), ScreenCell("¶", 11));
        planq.description = Description{"planq", "", ""};
        planq.planq = true;
        planq.device = Device{false, 100.0f, 0.0f};
        planq.portable = Portable{player};
        planq.isCarried = true;
        planqId = world.registry.create(std::move(planq));

        EntityRecord term;
        term.body = Body(Position(2, 1, 0), ScreenCell("◘", 7));
        term.description = Description{"terminal", "", ""};
        term.device = Device{true, 100.0f, 0.0f};
        term.accessPort = true;
        terminal = world.registry.create(std::move(term));
    }

    ~PlanqFixture() {
        SPACE_DISABLE_BENCHMARK_MODE();
    }

    void switchPlanq(bool on) {
        world.registry.get(planqId).device->pwSwitch = on;
    }

    // Powers on and runs the boot sequence until the PLANQ idles
    void bootToIdle() {
        switchPlanq(true);
        for (int i = 0; i < 5; ++i) {
            controller.update(PlanqController::BOOT_STAGE_SECONDS, world);
        }
    }

    std::vector<std::string> planqLines() const {
        return world.log.getLogAsLines("planq");
    }

    std::string lastPlanqLine() const {
        const auto lines = world.log.getLogAsLines("planq", 1);
        return lines.empty() ? std::string() : lines.back();
    }
};

BOOST_FIXTURE_TEST_SUITE(PlanqControllerTests, PlanqFixture)

BOOST_AUTO_TEST_CASE(TestStaysOfflineUntilSwitchedOn) {
    controller.update(1.0f, world);
    BOOST_CHECK(world.planq.cpuMode.is(Mode::Offline));
    BOOST_CHECK(!world.planq.powerIsOn);
    BOOST_CHECK_EQUAL(world.log.channelLen("planq"), 0u);
}

BOOST_AUTO_TEST_CASE(TestPowerOnStartsBoot) {
    switchPlanq(true);
    controller.update(1.0f, world);

    BOOST_CHECK(world.planq.powerIsOn);
    BOOST_CHECK(world.planq.showTerminal);
    BOOST_CHECK(world.planq.cpuMode.is(Mode::Startup));
    BOOST_CHECK_EQUAL(world.planq.procTable.size(), 1u);
    BOOST_CHECK_EQUAL(lastPlanqLine(), "¶│BIOS:  GRAIN v17.6.8 'Cedar'");
}

BOOST_AUTO_TEST_CASE(TestBootStagesAdvanceOnTimer) {
    switchPlanq(true);
    controller.update(1.0f, world);
    BOOST_CHECK_EQUAL(world.planq.bootStage, 0u);
    controller.update(1.0f, world);
    controller.update(1.0f, world);
    BOOST_CHECK_EQUAL(world.planq.bootStage, 0u);

    // The boot process finished on the last tick and delivers stage 1 now
    controller.update(1.0f, world);
    BOOST_CHECK_EQUAL(world.planq.bootStage, 1u);
    BOOST_CHECK(world.planq.cpuMode.is(Mode::Startup));
}

BOOST_AUTO_TEST_CASE(TestBootCompletesInIdle) {
    bootToIdle();

    BOOST_CHECK(world.planq.cpuMode.is(Mode::Idle));
    BOOST_CHECK_EQUAL(world.planq.bootStage, 4u);
    BOOST_CHECK_EQUAL(world.planq.procTable.size(), 1u);

    const auto lines = planqLines();
    BOOST_REQUIRE_GE(lines.size(), 2u);
    BOOST_CHECK_EQUAL(lines[lines.size() - 2], "¶│Ready for input!");
    BOOST_CHECK_EQUAL(lines.back(), " ");

    // Idles steadily with only the resident process
    controller.update(1.0f, world);
    BOOST_CHECK(world.planq.cpuMode.is(Mode::Idle));
}

BOOST_AUTO_TEST_CASE(TestExtraProcessMeansWorking) {
    bootToIdle();
    world.planq.procTable.push_back(PlanqProcess{PlanqTimer(10.0f, false), PlanqEvent{}});
    controller.update(1.0f, world);
    BOOST_CHECK(world.planq.cpuMode.is(Mode::Working));

    world.planq.procTable.pop_back();
    controller.update(1.0f, world);
    BOOST_CHECK(world.planq.cpuMode.is(Mode::Idle));
}

BOOST_AUTO_TEST_CASE(TestEmptyProcessTableCrashes) {
    bootToIdle();
    world.planq.procTable.clear();

    controller.update(1.0f, world);
    BOOST_CHECK(world.planq.cpuMode == PlanqCPUMode::error(PlanqController::CRASH_CODE));
    BOOST_CHECK_EQUAL(lastPlanqLine(), "¶│ERROR: kernel panic (420)");

    controller.update(1.0f, world);
    BOOST_CHECK(world.planq.cpuMode.is(Mode::Error));
    // Error reboots after ERROR_REBOOT_SECONDS
    controller.update(1.0f, world);
    BOOST_CHECK(world.planq.cpuMode.is(Mode::Startup));
    BOOST_CHECK(world.planq.powerIsOn);
    BOOST_CHECK(world.registry.get(planqId).device->pwSwitch);
    BOOST_CHECK(!world.planq.errorReported);
}

BOOST_AUTO_TEST_CASE(TestPowerSwitchOffShutsDown) {
    bootToIdle();
    world.planq.jackCnxn = terminal;
    switchPlanq(false);
    controller.update(1.0f, world);

    BOOST_CHECK(world.planq.cpuMode.is(Mode::Offline));
    BOOST_CHECK(!world.planq.powerIsOn);
    BOOST_CHECK_EQUAL(world.planq.bootStage, 0u);
    BOOST_CHECK(world.planq.procTable.empty());
    BOOST_CHECK_EQUAL(world.planq.jackCnxn, INVALID_ENTITY);
    BOOST_CHECK_EQUAL(lastPlanqLine(), "¶│Shutting down...");
}

BOOST_AUTO_TEST_CASE(TestShutdownCommand) {
    bootToIdle();
    BOOST_CHECK(controller.exec(planqParser("shutdown"), world));
    BOOST_CHECK_EQUAL(world.planq.pendingEvents.size(), 1u);

    controller.update(1.0f, world);
    BOOST_CHECK(world.planq.cpuMode.is(Mode::Offline));
    BOOST_CHECK(!world.registry.get(planqId).device->pwSwitch);
}

BOOST_AUTO_TEST_CASE(TestRebootCommand) {
    bootToIdle();
    controller.exec(planqParser("reboot"), world);
    controller.update(1.0f, world);

    BOOST_CHECK(world.planq.cpuMode.is(Mode::Startup));
    BOOST_CHECK_EQUAL(world.planq.bootStage, 0u);
    BOOST_CHECK(world.planq.powerIsOn);
    BOOST_CHECK_EQUAL(lastPlanqLine(), "¶│BIOS:  GRAIN v17.6.8 'Cedar'");
}

BOOST_AUTO_TEST_CASE(TestCliOnlyOpensWhenRunning) {
    BOOST_CHECK(!controller.processEvent({PlanqEvent::Type::CliOpen}, world));
    BOOST_CHECK(!world.planq.isCliOpen());

    bootToIdle();
    BOOST_CHECK(controller.processEvent({PlanqEvent::Type::CliOpen}, world));
    BOOST_CHECK(world.planq.isCliOpen());
    BOOST_CHECK(world.planq.showCliInput);

    world.planq.cliBuffer = "hel";
    BOOST_CHECK(controller.processEvent({PlanqEvent::Type::CliClose}, world));
    BOOST_CHECK(!world.planq.isCliOpen());
    BOOST_CHECK(world.planq.cliBuffer.empty());
}

BOOST_AUTO_TEST_CASE(TestHelpListsCommands) {
    BOOST_CHECK(controller.exec(planqParser("help"), world));
    const auto lines = planqLines();
    BOOST_REQUIRE_EQUAL(lines.size(), 7u);
    BOOST_CHECK_EQUAL(lines[0], "¶│Available commands:");
    BOOST_CHECK_EQUAL(lines[1], "¶│  help");
    BOOST_CHECK_EQUAL(lines[5], "¶│  disconnect");
    BOOST_CHECK_EQUAL(lines[6], " ");
}

BOOST_AUTO_TEST_CASE(TestErrorCommandReports) {
    BOOST_CHECK(!controller.exec(planqParser("xyzzy"), world));
    const auto lines = planqLines();
    BOOST_REQUIRE_EQUAL(lines.size(), 3u);
    BOOST_CHECK_EQUAL(lines[0], "¶│ERROR:");
    BOOST_CHECK_EQUAL(lines[1], "¶│Unknown command: xyzzy");
    BOOST_CHECK(!controller.exec(PlanqCmd{}, world));
}

BOOST_AUTO_TEST_CASE(TestConnectAndDisconnect) {
    controller.exec(planqParser("connect"), world);
    BOOST_CHECK_EQUAL(lastPlanqLine(), "P: No device on access jack.");

    controller.handleEvent(GameEvent::create(GameEventType::planqConnect(terminal), player), world);
    BOOST_CHECK_EQUAL(world.planq.jackCnxn, terminal);
    auto lines = world.log.getLogAsLines("planq", 3);
    BOOST_REQUIRE_EQUAL(lines.size(), 3u);
    BOOST_CHECK_EQUAL(lines[0], "P: Connected: terminal");
    BOOST_CHECK_EQUAL(lines[1], "E: Status: ONLINE");
    BOOST_CHECK_EQUAL(lines[2], "P: (idle)");

    controller.exec(planqParser("disconnect"), world);
    BOOST_CHECK_EQUAL(world.planq.jackCnxn, INVALID_ENTITY);
    lines = world.log.getLogAsLines("planq", 2);
    BOOST_CHECK_EQUAL(lines[0], "P: Connection closed");
}

BOOST_AUTO_TEST_CASE(TestPowerButtonClick) {
    controller.handleEvent(
        GameEvent::create(GameEventType::playerAction(ActionType::Kind::UseItem), player, planqId), world);
    const auto lines = world.log.getLogAsLines("world", 1);
    BOOST_REQUIRE_EQUAL(lines.size(), 1u);
    BOOST_CHECK_EQUAL(lines[0], "There is a faint 'click' as you press the PLANQ's power button.");
}

BOOST_AUTO_TEST_CASE(TestCarryTracking) {
    controller.handleEvent(
        GameEvent::create(GameEventType::playerAction(ActionType::Kind::DropItem), player, planqId), world);
    BOOST_CHECK(!world.planq.isCarried);
    controller.handleEvent(
        GameEvent::create(GameEventType::playerAction(ActionType::Kind::MoveItem), player, planqId), world);
    BOOST_CHECK(world.planq.isCarried);

    // update() reconciles with the portable component
    world.registry.get(planqId).portable->carrier = INVALID_ENTITY;
    controller.update(1.0f, world);
    BOOST_CHECK(!world.planq.isCarried);
}

BOOST_AUTO_TEST_SUITE_END()
