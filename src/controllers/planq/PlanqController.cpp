/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/planq/PlanqController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"
#include <format>

using namespace Spacegame;

namespace {

using Mode = PlanqCPUMode::Kind;
using PEvent = PlanqEvent::Type;

Device* planqDevice(GameWorld& world) {
    EntityRecord* record = world.registry.tryGet(world.registry.findPlanq());
    return (record && record->device) ? &*record->device : nullptr;
}

} // namespace

void PlanqController::handleEvent(const GameEvent& event, GameWorld& world) {
    PlanqData& planq = world.planq;
    const EntityID player = world.player();
    const EntityID planqId = world.registry.findPlanq();

    if (event.getType().kind == GameEventType::Kind::PlanqConnect) {
        planq.jackCnxn = event.getType().target;
        processEvent({PEvent::AccessLink}, world);
        return;
    }
    if (event.getType().kind != GameEventType::Kind::PlayerAction) {
        return;
    }

    switch (event.getType().action.kind) {
        case ActionType::Kind::MoveItem:
            if (event.getObject() == planqId) {
                planq.isCarried = event.getSubject() == player;
            }
            break;
        case ActionType::Kind::DropItem:
            if (event.getObject() == planqId) {
                planq.isCarried = false;
            }
            break;
        case ActionType::Kind::UseItem:
            if (event.getSubject() == player && event.getObject() == planqId) {
                world.log.tellPlayer("There is a faint 'click' as you press the PLANQ's power button.");
            }
            break;
        default:
            break;
    }
}

bool PlanqController::processEvent(const PlanqEvent& event, GameWorld& world) {
    PlanqData& planq = world.planq;
    switch (event.type) {
        case PEvent::NullEvent:
            return true;
        case PEvent::Startup:
            planq.cpuMode = {Mode::Startup};
            return true;
        case PEvent::BootStage:
            planq.bootStage = event.stage;
            return true;
        case PEvent::Shutdown:
            planq.cpuMode = {Mode::Shutdown};
            return true;
        case PEvent::Reboot:
            reboot(world);
            return true;
        case PEvent::GoIdle:
            idleMode(world);
            return true;
        case PEvent::CliOpen:
            if (!planq.cpuMode.is(Mode::Idle) && !planq.cpuMode.is(Mode::Working)) {
                PLANQ_DEBUG(std::format("CLI refused in mode {}", planq.cpuMode.toString()));
                return false;
            }
            planq.showCliInput = true;
            planq.actionMode = PlanqActionMode::CliInput;
            return true;
        case PEvent::CliClose:
            planq.cliBuffer.clear();
            planq.showCliInput = false;
            planq.actionMode = PlanqActionMode::Default;
            return true;
        case PEvent::AccessLink:
            writeConnection(world);
            return true;
        case PEvent::AccessUnlink:
            writeDisconnection(world);
            return true;
    }
    return false;
}

bool PlanqController::exec(const PlanqCmd& cmd, GameWorld& world) {
    MessageLog& log = world.log;
    switch (cmd.kind) {
        case PlanqCmd::Kind::NoOperation:
            return false;
        case PlanqCmd::Kind::Error:
            log.tellPlanq("¶│ERROR:");
            log.tellPlanq("¶│" + cmd.arg);
            log.tellPlanq(" ");
            return false;
        case PlanqCmd::Kind::Help:
            log.tellPlanq("¶│Available commands:");
            for (auto kind : planqCommandList()) {
                log.tellPlanq("¶│  " + PlanqCmd{kind, ""}.toString());
            }
            log.tellPlanq(" ");
            return true;
        case PlanqCmd::Kind::Shutdown:
            world.planq.raise({PEvent::Shutdown});
            return true;
        case PlanqCmd::Kind::Reboot:
            world.planq.raise({PEvent::Reboot});
            return true;
        case PlanqCmd::Kind::Connect:
            writeConnection(world);
            return true;
        case PlanqCmd::Kind::Disconnect:
            writeDisconnection(world);
            return true;
    }
    return false;
}

void PlanqController::update(float deltaTime, GameWorld& world) {
    PlanqData& planq = world.planq;
    const EntityID player = world.player();
    EntityRecord* planqRecord = world.registry.tryGet(world.registry.findPlanq());
    if (player == INVALID_ENTITY || !planqRecord || !planqRecord->device) {
        return;
    }

    // Handle all queued PlanqEvents
    std::vector<PlanqEvent> events;
    events.swap(planq.pendingEvents);
    for (const auto& event : events) {
        processEvent(event, world);
    }

    // Power switch edges
    const bool switchedOn = planqRecord->device->pwSwitch;
    if (!planq.powerIsOn && switchedOn) {
        planq.powerIsOn = true;
        planq.showTerminal = true;
        planq.cpuMode = {Mode::Startup};
    } else if (planq.powerIsOn && !switchedOn) {
        planq.cpuMode = {Mode::Shutdown};
    }

    // Crash check: powered and supposedly running, but nothing is
    if (planq.powerIsOn && planq.procTable.empty() &&
        (planq.cpuMode.is(Mode::Working) || planq.cpuMode.is(Mode::Idle))) {
        planq.cpuMode = PlanqCPUMode::error(CRASH_CODE);
    }

    runCpuMode(deltaTime, world);

    // Active process timers; these are not the monitor's sample timers
    for (auto& proc : planq.procTable) {
        proc.timer.tick(deltaTime);
    }

    // Keep the carry flag honest
    planqRecord = world.registry.tryGet(world.registry.findPlanq());
    if (planqRecord && planqRecord->portable) {
        planq.isCarried = planqRecord->portable->carrier == player;
    }
}

void PlanqController::runCpuMode(float deltaTime, GameWorld& world) {
    PlanqData& planq = world.planq;
    switch (planq.cpuMode.kind) {
        case Mode::Offline:
            break;
        case Mode::Startup:
            runBootSequence(world);
            break;
        case Mode::Shutdown:
            shutdown(world);
            break;
        case Mode::Idle:
            if (planq.procTable.size() != 1) {
                planq.cpuMode = {Mode::Working};
            }
            break;
        case Mode::Working:
            if (planq.procTable.size() == 1) {
                idleMode(world);
            }
            break;
        case Mode::Error:
            if (!planq.errorReported) {
                world.log.tellPlanq(std::format("¶│ERROR: kernel panic ({})", planq.cpuMode.code));
                planq.errorReported = true;
                planq.errorElapsed = 0.0f;
                PLANQ_WARN(std::format("PLANQ crashed with code {}", planq.cpuMode.code));
            }
            planq.errorElapsed += deltaTime;
            if (planq.errorElapsed >= ERROR_REBOOT_SECONDS) {
                reboot(world);
            }
            break;
    }
}

void PlanqController::runBootSequence(GameWorld& world) {
    PlanqData& planq = world.planq;

    // Finished processes deliver their outcome
    for (const auto& proc : planq.procTable) {
        if (!proc.timer.justFinished) {
            continue;
        }
        if (proc.outcome.type == PEvent::BootStage) {
            planq.bootStage = proc.outcome.stage;
        } else if (proc.outcome.type == PEvent::GoIdle) {
            idleMode(world);
        }
    }

    if (planq.bootStage == 0) {
        if (planq.procTable.empty()) {
            world.log.bootMessage(0);
            PlanqProcess boot;
            boot.timer = PlanqTimer(BOOT_STAGE_SECONDS, false);
            boot.outcome = PlanqEvent::bootStage(1);
            planq.procTable.push_back(boot);
        }
        return;
    }
    if (planq.procTable.empty()) {
        return;
    }

    // Proc 0 is the boot process
    PlanqProcess& boot = planq.procTable.front();
    if (!boot.timer.justFinished || planq.bootStage > 4) {
        return;
    }
    world.log.bootMessage(planq.bootStage);
    if (planq.bootStage < 4) {
        boot.timer.reset();
        boot.outcome = PlanqEvent::bootStage(planq.bootStage + 1);
    } else {
        // Boot complete; proc 0 stays resident as the idle process
        boot.outcome = PlanqEvent{};
        idleMode(world);
        PLANQ_INFO("PLANQ boot complete");
    }
}

void PlanqController::idleMode(GameWorld& world) {
    world.log.tellPlanq(" ");
    world.planq.cpuMode = {Mode::Idle};
}

void PlanqController::shutdown(GameWorld& world) {
    PlanqData& planq = world.planq;
    planq.procTable.clear();
    planq.cliBuffer.clear();
    planq.showCliInput = false;
    planq.actionMode = PlanqActionMode::Default;
    planq.jackCnxn = INVALID_ENTITY;
    planq.errorReported = false;
    planq.errorElapsed = 0.0f;
    world.log.tellPlanq("¶│Shutting down...");

    planq.powerIsOn = false;
    planq.bootStage = 0;
    if (Device* device = planqDevice(world)) {
        device->pwSwitch = false;
    }
    planq.cpuMode = {Mode::Offline};
    PLANQ_DEBUG("PLANQ shut down");
}

void PlanqController::reboot(GameWorld& world) {
    shutdown(world);
    PlanqData& planq = world.planq;
    if (Device* device = planqDevice(world)) {
        device->pwSwitch = true;
    }
    planq.powerIsOn = true;
    planq.showTerminal = true;
    planq.cpuMode = {Mode::Startup};
}

void PlanqController::writeConnection(GameWorld& world) {
    const EntityRecord* target = world.registry.tryGet(world.planq.jackCnxn);
    if (world.planq.jackCnxn == INVALID_ENTITY || !target) {
        world.log.tellPlanq("P: No device on access jack.");
        return;
    }
    std::string status = "NOMINAL";
    if (target->device) {
        status = target->device->pwSwitch ? "ONLINE" : "OFFLINE";
    }
    world.log.tellPlanq("P: Connected: " + target->name());
    world.log.tellPlanq("E: Status: " + status);
    world.log.tellPlanq("P: (idle)");
}

void PlanqController::writeDisconnection(GameWorld& world) {
    world.log.tellPlanq("P: Connection closed");
    world.log.tellPlanq("P: (idle)");
    world.planq.jackCnxn = INVALID_ENTITY;
}
