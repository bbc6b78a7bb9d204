/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/planq/PlanqMonitorController.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"
#include <algorithm>
#include <format>

using namespace Spacegame;

void PlanqMonitorController::update(float deltaTime, GameWorld& world) {
    PlanqMonitor& monitor = world.monitor;

    // sample() may watch or remove sources, so collect the due ones first
    std::vector<std::string> due;
    for (auto& sampler : monitor.sampleTimers()) {
        sampler.timer.tick(deltaTime);
        if (sampler.timer.justFinished) {
            due.push_back(sampler.source);
        }
    }
    for (const auto& source : due) {
        sample(source, world);
    }

    world.planq.stdoutLog = world.log.getLogAsMessages("planq");
    if (auto posn = world.positionOf(world.player())) {
        world.planq.playerLoc = *posn;
    }
}

bool PlanqMonitorController::sample(const std::string& source, GameWorld& world) {
    PlanqMonitor& monitor = world.monitor;

    if (source == "planq_mode") {
        monitor.set(source, PlanqText{world.planq.cpuMode.toString()});
    } else if (source == "player_location") {
        const EntityRecord* player = world.registry.tryGet(world.player());
        std::string locn = (player && player->description) ? player->description->locn : "";
        monitor.set(source, PlanqText{locn});
    } else if (source == "current_time") {
        monitor.set(source, PlanqText{PlanqMonitor::formatClock(world.elapsedTime + CLOCK_OFFSET_SECONDS)});
    } else if (source == "planq_battery") {
        const EntityRecord* planq = world.registry.tryGet(world.registry.findPlanq());
        uint32_t charge = 0;
        if (planq && planq->device) {
            charge = static_cast<uint32_t>(std::clamp(planq->device->battVoltage, 0.0f, 100.0f));
        }
        monitor.set(source, PlanqPercent{charge});
    } else if (source == "test_line") {
        std::uniform_int_distribution<int32_t> dist(0, 1000);
        monitor.set(source, PlanqDecimal{dist(world.rng), 100});
    } else if (source == "test_gauge") {
        std::uniform_int_distribution<uint32_t> dist(0, 100);
        monitor.set(source, PlanqPercent{dist(world.rng)});
    } else if (source == "test_sparkline") {
        std::uniform_int_distribution<uint64_t> dist(0, 100);
        monitor.pushSample(source, dist(world.rng));
    } else {
        PLANQ_ERROR(std::format("Unknown monitor source: {}", source));
        return false;
    }
    return true;
}
