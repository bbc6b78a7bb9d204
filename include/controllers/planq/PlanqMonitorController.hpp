/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLANQ_MONITOR_CONTROLLER_HPP
#define PLANQ_MONITOR_CONTROLLER_HPP

/**
 * @file PlanqMonitorController.hpp
 * @brief Samples the PLANQ status bar sources on their timers
 *
 * Each watched source owns a repeating DataSampleTimer in the world's
 * PlanqMonitor. When a timer wraps, the source is resampled from the
 * world: CPU mode, player location, ship clock, battery charge, or one of
 * the test feeds. The controller also mirrors the planq message channel
 * into PlanqData for the terminal view.
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include <string>

class PlanqMonitorController : public ControllerBase, public IUpdatable {
public:
    // Ship clock reads 12:34:56 at world start
    static constexpr double CLOCK_OFFSET_SECONDS = 12 * 3600 + 34 * 60 + 56;

    PlanqMonitorController() = default;
    ~PlanqMonitorController() override = default;

    [[nodiscard]] std::string_view getName() const override { return "PlanqMonitorController"; }

    void update(float deltaTime, Spacegame::GameWorld& world) override;

    /**
     * @brief Refresh one source immediately
     * @return false for an unknown source
     */
    bool sample(const std::string& source, Spacegame::GameWorld& world);
};

#endif // PLANQ_MONITOR_CONTROLLER_HPP
