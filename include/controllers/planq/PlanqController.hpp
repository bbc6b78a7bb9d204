/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLANQ_CONTROLLER_HPP
#define PLANQ_CONTROLLER_HPP

/**
 * @file PlanqController.hpp
 * @brief Runs the PLANQ's firmware: power, boot, CPU modes and the shell
 *
 * PlanqController handles:
 * - Tracking whether the player carries the PLANQ
 * - Power switch edges (startup and shutdown)
 * - The timed boot sequence and the Idle/Working/Error CPU modes
 * - PlanqEvents raised by the CLI, the access jack and shell commands
 * - Executing parsed shell commands
 *
 * The PLANQ's state lives in GameWorld::planq so that it is saved with
 * the rest of the world; this controller holds no state of its own.
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include "planq/PlanqData.hpp"

class PlanqController : public ControllerBase, public IUpdatable {
public:
    // Seconds per boot stage, and before an error forces a reboot
    static constexpr float BOOT_STAGE_SECONDS = 3.0f;
    static constexpr float ERROR_REBOOT_SECONDS = 3.0f;
    static constexpr uint32_t CRASH_CODE = 420;

    PlanqController() = default;
    ~PlanqController() override = default;

    void handleEvent(const Spacegame::GameEvent& event, Spacegame::GameWorld& world) override;

    [[nodiscard]] std::string_view getName() const override { return "PlanqController"; }

    /**
     * @brief Advance the PLANQ by one tick
     *
     * Order: queued PlanqEvents, power edges, crash check, CPU mode logic,
     * process timers, carry reconciliation.
     */
    void update(float deltaTime, Spacegame::GameWorld& world) override;

    /**
     * @brief Apply a PlanqEvent immediately
     * @return false if the event was refused (e.g. CliOpen while offline)
     */
    bool processEvent(const Spacegame::PlanqEvent& event, Spacegame::GameWorld& world);

    /**
     * @brief Run a parsed shell command, writing its output to the planq channel
     * @return true if the command was recognized
     */
    bool exec(const Spacegame::PlanqCmd& cmd, Spacegame::GameWorld& world);

    void shutdown(Spacegame::GameWorld& world);
    void reboot(Spacegame::GameWorld& world);

private:
    void runCpuMode(float deltaTime, Spacegame::GameWorld& world);
    void runBootSequence(Spacegame::GameWorld& world);
    void idleMode(Spacegame::GameWorld& world);
    void writeConnection(Spacegame::GameWorld& world);
    void writeDisconnection(Spacegame::GameWorld& world);
};

#endif // PLANQ_CONTROLLER_HPP
