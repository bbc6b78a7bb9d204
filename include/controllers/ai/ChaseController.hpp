/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CHASE_CONTROLLER_HPP
#define CHASE_CONTROLLER_HPP

/**
 * @file ChaseController.hpp
 * @brief Drives the LMR maintenance robot toward the player
 *
 * While the player is inside the LMR's viewshed the robot paths toward
 * them with A* over the deck's blocked map. Once sight is lost it heads
 * for the last known position for a limited number of decisions, then
 * gives up. Steps are queued as ActorAction(MoveTo) events so the robot
 * obeys the same movement rules as the player.
 *
 * The chase itself lives in the LMR's Pursuit component, so it is saved
 * with the world. The controller only keeps its decision cadence.
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include "utils/Position.hpp"
#include <optional>

class ChaseController : public ControllerBase, public IUpdatable {
public:
    explicit ChaseController(int chaseInterval = 2, int maxTicksWithoutSight = 20);
    ~ChaseController() override = default;

    [[nodiscard]] std::string_view getName() const override { return "ChaseController"; }

    void update(float deltaTime, Spacegame::GameWorld& world) override;

    void setChaseInterval(int ticks) { m_chaseInterval = ticks > 0 ? ticks : 1; }
    void setMaxTicksWithoutSight(int ticks) { m_maxTicksWithoutSight = ticks; }

    // Compass direction of a single step from one cell to a neighbouring one
    static std::optional<Spacegame::Direction> stepDirection(const Spacegame::Position& from,
                                                             const Spacegame::Position& to);

private:
    // Runs one chase decision for the LMR
    void think(Spacegame::GameWorld& world);

    int m_chaseInterval;
    int m_maxTicksWithoutSight;
    int m_tickCounter{0};
};

#endif // CHASE_CONTROLLER_HPP
