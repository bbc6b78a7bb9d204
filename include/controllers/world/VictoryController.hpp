/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VICTORY_CONTROLLER_HPP
#define VICTORY_CONTROLLER_HPP

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"

// Ends the game in GoodEnd once the player reaches the victory point with the PLANQ
class VictoryController : public ControllerBase, public IUpdatable {
public:
    VictoryController() = default;
    ~VictoryController() override = default;

    [[nodiscard]] std::string_view getName() const override { return "VictoryController"; }

    void update(float deltaTime, Spacegame::GameWorld& world) override;

    static bool isVictorious(const Spacegame::GameWorld& world);
};

#endif // VICTORY_CONTROLLER_HPP
