/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EXAMINE_CONTROLLER_HPP
#define EXAMINE_CONTROLLER_HPP

#include "controllers/ControllerBase.hpp"
#include "entities/EntityID.hpp"
#include <string>

// Describes entities to the player
class ExamineController : public ControllerBase {
public:
    ExamineController() = default;
    ~ExamineController() override = default;

    void handleEvent(const Spacegame::GameEvent& event, Spacegame::GameWorld& world) override;

    [[nodiscard]] std::string_view getName() const override { return "ExamineController"; }

    // "Name: desc", or "It's a name." when there is no description text
    [[nodiscard]] static std::string describe(Spacegame::EntityID target, const Spacegame::GameWorld& world);
};

#endif // EXAMINE_CONTROLLER_HPP
