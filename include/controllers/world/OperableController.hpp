/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OPERABLE_CONTROLLER_HPP
#define OPERABLE_CONTROLLER_HPP

/**
 * @file OperableController.hpp
 * @brief Power switches and batteries of Device entities
 *
 * UseItem flips a device's power switch. While switched on, a device
 * drains battDischarge volts per tick and shuts off when it runs flat.
 * The PLANQ's own feedback message is left to the PlanqController.
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include "entities/EntityID.hpp"

class OperableController : public ControllerBase, public IUpdatable {
public:
    OperableController() = default;
    ~OperableController() override = default;

    void handleEvent(const Spacegame::GameEvent& event, Spacegame::GameWorld& world) override;

    [[nodiscard]] std::string_view getName() const override { return "OperableController"; }

    void update(float deltaTime, Spacegame::GameWorld& world) override;

    bool toggle(Spacegame::EntityID subject, Spacegame::EntityID device, Spacegame::GameWorld& world);
};

#endif // OPERABLE_CONTROLLER_HPP
