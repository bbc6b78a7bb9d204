/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef VISIBILITY_CONTROLLER_HPP
#define VISIBILITY_CONTROLLER_HPP

/**
 * @file VisibilityController.hpp
 * @brief Recomputes dirty viewsheds and the player's map knowledge
 *
 * For the player the deck's visible layer is rebuilt, newly seen cells are
 * revealed, and the player's Memory records what each seen cell looked like
 * so the camera can draw it dimmed later.
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"
#include "entities/EntityID.hpp"

class VisibilityController : public ControllerBase, public IUpdatable {
public:
    VisibilityController() = default;
    ~VisibilityController() override = default;

    [[nodiscard]] std::string_view getName() const override { return "VisibilityController"; }

    void update(float deltaTime, Spacegame::GameWorld& world) override;

    // Recompute one entity's viewshed regardless of its dirty flag
    static void refresh(Spacegame::EntityID id, Spacegame::GameWorld& world);
};

#endif // VISIBILITY_CONTROLLER_HPP
