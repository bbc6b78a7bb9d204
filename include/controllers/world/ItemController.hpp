/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ITEM_CONTROLLER_HPP
#define ITEM_CONTROLLER_HPP

/**
 * @file ItemController.hpp
 * @brief Controller for picking up, dropping and destroying items
 *
 * ItemController handles:
 * - MoveItem: transfer a Portable from the map to the subject's inventory
 * - DropItem: place a carried item on the subject's tile
 * - KillItem: remove an item from the game entirely
 *
 * Tile contents are kept in step so that the camera and the movement
 * summary see the change on the same tick.
 *
 * Ownership: ControllerRegistry owns the controller instance.
 */

#include "controllers/ControllerBase.hpp"
#include "entities/EntityID.hpp"

class ItemController : public ControllerBase {
public:
    ItemController() = default;
    ~ItemController() override = default;

    void handleEvent(const Spacegame::GameEvent& event, Spacegame::GameWorld& world) override;

    [[nodiscard]] std::string_view getName() const override { return "ItemController"; }

    // --- Interaction API ---

    /**
     * @brief Give an item to the subject
     * @return true if the item changed hands
     */
    bool pickUp(Spacegame::EntityID subject, Spacegame::EntityID item, Spacegame::GameWorld& world);

    /**
     * @brief Put a carried item down where the subject stands
     * @return true if the item was dropped
     */
    bool drop(Spacegame::EntityID subject, Spacegame::EntityID item, Spacegame::GameWorld& world);

    /**
     * @brief Despawn an item and clear it from the map
     */
    bool destroy(Spacegame::EntityID item, Spacegame::GameWorld& world);
};

#endif // ITEM_CONTROLLER_HPP
