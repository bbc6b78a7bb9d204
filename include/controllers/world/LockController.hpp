/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOCK_CONTROLLER_HPP
#define LOCK_CONTROLLER_HPP

/**
 * @file LockController.hpp
 * @brief Locks and unlocks Lockable entities
 *
 * The acting entity must carry a Key whose id matches the lock, unless
 * the lock's key id is 0. An open door has to be closed before it can be
 * locked.
 */

#include "controllers/ControllerBase.hpp"
#include "entities/EntityID.hpp"

class LockController : public ControllerBase {
public:
    LockController() = default;
    ~LockController() override = default;

    void handleEvent(const Spacegame::GameEvent& event, Spacegame::GameWorld& world) override;

    [[nodiscard]] std::string_view getName() const override { return "LockController"; }

    bool setLocked(Spacegame::EntityID subject, Spacegame::EntityID target, bool lock,
                   Spacegame::GameWorld& world);

    // True if subject carries the key for the lock, or the lock needs none
    [[nodiscard]] static bool hasKeyFor(Spacegame::EntityID subject, int keyId,
                                        const Spacegame::GameWorld& world);
};

#endif // LOCK_CONTROLLER_HPP
