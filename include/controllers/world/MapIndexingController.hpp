/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MAP_INDEXING_CONTROLLER_HPP
#define MAP_INDEXING_CONTROLLER_HPP

/**
 * @file MapIndexingController.hpp
 * @brief Rebuilds each deck's blocked and opaque layers every tick
 *
 * Terrain is indexed first, then every uncarried Obstructive body marks
 * its cells blocked and every Opaque(true) body marks its cells opaque.
 */

#include "controllers/ControllerBase.hpp"
#include "controllers/IUpdatable.hpp"

class MapIndexingController : public ControllerBase, public IUpdatable {
public:
    MapIndexingController() = default;
    ~MapIndexingController() override = default;

    [[nodiscard]] std::string_view getName() const override { return "MapIndexingController"; }

    void update(float deltaTime, Spacegame::GameWorld& world) override;

    // Same as update(), callable outside the tick (new games, loads)
    static void reindex(Spacegame::GameWorld& world);
};

#endif // MAP_INDEXING_CONTROLLER_HPP
