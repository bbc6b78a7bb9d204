/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_WORLD_HPP
#define GAME_WORLD_HPP

#include "core/EngineMode.hpp"
#include "entities/EntityRegistry.hpp"
#include "events/GameEvent.hpp"
#include "planq/PlanqData.hpp"
#include "planq/PlanqMonitor.hpp"
#include "ui/MessageLog.hpp"
#include "world/WorldModel.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace Spacegame {

/**
 * Everything that makes up one running game. The session owns it; the
 * controllers read and write it while the world ticks, and the save
 * manager serializes it.
 */
struct GameWorld {
  EntityRegistry registry;
  WorldModel model;
  MessageLog log;
  PlanqData planq;
  PlanqMonitor monitor;
  std::mt19937 rng;

  Position victoryPoint{28, 1, 1};
  double elapsedTime{0.0};
  uint64_t tickCount{0};

  // Events waiting for the next world tick
  std::vector<GameEvent> pendingEvents;
  // Set by controllers that end or pause the game
  std::optional<EngineMode> requestedMode;

  void queueEvent(const GameEvent &event) { pendingEvents.push_back(event); }
  void requestMode(EngineMode mode) { requestedMode = mode; }

  EntityID player() const { return registry.findPlayer(); }

  // Position of an entity's body anchor, if it has one
  std::optional<Position> positionOf(EntityID id) const {
    const EntityRecord *rec = registry.tryGet(id);
    if (!rec || !rec->body)
      return std::nullopt;
    return rec->body->refPosn;
  }
};

} // namespace Spacegame

#endif // GAME_WORLD_HPP
