/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/WorldModel.hpp"
#include "core/Logger.hpp"

#include <algorithm>

namespace Spacegame {

void WorldModel::addPortal(const Position &left, const Position &right,
                           bool bidir) {
  Portal portal{left, right, bidir};
  if (std::find(m_portals.begin(), m_portals.end(), portal) != m_portals.end()) {
    WORLD_DEBUG("Skipping duplicate portal " + left.toString() + " <-> " +
                right.toString());
    return;
  }
  m_portals.insert(std::upper_bound(m_portals.begin(), m_portals.end(), portal),
                   portal);
}

std::optional<Position> WorldModel::getExit(const Position &entry) const {
  for (const auto &portal : m_portals) {
    if (portal.has(entry)) {
      return portal.exitFrom(entry);
    }
  }
  return std::nullopt;
}

TileType WorldModel::getTiletypeAt(const Position &p) const {
  if (!inBounds(p))
    return TileType::Vacuum;
  return level(p.z).getTile(p).ttype;
}

void WorldModel::addContents(const std::vector<Position> &posns, int priority,
                             EntityID id) {
  for (const auto &p : posns) {
    if (!inBounds(p)) {
      WORLD_WARN("addContents: position out of bounds " + p.toString());
      continue;
    }
    level(p.z).addOccupant(priority, id, p);
  }
}

void WorldModel::removeContents(const std::vector<Position> &posns,
                                EntityID id) {
  for (const auto &p : posns) {
    if (inBounds(p))
      level(p.z).removeOccupant(id, p);
  }
}

std::vector<EntityID> WorldModel::getContentsAt(const Position &p) const {
  if (!inBounds(p))
    return {};
  return level(p.z).getContentsAt(p);
}

bool WorldModel::isBlockedAt(const Position &p) const {
  if (!inBounds(p))
    return true;
  return level(p.z).isBlocked(p);
}

std::optional<std::vector<std::pair<Position, Obstructor>>>
WorldModel::getObstructionsAt(const std::vector<Position> &targets,
                              EntityID observer) const {
  std::vector<std::pair<Position, Obstructor>> blockList;
  for (const auto &p : targets) {
    if (!isBlockedAt(p))
      continue;
    if (!inBounds(p)) {
      blockList.insert(blockList.begin(), {p, Obstructor::fromTile(TileType::Vacuum)});
      continue;
    }
    auto observed = level(p.z).getVisibleEntityAt(p);
    if (observed) {
      if (observer == INVALID_ENTITY || *observed != observer) {
        blockList.insert(blockList.begin(), {p, Obstructor::fromActor(*observed)});
      }
    } else {
      blockList.insert(blockList.begin(), {p, Obstructor::fromTile(getTiletypeAt(p))});
    }
  }
  if (blockList.empty())
    return std::nullopt;
  return blockList;
}

std::optional<std::vector<std::pair<std::string, Position>>>
WorldModel::findSpawnpointIn(const std::string &room,
                             SpawnTemplate spawnTemplate, std::mt19937 &rng) {
  auto index = layout.getRoomIndex(room);
  if (!index) {
    WORLD_WARN("findSpawnpointIn: no room named " + room);
    return std::nullopt;
  }
  return layout.rooms()[*index].findOpenSpace(std::move(spawnTemplate), rng);
}

void WorldModel::setBlockedState(const Position &p, bool state) {
  if (inBounds(p))
    level(p.z).setBlocked(p, state);
}

void WorldModel::setOpaqueState(const Position &p, bool state) {
  if (inBounds(p))
    level(p.z).setOpaque(p, state);
}

} // namespace Spacegame
