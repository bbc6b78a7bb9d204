/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_MODEL_HPP
#define WORLD_MODEL_HPP

#include "world/ShipGraph.hpp"
#include "world/WorldMap.hpp"

#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace Spacegame {

/**
 * A one- or two-way link between two map positions, e.g. a ladder
 * between decks. Equality ignores orientation.
 */
struct Portal {
  Position left;
  Position right;
  bool bidir{false};

  std::optional<Position> exitFrom(const Position &entry) const {
    if (entry == left)
      return right;
    if (entry == right && bidir)
      return left;
    return std::nullopt;
  }

  bool has(const Position &p) const { return p == left || p == right; }

  bool operator==(const Portal &rhs) const {
    return (left == rhs.left && right == rhs.right) ||
           (left == rhs.right && right == rhs.left);
  }

  bool operator<(const Portal &rhs) const {
    if (left != rhs.left)
      return left < rhs.left;
    if (right != rhs.right)
      return right < rhs.right;
    return bidir < rhs.bidir;
  }
};

/**
 * The whole ship: one WorldMap per deck, the logical room layout, and the
 * portals linking decks.
 */
class WorldModel {
public:
  std::vector<WorldMap> levels;
  ShipGraph layout;

  bool hasLevel(int z) const { return z >= 0 && z < static_cast<int>(levels.size()); }
  bool inBounds(const Position &p) const {
    return hasLevel(p.z) && levels[static_cast<size_t>(p.z)].inBounds(p);
  }
  WorldMap &level(int z) { return levels[static_cast<size_t>(z)]; }
  const WorldMap &level(int z) const { return levels[static_cast<size_t>(z)]; }

  void addPortal(const Position &left, const Position &right, bool bidir);
  std::optional<Position> getExit(const Position &entry) const;
  const std::vector<Portal> &portals() const { return m_portals; }
  void clearPortals() { m_portals.clear(); }

  TileType getTiletypeAt(const Position &p) const;
  void addContents(const std::vector<Position> &posns, int priority, EntityID id);
  void removeContents(const std::vector<Position> &posns, EntityID id);
  std::vector<EntityID> getContentsAt(const Position &p) const;
  // Out-of-bounds positions count as blocked
  bool isBlockedAt(const Position &p) const;

  /**
   * Lists what blocks each target, nearest entries last. An occupant other
   * than the observer is reported as an Actor, bare terrain as an Object.
   */
  std::optional<std::vector<std::pair<Position, Obstructor>>>
  getObstructionsAt(const std::vector<Position> &targets,
                    EntityID observer = INVALID_ENTITY) const;

  std::optional<std::vector<std::pair<std::string, Position>>>
  findSpawnpointIn(const std::string &room, SpawnTemplate spawnTemplate,
                   std::mt19937 &rng);

  std::vector<std::string> getRoomNameList() const { return layout.getRoomList(); }
  std::optional<std::string> getRoomName(const Position &p) const { return layout.getRoomName(p); }

  void setBlockedState(const Position &p, bool state);
  void setOpaqueState(const Position &p, bool state);

private:
  std::vector<Portal> m_portals;
};

} // namespace Spacegame

#endif // WORLD_MODEL_HPP
