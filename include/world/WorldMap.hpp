/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_MAP_HPP
#define WORLD_MAP_HPP

#include "utils/Position.hpp"
#include "world/WorldData.hpp"

#include <optional>
#include <vector>

namespace Spacegame {

/**
 * A single deck of the ship: tiles plus the per-cell flag layers used by
 * movement, field of view, and the camera.
 */
class WorldMap {
public:
  WorldMap() = default;
  WorldMap(int width, int height);

  size_t toIndex(int x, int y) const {
    return static_cast<size_t>(y * m_width + x);
  }
  bool inBounds(int x, int y) const {
    return x >= 0 && y >= 0 && x < m_width && y < m_height;
  }
  bool inBounds(const Position &p) const { return inBounds(p.x, p.y); }

  int getWidth() const { return m_width; }
  int getHeight() const { return m_height; }

  // True for a Wall tile
  bool isOccupied(const Position &p) const;

  // Rebuilds the blocked and opaque layers from the terrain alone
  void updateTilemaps();

  const Tile &getTile(const Position &p) const { return m_tiles[toIndex(p.x, p.y)]; }
  Tile &getTile(const Position &p) { return m_tiles[toIndex(p.x, p.y)]; }
  void setTile(const Position &p, Tile tile);

  std::optional<EntityID> getVisibleEntityAt(const Position &p) const;
  std::vector<EntityID> getContentsAt(const Position &p) const;
  void addOccupant(int priority, EntityID id, const Position &p);
  void removeOccupant(EntityID id, const Position &p);

  bool isBlocked(const Position &p) const { return m_blocked[toIndex(p.x, p.y)]; }
  bool isOpaque(const Position &p) const { return m_opaque[toIndex(p.x, p.y)]; }
  bool isRevealed(const Position &p) const { return m_revealed[toIndex(p.x, p.y)]; }
  bool isVisible(const Position &p) const { return m_visible[toIndex(p.x, p.y)]; }

  void setBlocked(const Position &p, bool state) { m_blocked[toIndex(p.x, p.y)] = state; }
  void setOpaque(const Position &p, bool state) { m_opaque[toIndex(p.x, p.y)] = state; }
  void setRevealed(const Position &p, bool state) { m_revealed[toIndex(p.x, p.y)] = state; }
  void setVisible(const Position &p, bool state) { m_visible[toIndex(p.x, p.y)] = state; }
  void clearVisible();

  const std::vector<Tile> &tiles() const { return m_tiles; }
  std::vector<Tile> &tiles() { return m_tiles; }
  const std::vector<bool> &blockedTiles() const { return m_blocked; }
  const std::vector<bool> &revealedTiles() const { return m_revealed; }
  std::vector<bool> &revealedTiles() { return m_revealed; }

private:
  std::vector<Tile> m_tiles;
  int m_width{0};
  int m_height{0};
  std::vector<bool> m_revealed;
  std::vector<bool> m_visible;
  std::vector<bool> m_blocked;
  std::vector<bool> m_opaque;
};

} // namespace Spacegame

#endif // WORLD_MAP_HPP
