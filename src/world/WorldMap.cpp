/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/WorldMap.hpp"

#include <algorithm>

namespace Spacegame {

WorldMap::WorldMap(int width, int height)
    : m_tiles(static_cast<size_t>(width * height), Tile::vacuum()),
      m_width(width), m_height(height),
      m_revealed(static_cast<size_t>(width * height), false),
      m_visible(static_cast<size_t>(width * height), false),
      m_blocked(static_cast<size_t>(width * height), false),
      m_opaque(static_cast<size_t>(width * height), false) {}

bool WorldMap::isOccupied(const Position &p) const {
  return m_tiles[toIndex(p.x, p.y)].ttype == TileType::Wall;
}

void WorldMap::updateTilemaps() {
  for (size_t i = 0; i < m_tiles.size(); ++i) {
    const TileType type = m_tiles[i].ttype;
    m_blocked[i] = (type == TileType::Wall || type == TileType::Vacuum);
    m_opaque[i] = (type == TileType::Wall);
  }
}

void WorldMap::setTile(const Position &p, Tile tile) {
  auto &slot = m_tiles[toIndex(p.x, p.y)];
  // Occupants stay put when the terrain under them changes
  tile.contents = std::move(slot.contents);
  slot = std::move(tile);
}

std::optional<EntityID> WorldMap::getVisibleEntityAt(const Position &p) const {
  return m_tiles[toIndex(p.x, p.y)].getVisibleEntity();
}

std::vector<EntityID> WorldMap::getContentsAt(const Position &p) const {
  return m_tiles[toIndex(p.x, p.y)].getAllContents();
}

void WorldMap::addOccupant(int priority, EntityID id, const Position &p) {
  m_tiles[toIndex(p.x, p.y)].addOccupant(priority, id);
}

void WorldMap::removeOccupant(EntityID id, const Position &p) {
  m_tiles[toIndex(p.x, p.y)].removeOccupant(id);
}

void WorldMap::clearVisible() {
  std::fill(m_visible.begin(), m_visible.end(), false);
}

} // namespace Spacegame
