/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/FieldOfView.hpp"

#include <cmath>
#include <cstdlib>

namespace Spacegame {

namespace {

// Bresenham walk from origin towards target, stopping at the first opaque tile
void castRay(const Position &origin, const Position &target, const WorldMap &map,
             std::unordered_set<Position, PositionHash> &visible) {
  int x = origin.x;
  int y = origin.y;
  const int dx = std::abs(target.x - origin.x);
  const int dy = -std::abs(target.y - origin.y);
  const int sx = origin.x < target.x ? 1 : -1;
  const int sy = origin.y < target.y ? 1 : -1;
  int err = dx + dy;

  while (true) {
    if (!map.inBounds(x, y))
      return;
    const Position here(x, y, origin.z);
    visible.insert(here);
    if (here != origin && map.isOpaque(here))
      return;
    if (x == target.x && y == target.y)
      return;
    const int e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y += sy;
    }
  }
}

} // namespace

std::unordered_set<Position, PositionHash>
fieldOfView(const Position &origin, int range, const WorldMap &map) {
  std::unordered_set<Position, PositionHash> visible;
  if (!map.inBounds(origin))
    return visible;

  visible.insert(origin);
  if (range <= 0)
    return visible;

  for (int d = -range; d <= range; ++d) {
    castRay(origin, Position(origin.x + d, origin.y - range, origin.z), map, visible);
    castRay(origin, Position(origin.x + d, origin.y + range, origin.z), map, visible);
    castRay(origin, Position(origin.x - range, origin.y + d, origin.z), map, visible);
    castRay(origin, Position(origin.x + range, origin.y + d, origin.z), map, visible);
  }
  return visible;
}

} // namespace Spacegame
