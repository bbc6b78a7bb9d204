/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FIELD_OF_VIEW_HPP
#define FIELD_OF_VIEW_HPP

#include "utils/Position.hpp"
#include "world/WorldMap.hpp"

#include <unordered_set>

namespace Spacegame {

/**
 * Positions visible from origin within range on the origin's deck.
 * Rays run to every cell on the perimeter of the range square; each ray
 * stops at (and includes) the first opaque tile. Results are clipped to
 * the map bounds.
 */
std::unordered_set<Position, PositionHash>
fieldOfView(const Position &origin, int range, const WorldMap &map);

} // namespace Spacegame

#endif // FIELD_OF_VIEW_HPP
