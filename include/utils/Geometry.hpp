/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include "utils/Position.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace Spacegame {

inline float lerp(float start, float end, float t) {
  return start * (1.0f - t) + t * end;
}

inline float diagonalDistance(float ax, float ay, float bx, float by) {
  return std::max(std::abs(bx - ax), std::abs(by - ay));
}

/**
 * Points on the line from first towards second, stepping one cell along the
 * longer axis. The start is included, the end point is not. Stays on the
 * deck of the first point.
 */
inline std::vector<Position> getLine(const Position &first,
                                     const Position &second) {
  const float ax = static_cast<float>(first.x);
  const float ay = static_cast<float>(first.y);
  const float bx = static_cast<float>(second.x);
  const float by = static_cast<float>(second.y);

  std::vector<Position> points;
  const float n = diagonalDistance(ax, ay, bx, by);
  const int steps = static_cast<int>(n);
  points.reserve(static_cast<size_t>(std::max(steps, 0)));
  for (int step = 0; step < steps; ++step) {
    const float t = (n == 0.0f) ? 0.0f : static_cast<float>(step) / n;
    points.emplace_back(static_cast<int>(std::round(lerp(ax, bx, t))),
                        static_cast<int>(std::round(lerp(ay, by, t))), first.z);
  }
  return points;
}

} // namespace Spacegame

#endif // GEOMETRY_HPP
