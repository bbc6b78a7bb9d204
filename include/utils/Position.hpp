/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POSITION_HPP
#define POSITION_HPP

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <ostream>
#include <string>

namespace Spacegame {

/**
 * Integer map coordinate. z selects the deck.
 */
struct Position {
  int x{0};
  int y{0};
  int z{0};

  constexpr Position() = default;
  constexpr Position(int x_, int y_, int z_) : x(x_), y(y_), z(z_) {}

  constexpr Position operator+(const Position &rhs) const {
    return {x + rhs.x, y + rhs.y, z + rhs.z};
  }
  constexpr Position operator-(const Position &rhs) const {
    return {x - rhs.x, y - rhs.y, z - rhs.z};
  }
  Position &operator+=(const Position &rhs) {
    x += rhs.x;
    y += rhs.y;
    z += rhs.z;
    return *this;
  }

  // Ordered by deck, then row, then column
  constexpr auto operator<=>(const Position &rhs) const {
    if (auto c = z <=> rhs.z; c != 0)
      return c;
    if (auto c = y <=> rhs.y; c != 0)
      return c;
    return x <=> rhs.x;
  }
  constexpr bool operator==(const Position &rhs) const = default;

  // Chebyshev distance on the same deck; different decks never touch
  int distanceTo(const Position &rhs) const {
    if (z != rhs.z)
      return INT32_MAX;
    return std::max(std::abs(x - rhs.x), std::abs(y - rhs.y));
  }

  std::string toString() const {
    return "(" + std::to_string(x) + ", " + std::to_string(y) + ", " +
           std::to_string(z) + ")";
  }
};

inline std::ostream &operator<<(std::ostream &os, const Position &p) {
  return os << p.toString();
}

struct PositionHash {
  size_t operator()(const Position &p) const noexcept {
    size_t h = std::hash<int>()(p.x);
    h ^= std::hash<int>()(p.y) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<int>()(p.z) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
  }
};

enum class Direction : uint8_t { N, NW, W, SW, S, SE, E, NE, UP, DOWN };

inline const char *directionName(Direction dir) {
  switch (dir) {
  case Direction::N:
    return "north";
  case Direction::NW:
    return "northwest";
  case Direction::W:
    return "west";
  case Direction::SW:
    return "southwest";
  case Direction::S:
    return "south";
  case Direction::SE:
    return "southeast";
  case Direction::E:
    return "east";
  case Direction::NE:
    return "northeast";
  case Direction::UP:
    return "up";
  case Direction::DOWN:
    return "down";
  }
  return "nowhere";
}

constexpr Position directionDelta(Direction dir) {
  switch (dir) {
  case Direction::N:
    return {0, -1, 0};
  case Direction::NW:
    return {-1, -1, 0};
  case Direction::W:
    return {-1, 0, 0};
  case Direction::SW:
    return {-1, 1, 0};
  case Direction::S:
    return {0, 1, 0};
  case Direction::SE:
    return {1, 1, 0};
  case Direction::E:
    return {1, 0, 0};
  case Direction::NE:
    return {1, -1, 0};
  case Direction::UP:
    return {0, 0, 1};
  case Direction::DOWN:
    return {0, 0, -1};
  }
  return {};
}

inline std::ostream &operator<<(std::ostream &os, Direction dir) {
  return os << directionName(dir);
}

} // namespace Spacegame

#endif // POSITION_HPP
