/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SPAWN_TEMPLATE_HPP
#define SPAWN_TEMPLATE_HPP

#include "utils/Position.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace Spacegame {

// Occupancy state of one cell in a room's logical layout
enum class CellType : uint8_t {
  Open = 0, // Free, may receive an occupant
  Closed,   // Holds something
  Wall,     // Terrain
  Margin    // Must stay walkable
};

inline std::ostream &operator<<(std::ostream &os, CellType type) {
  switch (type) {
  case CellType::Open:
    return os << "Open";
  case CellType::Closed:
    return os << "Closed";
  case CellType::Wall:
    return os << "Wall";
  case CellType::Margin:
    return os << "Margin";
  }
  return os << "Unknown";
}

/**
 * The footprint of a piece of furniture (or a furniture set) to be placed
 * inside a room. Rows are parsed one character per cell:
 *   '.' skip, '+' Margin, '#' Wall, 'A'-'Z' an occupied cell whose letter
 *   names the item that will spawn there.
 */
class SpawnTemplate {
public:
  struct Cell {
    int dx{0};
    int dy{0};
    CellType type{CellType::Open};
    bool success{false};
  };

  struct Output {
    std::string id;   // template letter
    std::string name; // item to spawn
    int dx{0};
    int dy{0};
  };

  SpawnTemplate() = default;
  explicit SpawnTemplate(const std::vector<std::string> &rows);

  const std::vector<Cell> &shape() const { return m_shape; }
  std::vector<Cell> &shape() { return m_shape; }
  const std::vector<Output> &outputs() const { return m_output; }

  bool isSuccessful() const;
  void resetSuccess();

  std::vector<std::pair<std::string, Position>>
  realizeCoordinates(const Position &ref) const;

  void assignName(const std::string &name);
  // Pairs of (letter, item name)
  void assignNames(const std::vector<std::pair<std::string, std::string>> &names);

  static constexpr const char *DEFAULT_NAME = "spawn_template_default_name";

private:
  std::vector<Cell> m_shape;
  std::vector<Output> m_output;
};

} // namespace Spacegame

#endif // SPAWN_TEMPLATE_HPP
