/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_DATA_HPP
#define WORLD_DATA_HPP

#include "entities/EntityID.hpp"
#include "ui/ScreenCell.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Spacegame {

constexpr int MAPWIDTH = 80;
constexpr int MAPHEIGHT = 60;

enum class TileType : uint8_t { Vacuum = 0, Floor, Wall, Stairway };

inline const char *tileTypeName(TileType type) {
  switch (type) {
  case TileType::Vacuum:
    return "vacuum";
  case TileType::Floor:
    return "floor";
  case TileType::Wall:
    return "wall";
  case TileType::Stairway:
    return "stairway";
  }
  return "unknown";
}

inline std::ostream &operator<<(std::ostream &os, TileType type) {
  return os << tileTypeName(type);
}

/**
 * One map cell. Occupants are kept highest priority first; among equal
 * priorities the most recent arrival is on top.
 */
struct Tile {
  TileType ttype{TileType::Floor};
  ScreenCell cell{".", 8};
  std::vector<std::pair<int, EntityID>> contents;

  static Tile vacuum() { return {TileType::Vacuum, {"★", 8}, {}}; }
  static Tile floor() { return {TileType::Floor, {".", 8}, {}}; }
  static Tile wall() { return {TileType::Wall, {"╳", 7}, {}}; }
  static Tile stairway() { return {TileType::Stairway, {"∑", 5}, {}}; }

  void addOccupant(int priority, EntityID id) {
    auto it = std::find_if(contents.begin(), contents.end(),
                           [priority](const auto &entry) {
                             return entry.first <= priority;
                           });
    contents.insert(it, {priority, id});
  }

  void removeOccupant(EntityID id) {
    std::erase_if(contents,
                  [id](const auto &entry) { return entry.second == id; });
  }

  std::optional<EntityID> getVisibleEntity() const {
    if (contents.empty())
      return std::nullopt;
    return contents.front().second;
  }

  std::vector<EntityID> getAllContents() const {
    std::vector<EntityID> ids;
    ids.reserve(contents.size());
    for (const auto &entry : contents)
      ids.push_back(entry.second);
    return ids;
  }
};

// A thing standing in the way of a move
struct Obstructor {
  enum class Kind : uint8_t { Actor, Object };
  Kind kind{Kind::Object};
  EntityID actor{INVALID_ENTITY};
  TileType tile{TileType::Vacuum};

  static Obstructor fromActor(EntityID id) { return {Kind::Actor, id, TileType::Vacuum}; }
  static Obstructor fromTile(TileType t) { return {Kind::Object, INVALID_ENTITY, t}; }

  bool operator==(const Obstructor &) const = default;
};

} // namespace Spacegame

#endif
