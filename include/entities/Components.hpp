/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COMPONENTS_HPP
#define COMPONENTS_HPP

#include "entities/EntityID.hpp"
#include "events/GameEvent.hpp"
#include "ui/ScreenCell.hpp"
#include "utils/Position.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace Spacegame {

/**
 * Physical presence on the map. The extent lists every cell the entity
 * covers together with the glyph drawn there; refPosn is the anchor that
 * moveTo() places.
 */
struct Body {
  Position refPosn;
  std::vector<std::pair<Position, ScreenCell>> extent;

  Body() = default;
  Body(const Position &ref, ScreenCell cell) : refPosn(ref) {
    extent.emplace_back(ref, std::move(cell));
  }
  Body(const Position &ref, std::vector<std::pair<Position, ScreenCell>> cells)
      : refPosn(ref), extent(std::move(cells)) {}

  std::vector<Position> posns() const {
    std::vector<Position> result;
    result.reserve(extent.size());
    for (const auto &[posn, cell] : extent)
      result.push_back(posn);
    return result;
  }

  void moveTo(const Position &target) {
    const Position delta = target - refPosn;
    for (auto &[posn, cell] : extent)
      posn += delta;
    refPosn = target;
  }

  bool contains(const Position &p) const {
    for (const auto &[posn, cell] : extent) {
      if (posn == p)
        return true;
    }
    return false;
  }

  bool isWithinRange(const Position &p, int range) const {
    for (const auto &[posn, cell] : extent) {
      if (posn.distanceTo(p) <= range)
        return true;
    }
    return false;
  }

  bool isAdjacentTo(const Position &p) const { return isWithinRange(p, 1); }

  std::optional<ScreenCell> glyphAt(const Position &p) const {
    for (const auto &[posn, cell] : extent) {
      if (posn == p)
        return cell;
    }
    return std::nullopt;
  }

  // The cell drawn at the anchor; used for menus and the player marker
  ScreenCell mainCell() const {
    return extent.empty() ? ScreenCell::placeholder() : extent.front().second;
  }

  void setGlyph(const std::string &glyph) {
    for (auto &[posn, cell] : extent)
      cell.glyph = glyph;
  }
};

struct Description {
  std::string name;
  std::string desc;
  std::string locn; // name of the room the entity is in
};

struct ActionSet {
  std::set<ActionType> actions;

  bool has(ActionType::Kind kind) const {
    for (const auto &action : actions) {
      if (action.kind == kind)
        return true;
    }
    return false;
  }
};

// Remembered appearance of map cells, keyed by position
struct Memory {
  std::map<Position, ScreenCell> cells;
};

struct Device {
  bool pwSwitch{false};
  float battVoltage{100.0f};
  float battDischarge{0.0f}; // lost per world tick while switched on
};

struct Key {
  int keyId{0};
};

struct Lockable {
  bool isLocked{false};
  int keyId{0}; // 0 opens with no key
};

struct Opaque {
  bool opaque{true};
};

struct Openable {
  bool isOpen{false};
  bool isStuck{false};
  std::string openGlyph{"▔"};
  std::string closedGlyph{"█"};
};

struct Portable {
  EntityID carrier{INVALID_ENTITY};
};

struct Viewshed {
  int range{8};
  std::vector<Position> visibleTiles;
  bool dirty{true};

  bool canSee(const Position &p) const {
    for (const auto &tile : visibleTiles) {
      if (tile == p)
        return true;
    }
    return false;
  }
};

// Chase state carried by a pursuer between decisions
struct Pursuit {
  bool chasing{false};
  bool lineOfSight{false};
  std::optional<Position> lastKnownTarget;
  int ticksWithoutSight{0};
};

/**
 * All components an entity may carry. Data components are optional;
 * marker components are plain flags.
 */
struct EntityRecord {
  std::optional<Body> body;
  std::optional<Description> description;
  std::optional<ActionSet> actions;
  std::optional<Memory> memory;
  std::optional<Device> device;
  std::optional<Key> key;
  std::optional<Lockable> lockable;
  std::optional<Opaque> opaque;
  std::optional<Openable> openable;
  std::optional<Portable> portable;
  std::optional<Viewshed> viewshed;
  std::optional<Pursuit> pursuit;

  bool accessPort{false};
  bool container{false};
  bool isCarried{false};
  bool mobile{false};
  bool networkable{false};
  bool obstructive{false};
  bool planq{false};
  bool player{false};
  bool lmr{false};
  bool facade{false};

  const std::string &name() const {
    static const std::string unnamed{"thing"};
    return description ? description->name : unnamed;
  }

  // Fills the ActionSet from the other components present
  void refreshActions() {
    ActionSet set;
    set.actions.insert(ActionType::Kind::Examine);
    if (portable) {
      set.actions.insert(ActionType::Kind::MoveItem);
      set.actions.insert(ActionType::Kind::DropItem);
    }
    if (device)
      set.actions.insert(ActionType::Kind::UseItem);
    if (openable) {
      set.actions.insert(ActionType::Kind::OpenItem);
      set.actions.insert(ActionType::Kind::CloseItem);
    }
    if (lockable) {
      set.actions.insert(ActionType::Kind::LockItem);
      set.actions.insert(ActionType::Kind::UnlockItem);
    }
    actions = std::move(set);
  }
};

} // namespace Spacegame

#endif // COMPONENTS_HPP
