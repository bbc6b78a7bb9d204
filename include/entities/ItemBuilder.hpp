/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ITEM_BUILDER_HPP
#define ITEM_BUILDER_HPP

#include "entities/EntityRegistry.hpp"
#include "world/SpawnTemplate.hpp"

#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace Spacegame {

class JsonValue;

// One furniture entry from the items file
struct ItemDefinition {
  std::string name;
  std::string desc;
  std::vector<ScreenCell> body; // one cell per template letter, A first
  std::vector<std::vector<std::string>> shapes;
  std::vector<std::string> extra; // component strings
};

// A group of items placed together; contents map template letters to items
struct ItemSetDefinition {
  std::string name;
  std::vector<std::pair<std::string, std::string>> contents;
  std::vector<std::vector<std::string>> shapes;
};

/**
 * Builds furniture and portable items from their definitions.
 *
 * Usage:
 * @code
 * auto spawned = builder.create("door").at(posn).build(registry);
 * @endcode
 *
 * create() loads the named definition into the builder, at() and giveTo()
 * adjust it, and build() moves it into the registry and resets the builder.
 */
class ItemBuilder {
public:
  bool loadDefinitions(const std::string &itemsPath, const std::string &setsPath);
  // Accepts either a bare array or an object holding "furniture" / "sets"
  bool loadFromJson(const JsonValue &items, const JsonValue &sets);

  // variant selects the body cell when a shape holds several copies
  ItemBuilder &create(const std::string &name, size_t variant = 0);
  ItemBuilder &at(const Position &posn);
  ItemBuilder &giveTo(EntityID carrier);

  // Returns the new entity and the positions its body covers
  std::optional<std::pair<EntityID, std::vector<Position>>> build(EntityRegistry &registry);

  std::optional<SpawnTemplate> getRandomShape(const std::string &name,
                                              std::mt19937 &rng) const;

  bool hasItem(const std::string &name) const { return m_items.find(name) != m_items.end(); }
  bool hasSet(const std::string &name) const { return m_sets.find(name) != m_sets.end(); }
  size_t getItemCount() const { return m_items.size(); }
  size_t getSetCount() const { return m_sets.size(); }
  size_t getSpawnCount() const { return m_spawnCount; }

private:
  void reset();
  void applyComponent(const std::string &component);

  std::unordered_map<std::string, ItemDefinition> m_items;
  std::unordered_map<std::string, ItemSetDefinition> m_sets;

  std::optional<EntityRecord> m_pending;
  size_t m_spawnCount{0};
};

} // namespace Spacegame

#endif // ITEM_BUILDER_HPP
