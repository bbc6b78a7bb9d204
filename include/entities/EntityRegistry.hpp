/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_REGISTRY_HPP
#define ENTITY_REGISTRY_HPP

#include "entities/Components.hpp"

#include <boost/container/flat_map.hpp>
#include <string>
#include <vector>

namespace Spacegame {

/**
 * Owns every entity of a world. Ids are handed out monotonically from 1
 * and never reused within a session; iteration is in ascending id order.
 */
class EntityRegistry {
public:
  using Storage = boost::container::flat_map<EntityID, EntityRecord>;

  EntityID create();
  EntityID create(EntityRecord record);
  // Inserts a record under a known id (save games); returns false if taken
  bool restore(EntityID id, EntityRecord record);
  bool destroy(EntityID id);
  bool exists(EntityID id) const { return m_entities.find(id) != m_entities.end(); }

  // Throws std::out_of_range for an unknown id
  EntityRecord &get(EntityID id);
  const EntityRecord &get(EntityID id) const;
  EntityRecord *tryGet(EntityID id);
  const EntityRecord *tryGet(EntityID id) const;

  Storage &entities() { return m_entities; }
  const Storage &entities() const { return m_entities; }
  size_t size() const { return m_entities.size(); }
  void clear();

  EntityID findPlayer() const;
  EntityID findPlanq() const;
  EntityID findLMR() const;

  // Entities whose Body covers pos and that are not being carried
  std::vector<EntityID> entitiesAt(const Position &pos) const;
  // Portable entities held by the carrier
  std::vector<EntityID> carriedBy(EntityID carrier) const;

  std::string nameOf(EntityID id) const;

  EntityID getNextId() const { return m_nextId; }
  void setNextId(EntityID next) { m_nextId = next; }

private:
  Storage m_entities;
  EntityID m_nextId{1};
};

} // namespace Spacegame

#endif // ENTITY_REGISTRY_HPP
