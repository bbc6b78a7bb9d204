/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityRegistry.hpp"
#include "core/Logger.hpp"

#include <stdexcept>

namespace Spacegame {

EntityID EntityRegistry::create() { return create(EntityRecord{}); }

EntityID EntityRegistry::create(EntityRecord record) {
  const EntityID id = m_nextId++;
  m_entities.emplace(id, std::move(record));
  return id;
}

bool EntityRegistry::restore(EntityID id, EntityRecord record) {
  if (id == INVALID_ENTITY || exists(id)) {
    WORLD_ERROR("Cannot restore entity " + std::to_string(id) +
                ": id is invalid or already taken");
    return false;
  }
  m_entities.emplace(id, std::move(record));
  if (id >= m_nextId) {
    m_nextId = id + 1;
  }
  return true;
}

bool EntityRegistry::destroy(EntityID id) {
  return m_entities.erase(id) > 0;
}

EntityRecord &EntityRegistry::get(EntityID id) {
  auto it = m_entities.find(id);
  if (it == m_entities.end()) {
    throw std::out_of_range("Spacegame - no entity with id " +
                            std::to_string(id));
  }
  return it->second;
}

const EntityRecord &EntityRegistry::get(EntityID id) const {
  return const_cast<EntityRegistry *>(this)->get(id);
}

EntityRecord *EntityRegistry::tryGet(EntityID id) {
  auto it = m_entities.find(id);
  return it == m_entities.end() ? nullptr : &it->second;
}

const EntityRecord *EntityRegistry::tryGet(EntityID id) const {
  auto it = m_entities.find(id);
  return it == m_entities.end() ? nullptr : &it->second;
}

void EntityRegistry::clear() {
  m_entities.clear();
  m_nextId = 1;
}

EntityID EntityRegistry::findPlayer() const {
  for (const auto &[id, record] : m_entities) {
    if (record.player)
      return id;
  }
  return INVALID_ENTITY;
}

EntityID EntityRegistry::findPlanq() const {
  for (const auto &[id, record] : m_entities) {
    if (record.planq)
      return id;
  }
  return INVALID_ENTITY;
}

EntityID EntityRegistry::findLMR() const {
  for (const auto &[id, record] : m_entities) {
    if (record.lmr)
      return id;
  }
  return INVALID_ENTITY;
}

std::vector<EntityID> EntityRegistry::entitiesAt(const Position &pos) const {
  std::vector<EntityID> found;
  for (const auto &[id, record] : m_entities) {
    if (record.isCarried || !record.body)
      continue;
    if (record.body->contains(pos))
      found.push_back(id);
  }
  return found;
}

std::vector<EntityID> EntityRegistry::carriedBy(EntityID carrier) const {
  std::vector<EntityID> found;
  for (const auto &[id, record] : m_entities) {
    if (record.portable && record.portable->carrier == carrier)
      found.push_back(id);
  }
  return found;
}

std::string EntityRegistry::nameOf(EntityID id) const {
  const EntityRecord *record = tryGet(id);
  return record ? record->name() : std::string("nothing");
}

} // namespace Spacegame
