/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/ItemBuilder.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <charconv>
#include <format>
#include <sstream>
#include <string_view>
#include <variant>

namespace Spacegame {

namespace {

std::optional<bool> parseBool(std::string_view value) {
  if (value == "true" || value == "1")
    return true;
  if (value == "false" || value == "0")
    return false;
  return std::nullopt;
}

template <typename T> std::optional<T> parseNumber(std::string_view value) {
  T result{};
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
  if (ec != std::errc() || ptr != value.data() + value.size())
    return std::nullopt;
  return result;
}

std::vector<std::vector<std::string>> readShapes(const JsonValue &shapes) {
  std::vector<std::vector<std::string>> result;
  if (const auto *list = shapes.tryAsArray()) {
    for (const auto &shape : *list) {
      std::vector<std::string> rows;
      for (const auto &row : shape.asArray())
        rows.push_back(row.asString());
      result.push_back(std::move(rows));
    }
  }
  return result;
}

const JsonValue &listOf(const JsonValue &root, const char *key) {
  if (root.isObject())
    return root[key];
  return root;
}

} // namespace

bool ItemBuilder::loadDefinitions(const std::string &itemsPath,
                                  const std::string &setsPath) {
  JsonReader itemReader;
  if (!itemReader.loadFromFile(itemsPath)) {
    ARTISAN_ERROR(std::format("Failed to read item definitions {}: {}", itemsPath,
                              itemReader.getLastError()));
    return false;
  }
  JsonReader setReader;
  if (!setReader.loadFromFile(setsPath)) {
    ARTISAN_ERROR(std::format("Failed to read set definitions {}: {}", setsPath,
                              setReader.getLastError()));
    return false;
  }
  return loadFromJson(itemReader.getRoot(), setReader.getRoot());
}

bool ItemBuilder::loadFromJson(const JsonValue &items, const JsonValue &sets) {
  m_items.clear();
  m_sets.clear();

  const auto *itemList = listOf(items, "furniture").tryAsArray();
  if (!itemList) {
    ARTISAN_ERROR("Item definitions hold no furniture list");
    return false;
  }

  try {
    for (const auto &entry : *itemList) {
      ItemDefinition defn;
      defn.name = entry["name"].asString();
      defn.desc = entry["desc"].tryAsString().value_or("");
      if (const auto *cells = entry["body"].tryAsArray()) {
        for (const auto &cellText : *cells) {
          if (auto cell = ScreenCell::fromString(cellText.asString())) {
            defn.body.push_back(*cell);
          } else {
            ARTISAN_ERROR("Bad body cell '" + cellText.asString() + "' for " + defn.name);
          }
        }
      }
      defn.shapes = readShapes(entry["shapes"]);
      if (const auto *extras = entry["extra"].tryAsArray()) {
        for (const auto &extra : *extras)
          defn.extra.push_back(extra.asString());
      }
      m_items[defn.name] = std::move(defn);
    }

    if (const auto *setList = listOf(sets, "sets").tryAsArray()) {
      for (const auto &entry : *setList) {
        ItemSetDefinition defn;
        defn.name = entry["name"].asString();
        for (const auto &pair : entry["contents"].asArray())
          defn.contents.emplace_back(pair[0].asString(), pair[1].asString());
        defn.shapes = readShapes(entry["shapes"]);
        m_sets[defn.name] = std::move(defn);
      }
    } else {
      ARTISAN_WARN("Set definitions hold no sets list");
    }
  } catch (const std::bad_variant_access &e) {
    ARTISAN_ERROR(std::format("Malformed item definitions: {}", e.what()));
    m_items.clear();
    m_sets.clear();
    return false;
  }

  ARTISAN_INFO(std::format("Loaded {} items and {} sets", m_items.size(), m_sets.size()));
  return true;
}

void ItemBuilder::reset() { m_pending.reset(); }

ItemBuilder &ItemBuilder::create(const std::string &name, size_t variant) {
  reset();
  auto it = m_items.find(name);
  if (it == m_items.end()) {
    ARTISAN_ERROR("Item request '" + name + "' not found in dictionary");
    return *this;
  }

  const ItemDefinition &defn = it->second;
  EntityRecord record;
  record.description = Description{defn.name, defn.desc, ""};
  if (!defn.body.empty()) {
    record.body = Body(Position(), defn.body[variant % defn.body.size()]);
  }
  m_pending = std::move(record);
  for (const auto &component : defn.extra)
    applyComponent(component);
  return *this;
}

void ItemBuilder::applyComponent(const std::string &component) {
  std::istringstream tokens(component);
  std::string part;
  tokens >> part;
  std::vector<std::pair<std::string, std::string>> details;
  std::string token;
  while (tokens >> token) {
    const auto split = token.find(':');
    if (split == std::string::npos) {
      ARTISAN_WARN("Could not split key:value '" + token + "' on component " + part);
      continue;
    }
    details.emplace_back(token.substr(0, split), token.substr(split + 1));
  }

  EntityRecord &rec = *m_pending;
  auto badValue = [&part](const std::string &key, const std::string &value) {
    ARTISAN_ERROR("Could not parse " + part + ":" + key + " value '" + value + "'");
  };
  auto unknownKey = [&part](const std::string &key) {
    ARTISAN_WARN("Component key " + part + ":" + key + " was not recognized");
  };

  if (part == "accessport") {
    rec.accessPort = true;
  } else if (part == "actionset") {
    rec.actions = ActionSet{};
  } else if (part == "container") {
    rec.container = true;
  } else if (part == "description") {
    Description desc;
    for (const auto &[key, value] : details) {
      if (key == "name")
        desc.name = value;
      else if (key == "desc")
        desc.desc = value;
      else
        unknownKey(key);
    }
    rec.description = desc;
  } else if (part == "device") {
    Device device;
    for (const auto &[key, value] : details) {
      if (key == "state") {
        if (auto v = parseBool(value)) device.pwSwitch = *v; else badValue(key, value);
      } else if (key == "voltage") {
        if (auto v = parseNumber<float>(value)) device.battVoltage = *v; else badValue(key, value);
      } else if (key == "rate") {
        if (auto v = parseNumber<float>(value)) device.battDischarge = *v; else badValue(key, value);
      } else {
        unknownKey(key);
      }
    }
    rec.device = device;
  } else if (part == "facade") {
    rec.facade = true;
  } else if (part == "key") {
    Key newKey;
    for (const auto &[key, value] : details) {
      if (key == "id") {
        if (auto v = parseNumber<int>(value)) newKey.keyId = *v; else badValue(key, value);
      } else {
        unknownKey(key);
      }
    }
    rec.key = newKey;
  } else if (part == "lockable") {
    Lockable lock;
    for (const auto &[key, value] : details) {
      if (key == "state") {
        if (auto v = parseBool(value)) lock.isLocked = *v; else badValue(key, value);
      } else if (key == "key_id") {
        if (auto v = parseNumber<int>(value)) lock.keyId = *v; else badValue(key, value);
      } else {
        unknownKey(key);
      }
    }
    rec.lockable = lock;
  } else if (part == "mobile") {
    rec.mobile = true;
  } else if (part == "networkable") {
    rec.networkable = true;
  } else if (part == "obstructs") {
    rec.obstructive = true;
  } else if (part == "opaque") {
    Opaque opaque{true};
    for (const auto &[key, value] : details) {
      if (key == "state") {
        if (auto v = parseBool(value)) opaque.opaque = *v; else badValue(key, value);
      } else {
        unknownKey(key);
      }
    }
    rec.opaque = opaque;
  } else if (part == "openable") {
    Openable open;
    for (const auto &[key, value] : details) {
      if (key == "state") {
        if (auto v = parseBool(value)) open.isOpen = *v; else badValue(key, value);
      } else if (key == "stuck") {
        if (auto v = parseBool(value)) open.isStuck = *v; else badValue(key, value);
      } else if (key == "open") {
        open.openGlyph = value;
      } else if (key == "closed") {
        open.closedGlyph = value;
      } else {
        unknownKey(key);
      }
    }
    rec.openable = open;
    if (rec.body)
      rec.body->setGlyph(open.isOpen ? open.openGlyph : open.closedGlyph);
  } else if (part == "portable") {
    rec.portable = Portable{};
  } else if (part == "planq") {
    rec.planq = true;
  } else if (part == "viewshed") {
    Viewshed view;
    for (const auto &[key, value] : details) {
      if (key == "range") {
        if (auto v = parseNumber<int>(value)) view.range = *v; else badValue(key, value);
      } else {
        unknownKey(key);
      }
    }
    rec.viewshed = view;
  } else {
    ARTISAN_ERROR("Requested component '" + component + "' was not recognized");
  }
}

ItemBuilder &ItemBuilder::at(const Position &posn) {
  if (m_pending && m_pending->body)
    m_pending->body->moveTo(posn);
  return *this;
}

ItemBuilder &ItemBuilder::giveTo(EntityID carrier) {
  if (m_pending) {
    m_pending->portable = Portable{carrier};
    m_pending->isCarried = true;
  }
  return *this;
}

std::optional<std::pair<EntityID, std::vector<Position>>>
ItemBuilder::build(EntityRegistry &registry) {
  if (!m_pending || !m_pending->body || !m_pending->description) {
    ARTISAN_WARN("build() called with no item loaded");
    reset();
    return std::nullopt;
  }

  ++m_spawnCount;
  m_pending->refreshActions();
  std::vector<Position> shape = m_pending->body->posns();
  const EntityID id = registry.create(std::move(*m_pending));
  reset();
  return std::make_pair(id, std::move(shape));
}

std::optional<SpawnTemplate> ItemBuilder::getRandomShape(const std::string &name,
                                                         std::mt19937 &rng) const {
  auto pick = [&rng](const std::vector<std::vector<std::string>> &shapes) {
    if (shapes.empty())
      return SpawnTemplate(std::vector<std::string>{"A"});
    std::uniform_int_distribution<size_t> dist(0, shapes.size() - 1);
    return SpawnTemplate(shapes[dist(rng)]);
  };

  if (auto it = m_items.find(name); it != m_items.end()) {
    SpawnTemplate shape = pick(it->second.shapes);
    shape.assignName(name);
    return shape;
  }
  if (auto it = m_sets.find(name); it != m_sets.end()) {
    SpawnTemplate shape = pick(it->second.shapes);
    shape.assignNames(it->second.contents);
    return shape;
  }
  ARTISAN_ERROR("No shape available for unknown item '" + name + "'");
  return std::nullopt;
}

} // namespace Spacegame
