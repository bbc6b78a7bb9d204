/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/WorldBuilder.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

#include <format>
#include <variant>

namespace Spacegame {

namespace {

// Matches the deck size accepted when loading a save
constexpr int MAX_DECK_WIDTH = MAPWIDTH * 16;
constexpr int MAX_DECK_HEIGHT = MAPHEIGHT * 16;

bool validDeckSize(int width, int height) {
  return width > 0 && height > 0 && width <= MAX_DECK_WIDTH &&
         height <= MAX_DECK_HEIGHT;
}

size_t countColumns(const std::string &line) {
  size_t columns = 0;
  for (const char ch : line) {
    if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80)
      ++columns;
  }
  return columns;
}

std::optional<Position> toPosition(const JsonValue &value) {
  if (!value.isArray() || value.size() < 3)
    return std::nullopt;
  auto x = value[0].tryAsInt();
  auto y = value[1].tryAsInt();
  auto z = value[2].tryAsInt();
  if (!x || !y || !z)
    return std::nullopt;
  return Position(*x, *y, *z);
}

std::optional<GraphRoom> toRoom(const JsonValue &room) {
  auto name = room["name"].tryAsString();
  auto corner = toPosition(room["corner"]);
  auto width = room["width"].tryAsInt();
  auto height = room["height"].tryAsInt();
  if (!name || !corner || !width || !height ||
      !validDeckSize(*width, *height))
    return std::nullopt;
  return GraphRoom(*name, *corner, *width, *height);
}

const JsonValue *findRoom(const JsonValue &roomList, const std::string &name) {
  if (const auto *rooms = roomList.tryAsArray()) {
    for (const auto &room : *rooms) {
      if (room["name"].tryAsString() == name)
        return &room;
    }
  }
  return nullptr;
}

} // namespace

void JsonWorldBuilder::reset() {
  m_model = WorldModel();
  m_essentialItems.clear();
  m_additionalItems.clear();
}

bool JsonWorldBuilder::buildWorld(const std::string &path) {
  JsonReader reader;
  if (!reader.loadFromFile(path)) {
    MASON_ERROR(std::format("Failed to read layout file {}: {}", path,
                            reader.getLastError()));
    reset();
    return false;
  }
  return buildFromJson(reader.getRoot());
}

bool JsonWorldBuilder::buildFromJson(const JsonValue &root) {
  reset();
  if (!root.isObject() || !root["map_list"].isArray()) {
    MASON_ERROR("Layout document has no map_list");
    return false;
  }

  try {
    std::vector<std::vector<Position>> hallways;
    std::vector<Position> doors;
    if (!loadTilemaps(root["map_list"], hallways, doors)) {
      reset();
      return false;
    }
    loadRooms(root["room_list"], hallways);
    placeDoors(doors);
    placeLadders(root["ladder_list"]);
  } catch (const std::bad_variant_access &e) {
    MASON_ERROR(std::format("Malformed layout document: {}", e.what()));
    reset();
    return false;
  }

  MASON_INFO(std::format("Built {} decks, {} rooms, {} portals",
                         m_model.levels.size(), m_model.layout.rooms().size(),
                         m_model.portals().size()));
  return true;
}

bool JsonWorldBuilder::loadTilemaps(const JsonValue &mapList,
                                    std::vector<std::vector<Position>> &hallways,
                                    std::vector<Position> &doors) {
  const auto &maps = mapList.asArray();
  for (size_t z = 0; z < maps.size(); ++z) {
    const JsonValue &input = maps[z];
    const int width = input["width"].asInt();
    const int height = input["height"].asInt();
    const int deck = static_cast<int>(z);

    if (!validDeckSize(width, height)) {
      MASON_ERROR(std::format("Deck {} has invalid size {}x{}", deck, width,
                              height));
      return false;
    }
    const auto &rows = input["tilemap"].asArray();
    if (rows.size() != static_cast<size_t>(height)) {
      MASON_ERROR(std::format("Deck {} tilemap has {} rows, expected {}", deck,
                              rows.size(), height));
      return false;
    }
    for (size_t y = 0; y < rows.size(); ++y) {
      const size_t columns = countColumns(rows[y].asString());
      if (columns != static_cast<size_t>(width)) {
        MASON_ERROR(std::format("Deck {} tilemap row {} has {} columns, "
                                "expected {}",
                                deck, y, columns, width));
        return false;
      }
    }

    WorldMap level(width, height);
    std::vector<Position> hallway;
    for (size_t y = 0; y < rows.size(); ++y) {
      const std::string &line = rows[y].asString();
      // Tilemaps may contain multibyte glyphs; count columns by codepoint
      int x = 0;
      for (size_t i = 0; i < line.size() && x < width; ++i) {
        const unsigned char c = static_cast<unsigned char>(line[i]);
        if ((c & 0xC0) == 0x80)
          continue;
        const Position here(x, static_cast<int>(y), deck);
        Tile tile;
        switch (c) {
        case ' ':
          tile = Tile::vacuum();
          break;
        case '#':
          tile = Tile::wall();
          break;
        case '.':
          tile = Tile::floor();
          break;
        case ',':
          tile = Tile::floor();
          tile.cell.glyph = "x";
          hallway.push_back(here);
          break;
        case '=':
          tile = Tile::floor();
          doors.push_back(here);
          m_essentialItems.emplace_back("door", here);
          break;
        default:
          tile = Tile::vacuum();
          break;
        }
        level.setTile(here, std::move(tile));
        ++x;
      }
    }
    level.updateTilemaps();
    m_model.levels.push_back(std::move(level));
    hallways.push_back(std::move(hallway));
  }
  return true;
}

void JsonWorldBuilder::loadRooms(const JsonValue &roomList,
                                 const std::vector<std::vector<Position>> &hallways) {
  const auto *rooms = roomList.tryAsArray();
  if (!rooms) {
    MASON_WARN("Layout document has no room_list");
    return;
  }

  ShipGraph &layout = m_model.layout;
  for (const auto &input : *rooms) {
    auto room = toRoom(input);
    if (!room) {
      MASON_ERROR("Skipping malformed room entry: " + input.toString());
      continue;
    }
    const Position corner = room->getUpperLeft();

    RoomIndex roomIndex = 0;
    if (auto existing = layout.contains(room->getName())) {
      roomIndex = *existing;
    } else {
      roomIndex = layout.addRoom(std::move(*room));
    }

    if (const auto *exits = input["exits"].tryAsArray()) {
      for (const auto &exitValue : *exits) {
        const std::string &destination = exitValue.asString();
        if (auto destIndex = layout.contains(destination)) {
          layout.connect(roomIndex, *destIndex);
        } else if (destination.find("hallway") != std::string::npos) {
          GraphRoom hall;
          hall.setName(destination);
          if (corner.z >= 0 && static_cast<size_t>(corner.z) < hallways.size()) {
            hall.setInteriorTo(hallways[static_cast<size_t>(corner.z)]);
          }
          layout.connect(roomIndex, layout.addRoom(std::move(hall)));
        } else if (const JsonValue *found = findRoom(roomList, destination)) {
          if (auto destRoom = toRoom(*found)) {
            layout.connect(roomIndex, layout.addRoom(std::move(*destRoom)));
          }
        } else {
          MASON_WARN("Room " + layout.rooms()[roomIndex].getName() +
                     " has an exit to unknown room " + destination);
        }
      }
    }

    if (const auto *contents = input["contents"].tryAsArray()) {
      for (const auto &entry : *contents) {
        const std::string &item = entry[0].asString();
        const int qty = entry[1].asInt();
        for (int i = 0; i < qty; ++i) {
          m_additionalItems.emplace_back(layout.rooms()[roomIndex].getName(), item);
        }
      }
    }
  }
}

void JsonWorldBuilder::placeDoors(const std::vector<Position> &doors) {
  ShipGraph &layout = m_model.layout;
  for (const auto &posn : doors) {
    if (auto roomName = layout.getRoomName(posn)) {
      if (auto index = layout.getRoomIndex(*roomName)) {
        layout.rooms()[*index].setCell(posn, CellType::Closed);
      }
    }
    layout.addDoorToMapAt(posn);
  }
}

void JsonWorldBuilder::placeLadders(const JsonValue &ladderList) {
  const auto *ladders = ladderList.tryAsArray();
  if (!ladders)
    return;

  for (const auto &ladder : *ladders) {
    const JsonValue &points = ladder["points"];
    auto left = toPosition(points[0]);
    auto right = toPosition(points[1]);
    if (!left || !right || !m_model.inBounds(*left) || !m_model.inBounds(*right)) {
      MASON_ERROR("Skipping malformed ladder entry: " + ladder.toString());
      continue;
    }
    for (const Position &end : {*left, *right}) {
      WorldMap &level = m_model.level(end.z);
      level.setTile(end, Tile::stairway());
      level.setBlocked(end, false);
      level.setOpaque(end, false);
      m_model.layout.addStairsToMapAt(end);
    }
    m_model.addPortal(*left, *right, true);
  }
}

} // namespace Spacegame
