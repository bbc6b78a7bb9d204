/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_BUILDER_HPP
#define WORLD_BUILDER_HPP

#include "world/WorldModel.hpp"

#include <string>
#include <utility>
#include <vector>

namespace Spacegame {

class JsonValue;

/**
 * Produces a WorldModel plus the item spawn requests it implies.
 * Essential requests have fixed positions (doors); additional requests
 * name a room and an item to be placed somewhere inside it.
 */
class WorldBuilder {
public:
  virtual ~WorldBuilder() = default;

  virtual bool buildWorld(const std::string &path) = 0;
  virtual const WorldModel &getModel() const = 0;
  virtual WorldModel takeModel() = 0;
  virtual std::vector<std::pair<std::string, Position>> getEssentialItemRequests() const = 0;
  virtual std::vector<std::pair<std::string, std::string>> getAdditionalItemRequests() const = 0;
};

/**
 * Reads a ship layout file:
 *   map_list    - per deck: width, height, tilemap rows
 *   room_list   - name, corner [x,y,z], width, height, exits, contents
 *   ladder_list - name, points [[x,y,z],[x,y,z]]
 */
class JsonWorldBuilder : public WorldBuilder {
public:
  bool buildWorld(const std::string &path) override;
  // Builds from an already-parsed document; used by buildWorld and tests
  bool buildFromJson(const JsonValue &root);

  const WorldModel &getModel() const override { return m_model; }
  WorldModel takeModel() override { return std::move(m_model); }
  std::vector<std::pair<std::string, Position>> getEssentialItemRequests() const override {
    return m_essentialItems;
  }
  std::vector<std::pair<std::string, std::string>> getAdditionalItemRequests() const override {
    return m_additionalItems;
  }

private:
  void reset();
  bool loadTilemaps(const JsonValue &mapList,
                    std::vector<std::vector<Position>> &hallways,
                    std::vector<Position> &doors);
  void loadRooms(const JsonValue &roomList,
                 const std::vector<std::vector<Position>> &hallways);
  void placeDoors(const std::vector<Position> &doors);
  void placeLadders(const JsonValue &ladderList);

  WorldModel m_model;
  std::vector<std::pair<std::string, Position>> m_essentialItems;
  std::vector<std::pair<std::string, std::string>> m_additionalItems;
};

} // namespace Spacegame

#endif // WORLD_BUILDER_HPP
