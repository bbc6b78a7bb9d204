/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef SHIP_GRAPH_HPP
#define SHIP_GRAPH_HPP

#include "utils/Position.hpp"
#include "world/SpawnTemplate.hpp"

#include <boost/container/flat_map.hpp>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace Spacegame {

using RoomIndex = size_t;
using DoorIndex = size_t;

/**
 * A room of the ship's logical layout. Each cell inside the walls (walls
 * included) carries a CellType used when placing furniture.
 */
class GraphRoom {
public:
  GraphRoom() = default;
  // Rectangle whose upper-left wall corner is at corner; width and height
  // count from the corner, so the far walls sit at corner + (width, height)
  GraphRoom(std::string name, const Position &corner, int width, int height);

  const std::string &getName() const { return m_name; }
  void setName(std::string name) { m_name = std::move(name); }
  const Position &getCenterpoint() const { return m_centerpoint; }
  const Position &getUpperLeft() const { return m_ulCorner; }
  const Position &getLowerRight() const { return m_drCorner; }
  void setBounds(const Position &ul, const Position &dr, const Position &center) {
    m_ulCorner = ul;
    m_drCorner = dr;
    m_centerpoint = center;
  }

  bool contains(const Position &p) const { return m_cells.find(p) != m_cells.end(); }
  std::optional<CellType> cellAt(const Position &p) const;
  void setCell(const Position &p, CellType type) { m_cells[p] = type; }
  // Replaces the layout with Open cells at the given points (hallways)
  void setInteriorTo(const std::vector<Position> &points);

  const boost::container::flat_map<Position, CellType> &cells() const { return m_cells; }

  /**
   * Tries reference points inside the room in random order until the
   * template fits, then marks the room cells and returns the realized
   * (item name, position) pairs. Returns nullopt when nothing fits.
   */
  std::optional<std::vector<std::pair<std::string, Position>>>
  findOpenSpace(SpawnTemplate spawnTemplate, std::mt19937 &rng);

  void updateInterior(const SpawnTemplate &spawnTemplate, const Position &ref);

  // Renders the layout as rows of ".O#+" for diagnostics
  std::string debugString() const;

  std::optional<DoorIndex> firstOutgoingDoor;

private:
  std::string m_name{"blank_room"};
  boost::container::flat_map<Position, CellType> m_cells;
  Position m_centerpoint;
  Position m_ulCorner;
  Position m_drCorner;
};

struct GraphDoor {
  RoomIndex target{0};
  std::optional<DoorIndex> nextOutgoingDoor;
};

/**
 * Room connectivity of the ship, stored as per-room linked lists of
 * outgoing doors.
 */
class ShipGraph {
public:
  RoomIndex addRoom(GraphRoom room);
  void connect(RoomIndex from, RoomIndex to);
  std::vector<RoomIndex> successors(RoomIndex source) const;

  std::optional<RoomIndex> contains(const std::string &name) const;
  std::optional<RoomIndex> getRoomIndex(const std::string &name) const { return contains(name); }
  std::optional<std::string> getRoomName(const Position &p) const;
  std::vector<std::string> getRoomList() const;

  // Keeps a walkable lane from the containing room's center to the door
  bool addDoorToMapAt(Position target);
  // Marks the stairs occupied and their orthogonal neighbours as margin
  bool addStairsToMapAt(const Position &target);

  std::vector<GraphRoom> &rooms() { return m_rooms; }
  const std::vector<GraphRoom> &rooms() const { return m_rooms; }
  const std::vector<GraphDoor> &doors() const { return m_doors; }

  void clear() {
    m_rooms.clear();
    m_doors.clear();
  }

private:
  std::optional<RoomIndex> roomContaining(const Position &p) const;

  std::vector<GraphRoom> m_rooms;
  std::vector<GraphDoor> m_doors;
};

} // namespace Spacegame

#endif // SHIP_GRAPH_HPP
