/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/ShipGraph.hpp"
#include "core/Logger.hpp"
#include "utils/Geometry.hpp"

#include <algorithm>

namespace Spacegame {

// GraphRoom

GraphRoom::GraphRoom(std::string name, const Position &corner, int width,
                     int height)
    : m_name(std::move(name)),
      m_centerpoint(corner.x + width / 2, corner.y + height / 2, corner.z),
      m_ulCorner(corner),
      m_drCorner(corner.x + width, corner.y + height, corner.z) {
  const int z = corner.z;
  for (int x = m_ulCorner.x; x <= m_drCorner.x; ++x) {
    m_cells[Position(x, m_ulCorner.y, z)] = CellType::Wall;
    m_cells[Position(x, m_drCorner.y, z)] = CellType::Wall;
  }
  for (int y = m_ulCorner.y; y <= m_drCorner.y; ++y) {
    m_cells[Position(m_ulCorner.x, y, z)] = CellType::Wall;
    m_cells[Position(m_drCorner.x, y, z)] = CellType::Wall;
  }
  for (int y = m_ulCorner.y + 1; y <= m_drCorner.y - 1; ++y) {
    for (int x = m_ulCorner.x + 1; x <= m_drCorner.x - 1; ++x) {
      m_cells[Position(x, y, z)] = CellType::Open;
    }
  }
}

std::optional<CellType> GraphRoom::cellAt(const Position &p) const {
  auto it = m_cells.find(p);
  if (it == m_cells.end())
    return std::nullopt;
  return it->second;
}

void GraphRoom::setInteriorTo(const std::vector<Position> &points) {
  m_cells.clear();
  if (points.empty())
    return;
  Position lo = points.front();
  Position hi = points.front();
  for (const auto &p : points) {
    m_cells[p] = CellType::Open;
    lo.x = std::min(lo.x, p.x);
    lo.y = std::min(lo.y, p.y);
    hi.x = std::max(hi.x, p.x);
    hi.y = std::max(hi.y, p.y);
  }
  m_ulCorner = lo;
  m_drCorner = hi;
  m_centerpoint = Position((lo.x + hi.x) / 2, (lo.y + hi.y) / 2, lo.z);
}

std::optional<std::vector<std::pair<std::string, Position>>>
GraphRoom::findOpenSpace(SpawnTemplate spawnTemplate, std::mt19937 &rng) {
  if (spawnTemplate.shape().empty())
    return std::nullopt;

  const CellType firstType = spawnTemplate.shape().front().type;
  std::vector<Position> starts;
  for (const auto &[posn, type] : m_cells) {
    if (type == firstType || type == CellType::Open)
      starts.push_back(posn);
  }
  if (starts.empty())
    return std::nullopt;

  std::shuffle(starts.begin(), starts.end(), rng);

  for (const auto &ref : starts) {
    spawnTemplate.resetSuccess();
    for (auto &cell : spawnTemplate.shape()) {
      auto here = cellAt(Position(ref.x + cell.dx, ref.y + cell.dy, ref.z));
      if (!here)
        break;
      switch (*here) {
      case CellType::Open:
        cell.success = (cell.type != CellType::Wall);
        break;
      case CellType::Closed:
        break;
      case CellType::Wall:
        cell.success = (cell.type == CellType::Wall);
        break;
      case CellType::Margin:
        cell.success = (cell.type == CellType::Open || cell.type == CellType::Margin);
        break;
      }
      if (!cell.success)
        break;
    }
    if (spawnTemplate.isSuccessful()) {
      updateInterior(spawnTemplate, ref);
      return spawnTemplate.realizeCoordinates(ref);
    }
  }
  return std::nullopt;
}

void GraphRoom::updateInterior(const SpawnTemplate &spawnTemplate,
                               const Position &ref) {
  for (const auto &cell : spawnTemplate.shape()) {
    m_cells[Position(ref.x + cell.dx, ref.y + cell.dy, ref.z)] = cell.type;
  }
}

std::string GraphRoom::debugString() const {
  std::string out;
  for (int y = m_ulCorner.y; y <= m_drCorner.y; ++y) {
    for (int x = m_ulCorner.x; x <= m_drCorner.x; ++x) {
      auto type = cellAt(Position(x, y, m_ulCorner.z));
      if (!type) {
        out += ' ';
        continue;
      }
      switch (*type) {
      case CellType::Open:
        out += '.';
        break;
      case CellType::Closed:
        out += 'O';
        break;
      case CellType::Wall:
        out += '#';
        break;
      case CellType::Margin:
        out += '+';
        break;
      }
    }
    out += '\n';
  }
  return out;
}

// ShipGraph

RoomIndex ShipGraph::addRoom(GraphRoom room) {
  m_rooms.push_back(std::move(room));
  return m_rooms.size() - 1;
}

void ShipGraph::connect(RoomIndex from, RoomIndex to) {
  if (from >= m_rooms.size() || to >= m_rooms.size()) {
    MASON_ERROR("connect: room index out of range");
    return;
  }
  const DoorIndex door = m_doors.size();
  m_doors.push_back({to, m_rooms[from].firstOutgoingDoor});
  m_rooms[from].firstOutgoingDoor = door;
}

std::vector<RoomIndex> ShipGraph::successors(RoomIndex source) const {
  std::vector<RoomIndex> result;
  if (source >= m_rooms.size())
    return result;
  auto door = m_rooms[source].firstOutgoingDoor;
  while (door) {
    result.push_back(m_doors[*door].target);
    door = m_doors[*door].nextOutgoingDoor;
  }
  return result;
}

std::optional<RoomIndex> ShipGraph::contains(const std::string &name) const {
  auto it = std::find_if(m_rooms.begin(), m_rooms.end(),
                         [&name](const GraphRoom &r) { return r.getName() == name; });
  if (it == m_rooms.end())
    return std::nullopt;
  return static_cast<RoomIndex>(std::distance(m_rooms.begin(), it));
}

std::optional<RoomIndex> ShipGraph::roomContaining(const Position &p) const {
  for (RoomIndex i = 0; i < m_rooms.size(); ++i) {
    if (m_rooms[i].contains(p))
      return i;
  }
  return std::nullopt;
}

std::optional<std::string> ShipGraph::getRoomName(const Position &p) const {
  auto index = roomContaining(p);
  if (!index)
    return std::nullopt;
  return m_rooms[*index].getName();
}

std::vector<std::string> ShipGraph::getRoomList() const {
  std::vector<std::string> names;
  names.reserve(m_rooms.size());
  for (const auto &room : m_rooms)
    names.push_back(room.getName());
  return names;
}

bool ShipGraph::addDoorToMapAt(Position target) {
  auto index = roomContaining(target);
  if (!index)
    return false;

  GraphRoom &room = m_rooms[*index];
  const Position center = room.getCenterpoint();
  if (target.x != center.x && target.y != center.y) {
    target.x += (target.x < center.x) ? -1 : 1;
  }
  for (const auto &point : getLine(center, target)) {
    room.setCell(point, CellType::Margin);
  }
  return true;
}

bool ShipGraph::addStairsToMapAt(const Position &target) {
  auto index = roomContaining(target);
  if (!index)
    return false;

  GraphRoom &room = m_rooms[*index];
  room.setCell(target, CellType::Closed);
  const Position neighbours[] = {
      {target.x + 1, target.y, target.z},
      {target.x - 1, target.y, target.z},
      {target.x, target.y + 1, target.z},
      {target.x, target.y - 1, target.z},
  };
  for (const auto &n : neighbours) {
    if (room.cellAt(n) == CellType::Open)
      room.setCell(n, CellType::Margin);
  }
  return true;
}

} // namespace Spacegame
