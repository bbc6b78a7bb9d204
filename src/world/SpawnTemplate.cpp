/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "world/SpawnTemplate.hpp"
#include "core/Logger.hpp"

#include <algorithm>

namespace Spacegame {

SpawnTemplate::SpawnTemplate(const std::vector<std::string> &rows) {
  for (size_t row = 0; row < rows.size(); ++row) {
    const std::string &line = rows[row];
    for (size_t col = 0; col < line.size(); ++col) {
      const char c = line[col];
      CellType type = CellType::Wall;
      if (c == '.') {
        continue;
      } else if (c == '+') {
        type = CellType::Margin;
      } else if (c == '#') {
        type = CellType::Wall;
      } else if (c >= 'A' && c <= 'Z') {
        m_output.push_back({std::string(1, c), DEFAULT_NAME,
                            static_cast<int>(col), static_cast<int>(row)});
        type = CellType::Closed;
      } else {
        MASON_ERROR("Unrecognized celltype character: " + std::string(1, c));
      }
      m_shape.push_back({static_cast<int>(col), static_cast<int>(row), type, false});
    }
  }
}

bool SpawnTemplate::isSuccessful() const {
  return std::all_of(m_shape.begin(), m_shape.end(),
                     [](const Cell &cell) { return cell.success; });
}

void SpawnTemplate::resetSuccess() {
  for (auto &cell : m_shape) {
    cell.success = false;
  }
}

std::vector<std::pair<std::string, Position>>
SpawnTemplate::realizeCoordinates(const Position &ref) const {
  std::vector<std::pair<std::string, Position>> result;
  result.reserve(m_output.size());
  for (const auto &out : m_output) {
    result.emplace_back(out.name, Position(ref.x + out.dx, ref.y + out.dy, ref.z));
  }
  return result;
}

void SpawnTemplate::assignName(const std::string &name) {
  for (auto &out : m_output) {
    out.name = name;
  }
}

void SpawnTemplate::assignNames(
    const std::vector<std::pair<std::string, std::string>> &names) {
  for (auto &out : m_output) {
    auto it = std::find_if(names.begin(), names.end(),
                           [&out](const auto &entry) { return entry.first == out.id; });
    if (it != names.end()) {
      out.name = it->second;
    }
  }
}

} // namespace Spacegame
