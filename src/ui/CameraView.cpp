/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ui/CameraView.hpp"
#include "core/Logger.hpp"
#include "world/GameWorld.hpp"

#include <format>

namespace Spacegame {

void CameraView::setDims(int width, int height) {
  m_width = width < 0 ? 0 : width;
  m_height = height < 0 ? 0 : height;
  const size_t newSize = static_cast<size_t>(m_width * m_height);
  if (m_cells.size() != newSize)
    m_cells.assign(newSize, ScreenCell::blank());
}

const ScreenCell &CameraView::at(int x, int y) const {
  static const ScreenCell outside = ScreenCell::outOfBounds();
  if (x < 0 || y < 0 || x >= m_width || y >= m_height)
    return outside;
  return m_cells[static_cast<size_t>(y * m_width + x)];
}

bool CameraView::update(const GameWorld &world) {
  const EntityID playerId = world.player();
  const EntityRecord *player = world.registry.tryGet(playerId);
  if (!player || !player->body || m_cells.empty())
    return false;

  const Position p = player->body->refPosn;
  if (!world.model.hasLevel(p.z)) {
    CAMERA_WARN(std::format("Player is on missing deck {}", p.z));
    return false;
  }
  const WorldMap &deck = world.model.level(p.z);
  const Memory *memory = player->memory ? &*player->memory : nullptr;

  m_frameOrigin = Position(p.x - m_width / 2, p.y - m_height / 2, p.z);

  for (int sy = 0; sy < m_height; ++sy) {
    for (int sx = 0; sx < m_width; ++sx) {
      const Position map(m_frameOrigin.x + sx, m_frameOrigin.y + sy, p.z);
      ScreenCell &out = m_cells[static_cast<size_t>(sy * m_width + sx)];

      if (!deck.inBounds(map)) {
        out = ScreenCell::outOfBounds();
        continue;
      }

      if (map == p) {
        out = player->body->glyphAt(map).value_or(ScreenCell::placeholder());
      } else if (deck.isVisible(map)) {
        out = deck.getTile(map).cell;
        if (auto top = deck.getVisibleEntityAt(map)) {
          const EntityRecord *occupant = world.registry.tryGet(*top);
          if (occupant && occupant->body) {
            out = occupant->body->glyphAt(map).value_or(ScreenCell::placeholder());
          } else {
            CAMERA_WARN(std::format("Visible entity {} at {} has no body", *top, map.toString()));
            out = ScreenCell::placeholder();
          }
        }
      } else if (deck.isRevealed(map)) {
        out = deck.getTile(map).cell;
        if (memory) {
          auto it = memory->cells.find(map);
          if (it != memory->cells.end())
            out = it->second;
        }
        out.fg = MEMORY_FG;
      } else {
        out = ScreenCell::fogOfWar();
      }
    }
  }

  paintReticle();
  return true;
}

void CameraView::paintReticle() {
  if (!m_reticle || m_reticle->z != m_frameOrigin.z)
    return;
  const auto corners = Console::splitGlyphs(m_reticleGlyphs);
  if (corners.size() != 4)
    return;

  const int rx = m_reticle->x - m_frameOrigin.x;
  const int ry = m_reticle->y - m_frameOrigin.y;
  const int offsets[4][2] = {{-1, -1}, {1, -1}, {-1, 1}, {1, 1}};
  for (size_t i = 0; i < 4; ++i) {
    const int x = rx + offsets[i][0];
    const int y = ry + offsets[i][1];
    if (x < 0 || y < 0 || x >= m_width || y >= m_height)
      continue;
    ScreenCell &cell = m_cells[static_cast<size_t>(y * m_width + x)];
    cell.glyph = corners[i];
    cell.fg = RETICLE_FG;
    cell.bg = RETICLE_BG;
  }
}

void CameraView::blit(Console &console, const UIRect &rect) const {
  for (int y = 0; y < m_height && y < rect.height; ++y) {
    for (int x = 0; x < m_width && x < rect.width; ++x)
      console.put(rect.x + x, rect.y + y, m_cells[static_cast<size_t>(y * m_width + x)]);
  }
}

} // namespace Spacegame
