/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CAMERA_VIEW_HPP
#define CAMERA_VIEW_HPP

#include "ui/Console.hpp"
#include "ui/ScreenCell.hpp"
#include "utils/Position.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Spacegame {

struct GameWorld;

/**
 * @brief The player's window onto the map
 *
 * A non-singleton view that follows the player. Each update rebuilds the
 * cell buffer from what the player can see now, what they remember, and
 * fog for the rest. A targeting reticle can frame one map position.
 */
class CameraView {
public:
  static constexpr uint8_t RETICLE_FG = 11;
  static constexpr uint8_t RETICLE_BG = 8;
  static constexpr uint8_t MEMORY_FG = 8;

  CameraView() = default;
  CameraView(int width, int height) { setDims(width, height); }

  /**
   * @brief Resize the view
   *
   * The buffer is only reallocated when the cell count changes.
   */
  void setDims(int width, int height);

  /**
   * @brief Rebuild the view centred on the player
   * @return false if there is no player or the player's deck is missing
   */
  bool update(const GameWorld &world);

  // Map position to frame with corner glyphs; nullopt removes the reticle
  void setReticle(std::optional<Position> target) { m_reticle = target; }
  const std::optional<Position> &getReticle() const { return m_reticle; }
  // Four glyphs, in UL, UR, DL, DR order
  void setReticleGlyphs(const std::string &glyphs) { m_reticleGlyphs = glyphs; }

  int getWidth() const { return m_width; }
  int getHeight() const { return m_height; }
  const ScreenCell &at(int x, int y) const;
  const std::vector<ScreenCell> &cells() const { return m_cells; }

  // Map position shown at screen cell (0, 0) after the last update
  const Position &frameOrigin() const { return m_frameOrigin; }

  // Copies the view into the console at rect's corner, clipped to rect
  void blit(Console &console, const UIRect &rect) const;

private:
  void paintReticle();

  int m_width{0};
  int m_height{0};
  std::vector<ScreenCell> m_cells;
  std::optional<Position> m_reticle;
  std::string m_reticleGlyphs{"⌟⌞⌝⌜"};
  Position m_frameOrigin{};
};

} // namespace Spacegame

#endif // CAMERA_VIEW_HPP
