/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include "ui/ScreenCell.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace Spacegame {

// Cell-space rectangle; width/height of 0 is an empty area
struct UIRect {
  int x{0};
  int y{0};
  int width{0};
  int height{0};

  bool contains(int px, int py) const {
    return px >= x && py >= y && px < x + width && py < y + height;
  }
  bool isEmpty() const { return width <= 0 || height <= 0; }
  bool operator==(const UIRect &) const = default;
};

/**
 * In-memory grid of ScreenCells that the game draws into each frame.
 *
 * Every cell holds one UTF-8 glyph. The frontend turns the grid into
 * textures through FontManager; nothing here touches SDL, which keeps
 * the layout and HUD code testable.
 */
class Console {
public:
  Console() = default;
  Console(int width, int height);

  // Reallocates only when the size changes; contents are cleared then
  void resize(int width, int height);

  int getWidth() const { return m_width; }
  int getHeight() const { return m_height; }
  UIRect area() const { return {0, 0, m_width, m_height}; }

  bool inBounds(int x, int y) const {
    return x >= 0 && y >= 0 && x < m_width && y < m_height;
  }

  // Writes outside the console are dropped
  void put(int x, int y, const ScreenCell &cell);
  const ScreenCell &get(int x, int y) const;

  /**
   * Writes text starting at (x, y), one glyph per cell, stopping at
   * maxWidth glyphs (or the console edge when maxWidth is negative).
   * @return number of cells written
   */
  int print(int x, int y, std::string_view text, uint8_t fg = 7, uint8_t bg = 0,
            uint16_t mods = Mods::NONE, int maxWidth = -1);

  void fill(const UIRect &rect, const ScreenCell &cell);
  // Single-line box around the edge of rect, with an optional title on the top edge
  void drawBox(const UIRect &rect, uint8_t fg = 7, std::string_view title = {});
  void clear();

  // The row as a string, used by tests and the debug dump
  std::string rowText(int y) const;

  const std::vector<ScreenCell> &cells() const { return m_cells; }

  // Splits UTF-8 text into one string per code point
  static std::vector<std::string> splitGlyphs(std::string_view text);
  // Number of code points in UTF-8 text
  static size_t glyphCount(std::string_view text);

private:
  int m_width{0};
  int m_height{0};
  std::vector<ScreenCell> m_cells;
};

} // namespace Spacegame

#endif // CONSOLE_HPP
