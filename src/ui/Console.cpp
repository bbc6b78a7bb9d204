/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ui/Console.hpp"

#include <algorithm>

namespace Spacegame {

namespace {
// Box drawing set: corners UL, UR, DL, DR, then horizontal and vertical
constexpr const char *BOX_UL = "┌";
constexpr const char *BOX_UR = "┐";
constexpr const char *BOX_DL = "└";
constexpr const char *BOX_DR = "┘";
constexpr const char *BOX_H = "─";
constexpr const char *BOX_V = "│";

size_t utf8SequenceLength(unsigned char lead) {
  if (lead < 0x80)
    return 1;
  if ((lead >> 5) == 0x6)
    return 2;
  if ((lead >> 4) == 0xE)
    return 3;
  if ((lead >> 3) == 0x1E)
    return 4;
  return 1; // stray continuation byte; treat as its own glyph
}
} // namespace

Console::Console(int width, int height) { resize(width, height); }

void Console::resize(int width, int height) {
  if (width < 0)
    width = 0;
  if (height < 0)
    height = 0;
  if (width == m_width && height == m_height && !m_cells.empty())
    return;
  m_width = width;
  m_height = height;
  m_cells.assign(static_cast<size_t>(m_width * m_height), ScreenCell::empty());
}

void Console::put(int x, int y, const ScreenCell &cell) {
  if (!inBounds(x, y))
    return;
  m_cells[static_cast<size_t>(y * m_width + x)] = cell;
}

const ScreenCell &Console::get(int x, int y) const {
  static const ScreenCell outside = ScreenCell::blank();
  if (!inBounds(x, y))
    return outside;
  return m_cells[static_cast<size_t>(y * m_width + x)];
}

int Console::print(int x, int y, std::string_view text, uint8_t fg, uint8_t bg,
                   uint16_t mods, int maxWidth) {
  int written = 0;
  for (const auto &glyph : splitGlyphs(text)) {
    if (maxWidth >= 0 && written >= maxWidth)
      break;
    if (x + written >= m_width)
      break;
    put(x + written, y, ScreenCell(glyph, fg, bg, mods));
    ++written;
  }
  return written;
}

void Console::fill(const UIRect &rect, const ScreenCell &cell) {
  for (int y = rect.y; y < rect.y + rect.height; ++y) {
    for (int x = rect.x; x < rect.x + rect.width; ++x)
      put(x, y, cell);
  }
}

void Console::drawBox(const UIRect &rect, uint8_t fg, std::string_view title) {
  if (rect.width < 2 || rect.height < 2)
    return;
  const int right = rect.x + rect.width - 1;
  const int bottom = rect.y + rect.height - 1;
  for (int x = rect.x + 1; x < right; ++x) {
    put(x, rect.y, ScreenCell(BOX_H, fg));
    put(x, bottom, ScreenCell(BOX_H, fg));
  }
  for (int y = rect.y + 1; y < bottom; ++y) {
    put(rect.x, y, ScreenCell(BOX_V, fg));
    put(right, y, ScreenCell(BOX_V, fg));
  }
  put(rect.x, rect.y, ScreenCell(BOX_UL, fg));
  put(right, rect.y, ScreenCell(BOX_UR, fg));
  put(rect.x, bottom, ScreenCell(BOX_DL, fg));
  put(right, bottom, ScreenCell(BOX_DR, fg));
  if (!title.empty())
    print(rect.x + 1, rect.y, title, fg, 0, Mods::NONE, rect.width - 2);
}

void Console::clear() {
  std::fill(m_cells.begin(), m_cells.end(), ScreenCell::empty());
}

std::string Console::rowText(int y) const {
  std::string row;
  if (y < 0 || y >= m_height)
    return row;
  for (int x = 0; x < m_width; ++x)
    row += get(x, y).glyph;
  return row;
}

std::vector<std::string> Console::splitGlyphs(std::string_view text) {
  std::vector<std::string> glyphs;
  size_t i = 0;
  while (i < text.size()) {
    size_t len = utf8SequenceLength(static_cast<unsigned char>(text[i]));
    if (i + len > text.size())
      len = text.size() - i;
    glyphs.emplace_back(text.substr(i, len));
    i += len;
  }
  return glyphs;
}

size_t Console::glyphCount(std::string_view text) {
  size_t count = 0;
  for (char c : text) {
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80)
      ++count;
  }
  return count;
}

} // namespace Spacegame
