/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SCREEN_CELL_HPP
#define SCREEN_CELL_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace Spacegame {

// 16-color terminal palette indices
enum class Color : uint8_t {
  Black = 0,
  Red,
  Green,
  Yellow,
  Blue,
  Magenta,
  Cyan,
  Gray,
  DarkGray,
  LightRed,
  LightGreen,
  LightYellow,
  LightBlue,
  LightMagenta,
  LightCyan,
  White
};

namespace Mods {
constexpr uint16_t NONE = 0;
constexpr uint16_t BOLD = 1 << 0;
constexpr uint16_t DIM = 1 << 1;
constexpr uint16_t ITALIC = 1 << 2;
constexpr uint16_t UNDERLINED = 1 << 3;
constexpr uint16_t SLOW_BLINK = 1 << 4;
constexpr uint16_t RAPID_BLINK = 1 << 5;
constexpr uint16_t REVERSED = 1 << 6;
constexpr uint16_t HIDDEN = 1 << 7;
constexpr uint16_t CROSSED_OUT = 1 << 8;
} // namespace Mods

// Looks up a color by dictionary name ("orange", "ltblue", ...) or palette number
std::optional<uint8_t> parseColor(std::string_view name);

// ORs together space- or '|'-separated modifier names; unknown names are ignored
uint16_t parseMods(std::string_view input);

/**
 * One display cell: a UTF-8 glyph plus palette colors and text modifiers.
 */
struct ScreenCell {
  std::string glyph;
  uint8_t fg{0};
  uint8_t bg{0};
  uint16_t mods{0};

  ScreenCell() = default;
  ScreenCell(std::string g, uint8_t f, uint8_t b = 0, uint16_t m = 0)
      : glyph(std::move(g)), fg(f), bg(b), mods(m) {}

  // Parses "G fg bg mods..."; returns nullopt when fewer than three fields
  static std::optional<ScreenCell> fromString(std::string_view input);

  static ScreenCell empty() { return {" ", 8}; }
  static ScreenCell blank() { return {}; }
  static ScreenCell outOfBounds() { return {"*", 8}; }
  static ScreenCell fogOfWar() { return {" ", 8}; }
  static ScreenCell placeholder() { return {"%", 5, 8}; }

  bool isBlank() const { return glyph.empty(); }

  bool operator==(const ScreenCell &) const = default;
};

inline std::ostream &operator<<(std::ostream &os, const ScreenCell &cell) {
  return os << "'" << cell.glyph << "' " << static_cast<int>(cell.fg) << "/"
            << static_cast<int>(cell.bg) << "/" << cell.mods;
}

} // namespace Spacegame

#endif // SCREEN_CELL_HPP
