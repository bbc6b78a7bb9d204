/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ui/ScreenCell.hpp"

#include <charconv>
#include <unordered_map>
#include <vector>

namespace Spacegame {

namespace {

const std::unordered_map<std::string_view, Color> &colorDict() {
  static const std::unordered_map<std::string_view, Color> dict = {
      {"black", Color::Black},         {"red", Color::Red},
      {"green", Color::Green},         {"orange", Color::Yellow},
      {"blue", Color::Blue},           {"purple", Color::Magenta},
      {"cyan", Color::Cyan},           {"white", Color::Gray},
      {"grey", Color::DarkGray},       {"gray", Color::DarkGray},
      {"ltblack", Color::DarkGray},    {"ltred", Color::LightRed},
      {"ltgreen", Color::LightGreen},  {"yellow", Color::LightYellow},
      {"ltblue", Color::LightBlue},    {"pink", Color::LightMagenta},
      {"ltpurple", Color::LightMagenta}, {"ltcyan", Color::LightCyan},
      {"ltwhite", Color::White}};
  return dict;
}

const std::unordered_map<std::string_view, uint16_t> &modsDict() {
  static const std::unordered_map<std::string_view, uint16_t> dict = {
      {"none", Mods::NONE},          {"bright", Mods::BOLD},
      {"bold", Mods::BOLD},          {"dark", Mods::DIM},
      {"dim", Mods::DIM},            {"reverse", Mods::REVERSED},
      {"underline", Mods::UNDERLINED}, {"italic", Mods::ITALIC},
      {"hidden", Mods::HIDDEN},      {"strikeout", Mods::CROSSED_OUT},
      {"blink", Mods::SLOW_BLINK},   {"flash", Mods::RAPID_BLINK}};
  return dict;
}

std::vector<std::string_view> splitOn(std::string_view input,
                                      std::string_view separators) {
  std::vector<std::string_view> tokens;
  size_t start = 0;
  while (start < input.size()) {
    size_t end = input.find_first_of(separators, start);
    if (end == std::string_view::npos)
      end = input.size();
    if (end > start)
      tokens.push_back(input.substr(start, end - start));
    start = end + 1;
  }
  return tokens;
}

} // namespace

std::optional<uint8_t> parseColor(std::string_view name) {
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), value);
  if (ec == std::errc() && ptr == name.data() + name.size()) {
    if (value > 255)
      return std::nullopt;
    return static_cast<uint8_t>(value);
  }
  auto it = colorDict().find(name);
  if (it == colorDict().end())
    return std::nullopt;
  return static_cast<uint8_t>(it->second);
}

uint16_t parseMods(std::string_view input) {
  uint16_t result = Mods::NONE;
  for (auto token : splitOn(input, " |")) {
    auto it = modsDict().find(token);
    if (it != modsDict().end()) {
      result |= it->second;
      continue;
    }
    uint16_t raw = 0;
    auto [ptr, ec] =
        std::from_chars(token.data(), token.data() + token.size(), raw);
    if (ec == std::errc() && ptr == token.data() + token.size())
      result |= raw;
  }
  return result;
}

std::optional<ScreenCell> ScreenCell::fromString(std::string_view input) {
  auto fields = splitOn(input, " ");
  if (fields.size() < 3)
    return std::nullopt;

  auto fg = parseColor(fields[1]);
  auto bg = parseColor(fields[2]);
  if (!fg || !bg)
    return std::nullopt;

  ScreenCell cell(std::string(fields[0]), *fg, *bg);
  if (fields.size() > 3) {
    // Everything after the background color is modifier names
    size_t modsStart = static_cast<size_t>(fields[3].data() - input.data());
    cell.mods = parseMods(input.substr(modsStart));
  }
  return cell;
}

} // namespace Spacegame
