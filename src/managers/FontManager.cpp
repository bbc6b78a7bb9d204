/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/FontManager.hpp"
#include "core/Logger.hpp"
#include "ui/Console.hpp"
#include <algorithm>
#include <array>
#include <filesystem>
#include <format>

namespace {
  // Font size bounds for edge case protection
  constexpr int MIN_FONT_SIZE = 8;
  constexpr int MAX_FONT_SIZE = 100;

  // xterm default palette, indices match Spacegame::Color
  constexpr std::array<SDL_Color, 16> PALETTE{{
      {0, 0, 0, 255},       {205, 0, 0, 255},     {0, 205, 0, 255},     {205, 205, 0, 255},
      {0, 0, 238, 255},     {205, 0, 205, 255},   {0, 205, 205, 255},   {229, 229, 229, 255},
      {127, 127, 127, 255}, {255, 0, 0, 255},     {0, 255, 0, 255},     {255, 255, 0, 255},
      {92, 92, 255, 255},   {255, 0, 255, 255},   {0, 255, 255, 255},   {255, 255, 255, 255},
  }};

  uint32_t packColor(SDL_Color color) {
    return (static_cast<uint32_t>(color.r) << 24) | (static_cast<uint32_t>(color.g) << 16) |
           (static_cast<uint32_t>(color.b) << 8) | color.a;
  }
}

bool FontManager::init() {
  if (!TTF_Init()) {
    FONT_CRITICAL("Font system initialization failed: " + std::string(SDL_GetError()));
      return false;
  } else {
    // Reset shutdown flag when reinitializing
    m_isShutdown = false;
    FONT_INFO("Font system initialized");
      return true;
  }
}

bool FontManager::loadFont(const std::string& fontFile, const std::string& fontID, int fontSize) {
    if (!std::filesystem::exists(fontFile)) {
        FONT_ERROR("Font file not found: " + fontFile);
        return false;
    }

    const int size = std::clamp(fontSize, MIN_FONT_SIZE, MAX_FONT_SIZE);
    auto font = std::shared_ptr<TTF_Font>(TTF_OpenFont(fontFile.c_str(), static_cast<float>(size)), TTF_CloseFont);

    if (!font) {
        FONT_ERROR("Failed to load font '" + fontFile + "' with size " + std::to_string(size) + ": " + std::string(SDL_GetError()));
        return false;
    }

    TTF_SetFontHinting(font.get(), TTF_HINTING_MONO);
    // Cells are laid out on a fixed grid, so kerning would only shift glyphs inside their cell
    TTF_SetFontKerning(font.get(), false);
    TTF_SetFontStyle(font.get(), TTF_STYLE_NORMAL);

    if (!TTF_FontIsFixedWidth(font.get())) {
        FONT_WARN("Font '" + fontFile + "' is not monospaced; glyphs may not line up");
    }

    clearFont(fontID);
    m_fontMap[fontID] = std::move(font);
    FONT_INFO(std::format("Loaded font '{}' from '{}' at {}pt", fontID, fontFile, size));
    return true;
}

bool FontManager::getCellSize(const std::string& fontID, int* width, int* height) {
  if (m_isShutdown || !width || !height) {
    return false;
  }

  auto fontIt = m_fontMap.find(fontID);
  if (fontIt == m_fontMap.end()) {
    FONT_ERROR("Font '" + fontID + "' not found for measurement");
    return false;
  }

  TTF_Font* font = fontIt->second.get();
  int advance = 0;
  if (!TTF_GetGlyphMetrics(font, 'M', nullptr, nullptr, nullptr, nullptr, &advance)) {
    FONT_ERROR("Failed to measure font '" + fontID + "': " + std::string(SDL_GetError()));
    return false;
  }
  *width = advance;
  *height = TTF_GetFontHeight(font);
  return *width > 0 && *height > 0;
}

std::shared_ptr<SDL_Texture> FontManager::renderGlyph(const std::string& glyph, const std::string& fontID,
                                                      SDL_Color color, TTF_FontStyleFlags style,
                                                      SDL_Renderer* renderer) {
  // Skip if we're shutting down
  if (m_isShutdown) {
    FONT_WARN("Attempted to use FontManager after shutdown");
    return nullptr;
  }
  if (glyph.empty() || glyph == " ") {
    return nullptr;
  }

  // Check cache first
  GlyphCacheKey key{glyph, fontID, packColor(color), style};
  auto cacheIt = m_glyphCache.find(key);
  if (cacheIt != m_glyphCache.end()) {
    return cacheIt->second;
  }

  auto fontIt = m_fontMap.find(fontID);
  if (fontIt == m_fontMap.end()) {
    FONT_ERROR("Font '" + fontID + "' not found");
    return nullptr;
  }

  TTF_Font* font = fontIt->second.get();
  TTF_SetFontStyle(font, style);
  auto surface = std::unique_ptr<SDL_Surface, decltype(&SDL_DestroySurface)>(
      TTF_RenderText_Blended(font, glyph.c_str(), glyph.size(), color), SDL_DestroySurface);
  TTF_SetFontStyle(font, TTF_STYLE_NORMAL);
  if (!surface) {
    FONT_ERROR("Failed to render glyph '" + glyph + "': " + std::string(SDL_GetError()));
    return nullptr;
  }

  auto texture = std::shared_ptr<SDL_Texture>(
      SDL_CreateTextureFromSurface(renderer, surface.get()), SDL_DestroyTexture);
  if (!texture) {
    FONT_ERROR("Failed to create texture from rendered glyph: " + std::string(SDL_GetError()));
    return nullptr;
  }

  // NEAREST keeps glyph edges crisp when the window scales the grid
  SDL_SetTextureScaleMode(texture.get(), SDL_SCALEMODE_NEAREST);

  m_glyphCache.emplace(std::move(key), texture);
  return texture;
}

bool FontManager::drawConsole(const Spacegame::Console& console, const std::string& fontID,
                              SDL_Renderer* renderer, float originX, float originY) {
  int cellW = 0;
  int cellH = 0;
  if (!renderer || !getCellSize(fontID, &cellW, &cellH)) {
    return false;
  }

  for (int y = 0; y < console.getHeight(); ++y) {
    for (int x = 0; x < console.getWidth(); ++x) {
      const Spacegame::ScreenCell& cell = console.get(x, y);
      uint8_t fg = cell.fg;
      uint8_t bg = cell.bg;
      if (cell.mods & Spacegame::Mods::REVERSED) {
        std::swap(fg, bg);
      }

      const SDL_FRect rect{originX + static_cast<float>(x * cellW), originY + static_cast<float>(y * cellH),
                           static_cast<float>(cellW), static_cast<float>(cellH)};
      if (bg != 0) {
        const SDL_Color back = paletteColor(bg);
        SDL_SetRenderDrawColor(renderer, back.r, back.g, back.b, back.a);
        SDL_RenderFillRect(renderer, &rect);
      }

      if (cell.isBlank() || (cell.mods & Spacegame::Mods::HIDDEN)) {
        continue;
      }

      SDL_Color front = paletteColor(fg);
      if (cell.mods & Spacegame::Mods::DIM) {
        front.a = 160;
      }
      TTF_FontStyleFlags style = TTF_STYLE_NORMAL;
      if (cell.mods & Spacegame::Mods::BOLD) style |= TTF_STYLE_BOLD;
      if (cell.mods & Spacegame::Mods::ITALIC) style |= TTF_STYLE_ITALIC;
      if (cell.mods & Spacegame::Mods::UNDERLINED) style |= TTF_STYLE_UNDERLINE;
      if (cell.mods & Spacegame::Mods::CROSSED_OUT) style |= TTF_STYLE_STRIKETHROUGH;

      auto texture = renderGlyph(cell.glyph, fontID, front, style, renderer);
      if (!texture) {
        continue;
      }
      float texW = 0.0f;
      float texH = 0.0f;
      SDL_GetTextureSize(texture.get(), &texW, &texH);
      // Wide glyphs are squeezed into their cell
      const SDL_FRect dest{rect.x, rect.y, std::min(texW, rect.w), std::min(texH, rect.h)};
      SDL_RenderTexture(renderer, texture.get(), nullptr, &dest);
    }
  }
  return true;
}

SDL_Color FontManager::paletteColor(uint8_t index) {
  return PALETTE[index & 0x0F];
}

bool FontManager::isFontLoaded(const std::string& fontID) const {
  return m_fontMap.find(fontID) != m_fontMap.end();
}

void FontManager::clearFont(const std::string& fontID) {
  // The shared_ptr deleter closes the font
  if (m_fontMap.erase(fontID) > 0) {
    std::erase_if(m_glyphCache, [&](const auto& entry) { return entry.first.fontID == fontID; });
    FONT_INFO("Cleared font: " + fontID);
  }
}

void FontManager::clean() {
  if (m_isShutdown) {
    return;
  }

  [[maybe_unused]] size_t fontsFreed = m_fontMap.size();
  // Mark the manager as shutting down before freeing resources
  m_isShutdown = true;

  // Textures go before the fonts and the renderer they came from
  m_glyphCache.clear();
  m_fontMap.clear();

  FONT_INFO(std::to_string(fontsFreed) + " fonts freed");
  TTF_Quit();
}
