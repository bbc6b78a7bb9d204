/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef FONT_MANAGER_HPP
#define FONT_MANAGER_HPP

#include <SDL3/SDL.h>
#include <SDL3_ttf/SDL_ttf.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace Spacegame {
class Console;
}

/**
 * Owns the monospace fonts and turns Console cells into pixels.
 *
 * Every glyph is rendered once per (font, glyph, colour, style) and the
 * texture is kept in a cache, so a frame of the console costs one
 * background rect and one texture copy per cell.
 */
class FontManager {
 public:
  ~FontManager() {
    if (!m_isShutdown) {
      clean();
    }
  }

  static FontManager& Instance() {
    static FontManager instance;
    return instance;
  }

  /**
   * @brief Initializes the TTF font system
   * @return true if initialization successful, false otherwise
   */
  bool init();

  /**
   * @brief Loads a font with specified size
   * @param fontFile Path to a TTF/OTF file
   * @param fontID Unique identifier for the font
   * @param fontSize Size of the font in points
   * @return true if the font was loaded, false otherwise
   */
  bool loadFont(const std::string& fontFile, const std::string& fontID, int fontSize);

  /**
   * @brief Size of one console cell in pixels for a loaded font
   * @return false if the font is not loaded or cannot be measured
   */
  bool getCellSize(const std::string& fontID, int* width, int* height);

  /**
   * @brief Renders a single glyph, using the cache when possible
   * @param glyph UTF-8 text of one grapheme
   * @param fontID Font to render with
   * @param color Foreground colour
   * @param style TTF_STYLE_* flags
   * @param renderer SDL renderer for texture creation
   * @return Shared pointer to the glyph texture, or nullptr if failed
   */
  std::shared_ptr<SDL_Texture> renderGlyph(const std::string& glyph, const std::string& fontID,
                                           SDL_Color color, TTF_FontStyleFlags style,
                                           SDL_Renderer* renderer);

  /**
   * @brief Draws every cell of the console at (originX, originY)
   * @return false if the font is not loaded
   */
  bool drawConsole(const Spacegame::Console& console, const std::string& fontID,
                   SDL_Renderer* renderer, float originX = 0.0f, float originY = 0.0f);

  // The 16-colour terminal palette used for ScreenCell colours
  static SDL_Color paletteColor(uint8_t index);

  bool isFontLoaded(const std::string& fontID) const;

  void clearFont(const std::string& fontID);

  // Drops cached glyph textures; needed when the renderer is recreated
  void clearGlyphCache() { m_glyphCache.clear(); }
  size_t getGlyphCacheSize() const { return m_glyphCache.size(); }

  /**
   * @brief Cleans up all font resources
   */
  void clean();

  bool isShutdown() const { return m_isShutdown; }

 private:
  struct GlyphCacheKey {
    std::string glyph;
    std::string fontID;
    uint32_t rgba;
    TTF_FontStyleFlags style;

    bool operator==(const GlyphCacheKey&) const = default;
  };

  struct GlyphCacheKeyHash {
    size_t operator()(const GlyphCacheKey& key) const {
      size_t seed = std::hash<std::string>{}(key.glyph);
      seed ^= std::hash<std::string>{}(key.fontID) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
      seed ^= std::hash<uint32_t>{}(key.rgba) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
      seed ^= std::hash<uint32_t>{}(static_cast<uint32_t>(key.style)) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
      return seed;
    }
  };

  std::unordered_map<std::string, std::shared_ptr<TTF_Font>> m_fontMap{};
  std::unordered_map<GlyphCacheKey, std::shared_ptr<SDL_Texture>, GlyphCacheKeyHash> m_glyphCache{};
  bool m_isShutdown{false}; // Flag to indicate if FontManager has been shut down

  // Delete copy constructor and assignment operator
  FontManager(const FontManager&) = delete; // Prevent copying
  FontManager& operator=(const FontManager&) = delete; // Prevent assignment

  FontManager() = default;
};

#endif  // FONT_MANAGER_HPP
