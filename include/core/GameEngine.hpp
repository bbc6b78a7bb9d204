/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_ENGINE_HPP
#define GAME_ENGINE_HPP

#include "core/TimestepManager.hpp"
#include "managers/GameStateManager.hpp"
#include "ui/Console.hpp"
#include <SDL3/SDL.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class GameSession;

namespace Spacegame {
struct KeyEvent;
}

/**
 * @brief Owns the SDL window, the glyph console and the game states
 *
 * The engine is the only SDL-facing piece of the game. It translates
 * keyboard events into InputManager keys, lets the state stack update and
 * draw into the Console, then blits the console through FontManager.
 */
class GameEngine {
public:
  ~GameEngine();

  // The console must be at least this many cells for the HUD to fit
  static constexpr int MIN_COLUMNS = 80;
  static constexpr int MIN_ROWS = 40;

  /**
   * @brief Gets the singleton instance of GameEngine
   * @return Reference to the GameEngine singleton instance
   */
  static GameEngine &Instance() {
    static GameEngine instance;
    return instance;
  }

  /**
   * @brief Creates the window, renderer, font, console, session and states
   * @param title Window title
   * @param columns Console width in cells
   * @param rows Console height in cells
   * @param fontPath Monospace TTF file
   * @param fontSize Font size in points
   * @return false if any SDL resource fails or the console is below 80x40
   */
  bool init(std::string_view title, int columns, int rows,
            const std::string &fontPath, int fontSize);

  // Polls SDL events into InputManager, then lets the top state read them
  void handleEvents();

  void update(float deltaTime);

  void render();

  void clean();

  void setRunning(bool running);
  bool getRunning() const;

  float getCurrentFPS() const;

  GameStateManager *getGameStateManager() const { return mp_gameStateManager.get(); }
  GameSession *getSession() const { return mp_session.get(); }
  Spacegame::Console &getConsole() { return m_console; }
  TimestepManager &getTimestepManager() { return *m_timestepManager; }

  SDL_Window *getWindow() const { return mp_window.get(); }
  SDL_Renderer *getRenderer() const { return mp_renderer.get(); }

  int getCellWidth() const { return m_cellWidth; }
  int getCellHeight() const { return m_cellHeight; }

  /**
   * @brief Turns one SDL key press into a KeyEvent
   *
   * Printable keys without Ctrl arrive through text input instead, so they
   * return nothing here.
   */
  static std::optional<Spacegame::KeyEvent> translateKey(SDL_Keycode key, SDL_Keymod mods);

  // Splits SDL text input into one Char KeyEvent per code point
  static std::vector<Spacegame::KeyEvent> translateText(std::string_view text);

private:
  void onWindowResize(const SDL_Event &event);

  std::unique_ptr<SDL_Window, decltype(&SDL_DestroyWindow)> mp_window{
      nullptr, SDL_DestroyWindow};
  std::unique_ptr<SDL_Renderer, decltype(&SDL_DestroyRenderer)> mp_renderer{
      nullptr, SDL_DestroyRenderer};

  std::unique_ptr<GameSession> mp_session{nullptr};
  std::unique_ptr<GameStateManager> mp_gameStateManager{nullptr};
  std::unique_ptr<TimestepManager> m_timestepManager{nullptr};
  Spacegame::Console m_console;

  std::string m_fontID{"console"};
  int m_cellWidth{0};
  int m_cellHeight{0};
  int m_windowWidth{0};
  int m_windowHeight{0};
  bool m_running{false};

  // Delete copy constructor and assignment operator
  GameEngine(const GameEngine &) = delete;
  GameEngine &operator=(const GameEngine &) = delete;

  GameEngine();
};

#endif // GAME_ENGINE_HPP
