/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameEngine.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "gameStates/GamePlayState.hpp"
#include "gameStates/MainMenuState.hpp"
#include "managers/FontManager.hpp"
#include "managers/InputManager.hpp"
#include "managers/SaveGameManager.hpp"
#include <algorithm>
#include <format>
#include <string>

#define SPACE_BLACK 0, 0, 0, 255

using Spacegame::KeyEvent;

namespace {

// Decodes one UTF-8 sequence starting at text[i]; advances i past it
char32_t nextCodepoint(std::string_view text, size_t &i) {
  const auto lead = static_cast<unsigned char>(text[i++]);
  int extra = 0;
  char32_t cp = 0;
  if (lead < 0x80) {
    return lead;
  } else if ((lead & 0xE0) == 0xC0) {
    cp = lead & 0x1F;
    extra = 1;
  } else if ((lead & 0xF0) == 0xE0) {
    cp = lead & 0x0F;
    extra = 2;
  } else if ((lead & 0xF8) == 0xF0) {
    cp = lead & 0x07;
    extra = 3;
  } else {
    return U'�';
  }
  for (int n = 0; n < extra; ++n) {
    if (i >= text.size() || (static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) {
      return U'�';
    }
    cp = (cp << 6) | (static_cast<unsigned char>(text[i++]) & 0x3F);
  }
  return cp;
}

} // namespace

GameEngine::GameEngine() = default;

GameEngine::~GameEngine() = default;

bool GameEngine::init(const std::string_view title, const int columns,
                      const int rows, const std::string &fontPath,
                      const int fontSize) {
  if (columns < MIN_COLUMNS || rows < MIN_ROWS) {
    GAMEENGINE_CRITICAL(std::format("Console of {}x{} cells is too small, need at least {}x{}",
                                    columns, rows, MIN_COLUMNS, MIN_ROWS));
    return false;
  }

  GAMEENGINE_INFO("Initializing SDL Video");
  if (!SDL_Init(SDL_INIT_VIDEO)) {
    GAMEENGINE_CRITICAL(std::format("SDL initialization failed: {}", SDL_GetError()));
    return false;
  }
  GAMEENGINE_INFO("SDL Video online");

  FontManager &fontMgr = FontManager::Instance();
  if (!fontMgr.init()) {
    return false;
  }
  if (!fontMgr.loadFont(fontPath, m_fontID, fontSize)) {
    GAMEENGINE_CRITICAL("Console font failed to load: " + fontPath);
    return false;
  }
  if (!fontMgr.getCellSize(m_fontID, &m_cellWidth, &m_cellHeight)) {
    GAMEENGINE_CRITICAL("Could not measure the console font");
    return false;
  }

  // The window is exactly the console grid
  m_windowWidth = columns * m_cellWidth;
  m_windowHeight = rows * m_cellHeight;
  GAMEENGINE_INFO(std::format("Console {}x{} cells of {}x{} px, window {}x{}", columns, rows,
                              m_cellWidth, m_cellHeight, m_windowWidth, m_windowHeight));

  mp_window.reset(SDL_CreateWindow(std::string(title).c_str(), m_windowWidth, m_windowHeight,
                                   SDL_WINDOW_RESIZABLE));
  if (!mp_window) {
    GAMEENGINE_ERROR(std::format("Failed to create window: {}", SDL_GetError()));
    return false;
  }
  SDL_SetWindowMinimumSize(mp_window.get(), MIN_COLUMNS * m_cellWidth, MIN_ROWS * m_cellHeight);
  GAMEENGINE_DEBUG("Window creation system online");

  mp_renderer.reset(SDL_CreateRenderer(mp_window.get(), nullptr));
  if (!mp_renderer) {
    GAMEENGINE_ERROR(std::format("Failed to create renderer: {}", SDL_GetError()));
    return false;
  }
  if (!SDL_SetRenderVSync(mp_renderer.get(), 1)) {
    GAMEENGINE_WARN(std::format("VSync unavailable, using software frame limiting: {}", SDL_GetError()));
  }
  SDL_SetRenderDrawBlendMode(mp_renderer.get(), SDL_BLENDMODE_BLEND);
  GAMEENGINE_DEBUG("Rendering system online");

  if (!SDL_StartTextInput(mp_window.get())) {
    GAMEENGINE_WARN(std::format("Text input unavailable: {}", SDL_GetError()));
  }

  m_console.resize(columns, rows);

  const float tickRate = 60.0f;
  m_timestepManager = std::make_unique<TimestepManager>(tickRate, 1.0f / tickRate);

  mp_session = std::make_unique<GameSession>();
  mp_gameStateManager = std::make_unique<GameStateManager>();
  mp_gameStateManager->addState(std::make_unique<MainMenuState>(*mp_session));
  mp_gameStateManager->addState(std::make_unique<GamePlayState>(*mp_session));

  m_running = true;
  GAMEENGINE_INFO("Game engine initialized");
  return true;
}

std::optional<KeyEvent> GameEngine::translateKey(SDL_Keycode key, SDL_Keymod mods) {
  const bool ctrl = (mods & SDL_KMOD_CTRL) != 0;
  switch (key) {
    case SDLK_RETURN:
    case SDLK_KP_ENTER:
      return KeyEvent::key(KeyEvent::Code::Enter);
    case SDLK_ESCAPE:
      return KeyEvent::key(KeyEvent::Code::Escape);
    case SDLK_BACKSPACE:
      return KeyEvent::key(KeyEvent::Code::Backspace);
    case SDLK_TAB:
      return KeyEvent::key(KeyEvent::Code::Tab);
    case SDLK_UP:
      return KeyEvent::key(KeyEvent::Code::Up);
    case SDLK_DOWN:
      return KeyEvent::key(KeyEvent::Code::Down);
    case SDLK_LEFT:
      return KeyEvent::key(KeyEvent::Code::Left);
    case SDLK_RIGHT:
      return KeyEvent::key(KeyEvent::Code::Right);
    default:
      break;
  }
  // Text input does not fire while Ctrl is held
  if (ctrl && key >= SDLK_A && key <= SDLK_Z) {
    return KeyEvent::character(static_cast<char32_t>(key), true);
  }
  return std::nullopt;
}

std::vector<KeyEvent> GameEngine::translateText(std::string_view text) {
  std::vector<KeyEvent> keys;
  size_t i = 0;
  while (i < text.size()) {
    keys.push_back(KeyEvent::character(nextCodepoint(text, i)));
  }
  return keys;
}

void GameEngine::handleEvents() {
  InputManager &inputMgr = InputManager::Instance();
  inputMgr.clearFrameInput();

  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    switch (event.type) {
      case SDL_EVENT_QUIT:
        GAMEENGINE_INFO("Shutting down! {}===]>");
        inputMgr.requestQuit();
        break;

      case SDL_EVENT_KEY_DOWN:
        if (auto key = translateKey(event.key.key, event.key.mod)) {
          inputMgr.pushKey(*key);
        }
        break;

      case SDL_EVENT_TEXT_INPUT:
        for (const KeyEvent &key : translateText(event.text.text ? event.text.text : "")) {
          inputMgr.pushKey(key);
        }
        break;

      case SDL_EVENT_WINDOW_RESIZED:
        onWindowResize(event);
        break;

      default:
        break;
    }
  }

  mp_gameStateManager->handleInput();

  if (inputMgr.isQuitRequested()) {
    mp_session->quit();
  }
}

void GameEngine::setRunning(bool running) {
  m_running = running;
}

bool GameEngine::getRunning() const {
  return m_running;
}

float GameEngine::getCurrentFPS() const {
  if (m_timestepManager) {
    return m_timestepManager->getCurrentFPS();
  }
  return 0.0f;
}

void GameEngine::update(float deltaTime) {
  mp_gameStateManager->update(deltaTime);

  if (mp_session->isOffline()) {
    GAMEENGINE_INFO("Session is offline, leaving the main loop");
    setRunning(false);
  }
}

void GameEngine::render() {
  SDL_SetRenderDrawColor(mp_renderer.get(), SPACE_BLACK);
  SDL_RenderClear(mp_renderer.get());

  mp_gameStateManager->render(m_console);

  // Letterbox the grid inside a window that may be larger than it
  int pixelWidth = m_windowWidth;
  int pixelHeight = m_windowHeight;
  SDL_GetCurrentRenderOutputSize(mp_renderer.get(), &pixelWidth, &pixelHeight);
  const float originX = static_cast<float>(std::max(0, pixelWidth - m_console.getWidth() * m_cellWidth) / 2);
  const float originY = static_cast<float>(std::max(0, pixelHeight - m_console.getHeight() * m_cellHeight) / 2);
  if (!FontManager::Instance().drawConsole(m_console, m_fontID, mp_renderer.get(), originX, originY)) {
    GAMEENGINE_ERROR("Console draw failed");
  }

  SDL_RenderPresent(mp_renderer.get());
}

void GameEngine::onWindowResize(const SDL_Event &event) {
  const int newWidth = event.window.data1;
  const int newHeight = event.window.data2;
  if (m_cellWidth <= 0 || m_cellHeight <= 0) {
    return;
  }

  const int columns = std::max(MIN_COLUMNS, newWidth / m_cellWidth);
  const int rows = std::max(MIN_ROWS, newHeight / m_cellHeight);
  if (columns == m_console.getWidth() && rows == m_console.getHeight()) {
    return;
  }
  m_windowWidth = newWidth;
  m_windowHeight = newHeight;
  m_console.resize(columns, rows);
  GAMEENGINE_INFO(std::format("Window resized to {}x{}, console now {}x{}", newWidth, newHeight,
                              columns, rows));
}

void GameEngine::clean() {
  GAMEENGINE_INFO("Starting shutdown sequence...");

  if (mp_gameStateManager) {
    GAMEENGINE_INFO("Cleaning up GameState manager...");
    mp_gameStateManager->clearAllStates();
    mp_gameStateManager.reset();
  }
  mp_session.reset();

  GAMEENGINE_INFO("Cleaning up Font Manager...");
  FontManager::Instance().clean();

  GAMEENGINE_INFO("Cleaning up Save Game Manager...");
  SaveGameManager::Instance().clean();

  if (mp_window) {
    SDL_StopTextInput(mp_window.get());
  }
  // Renderer before the window it belongs to
  mp_renderer.reset();
  mp_window.reset();

  SDL_Quit();
  m_running = false;
  GAMEENGINE_INFO("Shutdown complete");
}
