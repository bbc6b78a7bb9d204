/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/GameEngine.hpp"
#include "core/Logger.hpp"
#include "core/TimestepManager.hpp"
#include "managers/SettingsManager.hpp"
#include <format>
#include <string>

const int CONSOLE_COLUMNS{100};
const int CONSOLE_ROWS{48};
const std::string GAME_NAME{"spacegame"};

// maybe_unused is just a hint to the compiler that the variable is not used.
// with -Wall -Wextra flags
int main([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
  // Load settings from disk before GameEngine initialization
  auto& settingsManager = Spacegame::SettingsManager::Instance();
  if (!settingsManager.loadFromFile("res/settings.json")) {
    GAMEENGINE_WARN("Failed to load settings.json - using defaults");
  } else {
    GAMEENGINE_INFO("Settings loaded from res/settings.json");
  }

  Spacegame::Logger::SetLogDirectory(settingsManager.get<std::string>("log", "directory", "logs"));

  const std::string title = settingsManager.get<std::string>("display", "title", GAME_NAME);
  GAMEENGINE_INFO(std::format("Initializing {}", title));

  const int columns = settingsManager.get<int>("display", "columns", CONSOLE_COLUMNS);
  const int rows = settingsManager.get<int>("display", "rows", CONSOLE_ROWS);
  const std::string fontPath =
      settingsManager.get<std::string>("display", "font_path", "res/fonts/DejaVuSansMono.ttf");
  const int fontSize = settingsManager.get<int>("display", "font_size", 18);

  // Cache GameEngine reference
  GameEngine& gameEngine = GameEngine::Instance();

  if (!gameEngine.init(title, columns, rows, fontPath, fontSize)) {
    GAMEENGINE_CRITICAL(std::format("Init {} Failed", title));

    // Always clean up on init failure so SDL and the font system shut down
    GAMEENGINE_INFO("Cleaning up after initialization failure");
    gameEngine.clean();

    return -1;
  }

  // The session starts in standby on the title menu
  gameEngine.getGameStateManager()->pushState("MainMenuState");

  GAMEENGINE_INFO("Starting Main Loop");

  TimestepManager& ts = gameEngine.getTimestepManager();

  while (gameEngine.getRunning()) {
    ts.startFrame();

    gameEngine.handleEvents();

    while (ts.shouldUpdate() && gameEngine.getRunning()) {
      gameEngine.update(ts.getUpdateDeltaTime());
    }

    gameEngine.render();

    ts.endFrame();
  }

  GAMEENGINE_INFO(std::format("Game {} shutting down", title));

  gameEngine.clean();

  return 0;
}
