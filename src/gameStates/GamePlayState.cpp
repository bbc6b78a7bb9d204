/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "gameStates/GamePlayState.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "managers/GameStateManager.hpp"
#include "managers/InputManager.hpp"
#include <format>

bool GamePlayState::enter() {
  if (m_session.isStandby() || !m_session.getWorld()) {
    GAMEPLAY_ERROR("No game loaded - cannot enter gameplay");
    return false;
  }
  m_announcedEnd = false;
  GAMEPLAY_INFO(std::format("Entering gameplay in mode {}",
                            Spacegame::engineModeName(m_session.getMode())));
  return true;
}

void GamePlayState::update(float deltaTime) {
  m_session.update(deltaTime);

  if (!m_session.isRunning() && !m_announcedEnd && m_session.getWorld()) {
    const auto mode = m_session.getMode();
    if (mode == Spacegame::EngineMode::GoodEnd || mode == Spacegame::EngineMode::BadEnd) {
      GAMEPLAY_INFO(std::format("Game over after {} ticks", m_session.getWorld()->tickCount));
      m_announcedEnd = true;
    }
  }

  if (m_session.isStandby() && !m_session.isOffline() && mp_stateManager) {
    mp_stateManager->requestChange("MainMenuState");
  }
}

void GamePlayState::render(Spacegame::Console& console) {
  m_session.render(console);
}

void GamePlayState::handleInput() {
  auto& input = InputManager::Instance();
  while (auto key = input.pollKey()) {
    m_session.handleKey(*key);
    if (key->isCtrlC()) {
      input.requestQuit();
    }
  }
}

bool GamePlayState::exit() {
  GAMEPLAY_INFO("Exiting gameplay");
  return true;
}

void GamePlayState::pause() {
  m_session.pauseGame();
}

void GamePlayState::resume() {
  m_session.unpauseGame();
}

std::string GamePlayState::getName() const {
  return "GamePlayState";
}
