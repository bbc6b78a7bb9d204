/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "gameStates/MainMenuState.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "managers/GameStateManager.hpp"
#include "managers/InputManager.hpp"

bool MainMenuState::enter() {
  GAMESTATE_INFO("Entering MAIN MENU State");
  if (!m_session.isStandby()) {
    m_session.haltGame();
  }
  m_session.setMenu(Spacegame::MenuType::Main, GameSession::MAIN_MENU_X, GameSession::MAIN_MENU_Y);
  return true;
}

void MainMenuState::update(float deltaTime) {
  m_session.update(deltaTime);

  // A new or loaded game hands over to the gameplay state
  if (!m_session.isStandby() && mp_stateManager) {
    mp_stateManager->requestChange("GamePlayState");
  }
}

void MainMenuState::render(Spacegame::Console& console) {
  m_session.render(console);
}

void MainMenuState::handleInput() {
  auto& input = InputManager::Instance();
  while (auto key = input.pollKey()) {
    m_session.handleKey(*key);
    if (key->isCtrlC()) {
      input.requestQuit();
    }
  }
}

bool MainMenuState::exit() {
  GAMESTATE_INFO("Exiting MAIN MENU State");
  return true;
}

std::string MainMenuState::getName() const {
  return "MainMenuState";
}
