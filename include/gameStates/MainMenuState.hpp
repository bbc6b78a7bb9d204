/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef MAIN_MENU_STATE_HPP
#define MAIN_MENU_STATE_HPP

#include "gameStates/GameState.hpp"

class GameSession;

// Title screen: the session is in standby and only the main menu is drawn
class MainMenuState : public GameState {
 public:
  explicit MainMenuState(GameSession& session) : m_session(session) {}

  bool enter() override;
  void update(float deltaTime) override;
  void render(Spacegame::Console& console) override;
  void handleInput() override;
  bool exit() override;
  std::string getName() const override;

 private:
  GameSession& m_session;
};

#endif  // MAIN_MENU_STATE_HPP
