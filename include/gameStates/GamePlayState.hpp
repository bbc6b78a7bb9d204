/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_PLAY_STATE_HPP
#define GAME_PLAY_STATE_HPP

#include "gameStates/GameState.hpp"
#include <string>

class GameSession;

/**
 * Active game: forwards keys to the session, ticks the world and draws
 * the HUD. Falls back to the main menu if the session returns to standby.
 */
class GamePlayState : public GameState {
public:
  explicit GamePlayState(GameSession& session) : m_session(session) {}

  bool enter() override;
  void update(float deltaTime) override;
  void render(Spacegame::Console& console) override;
  void handleInput() override;
  bool exit() override;
  void pause() override;
  void resume() override;
  std::string getName() const override;

private:
  GameSession& m_session;
  bool m_announcedEnd{false};
};

#endif // GAME_PLAY_STATE_HPP
