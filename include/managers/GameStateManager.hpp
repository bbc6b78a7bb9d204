/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef GAME_STATE_MANAGER_HPP
#define GAME_STATE_MANAGER_HPP

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "gameStates/GameState.hpp"

class GameStateManager {

 public:
  GameStateManager();
  void addState(std::unique_ptr<GameState> state);
  void pushState(const std::string& stateName);
  void popState();
  void changeState(const std::string& stateName); // Pops the current state and pushes a new one

  // Requests made by a state during update are applied once the update pass finishes
  void requestChange(const std::string& stateName) { m_pendingChange = stateName; }

  void update(float deltaTime);
  void render(Spacegame::Console& console);
  void handleInput();

  bool hasState(const std::string& stateName) const;
  std::shared_ptr<GameState> getState(const std::string& stateName) const;
  std::string getCurrentStateName() const;
  size_t getActiveCount() const { return m_activeStates.size(); }
  void removeState(const std::string& stateName);
  void clearAllStates();

 private:
  // All registered states, available for activation
  std::unordered_map<std::string, std::shared_ptr<GameState>> m_registeredStates;
  // The stack of active states
  std::vector<std::shared_ptr<GameState>> m_activeStates;

  std::string m_pendingChange;
};

#endif  // GAME_STATE_MANAGER_HPP
