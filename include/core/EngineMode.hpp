/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENGINE_MODE_HPP
#define ENGINE_MODE_HPP

#include <cstdint>
#include <ostream>

namespace Spacegame {

// Top-level state of a game session
enum class EngineMode : uint8_t {
  Offline = 0, // Shutting down, the main loop should exit
  Standby,     // No game loaded, main menu showing
  Startup,     // World built, waiting for the first tick
  Running,
  Paused,
  GoodEnd,
  BadEnd
};

inline const char *engineModeName(EngineMode mode) {
  switch (mode) {
  case EngineMode::Offline:
    return "Offline";
  case EngineMode::Standby:
    return "Standby";
  case EngineMode::Startup:
    return "Startup";
  case EngineMode::Running:
    return "Running";
  case EngineMode::Paused:
    return "Paused";
  case EngineMode::GoodEnd:
    return "GoodEnd";
  case EngineMode::BadEnd:
    return "BadEnd";
  }
  return "Unknown";
}

inline std::ostream &operator<<(std::ostream &os, EngineMode mode) {
  return os << engineModeName(mode);
}

} // namespace Spacegame

#endif // ENGINE_MODE_HPP
