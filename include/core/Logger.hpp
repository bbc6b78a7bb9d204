/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic> // IWYU pragma: keep - Required for std::atomic<bool> benchmark mode flag
#include <cstdint> // IWYU pragma: keep - Required for uint8_t type
#include <cstdio> // IWYU pragma: keep - Required for printf() and fflush() functions
#include <mutex> // IWYU pragma: keep - Required for thread-safe logging
#include <string> // IWYU pragma: keep - Required for std::string() conversions in macros

namespace Spacegame {
enum class LogLevel : uint8_t {
  CRITICAL = 0,     // Always logs (even in release for crashes)
  ERROR_LEVEL = 1,  // Always logs, file only in release
  WARNING = 2,      // Debug only
  INFO = 3,         // Debug only
  DEBUG_LEVEL = 4   // Debug only (renamed to avoid macro conflicts)
};

#ifdef DEBUG
// Console logging in debug builds
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;
  static std::mutex s_logMutex;

public:
  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Debug builds never write log files; kept so callers need no #ifdef
  static void SetLogDirectory(const std::string &) {}

  static void Log(LogLevel level, const char *system,
                  const std::string &message) {
    Log(level, system, message.c_str());
  }

  static void Log(LogLevel level, const char *system, const char *message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
      return;
    }

    std::lock_guard<std::mutex> lock(s_logMutex);
    printf("Spacegame - [%s] %s: %s\n", system, getLevelString(level),
           message);
    fflush(stdout);
  }

private:
  static const char *getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::CRITICAL:
      return "CRITICAL";
    case LogLevel::ERROR_LEVEL:
      return "ERROR";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::DEBUG_LEVEL:
      return "DEBUG";
    default:
      return "UNKNOWN";
    }
  }
};

#define SPACE_CRITICAL(system, msg)                                            \
  Spacegame::Logger::Log(Spacegame::LogLevel::CRITICAL, system, msg)
#define SPACE_ERROR(system, msg)                                               \
  Spacegame::Logger::Log(Spacegame::LogLevel::ERROR_LEVEL, system, msg)
#define SPACE_WARN(system, msg)                                                \
  Spacegame::Logger::Log(Spacegame::LogLevel::WARNING, system, msg)
#define SPACE_INFO(system, msg)                                                \
  Spacegame::Logger::Log(Spacegame::LogLevel::INFO, system, msg)
#define SPACE_DEBUG(system, msg)                                               \
  Spacegame::Logger::Log(Spacegame::LogLevel::DEBUG_LEVEL, system, msg)

#else
// Release builds - errors go to a rotating log file, everything else is elided
class Logger {
private:
  static std::atomic<bool> s_benchmarkMode;

public:
  static std::mutex s_logMutex;

  static void SetBenchmarkMode(bool enabled) {
    s_benchmarkMode.store(enabled, std::memory_order_relaxed);
  }

  static bool IsBenchmarkMode() {
    return s_benchmarkMode.load(std::memory_order_relaxed);
  }

  // Must be called before the first CRITICAL/ERROR message to take effect
  static void SetLogDirectory(const std::string &directory);

  static void Log(const char *level, const char *system,
                  const std::string &message);
  static void Log(const char *level, const char *system, const char *message);
};

#define SPACE_CRITICAL(system, msg)                                            \
  Spacegame::Logger::Log("CRITICAL", system, msg)

#define SPACE_ERROR(system, msg) Spacegame::Logger::Log("ERROR", system, msg)

#define SPACE_WARN(system, msg) ((void)0)  // Zero overhead
#define SPACE_INFO(system, msg) ((void)0)  // Zero overhead
#define SPACE_DEBUG(system, msg) ((void)0) // Zero overhead
#endif

inline std::atomic<bool> Logger::s_benchmarkMode{false};
inline std::mutex Logger::s_logMutex{};

// Convenience macros for each subsystem

// Core Systems

#define GAMEENGINE_CRITICAL(msg) SPACE_CRITICAL("GameEngine", msg)
#define GAMEENGINE_ERROR(msg) SPACE_ERROR("GameEngine", msg)
#define GAMEENGINE_WARN(msg) SPACE_WARN("GameEngine", msg)
#define GAMEENGINE_INFO(msg) SPACE_INFO("GameEngine", msg)
#define GAMEENGINE_DEBUG(msg) SPACE_DEBUG("GameEngine", msg)

#define GAMESESSION_CRITICAL(msg) SPACE_CRITICAL("GameSession", msg)
#define GAMESESSION_ERROR(msg) SPACE_ERROR("GameSession", msg)
#define GAMESESSION_WARN(msg) SPACE_WARN("GameSession", msg)
#define GAMESESSION_INFO(msg) SPACE_INFO("GameSession", msg)
#define GAMESESSION_DEBUG(msg) SPACE_DEBUG("GameSession", msg)

// Manager Systems
#define FONT_CRITICAL(msg) SPACE_CRITICAL("FontManager", msg)
#define FONT_ERROR(msg) SPACE_ERROR("FontManager", msg)
#define FONT_WARN(msg) SPACE_WARN("FontManager", msg)
#define FONT_INFO(msg) SPACE_INFO("FontManager", msg)
#define FONT_DEBUG(msg) SPACE_DEBUG("FontManager", msg)

#define INPUT_CRITICAL(msg) SPACE_CRITICAL("InputManager", msg)
#define INPUT_ERROR(msg) SPACE_ERROR("InputManager", msg)
#define INPUT_WARN(msg) SPACE_WARN("InputManager", msg)
#define INPUT_INFO(msg) SPACE_INFO("InputManager", msg)
#define INPUT_DEBUG(msg) SPACE_DEBUG("InputManager", msg)

#define SAVEGAME_CRITICAL(msg) SPACE_CRITICAL("SaveGameManager", msg)
#define SAVEGAME_ERROR(msg) SPACE_ERROR("SaveGameManager", msg)
#define SAVEGAME_WARN(msg) SPACE_WARN("SaveGameManager", msg)
#define SAVEGAME_INFO(msg) SPACE_INFO("SaveGameManager", msg)
#define SAVEGAME_DEBUG(msg) SPACE_DEBUG("SaveGameManager", msg)

#define SETTINGS_CRITICAL(msg) SPACE_CRITICAL("SettingsManager", msg)
#define SETTINGS_ERROR(msg) SPACE_ERROR("SettingsManager", msg)
#define SETTINGS_WARNING(msg) SPACE_WARN("SettingsManager", msg)
#define SETTINGS_INFO(msg) SPACE_INFO("SettingsManager", msg)
#define SETTINGS_DEBUG(msg) SPACE_DEBUG("SettingsManager", msg)

#define GAMESTATE_CRITICAL(msg) SPACE_CRITICAL("GameStateManager", msg)
#define GAMESTATE_ERROR(msg) SPACE_ERROR("GameStateManager", msg)
#define GAMESTATE_WARN(msg) SPACE_WARN("GameStateManager", msg)
#define GAMESTATE_INFO(msg) SPACE_INFO("GameStateManager", msg)
#define GAMESTATE_DEBUG(msg) SPACE_DEBUG("GameStateManager", msg)

#define GAMEPLAY_CRITICAL(msg) SPACE_CRITICAL("GamePlayState", msg)
#define GAMEPLAY_ERROR(msg) SPACE_ERROR("GamePlayState", msg)
#define GAMEPLAY_WARN(msg) SPACE_WARN("GamePlayState", msg)
#define GAMEPLAY_INFO(msg) SPACE_INFO("GamePlayState", msg)
#define GAMEPLAY_DEBUG(msg) SPACE_DEBUG("GamePlayState", msg)

// World construction
#define MASON_CRITICAL(msg) SPACE_CRITICAL("Mason", msg)
#define MASON_ERROR(msg) SPACE_ERROR("Mason", msg)
#define MASON_WARN(msg) SPACE_WARN("Mason", msg)
#define MASON_INFO(msg) SPACE_INFO("Mason", msg)
#define MASON_DEBUG(msg) SPACE_DEBUG("Mason", msg)

#define ARTISAN_CRITICAL(msg) SPACE_CRITICAL("Artisan", msg)
#define ARTISAN_ERROR(msg) SPACE_ERROR("Artisan", msg)
#define ARTISAN_WARN(msg) SPACE_WARN("Artisan", msg)
#define ARTISAN_INFO(msg) SPACE_INFO("Artisan", msg)
#define ARTISAN_DEBUG(msg) SPACE_DEBUG("Artisan", msg)

#define WORLD_CRITICAL(msg) SPACE_CRITICAL("World", msg)
#define WORLD_ERROR(msg) SPACE_ERROR("World", msg)
#define WORLD_WARN(msg) SPACE_WARN("World", msg)
#define WORLD_INFO(msg) SPACE_INFO("World", msg)
#define WORLD_DEBUG(msg) SPACE_DEBUG("World", msg)

// Gameplay Systems
#define CONTROLLER_CRITICAL(msg) SPACE_CRITICAL("Controller", msg)
#define CONTROLLER_ERROR(msg) SPACE_ERROR("Controller", msg)
#define CONTROLLER_WARN(msg) SPACE_WARN("Controller", msg)
#define CONTROLLER_INFO(msg) SPACE_INFO("Controller", msg)
#define CONTROLLER_DEBUG(msg) SPACE_DEBUG("Controller", msg)

#define PLANQ_CRITICAL(msg) SPACE_CRITICAL("Planq", msg)
#define PLANQ_ERROR(msg) SPACE_ERROR("Planq", msg)
#define PLANQ_WARN(msg) SPACE_WARN("Planq", msg)
#define PLANQ_INFO(msg) SPACE_INFO("Planq", msg)
#define PLANQ_DEBUG(msg) SPACE_DEBUG("Planq", msg)

#define AI_CRITICAL(msg) SPACE_CRITICAL("AI", msg)
#define AI_ERROR(msg) SPACE_ERROR("AI", msg)
#define AI_WARN(msg) SPACE_WARN("AI", msg)
#define AI_INFO(msg) SPACE_INFO("AI", msg)
#define AI_DEBUG(msg) SPACE_DEBUG("AI", msg)

#define PATHFIND_CRITICAL(msg) SPACE_CRITICAL("Pathfinding", msg)
#define PATHFIND_ERROR(msg) SPACE_ERROR("Pathfinding", msg)
#define PATHFIND_WARN(msg) SPACE_WARN("Pathfinding", msg)
#define PATHFIND_INFO(msg) SPACE_INFO("Pathfinding", msg)
#define PATHFIND_DEBUG(msg) SPACE_DEBUG("Pathfinding", msg)

// UI Systems
#define MENU_CRITICAL(msg) SPACE_CRITICAL("Menu", msg)
#define MENU_ERROR(msg) SPACE_ERROR("Menu", msg)
#define MENU_WARN(msg) SPACE_WARN("Menu", msg)
#define MENU_INFO(msg) SPACE_INFO("Menu", msg)
#define MENU_DEBUG(msg) SPACE_DEBUG("Menu", msg)

#define CAMERA_CRITICAL(msg) SPACE_CRITICAL("Camera", msg)
#define CAMERA_ERROR(msg) SPACE_ERROR("Camera", msg)
#define CAMERA_WARN(msg) SPACE_WARN("Camera", msg)
#define CAMERA_INFO(msg) SPACE_INFO("Camera", msg)
#define CAMERA_DEBUG(msg) SPACE_DEBUG("Camera", msg)

// Benchmark mode convenience macros
#define SPACE_ENABLE_BENCHMARK_MODE() Spacegame::Logger::SetBenchmarkMode(true)
#define SPACE_DISABLE_BENCHMARK_MODE()                                         \
  Spacegame::Logger::SetBenchmarkMode(false)

} // namespace Spacegame

#endif // LOGGER_HPP
