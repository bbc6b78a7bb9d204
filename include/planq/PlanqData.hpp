/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLANQ_DATA_HPP
#define PLANQ_DATA_HPP

#include "entities/EntityID.hpp"
#include "ui/MessageLog.hpp"
#include "utils/Position.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace Spacegame {

struct PlanqEvent {
  enum class Type : uint8_t {
    NullEvent = 0,
    Startup,
    BootStage,
    Shutdown,
    Reboot,
    GoIdle,
    CliOpen,
    CliClose,
    AccessLink,
    AccessUnlink
  };

  Type type{Type::NullEvent};
  uint32_t stage{0}; // BootStage only

  static PlanqEvent bootStage(uint32_t n) { return {Type::BootStage, n}; }

  bool operator==(const PlanqEvent &) const = default;
};

struct PlanqCPUMode {
  enum class Kind : uint8_t { Idle, Error, Startup, Shutdown, Working, Offline };

  Kind kind{Kind::Offline};
  uint32_t code{0}; // Error only

  static PlanqCPUMode error(uint32_t n) { return {Kind::Error, n}; }

  bool is(Kind k) const { return kind == k; }
  // IDLE, ERROR, STARTUP, SHUTDOWN, WORKING, OFFLINE
  const char *toString() const;

  bool operator==(const PlanqCPUMode &) const = default;
};

inline std::ostream &operator<<(std::ostream &os, const PlanqCPUMode &mode) {
  return os << mode.toString();
}

enum class PlanqActionMode : uint8_t { Default, CliInput };

/**
 * Countdown in seconds. A one-shot timer stays finished until reset; a
 * repeating timer wraps and reports justFinished for the tick it wrapped.
 */
struct PlanqTimer {
  float duration{0.0f};
  float elapsed{0.0f};
  bool finished{false};
  bool justFinished{false};
  bool repeating{false};

  PlanqTimer() = default;
  PlanqTimer(float seconds, bool repeat) : duration(seconds), repeating(repeat) {}

  void tick(float dt);
  void reset() {
    elapsed = 0.0f;
    finished = false;
    justFinished = false;
  }
};

// A job running on the PLANQ; its outcome fires when the timer runs out
struct PlanqProcess {
  PlanqTimer timer;
  PlanqEvent outcome;
};

/**
 * State of the player's PLANQ: power, boot progress, CPU mode, CLI, the
 * process table and the device currently on the access jack.
 */
struct PlanqData {
  bool powerIsOn{false};
  uint32_t bootStage{0};
  bool isCarried{false};
  PlanqCPUMode cpuMode{};
  PlanqActionMode actionMode{PlanqActionMode::Default};
  bool showTerminal{false};
  bool showCliInput{false};
  Position playerLoc;
  std::vector<Message> stdoutLog; // copy of the "planq" channel
  std::vector<PlanqProcess> procTable;
  EntityID jackCnxn{INVALID_ENTITY};
  std::string cliBuffer;

  bool errorReported{false};
  float errorElapsed{0.0f};

  // Events raised by commands and key input, handled on the next update
  std::vector<PlanqEvent> pendingEvents;

  void raise(PlanqEvent event) { pendingEvents.push_back(event); }
  bool isCliOpen() const { return actionMode == PlanqActionMode::CliInput; }
};

struct PlanqCmd {
  enum class Kind : uint8_t {
    NoOperation = 0,
    Error,
    Help,
    Shutdown,
    Reboot,
    Connect,
    Disconnect
  };

  Kind kind{Kind::NoOperation};
  std::string arg; // error message, or the connect target

  // Command name as typed at the prompt
  std::string toString() const;

  bool operator==(const PlanqCmd &) const = default;
};

inline std::ostream &operator<<(std::ostream &os, const PlanqCmd &cmd) {
  return os << cmd.toString();
}

// Commands the shell knows, in the order "help" lists them
const std::vector<PlanqCmd::Kind> &planqCommandList();

PlanqCmd planqParser(const std::string &input);

} // namespace Spacegame

#endif // PLANQ_DATA_HPP
