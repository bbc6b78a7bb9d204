/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "planq/PlanqData.hpp"

#include <sstream>
#include <string_view>

namespace Spacegame {

namespace {

constexpr std::string_view PROMPT_MARKS[] = {">", "¶"};
constexpr std::string_view WHITESPACE = " \t\r\n";

// Strips prompt marks from both ends, then leading whitespace
std::string_view trimPrompt(std::string_view text) {
  bool changed = true;
  while (changed && !text.empty()) {
    changed = false;
    for (auto mark : PROMPT_MARKS) {
      if (text.starts_with(mark)) {
        text.remove_prefix(mark.size());
        changed = true;
      }
      if (text.ends_with(mark)) {
        text.remove_suffix(mark.size());
        changed = true;
      }
    }
  }
  const auto first = text.find_first_not_of(WHITESPACE);
  if (first == std::string_view::npos)
    return {};
  text.remove_prefix(first);
  const auto last = text.find_last_not_of(WHITESPACE);
  return text.substr(0, last + 1);
}

} // namespace

const char *PlanqCPUMode::toString() const {
  switch (kind) {
  case Kind::Idle:
    return "IDLE";
  case Kind::Error:
    return "ERROR";
  case Kind::Startup:
    return "STARTUP";
  case Kind::Shutdown:
    return "SHUTDOWN";
  case Kind::Working:
    return "WORKING";
  case Kind::Offline:
    return "OFFLINE";
  }
  return "UNKNOWN";
}

void PlanqTimer::tick(float dt) {
  justFinished = false;
  if (finished && !repeating)
    return;
  elapsed += dt;
  if (elapsed >= duration) {
    justFinished = true;
    if (repeating) {
      elapsed = duration > 0.0f ? elapsed - duration : 0.0f;
      finished = false;
    } else {
      elapsed = duration;
      finished = true;
    }
  }
}

std::string PlanqCmd::toString() const {
  switch (kind) {
  case Kind::NoOperation:
    return "(NoOperation)";
  case Kind::Error:
    return "(Error)";
  case Kind::Help:
    return "help";
  case Kind::Shutdown:
    return "shutdown";
  case Kind::Reboot:
    return "reboot";
  case Kind::Connect:
    return "connect";
  case Kind::Disconnect:
    return "disconnect";
  }
  return "(Unknown)";
}

const std::vector<PlanqCmd::Kind> &planqCommandList() {
  static const std::vector<PlanqCmd::Kind> commands{
      PlanqCmd::Kind::Help, PlanqCmd::Kind::Shutdown, PlanqCmd::Kind::Reboot,
      PlanqCmd::Kind::Connect, PlanqCmd::Kind::Disconnect};
  return commands;
}

PlanqCmd planqParser(const std::string &input) {
  const std::string_view text = trimPrompt(input);
  if (text.empty())
    return {};

  std::vector<std::string> words;
  std::istringstream stream{std::string(text)};
  std::string word;
  while (std::getline(stream, word, ' '))
    words.push_back(word);

  const std::string &command = words.front();
  if (command == "help")
    return {PlanqCmd::Kind::Help, ""};
  if (command == "shutdown")
    return {PlanqCmd::Kind::Shutdown, ""};
  if (command == "reboot")
    return {PlanqCmd::Kind::Reboot, ""};
  if (command == "connect")
    return {PlanqCmd::Kind::Connect, words.size() > 1 ? words[1] : ""};
  if (command == "disconnect")
    return {PlanqCmd::Kind::Disconnect, ""};
  return {PlanqCmd::Kind::Error, "Unknown command: " + command};
}

} // namespace Spacegame
