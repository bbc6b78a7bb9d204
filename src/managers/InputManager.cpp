/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "managers/InputManager.hpp"
#include "core/Logger.hpp"
#include <algorithm>

namespace Spacegame {

std::string KeyEvent::utf8() const {
  std::string out;
  if (code != Code::Char) {
    return out;
  }
  const auto cp = static_cast<uint32_t>(ch);
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  return out;
}

} // namespace Spacegame

using Spacegame::KeyEvent;

void InputManager::pushKey(const KeyEvent& key) {
  if (key.isCtrlC()) {
    INPUT_INFO("Ctrl-C received, requesting quit");
    m_quitRequested = true;
  }
  m_queue.push_back(key);
  if (std::find(m_pressedThisFrame.begin(), m_pressedThisFrame.end(), key.code) == m_pressedThisFrame.end()) {
    m_pressedThisFrame.push_back(key.code);
  }
}

std::optional<KeyEvent> InputManager::pollKey() {
  if (m_queue.empty()) {
    return std::nullopt;
  }
  KeyEvent key = m_queue.front();
  m_queue.pop_front();
  return key;
}

bool InputManager::wasKeyPressed(KeyEvent::Code code) const {
  return std::find(m_pressedThisFrame.begin(), m_pressedThisFrame.end(), code) != m_pressedThisFrame.end();
}

void InputManager::clearFrameInput() {
  m_pressedThisFrame.clear();
}

void InputManager::reset() {
  m_queue.clear();
  m_pressedThisFrame.clear();
  m_quitRequested = false;
}
