/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef INPUT_MANAGER_HPP
#define INPUT_MANAGER_HPP

#include <boost/container/small_vector.hpp>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace Spacegame {

/**
 * @brief One keystroke, already translated from the platform event
 *
 * Printable input arrives as Char with the UTF-32 code point in ch.
 */
struct KeyEvent {
    enum class Code : uint8_t { Char, Enter, Escape, Backspace, Up, Down, Left, Right, Tab, Unknown };

    Code code{Code::Unknown};
    char32_t ch{0};
    bool ctrl{false};
    bool shift{false};

    static KeyEvent character(char32_t c, bool ctrl = false) { return {Code::Char, c, ctrl, false}; }
    static KeyEvent key(Code c) { return {c, 0, false, false}; }

    bool isChar(char32_t c) const { return code == Code::Char && ch == c; }
    bool isCtrlC() const { return ctrl && code == Code::Char && (ch == U'c' || ch == U'C'); }

    // UTF-8 encoding of ch; empty for non-character keys
    std::string utf8() const;

    bool operator==(const KeyEvent&) const = default;
};

} // namespace Spacegame

/**
 * @brief Keyboard queue between the frontend and the game session
 *
 * The frontend pushes KeyEvents as it translates SDL events; the session
 * polls them once per frame. There is no SDL dependency here so the key
 * handling can be driven from tests.
 */
class InputManager {
 public:
    ~InputManager() = default;

    static InputManager& Instance(){
        static InputManager instance;
        return instance;
    }

    void pushKey(const Spacegame::KeyEvent& key);

    // Oldest queued key, if any
    std::optional<Spacegame::KeyEvent> pollKey();
    bool hasPendingKeys() const { return !m_queue.empty(); }

    // True once per press, until clearFrameInput()
    bool wasKeyPressed(Spacegame::KeyEvent::Code code) const;
    void clearFrameInput();  // Call once per frame to clear pressed keys

    // Set by Ctrl-C or the window closing
    void requestQuit() { m_quitRequested = true; }
    bool isQuitRequested() const { return m_quitRequested; }

    // Drops queued keys and the quit flag
    void reset();

 private:
    std::deque<Spacegame::KeyEvent> m_queue{};
    boost::container::small_vector<Spacegame::KeyEvent::Code, 16> m_pressedThisFrame{}; // Keys pressed this frame
    bool m_quitRequested{false};

    // Delete copy constructor and assignment operator
    InputManager(const InputManager&) = delete; // Prevent copying
    InputManager& operator=(const InputManager&) = delete; // Prevent assignment

    InputManager() = default;
};

#endif  // INPUT_MANAGER_HPP
