/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MENU_HPP
#define MENU_HPP

/**
 * @file Menu.hpp
 * @brief Keyboard-driven drop-down menus
 *
 * A MenuState<T> owns a tree of MenuItem<T>. Leaves carry a T payload;
 * groups carry children. The highlight is a chain of flags from the root
 * down to the deepest highlighted item, and navigation walks that chain.
 * Selecting a leaf queues a MenuEvent<T> that the owner drains once per
 * frame.
 */

#include "ui/Console.hpp"
#include "utils/Position.hpp"

#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace Spacegame {

// Which menu is currently on screen
enum class MenuType { None, Main, Context };

template <typename T> struct MenuEvent {
  T selected;
};

template <typename T> class MenuState;

template <typename T> class MenuItem {
public:
  static MenuItem item(std::string name, T data,
                       std::optional<Position> target = std::nullopt) {
    MenuItem entry(std::move(name));
    entry.m_data = std::move(data);
    entry.m_target = target;
    return entry;
  }

  static MenuItem group(std::string name, std::vector<MenuItem> children) {
    MenuItem entry(std::move(name));
    entry.m_children = std::move(children);
    return entry;
  }

  const std::string &name() const { return m_name; }
  const std::optional<T> &data() const { return m_data; }
  const std::optional<Position> &target() const { return m_target; }
  size_t width() const { return m_width; }
  const std::vector<MenuItem> &children() const { return m_children; }
  bool isGroup() const { return !m_children.empty(); }
  bool isHighlighted() const { return m_highlighted; }

  bool operator<(const MenuItem &rhs) const { return m_name < rhs.m_name; }

private:
  friend class MenuState<T>;

  explicit MenuItem(std::string name)
      : m_name(std::move(name)), m_width(Console::glyphCount(m_name)) {}

  std::optional<size_t> highlightedIndex() const {
    for (size_t i = 0; i < m_children.size(); ++i) {
      if (m_children[i].m_highlighted)
        return i;
    }
    return std::nullopt;
  }

  MenuItem *highlightedChild() {
    auto index = highlightedIndex();
    return index ? &m_children[*index] : nullptr;
  }
  const MenuItem *highlightedChild() const {
    auto index = highlightedIndex();
    return index ? &m_children[*index] : nullptr;
  }

  std::optional<Position> setHighlight() {
    m_highlighted = true;
    return m_target;
  }

  void clearHighlight() {
    m_highlighted = false;
    for (auto &child : m_children)
      child.clearHighlight();
  }

  // Returns true if there was a child to highlight
  bool highlightFirstChild(std::optional<Position> &target) {
    if (m_children.empty())
      return false;
    target = m_children.front().setHighlight();
    return true;
  }

  std::optional<Position> highlightPrev() {
    auto index = highlightedIndex();
    std::optional<Position> target;
    if (!index) {
      highlightFirstChild(target);
      return target;
    }
    const size_t next = *index > 0 ? *index - 1 : 0;
    m_children[*index].clearHighlight();
    return m_children[next].setHighlight();
  }

  std::optional<Position> highlightNext() {
    auto index = highlightedIndex();
    std::optional<Position> target;
    if (!index) {
      highlightFirstChild(target);
      return target;
    }
    const size_t next = std::min(*index + 1, m_children.size() - 1);
    m_children[*index].clearHighlight();
    return m_children[next].setHighlight();
  }

  // Deepest highlighted item, or nullptr when this item is not highlighted
  MenuItem *deepestHighlighted() {
    if (!m_highlighted)
      return nullptr;
    MenuItem *current = this;
    while (MenuItem *child = current->highlightedChild())
      current = child;
    return current;
  }
  const MenuItem *deepestHighlighted() const {
    if (!m_highlighted)
      return nullptr;
    const MenuItem *current = this;
    while (const MenuItem *child = current->highlightedChild())
      current = child;
    return current;
  }

  // Parent of the deepest highlighted item, if the chain has two links
  MenuItem *lastButOne() {
    if (!m_highlighted || !highlightedChild())
      return nullptr;
    MenuItem *current = this;
    while (current->highlightedChild() && current->highlightedChild()->highlightedChild())
      current = current->highlightedChild();
    return current;
  }

  std::string m_name;
  std::optional<T> m_data;
  std::optional<Position> m_target;
  size_t m_width{0};
  std::vector<MenuItem> m_children;
  bool m_highlighted{false};
};

template <typename T> class MenuState {
public:
  MenuState() : MenuState(std::vector<MenuItem<T>>{}) {}

  explicit MenuState(std::vector<MenuItem<T>> items)
      : m_root(MenuItem<T>::group("root", std::move(items))) {
    // The root stays highlighted so the chain always has a head
    m_root.m_highlighted = true;
    for (const auto &entry : m_root.m_children)
      width = std::max(width, entry.width());
  }

  // Highlights the first entry if nothing is highlighted yet
  void activate() { m_target = m_root.highlightNext(); }

  void up() { prev(); }
  void down() { next(); }

  void left() {
    const size_t depth = activeDepth();
    if (depth == 1) {
      prev();
    } else if (depth == 2) {
      pop();
      prev();
    } else {
      pop();
    }
  }

  void right() {
    if (activeDepth() == 2) {
      if (!push()) {
        pop();
        next();
      }
    } else {
      push();
    }
  }

  // Enters a group, or queues the highlighted leaf's payload
  void select() {
    // Inactive menus ignore selection
    if (!m_root.highlightedChild())
      return;
    MenuItem<T> *item = m_root.deepestHighlighted();
    if (!item)
      return;
    if (item->isGroup()) {
      push();
    } else if (item->m_data) {
      m_events.push_back(MenuEvent<T>{*item->m_data});
    }
  }

  // Returns true if a submenu was entered
  bool push() {
    m_target.reset();
    MenuItem<T> *item = m_root.deepestHighlighted();
    return item && item->highlightFirstChild(m_target);
  }

  void pop() {
    MenuItem<T> *item = m_root.deepestHighlighted();
    if (item && item != &m_root)
      item->clearHighlight();
  }

  void reset() {
    for (auto &child : m_root.m_children)
      child.clearHighlight();
    m_target.reset();
  }

  std::vector<MenuEvent<T>> drainEvents() { return std::exchange(m_events, {}); }
  bool hasEvents() const { return !m_events.empty(); }

  // Deepest highlighted entry; nullptr before activate()
  const MenuItem<T> *highlight() const {
    const MenuItem<T> *item = m_root.deepestHighlighted();
    return item == &m_root ? nullptr : item;
  }

  const std::optional<Position> &target() const { return m_target; }
  const std::vector<MenuItem<T>> &items() const { return m_root.m_children; }
  bool empty() const { return m_root.m_children.empty(); }

  // Number of highlighted levels below the root
  size_t activeDepth() const {
    size_t depth = 0;
    const MenuItem<T> *item = m_root.highlightedChild();
    while (item) {
      ++depth;
      item = item->highlightedChild();
    }
    return depth;
  }

  // Widest top-level name
  size_t width{0};

private:
  void prev() {
    if (MenuItem<T> *item = m_root.lastButOne())
      m_target = item->highlightPrev();
    else
      m_target = m_root.highlightPrev();
  }

  void next() {
    if (MenuItem<T> *item = m_root.lastButOne())
      m_target = item->highlightNext();
    else
      m_target = m_root.highlightNext();
  }

  MenuItem<T> m_root;
  std::vector<MenuEvent<T>> m_events;
  std::optional<Position> m_target;
};

/**
 * Builds one leaf per entry, labelled by the given function, sorted by
 * label. Used for per-item action lists in the inventory.
 */
template <typename T>
std::vector<MenuItem<T>> makeNewSubmenu(std::vector<T> entries,
                                        const std::type_identity_t<std::function<std::string(const T &)>> &label) {
  std::vector<MenuItem<T>> submenu;
  submenu.reserve(entries.size());
  for (auto &entry : entries) {
    std::string name = label(entry);
    submenu.push_back(MenuItem<T>::item(std::move(name), std::move(entry)));
  }
  std::stable_sort(submenu.begin(), submenu.end());
  return submenu;
}

template <typename T> std::vector<MenuItem<T>> makeNewSubmenu(std::vector<T> entries) {
  return makeNewSubmenu<T>(std::move(entries), [](const T &entry) { return entry.toString(); });
}

// Menu colours: plain entries, the highlighted entry, and the drop shadow
struct MenuStyle {
  ScreenCell normal{" ", static_cast<uint8_t>(Color::Black), static_cast<uint8_t>(Color::Gray)};
  ScreenCell highlight{" ", static_cast<uint8_t>(Color::Black), static_cast<uint8_t>(Color::White)};
  ScreenCell shadow{" ", static_cast<uint8_t>(Color::Red), static_cast<uint8_t>(Color::DarkGray)};
  int minDropWidth{12};
};

namespace detail {
template <typename T>
void renderDropDown(Console &console, int x, int y, const std::vector<MenuItem<T>> &group,
                    const MenuStyle &style) {
  size_t widest = 0;
  for (const auto &item : group)
    widest = std::max(widest, item.width());
  const int dropWidth = std::max(style.minDropWidth, static_cast<int>(widest) + 2);
  const UIRect area{x, y, dropWidth, static_cast<int>(group.size())};

  console.fill({area.x + 1, area.y + 1, area.width, area.height}, style.shadow);
  console.fill(area, style.normal);
  for (size_t i = 0; i < group.size(); ++i) {
    const auto &item = group[i];
    const ScreenCell &cell = item.isHighlighted() ? style.highlight : style.normal;
    const int rowY = y + static_cast<int>(i);
    console.fill({x, rowY, dropWidth, 1}, cell);
    console.print(x + 1, rowY, item.name(), cell.fg, cell.bg, Mods::NONE, dropWidth - 1);
  }
  // Open submenus draw after the parent so they sit on top
  for (size_t i = 0; i < group.size(); ++i) {
    const auto &item = group[i];
    if (item.isHighlighted() && item.isGroup())
      renderDropDown(console, x + dropWidth, y + static_cast<int>(i), item.children(), style);
  }
}
} // namespace detail

template <typename T>
void renderMenu(Console &console, const MenuState<T> &state, int x, int y,
                const MenuStyle &style = {}) {
  if (state.empty())
    return;
  detail::renderDropDown(console, x, y, state.items(), style);
}

} // namespace Spacegame

#endif // MENU_HPP
