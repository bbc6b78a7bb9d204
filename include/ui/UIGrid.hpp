/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef UI_GRID_HPP
#define UI_GRID_HPP

#include "ui/Console.hpp"

#include <cstddef>

namespace Spacegame {

/**
 * Screen regions for the in-game view.
 *
 * The left column holds the camera above the message log. The PLANQ
 * sidebar runs down the right edge: status monitor on top, terminal
 * output below it, and a one-line input at the bottom while the CLI is
 * open.
 */
struct UIGrid {
  static constexpr int MIN_COLUMNS = 80;
  static constexpr int MIN_ROWS = 40;
  static constexpr int SIDEBAR_WIDTH = 32;
  static constexpr int MIN_LEFT_WIDTH = 30;
  static constexpr int MIN_CAMERA_HEIGHT = 30;
  static constexpr int LOG_HEIGHT = 12;
  static constexpr int MIN_PLANQ_SCREEN = 4;

  UIRect camera;
  UIRect messageLog;
  UIRect planqSidebar;
  UIRect planqStatus;
  UIRect planqScreen;
  UIRect planqStdout;
  UIRect planqStdin;

  static bool fits(int columns, int rows) { return columns >= MIN_COLUMNS && rows >= MIN_ROWS; }

  // Splits the area into camera, message log and sidebar
  void calcLayout(const UIRect &area);
  // Splits the sidebar; statusBars is the number of monitor lines shown
  void calcPlanqLayout(size_t statusBars, bool showCli);
};

} // namespace Spacegame

#endif // UI_GRID_HPP
