/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ui/UIGrid.hpp"

#include <algorithm>

namespace Spacegame {

void UIGrid::calcLayout(const UIRect &area) {
  // The sidebar gives way first so the left column keeps its minimum
  const int sidebar = std::clamp(area.width - MIN_LEFT_WIDTH, 0, SIDEBAR_WIDTH);
  const int leftWidth = area.width - sidebar;
  planqSidebar = {area.x + leftWidth, area.y, sidebar, area.height};

  // Likewise the log shrinks before the camera drops under its minimum
  const int logHeight = std::clamp(area.height - MIN_CAMERA_HEIGHT, 0, LOG_HEIGHT);
  camera = {area.x, area.y, leftWidth, area.height - logHeight};
  messageLog = {area.x, area.y + camera.height, leftWidth, logHeight};
}

void UIGrid::calcPlanqLayout(size_t statusBars, bool showCli) {
  const UIRect &side = planqSidebar;
  const int wanted = static_cast<int>(statusBars) + 2;
  const int statusHeight = std::clamp(side.height - MIN_PLANQ_SCREEN, 0, wanted);
  planqStatus = {side.x, side.y, side.width, statusHeight};
  planqScreen = {side.x, side.y + statusHeight, side.width, side.height - statusHeight};

  const int stdinHeight = (showCli && planqScreen.height > 1) ? 1 : 0;
  planqStdout = {planqScreen.x, planqScreen.y, planqScreen.width, planqScreen.height - stdinHeight};
  planqStdin = {planqScreen.x, planqStdout.y + planqStdout.height, planqScreen.width, stdinHeight};
}

} // namespace Spacegame
