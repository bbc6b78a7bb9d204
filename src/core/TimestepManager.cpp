/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <SDL3/SDL_timer.h>
#include <algorithm>

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep)
    : m_targetFPS(std::max(1.0f, targetFPS))
    , m_fixedTimestep(std::max(0.001f, fixedTimestep))
    , m_targetFrameTime(1.0f / m_targetFPS)
{
    const auto now = Clock::now();
    m_frameStart = now;
    m_lastFrameTime = now;
}

void TimestepManager::startFrame() {
    const auto now = Clock::now();

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = now;
        m_frameStart = now;
        // The first frame always gets one update
        m_accumulator = m_fixedTimestep;
        return;
    }

    const double deltaTime = std::chrono::duration<double>(now - m_lastFrameTime).count();
    m_lastFrameTime = now;
    m_frameStart = now;
    m_lastFrameTimeMs = static_cast<uint32_t>(deltaTime * 1000.0);

    m_accumulator += std::min(deltaTime, MAX_ACCUMULATOR);

    if (deltaTime > 0.0) {
        const float instantFPS = static_cast<float>(1.0 / deltaTime);
        m_currentFPS = m_currentFPS == 0.0f
            ? instantFPS
            : m_currentFPS + m_smoothingAlpha * (instantFPS - m_currentFPS);
    }
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

void TimestepManager::endFrame() {
    const double elapsed = std::chrono::duration<double>(Clock::now() - m_frameStart).count();
    const double remaining = static_cast<double>(m_targetFrameTime) - elapsed;
    if (remaining > 0.0) {
        SDL_DelayPrecise(static_cast<Uint64>(remaining * 1e9));
    }
}

void TimestepManager::setTargetFPS(float fps) {
    if (fps > 0.0f) {
        m_targetFPS = fps;
        m_targetFrameTime = 1.0f / fps;
    }
}

void TimestepManager::setFixedTimestep(float timestep) {
    if (timestep > 0.0f) {
        m_fixedTimestep = timestep;
    }
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_lastFrameTimeMs = 0;
    m_currentFPS = 0.0f;
    m_firstFrame = true;
    const auto now = Clock::now();
    m_frameStart = now;
    m_lastFrameTime = now;
}
