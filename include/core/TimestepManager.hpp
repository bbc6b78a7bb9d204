/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

/**
 * @brief Fixed-timestep frame pacing for the main loop
 *
 * Usage:
 * @code
 * ts.startFrame();
 * while (ts.shouldUpdate()) {
 *     update(ts.getUpdateDeltaTime());
 * }
 * render();
 * ts.endFrame();
 * @endcode
 *
 * The session keeps its own slower world tick on top of this; the fixed
 * step only paces input, menus and drawing.
 */
class TimestepManager {
public:
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f/60.0f);

    // Marks the start of a frame and feeds the elapsed time to the accumulator
    void startFrame();

    // True while a fixed update is owed this frame; consumes one step per call
    bool shouldUpdate();

    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    // Sleeps off whatever is left of the frame budget
    void endFrame();

    float getCurrentFPS() const { return m_currentFPS; }
    float getTargetFPS() const { return m_targetFPS; }
    uint32_t getFrameTimeMs() const { return m_lastFrameTimeMs; }

    void setTargetFPS(float fps);
    void setFixedTimestep(float timestep);

    void reset();

private:
    using Clock = std::chrono::steady_clock;

    float m_targetFPS;
    float m_fixedTimestep;
    float m_targetFrameTime;

    Clock::time_point m_frameStart;
    Clock::time_point m_lastFrameTime;

    double m_accumulator{0.0};
    static constexpr double MAX_ACCUMULATOR = 0.25; // Clamp after stalls

    uint32_t m_lastFrameTimeMs{0};
    float m_currentFPS{0.0f};
    float m_smoothingAlpha{0.05f}; // EMA factor for the FPS readout
    bool m_firstFrame{true};
};

#endif // TIMESTEP_MANAGER_HPP
