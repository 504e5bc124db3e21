/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <chrono>
#include <cstdint>

namespace PopEngine {

/**
 * TimestepManager paces the host loop.
 *
 * Measured frame time feeds an accumulator that is drained in fixed steps,
 * so the simulation sees the same dt every tick. The accumulator is capped
 * to avoid a spiral of catch-up ticks after a stall.
 */
class TimestepManager {
public:
    /**
     * @param targetFPS frames per second the software limiter aims for
     * @param fixedTimestep seconds per simulation tick
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f / 60.0f);

    // Call at the start of each frame
    void startFrame();

    /**
     * Returns true while a fixed step is owed; may be true more than once per frame.
     */
    bool shouldUpdate();

    float getUpdateDeltaTime() const { return m_fixedTimestep; }

    // Call at the end of each frame; sleeps when software limiting is on
    void endFrame() const;

    float getCurrentFPS() const { return m_currentFPS; }
    uint32_t getFrameTimeMs() const { return m_lastFrameTimeMs; }

    void setSoftwareFrameLimiting(bool enabled) { m_softwareLimiting = enabled; }
    bool isUsingSoftwareFrameLimiting() const { return m_softwareLimiting; }

    // Forget accumulated time, e.g. after a pause
    void reset();

private:
    using Clock = std::chrono::steady_clock;

    static constexpr double MAX_ACCUMULATOR = 0.25;
    static constexpr float FPS_SMOOTHING = 0.03f;

    void updateFPS(double deltaSeconds);

    float m_targetFPS;
    float m_fixedTimestep;
    Clock::time_point m_frameStart;
    Clock::time_point m_lastFrameTime;
    double m_accumulator{0.0};
    uint32_t m_lastFrameTimeMs{0};
    float m_currentFPS{0.0f};
    bool m_firstFrame{true};
    bool m_softwareLimiting{true};
};

} // namespace PopEngine

#endif // TIMESTEP_MANAGER_HPP
