/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"

#include <SDL3/SDL.h>

#include <algorithm>

namespace PopEngine {

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : 60.0f),
      m_fixedTimestep(fixedTimestep > 0.0f ? fixedTimestep : 1.0f / 60.0f),
      m_frameStart(Clock::now()),
      m_lastFrameTime(m_frameStart) {}

void TimestepManager::startFrame() {
    const auto now = Clock::now();
    m_frameStart = now;

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameTime = now;
        // Owe one step so the first frame still ticks
        m_accumulator = m_fixedTimestep;
        return;
    }

    const double delta = std::chrono::duration<double>(now - m_lastFrameTime).count();
    m_lastFrameTime = now;
    m_lastFrameTimeMs = static_cast<uint32_t>(delta * 1000.0);

    m_accumulator += std::min(delta, MAX_ACCUMULATOR);
    updateFPS(delta);
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

void TimestepManager::endFrame() const {
    if (!m_softwareLimiting) {
        return;
    }

    const auto target = m_frameStart + std::chrono::duration_cast<Clock::duration>(
                                           std::chrono::duration<double>(1.0 / m_targetFPS));
    const auto remaining =
        std::chrono::duration_cast<std::chrono::nanoseconds>(target - Clock::now());
    if (remaining.count() > 0) {
        SDL_DelayPrecise(static_cast<Uint64>(remaining.count()));
    }
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_firstFrame = true;
    m_currentFPS = 0.0f;
    m_frameStart = Clock::now();
    m_lastFrameTime = m_frameStart;
}

void TimestepManager::updateFPS(double deltaSeconds) {
    if (deltaSeconds <= 0.0) {
        return;
    }
    const float instant = std::clamp(static_cast<float>(1.0 / deltaSeconds), 0.1f, 1000.0f);
    m_currentFPS = (m_currentFPS <= 0.0f)
                       ? instant
                       : FPS_SMOOTHING * instant + (1.0f - FPS_SMOOTHING) * m_currentFPS;
}

} // namespace PopEngine
