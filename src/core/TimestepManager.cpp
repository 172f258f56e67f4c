/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cstdint>
#include <utility>

namespace {
constexpr float kDefaultFPS = 60.0f;
constexpr float kMinMeasuredFPS = 0.1f;
constexpr float kMaxMeasuredFPS = 1000.0f;
}

std::chrono::nanoseconds TimestepManager::budgetFor(float fps) {
    return std::chrono::nanoseconds(static_cast<int64_t>(1e9 / static_cast<double>(fps)));
}

TimestepManager::TimestepManager(float targetFPS)
    : m_targetFPS(targetFPS > 0.0f ? targetFPS : kDefaultFPS)
    , m_frameBudget(budgetFor(m_targetFPS))
    , m_frameStart(Clock::now())
    , m_previousFrameStart(m_frameStart)
{
}

void TimestepManager::startFrame() {
    const Clock::time_point now = Clock::now();
    m_previousFrameStart = std::exchange(m_frameStart, now);

    // The first frame after construction or reset() has nothing to measure
    if (!m_clockArmed) {
        m_clockArmed = true;
        return;
    }

    const std::chrono::duration<double> delta = now - m_previousFrameStart;
    recordFrame(delta.count());
}

void TimestepManager::recordFrame(double deltaSeconds) {
    const double clamped = std::max(deltaSeconds, 0.0);
    m_lastFrameTimeMs = static_cast<uint32_t>(clamped * 1000.0);
    if (clamped <= 0.0) {
        return;
    }

    const float instant = std::clamp(static_cast<float>(1.0 / clamped), kMinMeasuredFPS, kMaxMeasuredFPS);
    m_currentFPS = m_currentFPS > 0.0f
                       ? kSmoothing * instant + (1.0f - kSmoothing) * m_currentFPS
                       : instant;
}

void TimestepManager::endFrame() {
    if (!m_usingSoftwareFrameLimiting) {
        return;
    }

    const auto remaining = (m_frameStart + m_frameBudget) - Clock::now();
    if (remaining > std::chrono::nanoseconds::zero()) {
        SDL_DelayPrecise(static_cast<Uint64>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(remaining).count()));
    }
}

bool TimestepManager::isFrameTimeExcessive() const {
    const auto budgetMs = std::chrono::duration_cast<std::chrono::milliseconds>(m_frameBudget).count();
    return m_lastFrameTimeMs > static_cast<uint32_t>(2 * budgetMs);
}

void TimestepManager::setTargetFPS(float fps) {
    if (fps <= 0.0f) {
        return;
    }
    m_targetFPS = fps;
    m_frameBudget = budgetFor(fps);
}

void TimestepManager::reset() {
    m_clockArmed = false;
    m_currentFPS = 0.0f;
    m_lastFrameTimeMs = 0;
    m_frameStart = Clock::now();
    m_previousFrameStart = m_frameStart;
}
