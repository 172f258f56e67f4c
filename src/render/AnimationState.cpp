/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "render/AnimationState.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <format>
#include <numbers>

namespace Wayfarer {

namespace {
constexpr double TWO_PI = 2.0 * std::numbers::pi;

uint32_t resolveSeed(uint32_t seed) {
    return seed != 0 ? seed : std::random_device{}();
}
} // namespace

AnimationState::AnimationState(int canvasWidth, int canvasHeight, uint32_t seed)
    : m_canvasWidth(canvasWidth)
    , m_canvasHeight(canvasHeight)
    , m_rng(resolveSeed(seed))
{
    initializeClouds();
}

bool AnimationState::tick(int64_t nowMs) {
    if (m_lastUpdateMs && nowMs - *m_lastUpdateMs < UPDATE_INTERVAL_MS) {
        return false;
    }
    advance(nowMs);
    return true;
}

void AnimationState::advance(int64_t nowMs) {
    updateClouds();

    if (m_settings.wavesEnabled) {
        m_waveOffset = std::fmod(static_cast<double>(nowMs) / WAVE_PERIOD_DIVISOR_MS, TWO_PI);
    }
    if (m_settings.riverEnabled) {
        m_riverOffset = std::fmod(static_cast<double>(nowMs) / RIVER_PERIOD_DIVISOR_MS, TWO_PI);
    }

    m_lastUpdateMs = nowMs;
}

void AnimationState::applySettings(const AnimationSettingsPatch& patch) {
    if (patch.cloudsEnabled) m_settings.cloudsEnabled = *patch.cloudsEnabled;
    if (patch.wavesEnabled) m_settings.wavesEnabled = *patch.wavesEnabled;
    if (patch.riverEnabled) m_settings.riverEnabled = *patch.riverEnabled;

    if (!m_settings.cloudsEnabled) {
        initializeClouds();
    }
    if (!m_settings.wavesEnabled) {
        m_waveOffset = 0.0;
    }
    if (!m_settings.riverEnabled) {
        m_riverOffset = 0.0;
    }

    ANIMATION_DEBUG(std::format("Animation settings: clouds={} waves={} river={}",
                                m_settings.cloudsEnabled, m_settings.wavesEnabled,
                                m_settings.riverEnabled));
}

void AnimationState::resize(int canvasWidth, int canvasHeight) {
    m_canvasWidth = canvasWidth;
    m_canvasHeight = canvasHeight;
    initializeClouds();
    ANIMATION_DEBUG(std::format("Canvas resized to {}x{}, clouds re-seeded", canvasWidth, canvasHeight));
}

Cloud AnimationState::createCloud(size_t index, bool forceOffscreen) {
    Cloud cloud;
    cloud.size = 60.0f + random01() * 100.0f;
    if (forceOffscreen) {
        cloud.x = -cloud.size;
    } else {
        const float slotWidth = static_cast<float>(m_canvasWidth) / static_cast<float>(CLOUD_COUNT);
        cloud.x = static_cast<float>(index) * slotWidth + random01() * 200.0f;
    }
    cloud.y = random01() * (static_cast<float>(m_canvasHeight) * 0.4f);
    cloud.speed = MIN_CLOUD_SPEED + random01() * (MAX_CLOUD_SPEED - MIN_CLOUD_SPEED);
    cloud.opacity = 0.4f + random01() * 0.3f;
    return cloud;
}

void AnimationState::initializeClouds() {
    for (size_t i = 0; i < CLOUD_COUNT; ++i) {
        m_clouds[i] = createCloud(i, false);
    }
}

void AnimationState::updateClouds() {
    if (!m_settings.cloudsEnabled) {
        return;
    }

    for (size_t i = 0; i < CLOUD_COUNT; ++i) {
        Cloud& cloud = m_clouds[i];
        cloud.x += cloud.speed;

        if (cloud.x > static_cast<float>(m_canvasWidth) + cloud.size) {
            m_clouds[i] = createCloud(i, true);
            ++m_cloudsRecycled;
        }
    }
}

} // namespace Wayfarer
