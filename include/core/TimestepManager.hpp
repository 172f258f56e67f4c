/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <cstdint>
#include <chrono>

/**
 * TimestepManager paces the foreground loop and measures frame rate.
 *
 * In software mode endFrame() sleeps with SDL_DelayPrecise until the target
 * frame time has elapsed since startFrame(). Otherwise endFrame() returns
 * immediately and pacing is left to SDL_RenderPresent().
 *
 * The render controller throttles drawing further by idle state; this class
 * only bounds how often the loop spins.
 */
class TimestepManager {
public:
    /**
     * Constructor
     * @param targetFPS Target loop frequency (e.g., 60.0f)
     */
    explicit TimestepManager(float targetFPS = 60.0f);

    /**
     * Call this at the start of each frame
     */
    void startFrame();

    /**
     * Call this at the end of each frame.
     * Handles frame rate limiting via SDL_DelayPrecise in software mode.
     */
    void endFrame();

    /**
     * Get current measured FPS (EMA smoothed)
     */
    float getCurrentFPS() const { return m_currentFPS; }

    float getTargetFPS() const { return m_targetFPS; }

    /**
     * Get last frame time in milliseconds
     */
    uint32_t getFrameTimeMs() const { return m_lastFrameTimeMs; }

    /**
     * Check if the last frame took more than twice the target frame time
     */
    bool isFrameTimeExcessive() const;

    /**
     * Set new target FPS; non-positive values are ignored
     */
    void setTargetFPS(float fps);

    /**
     * Reset timing state (useful when the window was minimised)
     */
    void reset();

    /**
     * Feed one frame duration into the statistics without touching the clock
     * @param deltaSeconds Duration of the frame
     */
    void recordFrame(double deltaSeconds);

    /**
     * Explicitly set software frame limiting mode (called from GameEngine)
     * @param useSoftwareLimiting false leaves pacing to a blocking present
     */
    void setSoftwareFrameLimiting(bool useSoftwareLimiting) { m_usingSoftwareFrameLimiting = useSoftwareLimiting; }

    /**
     * Check if software frame limiting is active
     * @return true if endFrame() sleeps out the frame budget
     */
    bool isUsingSoftwareFrameLimiting() const { return m_usingSoftwareFrameLimiting; }

private:
    using Clock = std::chrono::steady_clock;

    float m_targetFPS;
    std::chrono::nanoseconds m_frameBudget;  // 1 / targetFPS

    Clock::time_point m_frameStart;
    Clock::time_point m_previousFrameStart;
    bool m_clockArmed{false};

    uint32_t m_lastFrameTimeMs{0};
    float m_currentFPS{0.0f};
    static constexpr float kSmoothing{0.03f};  // EMA weight of the newest frame

    bool m_usingSoftwareFrameLimiting{false};

    static std::chrono::nanoseconds budgetFor(float fps);
};

#endif // TIMESTEP_MANAGER_HPP
